export module ECS;

export import :Components;
export import :Scene;
export import :Systems.Visibility;
export import :Systems.VisualExtraction;
