export module Graphics;

export import :Color;
export import :Image;
export import :InstanceLayout;
export import :GeometryTemplate;
export import :SpriteSheet;
export import :Camera;
export import :VisualRecord;
export import :InstanceStream;
export import :PipelineLibrary;
export import :TextureRegistry;
export import :MaterialCache;
export import :DrawBatcher;
export import :RectFragment;
export import :UiLayout;
export import :ProceduralImages;
export import :RenderContext;
export import :FrameRenderer;
