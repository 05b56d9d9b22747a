export module RHI;

export import :Buffer;
export import :CommandUtils;
export import :Context;
export import :Descriptors;
export import :Device;
export import :Image;
export import :Pipeline;
export import :RenderDevice;
export import :Shader;
export import :Swapchain;
export import :Texture;
export import :Types;
export import :VulkanRenderDevice;
