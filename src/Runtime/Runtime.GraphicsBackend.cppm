module;
#include <memory>
#include <string>

#include "RHI.Vulkan.hpp"

export module Runtime.GraphicsBackend;

import Core;
import RHI;

export namespace Runtime
{
    struct GraphicsBackendConfig
    {
        std::string AppName = "Mosaic App";
        bool EnableValidation = true;
    };

    // Owns the Vulkan context, the window surface, the logical device and the
    // IRenderDevice built on top of them. Encapsulates construction and
    // destruction order so the Engine never manages individual GPU lifetimes.
    class GraphicsBackend
    {
    public:
        // Requires a valid, already-created window. Check IsValid afterwards.
        GraphicsBackend(Core::Windowing::Window& window, const GraphicsBackendConfig& config);
        ~GraphicsBackend();

        // Non-copyable, non-movable (owns Vulkan resources).
        GraphicsBackend(const GraphicsBackend&) = delete;
        GraphicsBackend& operator=(const GraphicsBackend&) = delete;
        GraphicsBackend(GraphicsBackend&&) = delete;
        GraphicsBackend& operator=(GraphicsBackend&&) = delete;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] RHI::VulkanContext& GetContext() const { return *m_Context; }
        [[nodiscard]] RHI::VulkanDevice& GetDevice() const { return *m_Device; }
        [[nodiscard]] RHI::IRenderDevice& GetRenderDevice() const { return *m_RenderDevice; }

        void WaitIdle();

    private:
        // Vulkan instance & debug layers.
        std::unique_ptr<RHI::VulkanContext> m_Context;

        // Window surface for presentation.
        VkSurfaceKHR m_Surface = VK_NULL_HANDLE;

        // Logical device, queues, VMA allocator, deferred deletion.
        std::unique_ptr<RHI::VulkanDevice> m_Device;

        // Swapchain, frame slots and resource pools.
        std::unique_ptr<RHI::VulkanRenderDevice> m_RenderDevice;

        bool m_IsValid = false;
    };
}
