module;
#include <memory>
#include "RHI.Vulkan.hpp"

module Runtime.GraphicsBackend;

import Core;
import RHI;

namespace Runtime
{
    GraphicsBackend::GraphicsBackend(Core::Windowing::Window& window, const GraphicsBackendConfig& config)
    {
        Core::Log::Info("GraphicsBackend: Initializing...");

        // 1. Vulkan Context
        RHI::ContextConfig ctxConfig{
            .AppName = config.AppName,
            .EnableValidation = config.EnableValidation,
            .RequiredExtensions = Core::Windowing::Window::GetRequiredInstanceExtensions()
        };
        m_Context = std::make_unique<RHI::VulkanContext>(ctxConfig);
        if (!m_Context->IsValid())
        {
            Core::Log::Error("GraphicsBackend: failed to create Vulkan instance");
            return;
        }

        // 2. Surface
        if (!window.CreateSurface(m_Context->GetInstance(), nullptr, &m_Surface))
        {
            Core::Log::Error("GraphicsBackend: failed to create Vulkan surface");
            return;
        }

        // 3. Device
        m_Device = std::make_unique<RHI::VulkanDevice>(*m_Context, m_Surface);
        if (!m_Device->IsValid())
        {
            Core::Log::Error("GraphicsBackend: no suitable Vulkan device");
            return;
        }

        // 4. Render device (swapchain, frame slots, pools)
        const RHI::Extent2D extent{
            static_cast<uint32_t>(window.GetFramebufferWidth()),
            static_cast<uint32_t>(window.GetFramebufferHeight())
        };
        m_RenderDevice = std::make_unique<RHI::VulkanRenderDevice>(*m_Device, extent);
        if (!m_RenderDevice->IsValid())
        {
            Core::Log::Error("GraphicsBackend: failed to initialize render device");
            return;
        }

        m_IsValid = true;
        Core::Log::Info("GraphicsBackend: Initialization complete.");
    }

    GraphicsBackend::~GraphicsBackend()
    {
        WaitIdle();

        // The render device flushes its own pools and deletion queues.
        m_RenderDevice.reset();
        m_Device.reset();

        // Surface and context.
        if (m_Context && m_Surface != VK_NULL_HANDLE)
        {
            vkDestroySurfaceKHR(m_Context->GetInstance(), m_Surface, nullptr);
        }
        m_Context.reset();

        Core::Log::Info("GraphicsBackend: Shutdown complete.");
    }

    void GraphicsBackend::WaitIdle()
    {
        if (m_RenderDevice) m_RenderDevice->WaitIdle();
        else if (m_Device && m_Device->GetLogicalDevice() != VK_NULL_HANDLE)
            vkDeviceWaitIdle(m_Device->GetLogicalDevice());
    }
}
