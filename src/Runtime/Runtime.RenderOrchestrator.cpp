module;
#include <cstdint>
#include <optional>
#include <utility>
#include <glm/glm.hpp>

module Runtime.RenderOrchestrator;

import Core;
import RHI;
import Graphics;

namespace Runtime
{
    RenderOrchestrator::RenderOrchestrator(RHI::IRenderDevice& device, RenderOrchestratorConfig config)
        : m_Device(device),
          m_Config(std::move(config)),
          m_Context{m_Device, m_Textures, m_Materials, m_Pipelines, m_Quad, m_Scissors},
          m_Batcher(m_Config.Batcher),
          m_FrameRenderer(m_Context, m_Batcher, m_Camera, m_Config.Frame)
    {
        Core::Log::Info("RenderOrchestrator: Initializing...");

        const RHI::Extent2D extent = m_Device.GetSurfaceExtent();
        m_Camera.SetViewport(glm::vec2(static_cast<float>(extent.Width), static_cast<float>(extent.Height)));
    }

    RenderOrchestrator::~RenderOrchestrator()
    {
        // Also reached after a failed Initialize; every Release is a no-op on
        // what was never created.
        // Drain the GPU before releasing what in-flight frames still read.
        m_Device.WaitIdle();

        m_FrameRenderer.Shutdown();
        m_Batcher.Release(m_Device);
        m_Materials.Clear(m_Device);
        m_Pipelines.Release(m_Device);
        m_Quad.Release(m_Device);
        m_Textures.Release(m_Device);

        Core::Log::Info("RenderOrchestrator: Shutdown complete.");
    }

    Core::Result RenderOrchestrator::Initialize()
    {
        if (m_Initialized) return Core::Ok();

        if (auto r = m_Textures.Initialize(m_Device); !r) return r;
        if (auto r = m_Quad.Create(m_Device); !r) return r;
        if (auto r = m_Pipelines.Build(m_Device, m_Config.ShaderDirectory); !r) return r;
        if (auto r = m_FrameRenderer.Initialize(); !r) return r;

        m_Initialized = true;
        return Core::Ok();
    }

    bool RenderOrchestrator::SubmitVisual(const Graphics::VisualRecord& record)
    {
        return m_Batcher.Submit(m_Textures, record);
    }

    void RenderOrchestrator::SetCamera(const glm::vec2& position, float zoom, const glm::vec2& viewport)
    {
        m_Camera.Update(position, zoom, viewport);
    }

    void RenderOrchestrator::SetCameraRotation(float radians)
    {
        m_Camera.SetRotation(radians);
    }

    Graphics::ScissorId RenderOrchestrator::DefineScissor(const RHI::ScissorRect& rect)
    {
        return m_Scissors.Define(rect);
    }

    Core::Expected<Graphics::FrameStatus> RenderOrchestrator::RenderFrame()
    {
        if (!m_Initialized) return Core::Err<Graphics::FrameStatus>(Core::ErrorCode::InvalidState);
        return m_FrameRenderer.RenderFrame();
    }

    void RenderOrchestrator::Resize(uint32_t width, uint32_t height)
    {
        m_Camera.SetViewport(glm::vec2(static_cast<float>(width), static_cast<float>(height)));
        m_FrameRenderer.RequestReconfigure({width, height});
    }

    Core::Expected<Graphics::TextureId> RenderOrchestrator::RegisterTexture(
        const Graphics::Image& image,
        std::optional<Graphics::SpriteSheetDescriptor> sheet,
        RHI::TextureFilter filter)
    {
        return m_Textures.Register(m_Device, image, sheet, filter);
    }

    Core::Result RenderOrchestrator::ReplaceTexture(Graphics::TextureId id,
                                                    const Graphics::Image& image,
                                                    std::optional<Graphics::SpriteSheetDescriptor> sheet)
    {
        if (auto r = m_Textures.Replace(m_Device, id, image, sheet); !r) return r;
        m_Materials.Invalidate(m_Device, id);
        return Core::Ok();
    }

    Core::Result RenderOrchestrator::UnregisterTexture(Graphics::TextureId id)
    {
        if (auto r = m_Textures.Unregister(m_Device, id); !r) return r;
        m_Materials.Invalidate(m_Device, id);
        return Core::Ok();
    }

    void RenderOrchestrator::InvalidateTexture(Graphics::TextureId id)
    {
        m_Materials.Invalidate(m_Device, id);
    }
}
