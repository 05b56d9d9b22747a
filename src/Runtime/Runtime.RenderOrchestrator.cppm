module;
#include <cstdint>
#include <optional>
#include <string>
#include <glm/glm.hpp>

export module Runtime.RenderOrchestrator;

import Core;
import RHI;
import Graphics;

export namespace Runtime
{
    struct RenderOrchestratorConfig
    {
        std::string ShaderDirectory = "shaders";
        Graphics::BatcherConfig Batcher{};
        Graphics::FrameRendererConfig Frame{};
    };

    // Collaborator-facing facade over the batching core. Owns the texture
    // registry, material cache, pipelines, shared quad, scissor table,
    // batcher, camera and frame renderer, and wires them into one
    // RenderContext over a borrowed IRenderDevice.
    //
    // Per frame: SubmitVisual for every visible record, then RenderFrame.
    class RenderOrchestrator
    {
    public:
        RenderOrchestrator(RHI::IRenderDevice& device, RenderOrchestratorConfig config);
        ~RenderOrchestrator();

        // Non-copyable, non-movable (RenderContext points into this object).
        RenderOrchestrator(const RenderOrchestrator&) = delete;
        RenderOrchestrator& operator=(const RenderOrchestrator&) = delete;
        RenderOrchestrator(RenderOrchestrator&&) = delete;
        RenderOrchestrator& operator=(RenderOrchestrator&&) = delete;

        // Creates the placeholder texture, quad geometry, pipelines and camera
        // uniform. Nothing else may be called until this succeeds.
        [[nodiscard]] Core::Result Initialize();

        // --- Per frame ---
        bool SubmitVisual(const Graphics::VisualRecord& record);
        void SetCamera(const glm::vec2& position, float zoom, const glm::vec2& viewport);
        void SetCameraRotation(float radians);
        [[nodiscard]] Graphics::ScissorId DefineScissor(const RHI::ScissorRect& rect);
        [[nodiscard]] Core::Expected<Graphics::FrameStatus> RenderFrame();

        void Resize(uint32_t width, uint32_t height);

        // --- Textures ---
        [[nodiscard]] Core::Expected<Graphics::TextureId> RegisterTexture(
            const Graphics::Image& image,
            std::optional<Graphics::SpriteSheetDescriptor> sheet = std::nullopt,
            RHI::TextureFilter filter = RHI::TextureFilter::Nearest);
        [[nodiscard]] Core::Result ReplaceTexture(Graphics::TextureId id,
                                                  const Graphics::Image& image,
                                                  std::optional<Graphics::SpriteSheetDescriptor> sheet = std::nullopt);
        [[nodiscard]] Core::Result UnregisterTexture(Graphics::TextureId id);
        void InvalidateTexture(Graphics::TextureId id);

        // --- Accessors ---
        [[nodiscard]] Graphics::Camera2D& GetCamera() { return m_Camera; }
        [[nodiscard]] const Graphics::Camera2D& GetCamera() const { return m_Camera; }
        [[nodiscard]] const Graphics::TextureRegistry& GetTextures() const { return m_Textures; }
        [[nodiscard]] const Graphics::MaterialCache& GetMaterials() const { return m_Materials; }
        [[nodiscard]] const Graphics::DrawBatcher& GetBatcher() const { return m_Batcher; }
        [[nodiscard]] Graphics::FrameRenderer& GetFrameRenderer() { return m_FrameRenderer; }
        [[nodiscard]] const Graphics::FrameRenderer& GetFrameRenderer() const { return m_FrameRenderer; }
        [[nodiscard]] glm::vec2 GetViewport() const { return m_Camera.GetViewport(); }

    private:
        RHI::IRenderDevice& m_Device;
        RenderOrchestratorConfig m_Config;

        Graphics::TextureRegistry m_Textures;
        Graphics::MaterialCache m_Materials;
        Graphics::PipelineLibrary m_Pipelines;
        Graphics::QuadGeometry m_Quad;
        Graphics::ScissorTable m_Scissors;
        Graphics::RenderContext m_Context;

        Graphics::DrawBatcher m_Batcher;
        Graphics::Camera2D m_Camera;
        Graphics::FrameRenderer m_FrameRenderer;

        bool m_Initialized = false;
    };
}
