module;
#include <cstddef>
#include <cstdint>
#include <glm/glm.hpp>

export module RHI:RenderDevice;

import Core;
import :Types;

export namespace RHI
{
    // The seam between the batching core and a GPU backend.
    //
    // Frame protocol (render thread only):
    //   BeginFrame -> [resource writes] -> AcquireSurface -> BeginRenderPass ->
    //   [binds + draws] -> EndRenderPass -> Submit -> Present
    //
    // Any step may fail with a transient surface error; the caller owns
    // recovery (Reconfigure) and decides when a failure becomes fatal.
    // Resource destruction is deferred internally until no frame in flight can
    // still reference the object.
    class IRenderDevice
    {
    public:
        virtual ~IRenderDevice() = default;

        // --- Frame ---
        // Waits until the next frame slot is free and retires deferred deletions.
        [[nodiscard]] virtual Core::Result BeginFrame() = 0;
        [[nodiscard]] virtual Core::Expected<FrameTarget> AcquireSurface(uint64_t timeoutNs) = 0;
        [[nodiscard]] virtual Core::Result Submit() = 0;
        [[nodiscard]] virtual Core::Result Present() = 0;
        // Rebuilds the presentation surface. Drops any partially recorded frame.
        [[nodiscard]] virtual Core::Result Reconfigure(Extent2D extent) = 0;

        [[nodiscard]] virtual Extent2D GetSurfaceExtent() const = 0;
        [[nodiscard]] virtual uint64_t GetFrameNumber() const = 0;
        virtual void WaitIdle() = 0;

        // --- Resources ---
        [[nodiscard]] virtual Core::Expected<BufferHandle> CreateBuffer(const BufferDesc& desc) = 0;
        // Dynamic buffers receive the write in the current frame slot's copy.
        virtual void WriteBuffer(BufferHandle buffer, const void* data, size_t size, size_t offset = 0) = 0;
        virtual void DestroyBuffer(BufferHandle buffer) = 0;

        [[nodiscard]] virtual Core::Expected<TextureHandle> CreateTexture(const TextureDesc& desc) = 0;
        virtual void DestroyTexture(TextureHandle texture) = 0;

        [[nodiscard]] virtual Core::Expected<BindGroupHandle> CreateBindGroup(const BindGroupDesc& desc) = 0;
        virtual void DestroyBindGroup(BindGroupHandle group) = 0;

        [[nodiscard]] virtual Core::Expected<PipelineHandle> CreatePipeline(const PipelineDesc& desc) = 0;
        virtual void DestroyPipeline(PipelineHandle pipeline) = 0;

        // --- Recording ---
        virtual void BeginRenderPass(const glm::vec4& clearColor) = 0;
        virtual void BindPipeline(PipelineHandle pipeline) = 0;
        virtual void BindGroup(uint32_t set, BindGroupHandle group) = 0;
        virtual void BindVertexBuffer(uint32_t binding, BufferHandle buffer) = 0;
        virtual void BindIndexBuffer(BufferHandle buffer) = 0;
        virtual void SetScissor(const ScissorRect& rect) = 0;
        virtual void DrawIndexed(uint32_t indexCount, uint32_t instanceCount) = 0;
        virtual void EndRenderPass() = 0;
    };
}
