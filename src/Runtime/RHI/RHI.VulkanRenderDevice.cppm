module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

export module RHI:VulkanRenderDevice;

import Core;
import :Types;
import :RenderDevice;
import :Device;
import :Buffer;
import :Image;
import :Texture;
import :Pipeline;
import :Descriptors;
import :Swapchain;

export namespace RHI
{
    [[nodiscard]] Core::ErrorCode ToErrorCode(VkResult result);

    // IRenderDevice on Vulkan 1.3: dynamic rendering, sync2, two frames in
    // flight. Owns the swapchain, the shared depth target, per-slot command
    // buffers and sync objects, and every resource created through the
    // interface.
    class VulkanRenderDevice final : public IRenderDevice
    {
    public:
        VulkanRenderDevice(VulkanDevice& device, Extent2D initialExtent);
        ~VulkanRenderDevice() override;

        VulkanRenderDevice(const VulkanRenderDevice&) = delete;
        VulkanRenderDevice& operator=(const VulkanRenderDevice&) = delete;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] Core::Result BeginFrame() override;
        [[nodiscard]] Core::Expected<FrameTarget> AcquireSurface(uint64_t timeoutNs) override;
        [[nodiscard]] Core::Result Submit() override;
        [[nodiscard]] Core::Result Present() override;
        [[nodiscard]] Core::Result Reconfigure(Extent2D extent) override;

        [[nodiscard]] Extent2D GetSurfaceExtent() const override;
        [[nodiscard]] uint64_t GetFrameNumber() const override { return m_FrameNumber; }
        void WaitIdle() override;

        [[nodiscard]] Core::Expected<BufferHandle> CreateBuffer(const BufferDesc& desc) override;
        void WriteBuffer(BufferHandle buffer, const void* data, size_t size, size_t offset = 0) override;
        void DestroyBuffer(BufferHandle buffer) override;

        [[nodiscard]] Core::Expected<TextureHandle> CreateTexture(const TextureDesc& desc) override;
        void DestroyTexture(TextureHandle texture) override;

        [[nodiscard]] Core::Expected<BindGroupHandle> CreateBindGroup(const BindGroupDesc& desc) override;
        void DestroyBindGroup(BindGroupHandle group) override;

        [[nodiscard]] Core::Expected<PipelineHandle> CreatePipeline(const PipelineDesc& desc) override;
        void DestroyPipeline(PipelineHandle pipeline) override;

        void BeginRenderPass(const glm::vec4& clearColor) override;
        void BindPipeline(PipelineHandle pipeline) override;
        void BindGroup(uint32_t set, BindGroupHandle group) override;
        void BindVertexBuffer(uint32_t binding, BufferHandle buffer) override;
        void BindIndexBuffer(BufferHandle buffer) override;
        void SetScissor(const ScissorRect& rect) override;
        void DrawIndexed(uint32_t indexCount, uint32_t instanceCount) override;
        void EndRenderPass() override;

    private:
        struct GpuBuffer
        {
            std::array<std::unique_ptr<VulkanBuffer>, FRAMES_IN_FLIGHT> Copies;
            uint32_t CopyCount = 1;

            [[nodiscard]] VulkanBuffer* ForSlot(uint32_t slot) const
            {
                return Copies[CopyCount == 1 ? 0 : slot].get();
            }
        };

        struct GpuBindGroup
        {
            DescriptorPool* Pool = nullptr;
            std::array<VkDescriptorSet, FRAMES_IN_FLIGHT> Sets{};

            ~GpuBindGroup()
            {
                if (!Pool) return;
                for (VkDescriptorSet set : Sets) Pool->Free(set);
            }
        };

        VulkanDevice& m_Device;
        std::unique_ptr<VulkanSwapchain> m_Swapchain;
        std::unique_ptr<VulkanImage> m_DepthImage;
        VkFormat m_DepthFormat = VK_FORMAT_UNDEFINED;

        std::unique_ptr<DescriptorLayout> m_CameraLayout;
        std::unique_ptr<DescriptorLayout> m_MaterialLayout;
        std::unique_ptr<DescriptorPool> m_DescriptorPool;

        Core::ResourcePool<GpuBuffer, BufferHandle> m_Buffers;
        Core::ResourcePool<VulkanTexture, TextureHandle> m_Textures;
        Core::ResourcePool<GpuBindGroup, BindGroupHandle> m_BindGroups;
        Core::ResourcePool<GraphicsPipeline, PipelineHandle> m_Pipelines;

        VkCommandPool m_CommandPool = VK_NULL_HANDLE;
        std::array<VkCommandBuffer, FRAMES_IN_FLIGHT> m_CommandBuffers{};
        std::array<VkSemaphore, FRAMES_IN_FLIGHT> m_ImageAvailableSemaphores{};
        std::array<VkSemaphore, FRAMES_IN_FLIGHT> m_RenderFinishedSemaphores{};
        std::array<VkFence, FRAMES_IN_FLIGHT> m_InFlightFences{};

        uint32_t m_CurrentFrame = 0;
        uint32_t m_ImageIndex = 0;
        uint64_t m_FrameNumber = 0;

        bool m_IsValid = false;
        bool m_ImageAcquired = false;
        bool m_IsRecording = false;
        bool m_SurfaceDirty = false;
        VkPipelineLayout m_BoundLayout = VK_NULL_HANDLE;

        bool InitSyncStructures();
        void DestroySyncStructures();
        bool CreateDepthTarget();
        void AbandonFrame();
        [[nodiscard]] VkCommandBuffer Cmd() const { return m_CommandBuffers[m_CurrentFrame]; }
    };
}
