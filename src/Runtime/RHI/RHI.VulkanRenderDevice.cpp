module;
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

module RHI:VulkanRenderDevice.Impl;
import :VulkanRenderDevice;
import :Shader;
import :CommandUtils;
import Core;

namespace RHI
{
    Core::ErrorCode ToErrorCode(VkResult result)
    {
        switch (result)
        {
        case VK_SUCCESS: return Core::ErrorCode::Success;
        case VK_TIMEOUT:
        case VK_NOT_READY: return Core::ErrorCode::SurfaceTimeout;
        case VK_SUBOPTIMAL_KHR:
        case VK_ERROR_OUT_OF_DATE_KHR: return Core::ErrorCode::SwapchainOutOfDate;
        case VK_ERROR_SURFACE_LOST_KHR: return Core::ErrorCode::SurfaceLost;
        case VK_ERROR_DEVICE_LOST: return Core::ErrorCode::DeviceLost;
        case VK_ERROR_OUT_OF_HOST_MEMORY: return Core::ErrorCode::OutOfMemory;
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return Core::ErrorCode::OutOfDeviceMemory;
        default: return Core::ErrorCode::Unknown;
        }
    }

    namespace
    {
        VkFormat ToVkFormat(VertexFormat format)
        {
            switch (format)
            {
            case VertexFormat::Float: return VK_FORMAT_R32_SFLOAT;
            case VertexFormat::Float2: return VK_FORMAT_R32G32_SFLOAT;
            case VertexFormat::Float3: return VK_FORMAT_R32G32B32_SFLOAT;
            case VertexFormat::Float4: return VK_FORMAT_R32G32B32A32_SFLOAT;
            case VertexFormat::Uint: return VK_FORMAT_R32_UINT;
            }
            return VK_FORMAT_UNDEFINED;
        }

        VkBufferUsageFlags ToVkUsage(BufferUsage usage)
        {
            switch (usage)
            {
            case BufferUsage::Vertex: return VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
            case BufferUsage::Index: return VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
            case BufferUsage::Uniform: return VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
            }
            return 0;
        }

        bool HasStencil(VkFormat format)
        {
            return format == VK_FORMAT_D32_SFLOAT_S8_UINT || format == VK_FORMAT_D24_UNORM_S8_UINT;
        }
    }

    VulkanRenderDevice::VulkanRenderDevice(VulkanDevice& device, Extent2D initialExtent)
        : m_Device(device)
    {
        Core::Log::Info("VulkanRenderDevice: Initializing...");

        m_Buffers.Initialize(FRAMES_IN_FLIGHT);
        m_Textures.Initialize(FRAMES_IN_FLIGHT);
        m_BindGroups.Initialize(FRAMES_IN_FLIGHT);
        m_Pipelines.Initialize(FRAMES_IN_FLIGHT);

        m_Swapchain = std::make_unique<VulkanSwapchain>(m_Device, initialExtent);
        if (!m_Swapchain->IsValid())
        {
            Core::Log::Error("VulkanRenderDevice: swapchain creation failed");
            return;
        }

        m_DepthFormat = VulkanImage::FindDepthFormat(m_Device);
        if (m_DepthFormat == VK_FORMAT_UNDEFINED || !CreateDepthTarget()) return;

        m_CameraLayout = std::make_unique<DescriptorLayout>(m_Device, BindGroupLayoutKind::Camera);
        m_MaterialLayout = std::make_unique<DescriptorLayout>(m_Device, BindGroupLayoutKind::Material);
        m_DescriptorPool = std::make_unique<DescriptorPool>(m_Device);
        if (!m_CameraLayout->IsValid() || !m_MaterialLayout->IsValid() || !m_DescriptorPool->IsValid()) return;

        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = m_Device.GetQueueIndices().GraphicsFamily.value();

        if (vkCreateCommandPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &m_CommandPool) != VK_SUCCESS)
        {
            Core::Log::Error("VulkanRenderDevice: failed to create command pool");
            m_CommandPool = VK_NULL_HANDLE;
            return;
        }

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = m_CommandPool;
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = static_cast<uint32_t>(m_CommandBuffers.size());

        if (vkAllocateCommandBuffers(m_Device.GetLogicalDevice(), &allocInfo, m_CommandBuffers.data()) != VK_SUCCESS)
        {
            Core::Log::Error("VulkanRenderDevice: failed to allocate command buffers");
            return;
        }

        m_IsValid = InitSyncStructures();
    }

    VulkanRenderDevice::~VulkanRenderDevice()
    {
        vkDeviceWaitIdle(m_Device.GetLogicalDevice());

        m_Pipelines.Clear();
        m_BindGroups.Clear();
        m_Textures.Clear();
        m_Buffers.Clear();

        m_DepthImage.reset();
        m_Swapchain.reset();

        DestroySyncStructures();
        if (m_CommandPool) vkDestroyCommandPool(m_Device.GetLogicalDevice(), m_CommandPool, nullptr);

        // Descriptor frees and VMA releases queued above still need the pool and allocator.
        m_Device.FlushAllDeletionQueues();

        m_DescriptorPool.reset();
        m_MaterialLayout.reset();
        m_CameraLayout.reset();
    }

    bool VulkanRenderDevice::InitSyncStructures()
    {
        VkSemaphoreCreateInfo semaphoreInfo{};
        semaphoreInfo.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;

        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        VkDevice device = m_Device.GetLogicalDevice();
        for (size_t i = 0; i < FRAMES_IN_FLIGHT; i++)
        {
            if (vkCreateSemaphore(device, &semaphoreInfo, nullptr, &m_ImageAvailableSemaphores[i]) != VK_SUCCESS ||
                vkCreateSemaphore(device, &semaphoreInfo, nullptr, &m_RenderFinishedSemaphores[i]) != VK_SUCCESS ||
                vkCreateFence(device, &fenceInfo, nullptr, &m_InFlightFences[i]) != VK_SUCCESS)
            {
                Core::Log::Error("VulkanRenderDevice: failed to create frame sync objects");
                return false;
            }
        }
        return true;
    }

    void VulkanRenderDevice::DestroySyncStructures()
    {
        VkDevice device = m_Device.GetLogicalDevice();
        for (size_t i = 0; i < FRAMES_IN_FLIGHT; i++)
        {
            if (m_ImageAvailableSemaphores[i]) vkDestroySemaphore(device, m_ImageAvailableSemaphores[i], nullptr);
            if (m_RenderFinishedSemaphores[i]) vkDestroySemaphore(device, m_RenderFinishedSemaphores[i], nullptr);
            if (m_InFlightFences[i]) vkDestroyFence(device, m_InFlightFences[i], nullptr);
            m_ImageAvailableSemaphores[i] = VK_NULL_HANDLE;
            m_RenderFinishedSemaphores[i] = VK_NULL_HANDLE;
            m_InFlightFences[i] = VK_NULL_HANDLE;
        }
    }

    bool VulkanRenderDevice::CreateDepthTarget()
    {
        VkExtent2D extent = m_Swapchain->GetExtent();
        m_DepthImage = std::make_unique<VulkanImage>(m_Device, extent.width, extent.height, m_DepthFormat,
                                                     VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT,
                                                     VK_IMAGE_ASPECT_DEPTH_BIT);
        return m_DepthImage->IsValid();
    }

    // A frame that acquired an image but never submitted leaves its
    // image-available semaphore signaled. Drain the GPU and rebuild the sync
    // objects so the slot starts clean.
    void VulkanRenderDevice::AbandonFrame()
    {
        vkDeviceWaitIdle(m_Device.GetLogicalDevice());
        for (VkCommandBuffer cmd : m_CommandBuffers)
        {
            if (cmd) vkResetCommandBuffer(cmd, 0);
        }
        DestroySyncStructures();
        m_IsValid = InitSyncStructures();

        m_ImageAcquired = false;
        m_IsRecording = false;
        m_BoundLayout = VK_NULL_HANDLE;
    }

    Core::Result VulkanRenderDevice::BeginFrame()
    {
        if (!m_IsValid) return Core::Err(Core::ErrorCode::DeviceLost);

        if (m_ImageAcquired || m_IsRecording)
        {
            Core::Log::Warn("VulkanRenderDevice: previous frame was abandoned mid-flight; resetting slot sync");
            AbandonFrame();
            if (!m_IsValid) return Core::Err(Core::ErrorCode::DeviceLost);
        }

        VkResult result = vkWaitForFences(m_Device.GetLogicalDevice(), 1, &m_InFlightFences[m_CurrentFrame],
                                          VK_TRUE, UINT64_MAX);
        if (result != VK_SUCCESS) return Core::Err(ToErrorCode(result));

        m_Device.FlushDeletionQueue(m_CurrentFrame);
        m_Buffers.ProcessDeletions(m_FrameNumber);
        m_Textures.ProcessDeletions(m_FrameNumber);
        m_BindGroups.ProcessDeletions(m_FrameNumber);
        m_Pipelines.ProcessDeletions(m_FrameNumber);

        return Core::Ok();
    }

    Core::Expected<FrameTarget> VulkanRenderDevice::AcquireSurface(uint64_t timeoutNs)
    {
        if (!m_Swapchain->IsValid()) return Core::Err<FrameTarget>(Core::ErrorCode::SurfaceLost);
        if (m_SurfaceDirty) return Core::Err<FrameTarget>(Core::ErrorCode::SwapchainOutOfDate);

        VkResult result = vkAcquireNextImageKHR(
            m_Device.GetLogicalDevice(),
            m_Swapchain->GetHandle(),
            timeoutNs,
            m_ImageAvailableSemaphores[m_CurrentFrame],
            VK_NULL_HANDLE,
            &m_ImageIndex
        );

        if (result == VK_SUBOPTIMAL_KHR)
        {
            // Still presentable; rebuild after this frame.
            m_SurfaceDirty = true;
        }
        else if (result != VK_SUCCESS)
        {
            return Core::Err<FrameTarget>(ToErrorCode(result));
        }

        m_ImageAcquired = true;

        const VkExtent2D extent = m_Swapchain->GetExtent();
        return FrameTarget{
            .FrameSlot = m_CurrentFrame,
            .ImageIndex = m_ImageIndex,
            .Extent = {extent.width, extent.height},
            .FrameNumber = m_FrameNumber
        };
    }

    void VulkanRenderDevice::BeginRenderPass(const glm::vec4& clearColor)
    {
        if (!m_ImageAcquired || m_IsRecording) return;

        VkCommandBuffer cmd = Cmd();
        VK_CHECK(vkResetCommandBuffer(cmd, 0));

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        VK_CHECK(vkBeginCommandBuffer(cmd, &beginInfo));
        m_IsRecording = true;

        VkImage colorImage = m_Swapchain->GetImages()[m_ImageIndex];
        VkImageAspectFlags depthAspect = VK_IMAGE_ASPECT_DEPTH_BIT;
        if (HasStencil(m_DepthFormat)) depthAspect |= VK_IMAGE_ASPECT_STENCIL_BIT;

        CommandUtils::TransitionImageLayout(cmd, colorImage, VK_IMAGE_LAYOUT_UNDEFINED,
                                            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL);
        CommandUtils::TransitionImageLayout(cmd, m_DepthImage->GetHandle(), VK_IMAGE_LAYOUT_UNDEFINED,
                                            VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL, depthAspect);

        VkRenderingAttachmentInfo colorAttachment{};
        colorAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
        colorAttachment.imageView = m_Swapchain->GetImageViews()[m_ImageIndex];
        colorAttachment.imageLayout = VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL;
        colorAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        colorAttachment.storeOp = VK_ATTACHMENT_STORE_OP_STORE;
        colorAttachment.clearValue.color = {{clearColor.r, clearColor.g, clearColor.b, clearColor.a}};

        VkRenderingAttachmentInfo depthAttachment{};
        depthAttachment.sType = VK_STRUCTURE_TYPE_RENDERING_ATTACHMENT_INFO;
        depthAttachment.imageView = m_DepthImage->GetView();
        depthAttachment.imageLayout = VK_IMAGE_LAYOUT_DEPTH_ATTACHMENT_OPTIMAL;
        depthAttachment.loadOp = VK_ATTACHMENT_LOAD_OP_CLEAR;
        depthAttachment.storeOp = VK_ATTACHMENT_STORE_OP_DONT_CARE;
        depthAttachment.clearValue.depthStencil = {1.0f, 0};

        const VkExtent2D extent = m_Swapchain->GetExtent();

        VkRenderingInfo renderingInfo{};
        renderingInfo.sType = VK_STRUCTURE_TYPE_RENDERING_INFO;
        renderingInfo.renderArea = {{0, 0}, extent};
        renderingInfo.layerCount = 1;
        renderingInfo.colorAttachmentCount = 1;
        renderingInfo.pColorAttachments = &colorAttachment;
        renderingInfo.pDepthAttachment = &depthAttachment;

        vkCmdBeginRendering(cmd, &renderingInfo);

        VkViewport viewport{};
        viewport.x = 0.0f;
        viewport.y = 0.0f;
        viewport.width = static_cast<float>(extent.width);
        viewport.height = static_cast<float>(extent.height);
        viewport.minDepth = 0.0f;
        viewport.maxDepth = 1.0f;
        vkCmdSetViewport(cmd, 0, 1, &viewport);

        VkRect2D scissor{{0, 0}, extent};
        vkCmdSetScissor(cmd, 0, 1, &scissor);

        m_BoundLayout = VK_NULL_HANDLE;
    }

    void VulkanRenderDevice::EndRenderPass()
    {
        if (!m_IsRecording) return;

        VkCommandBuffer cmd = Cmd();
        vkCmdEndRendering(cmd);

        CommandUtils::TransitionImageLayout(cmd, m_Swapchain->GetImages()[m_ImageIndex],
                                            VK_IMAGE_LAYOUT_COLOR_ATTACHMENT_OPTIMAL,
                                            VK_IMAGE_LAYOUT_PRESENT_SRC_KHR);
    }

    Core::Result VulkanRenderDevice::Submit()
    {
        if (!m_ImageAcquired || !m_IsRecording) return Core::Err(Core::ErrorCode::InvalidState);

        VkCommandBuffer cmd = Cmd();
        VkResult result = vkEndCommandBuffer(cmd);
        m_IsRecording = false;
        if (result != VK_SUCCESS) return Core::Err(ToErrorCode(result));

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;

        VkSemaphore waitSemaphores[] = {m_ImageAvailableSemaphores[m_CurrentFrame]};
        VkPipelineStageFlags waitStages[] = {VK_PIPELINE_STAGE_COLOR_ATTACHMENT_OUTPUT_BIT};
        submitInfo.waitSemaphoreCount = 1;
        submitInfo.pWaitSemaphores = waitSemaphores;
        submitInfo.pWaitDstStageMask = waitStages;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;

        VkSemaphore signalSemaphores[] = {m_RenderFinishedSemaphores[m_CurrentFrame]};
        submitInfo.signalSemaphoreCount = 1;
        submitInfo.pSignalSemaphores = signalSemaphores;

        // Reset only once a submit is certain to follow, so an early-out never
        // leaves the slot's fence unsignaled.
        VK_CHECK(vkResetFences(m_Device.GetLogicalDevice(), 1, &m_InFlightFences[m_CurrentFrame]));

        result = m_Device.SubmitToGraphicsQueue(submitInfo, m_InFlightFences[m_CurrentFrame]);
        if (result != VK_SUCCESS) return Core::Err(ToErrorCode(result));

        return Core::Ok();
    }

    Core::Result VulkanRenderDevice::Present()
    {
        if (!m_ImageAcquired) return Core::Err(Core::ErrorCode::InvalidState);

        VkSemaphore waitSemaphores[] = {m_RenderFinishedSemaphores[m_CurrentFrame]};
        VkSwapchainKHR swapchains[] = {m_Swapchain->GetHandle()};

        VkPresentInfoKHR presentInfo{};
        presentInfo.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
        presentInfo.waitSemaphoreCount = 1;
        presentInfo.pWaitSemaphores = waitSemaphores;
        presentInfo.swapchainCount = 1;
        presentInfo.pSwapchains = swapchains;
        presentInfo.pImageIndices = &m_ImageIndex;

        VkResult result = m_Device.Present(presentInfo);

        // The submit went through, so the slot advances whatever present said.
        m_ImageAcquired = false;
        m_CurrentFrame = (m_CurrentFrame + 1) % FRAMES_IN_FLIGHT;
        ++m_FrameNumber;

        if (result == VK_SUBOPTIMAL_KHR)
        {
            m_SurfaceDirty = true;
            return Core::Ok();
        }
        if (result != VK_SUCCESS) return Core::Err(ToErrorCode(result));
        return Core::Ok();
    }

    Core::Result VulkanRenderDevice::Reconfigure(Extent2D extent)
    {
        AbandonFrame();
        if (!m_IsValid) return Core::Err(Core::ErrorCode::DeviceLost);

        auto result = m_Swapchain->Recreate(extent);
        if (!result) return result;

        if (!CreateDepthTarget()) return Core::Err(Core::ErrorCode::OutOfDeviceMemory);

        m_SurfaceDirty = false;
        return Core::Ok();
    }

    Extent2D VulkanRenderDevice::GetSurfaceExtent() const
    {
        if (!m_Swapchain || !m_Swapchain->IsValid()) return {};
        const VkExtent2D extent = m_Swapchain->GetExtent();
        return {extent.width, extent.height};
    }

    void VulkanRenderDevice::WaitIdle()
    {
        VK_CHECK(vkDeviceWaitIdle(m_Device.GetLogicalDevice()));
    }

    Core::Expected<BufferHandle> VulkanRenderDevice::CreateBuffer(const BufferDesc& desc)
    {
        if (desc.SizeBytes == 0) return Core::Err<BufferHandle>(Core::ErrorCode::InvalidArgument);

        auto buffer = std::make_unique<GpuBuffer>();
        buffer->CopyCount = desc.Domain == BufferDomain::Dynamic ? FRAMES_IN_FLIGHT : 1;

        for (uint32_t i = 0; i < buffer->CopyCount; ++i)
        {
            buffer->Copies[i] = std::make_unique<VulkanBuffer>(m_Device, desc.SizeBytes, ToVkUsage(desc.Usage));
            if (!buffer->Copies[i]->IsValid())
            {
                Core::Log::Error("CreateBuffer '{}' ({} bytes) failed", desc.DebugName, desc.SizeBytes);
                return Core::Err<BufferHandle>(Core::ErrorCode::OutOfDeviceMemory);
            }
        }

        return m_Buffers.Add(std::move(buffer));
    }

    void VulkanRenderDevice::WriteBuffer(BufferHandle buffer, const void* data, size_t size, size_t offset)
    {
        GpuBuffer* gpu = m_Buffers.Get(buffer);
        if (!gpu)
        {
            Core::Log::Error("WriteBuffer: stale buffer handle {}", buffer.Index);
            return;
        }
        if (!gpu->ForSlot(m_CurrentFrame)->Write(data, size, offset))
        {
            Core::Log::Error("WriteBuffer: {} bytes at offset {} exceeds buffer of {} bytes",
                             size, offset, gpu->ForSlot(m_CurrentFrame)->GetSizeBytes());
        }
    }

    void VulkanRenderDevice::DestroyBuffer(BufferHandle buffer)
    {
        m_Buffers.Remove(buffer, m_FrameNumber);
    }

    Core::Expected<TextureHandle> VulkanRenderDevice::CreateTexture(const TextureDesc& desc)
    {
        auto texture = std::make_unique<VulkanTexture>(m_Device, desc);
        if (!texture->IsValid()) return Core::Err<TextureHandle>(Core::ErrorCode::OutOfDeviceMemory);
        return m_Textures.Add(std::move(texture));
    }

    void VulkanRenderDevice::DestroyTexture(TextureHandle texture)
    {
        m_Textures.Remove(texture, m_FrameNumber);
    }

    Core::Expected<BindGroupHandle> VulkanRenderDevice::CreateBindGroup(const BindGroupDesc& desc)
    {
        GpuBuffer* uniform = m_Buffers.Get(desc.Uniform);
        if (!uniform) return Core::Err<BindGroupHandle>(Core::ErrorCode::ResourceNotFound);

        VulkanTexture* texture = nullptr;
        if (desc.Layout == BindGroupLayoutKind::Material)
        {
            texture = m_Textures.Get(desc.Texture);
            if (!texture) return Core::Err<BindGroupHandle>(Core::ErrorCode::ResourceNotFound);
        }

        const VkDescriptorSetLayout layout = desc.Layout == BindGroupLayoutKind::Camera
                                                 ? m_CameraLayout->GetHandle()
                                                 : m_MaterialLayout->GetHandle();

        auto group = std::make_unique<GpuBindGroup>();
        group->Pool = m_DescriptorPool.get();

        for (uint32_t slot = 0; slot < FRAMES_IN_FLIGHT; ++slot)
        {
            VkDescriptorSet set = m_DescriptorPool->Allocate(layout);
            if (set == VK_NULL_HANDLE) return Core::Err<BindGroupHandle>(Core::ErrorCode::OutOfDeviceMemory);
            group->Sets[slot] = set;

            const VulkanBuffer* ubo = uniform->ForSlot(slot);
            VkDescriptorBufferInfo bufferInfo{};
            bufferInfo.buffer = ubo->GetHandle();
            bufferInfo.offset = 0;
            bufferInfo.range = ubo->GetSizeBytes();

            std::array<VkWriteDescriptorSet, 2> writes{};
            uint32_t writeCount = 0;

            VkDescriptorImageInfo imageInfo{};
            if (texture)
            {
                imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
                imageInfo.imageView = texture->GetView();
                imageInfo.sampler = texture->GetSampler();

                writes[writeCount].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
                writes[writeCount].dstSet = set;
                writes[writeCount].dstBinding = 0;
                writes[writeCount].descriptorCount = 1;
                writes[writeCount].descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
                writes[writeCount].pImageInfo = &imageInfo;
                ++writeCount;
            }

            writes[writeCount].sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
            writes[writeCount].dstSet = set;
            writes[writeCount].dstBinding = texture ? 1 : 0;
            writes[writeCount].descriptorCount = 1;
            writes[writeCount].descriptorType = VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER;
            writes[writeCount].pBufferInfo = &bufferInfo;
            ++writeCount;

            vkUpdateDescriptorSets(m_Device.GetLogicalDevice(), writeCount, writes.data(), 0, nullptr);
        }

        return m_BindGroups.Add(std::move(group));
    }

    void VulkanRenderDevice::DestroyBindGroup(BindGroupHandle group)
    {
        m_BindGroups.Remove(group, m_FrameNumber);
    }

    Core::Expected<PipelineHandle> VulkanRenderDevice::CreatePipeline(const PipelineDesc& desc)
    {
        ShaderModule vert(m_Device, desc.VertexShaderPath, ShaderStage::Vertex);
        ShaderModule frag(m_Device, desc.FragmentShaderPath, ShaderStage::Fragment);
        if (!vert.IsValid() || !frag.IsValid())
        {
            Core::Log::Error("CreatePipeline '{}': shader load failed", desc.DebugName);
            return Core::Err<PipelineHandle>(Core::ErrorCode::ShaderCompilationFailed);
        }

        PipelineConfig config{};
        config.VertexShader = &vert;
        config.FragmentShader = &frag;
        config.ColorFormat = m_Swapchain->GetImageFormat();
        config.DepthFormat = m_DepthFormat;
        config.DepthTest = desc.DepthTest;
        config.DepthWrite = desc.DepthWrite;
        config.AlphaBlend = desc.Blend == BlendMode::AlphaBlend;

        config.DescriptorSetLayouts.push_back(m_CameraLayout->GetHandle());
        if (desc.UsesMaterial) config.DescriptorSetLayouts.push_back(m_MaterialLayout->GetHandle());

        for (uint32_t binding = 0; binding < desc.VertexLayouts.size(); ++binding)
        {
            const VertexBufferLayout& layout = desc.VertexLayouts[binding];

            VkVertexInputBindingDescription bindingDesc{};
            bindingDesc.binding = binding;
            bindingDesc.stride = layout.Stride;
            bindingDesc.inputRate = layout.StepRate == VertexStepRate::Instance
                                        ? VK_VERTEX_INPUT_RATE_INSTANCE
                                        : VK_VERTEX_INPUT_RATE_VERTEX;
            config.BindingDescriptions.push_back(bindingDesc);

            for (const VertexAttribute& attribute : layout.Attributes)
            {
                VkVertexInputAttributeDescription attributeDesc{};
                attributeDesc.location = attribute.Location;
                attributeDesc.binding = binding;
                attributeDesc.format = ToVkFormat(attribute.Format);
                attributeDesc.offset = attribute.Offset;
                config.AttributeDescriptions.push_back(attributeDesc);
            }
        }

        auto pipeline = std::make_unique<GraphicsPipeline>(m_Device, config);
        if (!pipeline->IsValid()) return Core::Err<PipelineHandle>(Core::ErrorCode::PipelineCreationFailed);

        Core::Log::Info("Pipeline '{}' created", desc.DebugName);
        return m_Pipelines.Add(std::move(pipeline));
    }

    void VulkanRenderDevice::DestroyPipeline(PipelineHandle pipeline)
    {
        m_Pipelines.Remove(pipeline, m_FrameNumber);
    }

    void VulkanRenderDevice::BindPipeline(PipelineHandle pipeline)
    {
        if (!m_IsRecording) return;
        GraphicsPipeline* gpu = m_Pipelines.Get(pipeline);
        if (!gpu) return;

        vkCmdBindPipeline(Cmd(), VK_PIPELINE_BIND_POINT_GRAPHICS, gpu->GetHandle());
        m_BoundLayout = gpu->GetLayout();
    }

    void VulkanRenderDevice::BindGroup(uint32_t set, BindGroupHandle group)
    {
        if (!m_IsRecording || m_BoundLayout == VK_NULL_HANDLE) return;
        GpuBindGroup* gpu = m_BindGroups.Get(group);
        if (!gpu) return;

        vkCmdBindDescriptorSets(Cmd(), VK_PIPELINE_BIND_POINT_GRAPHICS, m_BoundLayout, set, 1,
                                &gpu->Sets[m_CurrentFrame], 0, nullptr);
    }

    void VulkanRenderDevice::BindVertexBuffer(uint32_t binding, BufferHandle buffer)
    {
        if (!m_IsRecording) return;
        GpuBuffer* gpu = m_Buffers.Get(buffer);
        if (!gpu) return;

        VkBuffer handle = gpu->ForSlot(m_CurrentFrame)->GetHandle();
        VkDeviceSize offset = 0;
        vkCmdBindVertexBuffers(Cmd(), binding, 1, &handle, &offset);
    }

    void VulkanRenderDevice::BindIndexBuffer(BufferHandle buffer)
    {
        if (!m_IsRecording) return;
        GpuBuffer* gpu = m_Buffers.Get(buffer);
        if (!gpu) return;

        vkCmdBindIndexBuffer(Cmd(), gpu->ForSlot(m_CurrentFrame)->GetHandle(), 0, VK_INDEX_TYPE_UINT16);
    }

    void VulkanRenderDevice::SetScissor(const ScissorRect& rect)
    {
        if (!m_IsRecording) return;

        const VkExtent2D extent = m_Swapchain->GetExtent();
        const int32_t x = std::clamp(rect.X, 0, static_cast<int32_t>(extent.width));
        const int32_t y = std::clamp(rect.Y, 0, static_cast<int32_t>(extent.height));

        VkRect2D scissor{};
        scissor.offset = {x, y};
        scissor.extent.width = std::min(rect.Width, extent.width - static_cast<uint32_t>(x));
        scissor.extent.height = std::min(rect.Height, extent.height - static_cast<uint32_t>(y));
        vkCmdSetScissor(Cmd(), 0, 1, &scissor);
    }

    void VulkanRenderDevice::DrawIndexed(uint32_t indexCount, uint32_t instanceCount)
    {
        if (!m_IsRecording || instanceCount == 0) return;
        vkCmdDrawIndexed(Cmd(), indexCount, instanceCount, 0, 0, 0);
    }
}
