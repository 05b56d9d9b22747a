module;
#include <cstdint>
#include <memory>
#include <span>
#include "RHI.Vulkan.hpp"

module RHI:Texture.Impl;
import :Texture;
import :Buffer;
import :CommandUtils;
import Core;

namespace RHI
{
    VulkanTexture::VulkanTexture(VulkanDevice& device, const TextureDesc& desc)
        : m_Device(device)
    {
        const size_t expected = static_cast<size_t>(desc.Width) * desc.Height * 4;
        if (desc.Width == 0 || desc.Height == 0 || desc.Rgba8Pixels.size() != expected)
        {
            Core::Log::Error("Texture '{}' data size mismatch: {}x{} needs {} bytes, got {}",
                             desc.DebugName, desc.Width, desc.Height, expected, desc.Rgba8Pixels.size());
            return;
        }

        if (!Upload(desc.Rgba8Pixels, desc.Width, desc.Height)) return;
        m_IsValid = CreateSampler(desc.Filter);
    }

    VulkanTexture::~VulkanTexture()
    {
        if (m_Sampler)
        {
            VkDevice logicalDevice = m_Device.GetLogicalDevice();
            VkSampler sampler = m_Sampler;

            m_Device.SafeDestroy([logicalDevice, sampler]()
            {
                vkDestroySampler(logicalDevice, sampler, nullptr);
            });
        }
    }

    bool VulkanTexture::CreateSampler(TextureFilter filter)
    {
        const VkFilter vkFilter = filter == TextureFilter::Nearest ? VK_FILTER_NEAREST : VK_FILTER_LINEAR;

        VkSamplerCreateInfo samplerInfo{};
        samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        samplerInfo.magFilter = vkFilter;
        samplerInfo.minFilter = vkFilter;
        samplerInfo.mipmapMode = VK_SAMPLER_MIPMAP_MODE_NEAREST;
        // Sheet cells sit edge to edge; repeat would bleed the opposite border in.
        samplerInfo.addressModeU = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.addressModeV = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.addressModeW = VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE;
        samplerInfo.anisotropyEnable = VK_FALSE;
        samplerInfo.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
        samplerInfo.unnormalizedCoordinates = VK_FALSE;
        samplerInfo.compareEnable = VK_FALSE;
        samplerInfo.compareOp = VK_COMPARE_OP_ALWAYS;
        samplerInfo.minLod = 0.0f;
        samplerInfo.maxLod = 0.0f;

        if (vkCreateSampler(m_Device.GetLogicalDevice(), &samplerInfo, nullptr, &m_Sampler) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create texture sampler!");
            m_Sampler = VK_NULL_HANDLE;
            return false;
        }
        return true;
    }

    bool VulkanTexture::Upload(std::span<const uint8_t> pixels, uint32_t width, uint32_t height)
    {
        VulkanBuffer stagingBuffer(m_Device, pixels.size_bytes(), VK_BUFFER_USAGE_TRANSFER_SRC_BIT);
        if (!stagingBuffer.IsValid() || !stagingBuffer.Write(pixels.data(), pixels.size_bytes()))
        {
            Core::Log::Error("Failed to stage {} bytes of texture data", pixels.size_bytes());
            return false;
        }

        m_Image = std::make_unique<VulkanImage>(
            m_Device, width, height, VK_FORMAT_R8G8B8A8_SRGB,
            VK_IMAGE_USAGE_TRANSFER_DST_BIT | VK_IMAGE_USAGE_SAMPLED_BIT,
            VK_IMAGE_ASPECT_COLOR_BIT);
        if (!m_Image->IsValid()) return false;

        auto result = CommandUtils::ExecuteImmediate(m_Device, [&](VkCommandBuffer cmd)
        {
            CommandUtils::TransitionImageLayout(cmd, m_Image->GetHandle(),
                                                VK_IMAGE_LAYOUT_UNDEFINED, VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL);

            VkBufferImageCopy region{};
            region.imageSubresource = {VK_IMAGE_ASPECT_COLOR_BIT, 0, 0, 1};
            region.imageExtent = {width, height, 1};
            vkCmdCopyBufferToImage(cmd, stagingBuffer.GetHandle(), m_Image->GetHandle(),
                                   VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL, 1, &region);

            CommandUtils::TransitionImageLayout(cmd, m_Image->GetHandle(),
                                                VK_IMAGE_LAYOUT_TRANSFER_DST_OPTIMAL,
                                                VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL);
        });

        if (!result)
        {
            Core::Log::Error("Texture upload failed: {}", Core::ErrorCodeToString(result.error()));
            return false;
        }
        return true;
    }
}
