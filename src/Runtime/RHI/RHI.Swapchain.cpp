module;
#include <vector>
#include <algorithm>
#include <limits>
#include <cstdint>

#include "RHI.Vulkan.hpp"

module RHI:Swapchain.Impl;
import :Swapchain;
import Core;

namespace RHI
{
    VulkanSwapchain::VulkanSwapchain(VulkanDevice& device, Extent2D requestedExtent)
        : m_Device(device)
    {
        if (CreateSwapchain(requestedExtent))
        {
            CreateImageViews();
        }
    }

    VulkanSwapchain::~VulkanSwapchain()
    {
        Cleanup();
    }

    Core::Result VulkanSwapchain::Recreate(Extent2D requestedExtent)
    {
        if (requestedExtent.IsEmpty())
        {
            return Core::Err(Core::ErrorCode::SurfaceLost);
        }

        vkDeviceWaitIdle(m_Device.GetLogicalDevice());

        DestroyImageViews();

        VkSwapchainKHR oldSwapchain = m_Swapchain;
        auto result = CreateSwapchain(requestedExtent);

        if (oldSwapchain != VK_NULL_HANDLE && oldSwapchain != m_Swapchain)
        {
            vkDestroySwapchainKHR(m_Device.GetLogicalDevice(), oldSwapchain, nullptr);
        }
        if (!result)
        {
            // The old handle is retired either way; don't let anyone present to it.
            m_Swapchain = VK_NULL_HANDLE;
            m_Images.clear();
            return result;
        }

        CreateImageViews();
        return Core::Ok();
    }

    void VulkanSwapchain::DestroyImageViews()
    {
        for (auto imageView : m_ImageViews)
        {
            vkDestroyImageView(m_Device.GetLogicalDevice(), imageView, nullptr);
        }
        m_ImageViews.clear();
    }

    void VulkanSwapchain::Cleanup()
    {
        DestroyImageViews();
        m_Images.clear();

        if (m_Swapchain != VK_NULL_HANDLE)
        {
            vkDestroySwapchainKHR(m_Device.GetLogicalDevice(), m_Swapchain, nullptr);
            m_Swapchain = VK_NULL_HANDLE;
        }
    }

    Core::Result VulkanSwapchain::CreateSwapchain(Extent2D requestedExtent)
    {
        auto support = m_Device.QuerySwapchainSupport();
        if (support.Formats.empty() || support.PresentModes.empty())
        {
            Core::Log::Error("Surface reports no formats or present modes");
            return Core::Err(Core::ErrorCode::SurfaceLost);
        }

        VkSurfaceFormatKHR surfaceFormat = ChooseSwapSurfaceFormat(support.Formats);
        VkPresentModeKHR presentMode = ChooseSwapPresentMode(support.PresentModes);
        VkExtent2D extent = ChooseSwapExtent(support.Capabilities, requestedExtent);

        if (extent.width == 0 || extent.height == 0)
        {
            return Core::Err(Core::ErrorCode::SurfaceLost);
        }

        uint32_t imageCount = support.Capabilities.minImageCount + 1;
        if (support.Capabilities.maxImageCount > 0 && imageCount > support.Capabilities.maxImageCount)
        {
            imageCount = support.Capabilities.maxImageCount;
        }

        VkSwapchainCreateInfoKHR createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
        createInfo.surface = m_Device.GetSurface();
        createInfo.minImageCount = imageCount;
        createInfo.imageFormat = surfaceFormat.format;
        createInfo.imageColorSpace = surfaceFormat.colorSpace;
        createInfo.imageExtent = extent;
        createInfo.imageArrayLayers = 1;
        createInfo.imageUsage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;

        QueueFamilyIndices indices = m_Device.GetQueueIndices();
        uint32_t queueFamilyIndices[] = {indices.GraphicsFamily.value(), indices.PresentFamily.value()};

        if (indices.GraphicsFamily != indices.PresentFamily)
        {
            createInfo.imageSharingMode = VK_SHARING_MODE_CONCURRENT;
            createInfo.queueFamilyIndexCount = 2;
            createInfo.pQueueFamilyIndices = queueFamilyIndices;
        }
        else
        {
            createInfo.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
        }

        createInfo.preTransform = support.Capabilities.currentTransform;
        createInfo.compositeAlpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        createInfo.presentMode = presentMode;
        createInfo.clipped = VK_TRUE;
        createInfo.oldSwapchain = m_Swapchain;

        VkSwapchainKHR newSwapchain = VK_NULL_HANDLE;
        VkResult result = vkCreateSwapchainKHR(m_Device.GetLogicalDevice(), &createInfo, nullptr, &newSwapchain);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create swapchain! (VkResult {})", static_cast<int>(result));
            if (result == VK_ERROR_OUT_OF_DEVICE_MEMORY || result == VK_ERROR_OUT_OF_HOST_MEMORY)
            {
                return Core::Err(Core::ErrorCode::OutOfDeviceMemory);
            }
            return Core::Err(Core::ErrorCode::SurfaceLost);
        }
        m_Swapchain = newSwapchain;

        vkGetSwapchainImagesKHR(m_Device.GetLogicalDevice(), m_Swapchain, &imageCount, nullptr);
        m_Images.resize(imageCount);
        vkGetSwapchainImagesKHR(m_Device.GetLogicalDevice(), m_Swapchain, &imageCount, m_Images.data());

        m_ImageFormat = surfaceFormat.format;
        m_Extent = extent;

        Core::Log::Info("Swapchain Created/Resized: {}x{}", extent.width, extent.height);
        return Core::Ok();
    }

    void VulkanSwapchain::CreateImageViews()
    {
        m_ImageViews.resize(m_Images.size());
        for (size_t i = 0; i < m_Images.size(); i++)
        {
            VkImageViewCreateInfo createInfo{};
            createInfo.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
            createInfo.image = m_Images[i];
            createInfo.viewType = VK_IMAGE_VIEW_TYPE_2D;
            createInfo.format = m_ImageFormat;
            createInfo.components.r = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.components.g = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.components.b = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.components.a = VK_COMPONENT_SWIZZLE_IDENTITY;
            createInfo.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            createInfo.subresourceRange.baseMipLevel = 0;
            createInfo.subresourceRange.levelCount = 1;
            createInfo.subresourceRange.baseArrayLayer = 0;
            createInfo.subresourceRange.layerCount = 1;

            if (vkCreateImageView(m_Device.GetLogicalDevice(), &createInfo, nullptr, &m_ImageViews[i]) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create image views!");
                m_ImageViews[i] = VK_NULL_HANDLE;
            }
        }
    }

    VkSurfaceFormatKHR VulkanSwapchain::ChooseSwapSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats)
    {
        for (const auto& availableFormat : formats)
        {
            if (availableFormat.format == VK_FORMAT_B8G8R8A8_SRGB &&
                availableFormat.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR)
            {
                return availableFormat;
            }
        }
        return formats[0];
    }

    VkPresentModeKHR VulkanSwapchain::ChooseSwapPresentMode(const std::vector<VkPresentModeKHR>& presentModes)
    {
        for (const auto& availablePresentMode : presentModes)
        {
            if (availablePresentMode == VK_PRESENT_MODE_MAILBOX_KHR)
            {
                return availablePresentMode;
            }
        }
        return VK_PRESENT_MODE_FIFO_KHR;
    }

    VkExtent2D VulkanSwapchain::ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, Extent2D requestedExtent)
    {
        if (capabilities.currentExtent.width != std::numeric_limits<uint32_t>::max())
        {
            return capabilities.currentExtent;
        }

        VkExtent2D actualExtent = {requestedExtent.Width, requestedExtent.Height};
        actualExtent.width = std::clamp(actualExtent.width, capabilities.minImageExtent.width,
                                        capabilities.maxImageExtent.width);
        actualExtent.height = std::clamp(actualExtent.height, capabilities.minImageExtent.height,
                                         capabilities.maxImageExtent.height);
        return actualExtent;
    }
}
