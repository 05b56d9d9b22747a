module;
#include <vector>
#include <cstdint>

#include "RHI.Vulkan.hpp"

export module RHI:Swapchain;

import :Device;
import :Types;
import Core;

namespace RHI
{
    // Presentation images for the device's surface. The size comes from the
    // caller so the swapchain never has to poll the window itself.
    export class VulkanSwapchain
    {
    public:
        VulkanSwapchain(VulkanDevice& device, Extent2D requestedExtent);
        ~VulkanSwapchain();

        VulkanSwapchain(const VulkanSwapchain&) = delete;
        VulkanSwapchain& operator=(const VulkanSwapchain&) = delete;

        // Rebuilds against the surface's current capabilities, handing the old
        // swapchain to the driver. A zero extent (minimized) leaves the
        // swapchain untouched and reports SurfaceLost.
        [[nodiscard]] Core::Result Recreate(Extent2D requestedExtent);

        [[nodiscard]] VkSwapchainKHR GetHandle() const { return m_Swapchain; }
        [[nodiscard]] VkFormat GetImageFormat() const { return m_ImageFormat; }
        [[nodiscard]] VkExtent2D GetExtent() const { return m_Extent; }
        [[nodiscard]] bool IsValid() const { return m_Swapchain != VK_NULL_HANDLE; }

        [[nodiscard]] const std::vector<VkImageView>& GetImageViews() const { return m_ImageViews; }
        [[nodiscard]] const std::vector<VkImage>& GetImages() const { return m_Images; }

    private:
        VulkanDevice& m_Device;

        VkSwapchainKHR m_Swapchain = VK_NULL_HANDLE;
        std::vector<VkImage> m_Images;
        std::vector<VkImageView> m_ImageViews;

        VkFormat m_ImageFormat = VK_FORMAT_UNDEFINED;
        VkExtent2D m_Extent{};

        Core::Result CreateSwapchain(Extent2D requestedExtent);
        void CreateImageViews();
        void DestroyImageViews();
        void Cleanup();

        static VkSurfaceFormatKHR ChooseSwapSurfaceFormat(const std::vector<VkSurfaceFormatKHR>& formats);
        static VkPresentModeKHR ChooseSwapPresentMode(const std::vector<VkPresentModeKHR>& presentModes);
        static VkExtent2D ChooseSwapExtent(const VkSurfaceCapabilitiesKHR& capabilities, Extent2D requestedExtent);
    };
}
