module;

#include <string>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Context;

namespace RHI
{
    export struct ContextConfig
    {
        std::string AppName = "Mosaic App";
        bool EnableValidation = true;
        // Instance extensions demanded by the presentation layer (the window).
        std::vector<const char*> RequiredExtensions;
    };

    export class VulkanContext
    {
    public:
        explicit VulkanContext(const ContextConfig& config);
        ~VulkanContext();

        VulkanContext(const VulkanContext&) = delete;
        VulkanContext& operator=(const VulkanContext&) = delete;

        [[nodiscard]] VkInstance GetInstance() const { return m_Instance; }
        [[nodiscard]] bool IsValid() const { return m_Instance != VK_NULL_HANDLE; }

    private:
        VkInstance m_Instance = VK_NULL_HANDLE;
        VkDebugUtilsMessengerEXT m_DebugMessenger = VK_NULL_HANDLE;

        void CreateInstance(const ContextConfig& config);
        void SetupDebugMessenger();
    };
}
