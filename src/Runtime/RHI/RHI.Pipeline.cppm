module;
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Pipeline;

import :Device;
import :Shader;

export namespace RHI
{
    struct PipelineConfig
    {
        ShaderModule* VertexShader = nullptr;
        ShaderModule* FragmentShader = nullptr;

        std::vector<VkVertexInputBindingDescription> BindingDescriptions;
        std::vector<VkVertexInputAttributeDescription> AttributeDescriptions;
        std::vector<VkDescriptorSetLayout> DescriptorSetLayouts;

        VkFormat ColorFormat = VK_FORMAT_UNDEFINED;
        VkFormat DepthFormat = VK_FORMAT_UNDEFINED;

        bool DepthTest = false;
        bool DepthWrite = false;
        bool AlphaBlend = true;
    };

    class GraphicsPipeline
    {
    public:
        GraphicsPipeline(VulkanDevice& device, const PipelineConfig& config);
        ~GraphicsPipeline();

        GraphicsPipeline(const GraphicsPipeline&) = delete;
        GraphicsPipeline& operator=(const GraphicsPipeline&) = delete;

        [[nodiscard]] VkPipeline GetHandle() const { return m_Pipeline; }
        [[nodiscard]] VkPipelineLayout GetLayout() const { return m_Layout; }
        [[nodiscard]] bool IsValid() const { return m_Pipeline != VK_NULL_HANDLE; }

    private:
        VulkanDevice& m_Device;
        VkPipeline m_Pipeline = VK_NULL_HANDLE;
        VkPipelineLayout m_Layout = VK_NULL_HANDLE;

        bool CreateLayout(const std::vector<VkDescriptorSetLayout>& descriptorLayouts);
        void CreatePipeline(const PipelineConfig& config);
    };
}
