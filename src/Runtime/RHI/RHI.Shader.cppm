module;
#include <string>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Shader;

import :Device;

export namespace RHI
{
    enum class ShaderStage { Vertex, Fragment };

    // SPIR-V module loaded from disk. Only needed while a pipeline is built.
    class ShaderModule
    {
    public:
        ShaderModule(VulkanDevice& device, const std::string& filepath, ShaderStage stage);
        ~ShaderModule();

        ShaderModule(const ShaderModule&) = delete;
        ShaderModule& operator=(const ShaderModule&) = delete;

        [[nodiscard]] VkShaderModule GetHandle() const { return m_Module; }
        [[nodiscard]] bool IsValid() const { return m_Module != VK_NULL_HANDLE; }
        [[nodiscard]] VkPipelineShaderStageCreateInfo GetStageInfo() const;

    private:
        VulkanDevice& m_Device;
        VkShaderModule m_Module = VK_NULL_HANDLE;
        ShaderStage m_Stage;

        static std::vector<char> ReadFile(const std::string& filename);
    };
}
