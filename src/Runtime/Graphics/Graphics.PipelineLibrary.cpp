module;

#include <array>
#include <string>

module Graphics:PipelineLibrary.Impl;

import :PipelineLibrary;
import :InstanceLayout;
import :VisualRecord;
import Core;
import RHI;

namespace Graphics
{
    namespace
    {
        std::string JoinPath(const std::string& directory, const char* file)
        {
            if (directory.empty()) return file;
            if (directory.back() == '/') return directory + file;
            return directory + "/" + file;
        }
    }

    Core::Result PipelineLibrary::Build(RHI::IRenderDevice& device, const std::string& shaderDirectory)
    {
        Release(device);

        for (uint32_t i = 0; i < kPipelineKindCount; ++i)
        {
            const auto kind = static_cast<PipelineKind>(i);
            const PipelineTraits& traits = kPipelineTraits[i];

            const std::array<RHI::VertexBufferLayout, 2> layouts = {{
                {sizeof(QuadVertex), RHI::VertexStepRate::Vertex, QuadVertexAttributes},
                {traits.InstanceStride, RHI::VertexStepRate::Instance, traits.InstanceAttributes},
            }};

            RHI::PipelineDesc desc{
                .DebugName = PipelineKindName(kind),
                .VertexShaderPath = JoinPath(shaderDirectory, traits.VertexShader),
                .FragmentShaderPath = JoinPath(shaderDirectory, traits.FragmentShader),
                .VertexLayouts = layouts,
                .UsesMaterial = traits.UsesMaterial,
                .DepthTest = traits.DepthTest,
                .DepthWrite = traits.DepthWrite,
                .Blend = RHI::BlendMode::AlphaBlend
            };

            auto pipeline = device.CreatePipeline(desc);
            if (!pipeline)
            {
                Core::Log::Error("PipelineLibrary: failed to build '{}' pipeline ({})",
                                 PipelineKindName(kind), Core::ErrorCodeToString(pipeline.error()));
                Release(device);
                return Core::Err(pipeline.error());
            }
            m_Pipelines[i] = *pipeline;
        }

        m_Built = true;
        Core::Log::Info("PipelineLibrary: built {} pipelines from '{}'", kPipelineKindCount, shaderDirectory);
        return Core::Ok();
    }

    void PipelineLibrary::Release(RHI::IRenderDevice& device)
    {
        for (auto& handle : m_Pipelines)
        {
            if (handle.IsValid()) device.DestroyPipeline(handle);
            handle = {};
        }
        m_Built = false;
    }
}
