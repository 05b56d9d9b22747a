module;

#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

module Graphics:FrameRenderer.Impl;

import :FrameRenderer;
import :RenderContext;
import :DrawBatcher;
import :Camera;
import :GeometryTemplate;
import :InstanceLayout;
import :MaterialCache;
import :PipelineLibrary;
import :TextureRegistry;
import :UiLayout;
import :VisualRecord;
import Core;
import RHI;

namespace Graphics
{
    FrameRenderer::FrameRenderer(RenderContext& context, DrawBatcher& batcher, Camera2D& camera,
                                 FrameRendererConfig config)
        : m_Context(context), m_Batcher(batcher), m_Camera(camera), m_Config(config)
    {
        Core::Log::Info("FrameRenderer: Initializing...");
        if (m_Config.MaxRecoveryAttempts == 0) m_Config.MaxRecoveryAttempts = 1;
    }

    FrameRenderer::~FrameRenderer()
    {
        Shutdown();
    }

    Core::Result FrameRenderer::Initialize()
    {
        RHI::IRenderDevice& device = m_Context.Device;
        m_Camera.SetDepthRange(m_Config.CameraDepthRange);

        auto buffer = device.CreateBuffer({
            .SizeBytes = sizeof(CameraUniform),
            .Usage = RHI::BufferUsage::Uniform,
            .Domain = RHI::BufferDomain::Dynamic,
            .DebugName = "CameraUniform"
        });
        if (!buffer)
        {
            Core::Log::Error("FrameRenderer: failed to create camera uniform ({})",
                             Core::ErrorCodeToString(buffer.error()));
            return Core::Err(buffer.error());
        }
        m_CameraBuffer = *buffer;

        auto group = device.CreateBindGroup({
            .Layout = RHI::BindGroupLayoutKind::Camera,
            .Uniform = m_CameraBuffer,
            .Texture = {}
        });
        if (!group)
        {
            Core::Log::Error("FrameRenderer: failed to create camera bind group ({})",
                             Core::ErrorCodeToString(group.error()));
            device.DestroyBuffer(m_CameraBuffer);
            m_CameraBuffer = {};
            return Core::Err(group.error());
        }
        m_CameraGroup = *group;

        m_Batcher.Begin();
        m_State = FrameState::Idle;
        m_Initialized = true;
        return Core::Ok();
    }

    void FrameRenderer::Shutdown()
    {
        if (!m_Initialized) return;

        RHI::IRenderDevice& device = m_Context.Device;
        if (m_CameraGroup.IsValid()) device.DestroyBindGroup(m_CameraGroup);
        if (m_CameraBuffer.IsValid()) device.DestroyBuffer(m_CameraBuffer);
        m_CameraGroup = {};
        m_CameraBuffer = {};
        m_Initialized = false;
    }

    void FrameRenderer::RequestReconfigure(RHI::Extent2D extent)
    {
        m_PendingExtent = extent;
    }

    void FrameRenderer::ResetAfterFatal()
    {
        m_Fatal = false;
        m_ConsecutiveFailures = 0;
        m_State = FrameState::Idle;
        m_Batcher.Begin();
        m_Context.Scissors.Reset();
    }

    Core::Expected<FrameStatus> FrameRenderer::RenderFrame()
    {
        if (m_Fatal) return Core::Err<FrameStatus>(Core::ErrorCode::DeviceLost);
        if (!m_Initialized) return Core::Err<FrameStatus>(Core::ErrorCode::InvalidState);
        if (m_State != FrameState::Idle)
        {
            Core::Log::Error("FrameRenderer: RenderFrame re-entered while in state {}", FrameStateName(m_State));
            return Core::Err<FrameStatus>(Core::ErrorCode::InvalidState);
        }

        auto result = ExecuteFrame();
        if (!result) return HandleFailure(result.error());

        m_ConsecutiveFailures = 0;
        CloseFrame(true);
        return FrameStatus::Presented;
    }

    Core::Result FrameRenderer::ExecuteFrame()
    {
        RHI::IRenderDevice& device = m_Context.Device;

        if (m_PendingExtent)
        {
            const RHI::Extent2D extent = *m_PendingExtent;
            m_PendingExtent.reset();
            if (extent != device.GetSurfaceExtent())
            {
                if (auto r = device.Reconfigure(extent); !r) return r;
            }
        }

        if (auto r = device.BeginFrame(); !r) return r;

        const CameraUniform& camera = m_Camera.GetUniform();
        device.WriteBuffer(m_CameraBuffer, &camera, sizeof(CameraUniform));
        m_State = FrameState::CameraUpdated;

        m_Batcher.End(device, m_Context.Textures);
        m_State = FrameState::BatchesCollected;

        auto target = device.AcquireSurface(m_Config.AcquireTimeoutNs);
        if (!target) return Core::Err(target.error());

        if (auto r = UploadBatches(); !r) return r;
        m_State = FrameState::Uploaded;

        RecordDraws(*target);
        if (auto r = device.Submit(); !r) return r;
        m_State = FrameState::Submitted;

        if (auto r = device.Present(); !r) return r;
        m_State = FrameState::Presented;
        return Core::Ok();
    }

    Core::Result FrameRenderer::UploadBatches()
    {
        RHI::IRenderDevice& device = m_Context.Device;
        const auto& batches = m_Batcher.GetBatches();

        m_BatchMaterials.assign(batches.size(), RHI::BindGroupHandle{});
        for (size_t i = 0; i < batches.size(); ++i)
        {
            const Batch& batch = batches[i];
            if (auto r = batch.Stream->Upload(device); !r) return r;

            if (!GetPipelineTraits(batch.Key.Kind).UsesMaterial) continue;

            auto material = m_Context.Materials.GetOrCreate(device, m_Context.Textures, batch.Key.Texture);
            if (!material)
            {
                Core::Log::Error("FrameRenderer: no material for texture {} ({})",
                                 batch.Key.Texture, Core::ErrorCodeToString(material.error()));
                return Core::Err(material.error());
            }
            m_BatchMaterials[i] = *material;
        }
        return Core::Ok();
    }

    void FrameRenderer::RecordDraws(const RHI::FrameTarget& target)
    {
        RHI::IRenderDevice& device = m_Context.Device;
        const auto& batches = m_Batcher.GetBatches();

        FrameStats stats{};
        device.BeginRenderPass(m_Config.ClearColor);
        device.BindVertexBuffer(kGeometryBinding, m_Context.Quad.GetVertexBuffer());
        device.BindIndexBuffer(m_Context.Quad.GetIndexBuffer());

        RHI::PipelineHandle boundPipeline{};
        for (size_t i = 0; i < batches.size(); ++i)
        {
            const Batch& batch = batches[i];
            const uint32_t count = batch.InstanceCount();
            if (count == 0) continue;

            const RHI::PipelineHandle pipeline = m_Context.Pipelines.Get(batch.Key.Kind);
            if (pipeline != boundPipeline)
            {
                device.BindPipeline(pipeline);
                device.BindGroup(0, m_CameraGroup);
                boundPipeline = pipeline;
                ++stats.PipelineBinds;
            }

            if (m_BatchMaterials[i].IsValid()) device.BindGroup(1, m_BatchMaterials[i]);

            device.BindVertexBuffer(kInstanceBinding, batch.Stream->GetBuffer());
            device.SetScissor(m_Context.Scissors.Resolve(batch.Key.Scissor, target.Extent));
            device.DrawIndexed(QuadGeometry::GetIndexCount(), count);

            ++stats.DrawCalls;
            stats.Instances += count;
        }

        device.EndRenderPass();
        m_LastStats = stats;
    }

    Core::Expected<FrameStatus> FrameRenderer::HandleFailure(Core::ErrorCode code)
    {
        const FrameState failedIn = m_State;

        if (!Core::IsTransientSurfaceError(code))
        {
            Core::Log::Error("FrameRenderer: fatal {} in state {}", Core::ErrorCodeToString(code), FrameStateName(failedIn));
            m_Fatal = true;
            CloseFrame(false);
            return Core::Err<FrameStatus>(code);
        }

        m_State = FrameState::Recovering;
        ++m_ConsecutiveFailures;

        if (m_ConsecutiveFailures > m_Config.MaxRecoveryAttempts)
        {
            Core::Log::Error("FrameRenderer: {} consecutive surface failures (last: {}), giving up",
                             m_ConsecutiveFailures, Core::ErrorCodeToString(code));
            m_Fatal = true;
            CloseFrame(false);
            return Core::Err<FrameStatus>(code);
        }

        Core::Log::Warn("FrameRenderer: {} in state {}, reconfiguring (attempt {}/{})",
                        Core::ErrorCodeToString(code), FrameStateName(failedIn),
                        m_ConsecutiveFailures, m_Config.MaxRecoveryAttempts);

        RHI::IRenderDevice& device = m_Context.Device;
        const RHI::Extent2D extent = m_PendingExtent.value_or(device.GetSurfaceExtent());
        m_PendingExtent.reset();

        if (auto r = device.Reconfigure(extent); !r)
        {
            if (!Core::IsTransientSurfaceError(r.error()))
            {
                Core::Log::Error("FrameRenderer: reconfigure failed ({})", Core::ErrorCodeToString(r.error()));
                m_Fatal = true;
                CloseFrame(false);
                return Core::Err<FrameStatus>(r.error());
            }
            Core::Log::Warn("FrameRenderer: reconfigure failed ({}), will retry next frame",
                            Core::ErrorCodeToString(r.error()));
        }

        CloseFrame(false);
        return FrameStatus::Skipped;
    }

    void FrameRenderer::CloseFrame(bool presented)
    {
        // Materials only age on frames that actually drew, so a run of skipped
        // frames does not flush the cache.
        if (presented) m_Context.Materials.EndFrame(m_Context.Device);

        m_Context.Scissors.Reset();
        m_Batcher.Begin();
        m_State = FrameState::Idle;
    }
}
