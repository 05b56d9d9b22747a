module;

#include <cstdint>
#include <optional>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:FrameRenderer;

import Core;
import RHI;
import :RenderContext;
import :DrawBatcher;
import :Camera;

export namespace Graphics
{
    enum class FrameState : uint8_t
    {
        Idle,
        CameraUpdated,
        BatchesCollected,
        Uploaded,
        Submitted,
        Presented,
        Recovering
    };

    [[nodiscard]] constexpr const char* FrameStateName(FrameState state)
    {
        switch (state)
        {
        case FrameState::Idle: return "Idle";
        case FrameState::CameraUpdated: return "CameraUpdated";
        case FrameState::BatchesCollected: return "BatchesCollected";
        case FrameState::Uploaded: return "Uploaded";
        case FrameState::Submitted: return "Submitted";
        case FrameState::Presented: return "Presented";
        case FrameState::Recovering: return "Recovering";
        }
        return "Unknown";
    }

    enum class FrameStatus : uint8_t
    {
        Presented,
        Skipped
    };

    struct FrameRendererConfig
    {
        glm::vec4 ClearColor{0.4588f, 0.031f, 0.451f, 1.0f};
        uint64_t AcquireTimeoutNs = 100'000'000;
        uint32_t MaxRecoveryAttempts = 3;
        float CameraDepthRange = Camera2D::kDefaultDepthRange;
    };

    struct FrameStats
    {
        uint32_t DrawCalls = 0;
        uint32_t PipelineBinds = 0;
        uint32_t Instances = 0;
    };

    // Drives one frame through the device:
    //
    //   Idle -> CameraUpdated -> BatchesCollected -> Uploaded -> Submitted
    //        -> Presented -> Idle
    //
    // Transient surface failures pass through Recovering, reconfigure the
    // device and report the frame as Skipped. More than MaxRecoveryAttempts
    // of them in a row, or any other failure, is fatal: the error is returned
    // and every later call fails with DeviceLost until ResetAfterFatal.
    class FrameRenderer
    {
    public:
        FrameRenderer(RenderContext& context, DrawBatcher& batcher, Camera2D& camera,
                      FrameRendererConfig config = {});
        ~FrameRenderer();

        FrameRenderer(const FrameRenderer&) = delete;
        FrameRenderer& operator=(const FrameRenderer&) = delete;

        // Creates the camera uniform and its bind group and opens the first
        // batching frame.
        [[nodiscard]] Core::Result Initialize();
        void Shutdown();

        [[nodiscard]] Core::Expected<FrameStatus> RenderFrame();

        // Applied before the next frame starts.
        void RequestReconfigure(RHI::Extent2D extent);
        void ResetAfterFatal();

        [[nodiscard]] FrameState GetState() const { return m_State; }
        [[nodiscard]] bool IsFatal() const { return m_Fatal; }
        [[nodiscard]] uint32_t GetConsecutiveFailures() const { return m_ConsecutiveFailures; }
        [[nodiscard]] const FrameStats& GetLastFrameStats() const { return m_LastStats; }
        [[nodiscard]] const FrameRendererConfig& GetConfig() const { return m_Config; }

    private:
        [[nodiscard]] Core::Result ExecuteFrame();
        [[nodiscard]] Core::Result UploadBatches();
        void RecordDraws(const RHI::FrameTarget& target);
        [[nodiscard]] Core::Expected<FrameStatus> HandleFailure(Core::ErrorCode code);
        void CloseFrame(bool presented);

        RenderContext& m_Context;
        DrawBatcher& m_Batcher;
        Camera2D& m_Camera;
        FrameRendererConfig m_Config;

        RHI::BufferHandle m_CameraBuffer{};
        RHI::BindGroupHandle m_CameraGroup{};

        // Material group per batch, parallel to the batcher's batch list.
        std::vector<RHI::BindGroupHandle> m_BatchMaterials;

        std::optional<RHI::Extent2D> m_PendingExtent;
        FrameState m_State = FrameState::Idle;
        FrameStats m_LastStats{};
        uint32_t m_ConsecutiveFailures = 0;
        bool m_Fatal = false;
        bool m_Initialized = false;
    };
}
