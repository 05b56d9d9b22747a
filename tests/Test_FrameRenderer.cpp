#include <gtest/gtest.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <glm/glm.hpp>

import Core;
import RHI;
import Graphics;

#include "FakeRenderDevice.h"

using namespace Graphics;

class FrameRendererTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(Textures.Initialize(Device).has_value());
        ASSERT_TRUE(Quad.Create(Device).has_value());
        ASSERT_TRUE(Pipelines.Build(Device, "shaders").has_value());

        for (TextureId& id : Sheets)
        {
            auto registered = Textures.Register(Device,
                                                ProceduralImages::SolidColor(64, 64, Color::White),
                                                ProceduralImages::SpriteGridSheet(2, 2, 32, 1));
            ASSERT_TRUE(registered.has_value());
            id = *registered;
        }

        Camera.Update(glm::vec2(0.0f), 1.0f, glm::vec2(800.0f, 600.0f));
        Renderer = std::make_unique<FrameRenderer>(Context, Batcher, Camera, Config);
        ASSERT_TRUE(Renderer->Initialize().has_value());
    }

    void TearDown() override
    {
        Renderer.reset();
        Batcher.Release(Device);
        Materials.Clear(Device);
        Pipelines.Release(Device);
        Quad.Release(Device);
        Textures.Release(Device);
    }

    void SubmitSprite(TextureId texture, float layer = 0.0f)
    {
        VisualRecord record;
        record.Kind = PipelineKind::Sprite;
        record.Texture = texture;
        record.Layer = layer;
        ASSERT_TRUE(Batcher.Submit(Textures, record));
    }

    void SubmitRect(ScissorId scissor = kNoScissor)
    {
        VisualRecord record = MakeUiRect({10.0f, 10.0f, 100.0f, 50.0f}, 1, glm::vec2(800.0f, 600.0f),
                                         {.Fill = Color::Blue, .Outline = 0, .CornerRadius = {}, .Scissor = scissor});
        ASSERT_TRUE(Batcher.Submit(Textures, record));
    }

    FakeRenderDevice Device;
    TextureRegistry Textures;
    MaterialCache Materials;
    PipelineLibrary Pipelines;
    QuadGeometry Quad;
    ScissorTable Scissors;
    RenderContext Context{Device, Textures, Materials, Pipelines, Quad, Scissors};

    DrawBatcher Batcher;
    Camera2D Camera;
    FrameRendererConfig Config{};
    std::unique_ptr<FrameRenderer> Renderer;
    TextureId Sheets[2]{};
};

TEST(FrameRenderer, RenderBeforeInitializeIsInvalidState)
{
    FakeRenderDevice device;
    TextureRegistry textures;
    MaterialCache materials;
    PipelineLibrary pipelines;
    QuadGeometry quad;
    ScissorTable scissors;
    RenderContext context{device, textures, materials, pipelines, quad, scissors};
    DrawBatcher batcher;
    Camera2D camera;

    FrameRenderer renderer(context, batcher, camera);
    auto status = renderer.RenderFrame();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error(), Core::ErrorCode::InvalidState);
}

TEST_F(FrameRendererTest, DrawsOneCallPerBatch)
{
    for (int i = 0; i < 10; ++i) SubmitSprite(Sheets[i % 2]);
    SubmitRect();
    SubmitRect();

    auto status = Renderer->RenderFrame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, FrameStatus::Presented);
    EXPECT_EQ(Renderer->GetState(), FrameState::Idle);

    ASSERT_EQ(Device.Draws.size(), 3u);
    EXPECT_EQ(Renderer->GetLastFrameStats().DrawCalls, 3u);
    EXPECT_EQ(Renderer->GetLastFrameStats().Instances, 12u);
    EXPECT_EQ(Renderer->GetLastFrameStats().PipelineBinds, 2u);
    EXPECT_EQ(Device.PipelineBinds, 2u);

    EXPECT_EQ(Device.Draws[0].Pipeline, Pipelines.Get(PipelineKind::Sprite));
    EXPECT_EQ(Device.Draws[0].InstanceCount, 5u);
    EXPECT_EQ(Device.Draws[1].InstanceCount, 5u);
    EXPECT_NE(Device.Draws[0].Material, Device.Draws[1].Material);
    EXPECT_EQ(Device.Draws[2].Pipeline, Pipelines.Get(PipelineKind::UIRect));
    EXPECT_EQ(Device.Draws[2].InstanceCount, 2u);

    for (const auto& draw : Device.Draws)
    {
        EXPECT_EQ(draw.IndexCount, 6u);
        EXPECT_TRUE(draw.Camera.IsValid());
        EXPECT_TRUE(draw.Instances.IsValid());
        EXPECT_EQ(draw.Scissor, (RHI::ScissorRect{0, 0, 800, 600}));
    }

    EXPECT_EQ(Device.BoundGeometry, Quad.GetVertexBuffer());
    EXPECT_EQ(Device.BoundIndices, Quad.GetIndexBuffer());
    EXPECT_EQ(Device.PresentCount, 1u);
    EXPECT_EQ(Device.LastAcquireTimeout, Config.AcquireTimeoutNs);
    EXPECT_FLOAT_EQ(Device.LastClearColor.r, Config.ClearColor.r);
}

TEST_F(FrameRendererTest, EmptyFrameStillPresents)
{
    auto status = Renderer->RenderFrame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, FrameStatus::Presented);
    EXPECT_TRUE(Device.Draws.empty());
    EXPECT_EQ(Device.RenderPassCount, 1u);
}

TEST_F(FrameRendererTest, RecordsDoNotCarryOverFrames)
{
    SubmitSprite(Sheets[0]);
    ASSERT_TRUE(Renderer->RenderFrame().has_value());
    EXPECT_EQ(Device.Draws.size(), 1u);

    ASSERT_TRUE(Renderer->RenderFrame().has_value());
    EXPECT_TRUE(Device.Draws.empty());
}

TEST_F(FrameRendererTest, SurfaceLostSkipsThenRecovers)
{
    Device.AcquireError = Core::ErrorCode::SurfaceLost;
    Device.ReconfigureClearsAcquireError = true;
    SubmitSprite(Sheets[0]);

    auto first = Renderer->RenderFrame();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, FrameStatus::Skipped);
    EXPECT_EQ(Device.ReconfigureCount, 1u);
    EXPECT_EQ(Device.PresentCount, 0u);
    EXPECT_EQ(Renderer->GetConsecutiveFailures(), 1u);
    EXPECT_EQ(Renderer->GetState(), FrameState::Idle);

    SubmitSprite(Sheets[0]);
    auto second = Renderer->RenderFrame();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, FrameStatus::Presented);
    EXPECT_EQ(Renderer->GetConsecutiveFailures(), 0u);
    EXPECT_EQ(Device.PresentCount, 1u);
    ASSERT_EQ(Device.Draws.size(), 1u);
    EXPECT_EQ(Device.Draws[0].InstanceCount, 1u);
}

TEST_F(FrameRendererTest, PresentFailureIsRecoverable)
{
    Device.PresentError = Core::ErrorCode::SwapchainOutOfDate;

    auto skipped = Renderer->RenderFrame();
    ASSERT_TRUE(skipped.has_value());
    EXPECT_EQ(*skipped, FrameStatus::Skipped);

    Device.PresentError.reset();
    auto presented = Renderer->RenderFrame();
    ASSERT_TRUE(presented.has_value());
    EXPECT_EQ(*presented, FrameStatus::Presented);
}

TEST_F(FrameRendererTest, RepeatedFailuresBecomeFatal)
{
    Device.AcquireError = Core::ErrorCode::SurfaceTimeout;

    for (uint32_t attempt = 0; attempt < Config.MaxRecoveryAttempts; ++attempt)
    {
        auto status = Renderer->RenderFrame();
        ASSERT_TRUE(status.has_value()) << "attempt " << attempt;
        EXPECT_EQ(*status, FrameStatus::Skipped);
    }

    auto fatal = Renderer->RenderFrame();
    ASSERT_FALSE(fatal.has_value());
    EXPECT_EQ(fatal.error(), Core::ErrorCode::SurfaceTimeout);
    EXPECT_TRUE(Renderer->IsFatal());

    auto after = Renderer->RenderFrame();
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error(), Core::ErrorCode::DeviceLost);

    Device.AcquireError.reset();
    Renderer->ResetAfterFatal();
    auto recovered = Renderer->RenderFrame();
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, FrameStatus::Presented);
}

TEST_F(FrameRendererTest, OutOfMemoryOnGrowthIsFatal)
{
    SubmitSprite(Sheets[0]);
    Device.CreateBufferError = Core::ErrorCode::OutOfDeviceMemory;

    auto status = Renderer->RenderFrame();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error(), Core::ErrorCode::OutOfDeviceMemory);
    EXPECT_TRUE(Renderer->IsFatal());
    EXPECT_EQ(Device.ReconfigureCount, 0u);
    EXPECT_EQ(Renderer->GetState(), FrameState::Idle);
}

TEST_F(FrameRendererTest, ReconfigureFailureIsFatal)
{
    Device.AcquireError = Core::ErrorCode::SurfaceLost;
    Device.ReconfigureError = Core::ErrorCode::OutOfDeviceMemory;

    auto status = Renderer->RenderFrame();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error(), Core::ErrorCode::OutOfDeviceMemory);
    EXPECT_TRUE(Renderer->IsFatal());
}

TEST_F(FrameRendererTest, ReentrantRenderFrameIsRejected)
{
    std::optional<Core::Expected<FrameStatus>> inner;
    Device.OnPresent = [&] { inner = Renderer->RenderFrame(); };

    auto outer = Renderer->RenderFrame();
    ASSERT_TRUE(outer.has_value());
    EXPECT_EQ(*outer, FrameStatus::Presented);

    ASSERT_TRUE(inner.has_value());
    ASSERT_FALSE(inner->has_value());
    EXPECT_EQ(inner->error(), Core::ErrorCode::InvalidState);
}

TEST_F(FrameRendererTest, PendingResizeAppliedBeforeFrame)
{
    Renderer->RequestReconfigure({1024, 768});
    ASSERT_TRUE(Renderer->RenderFrame().has_value());

    ASSERT_EQ(Device.ReconfigureExtents.size(), 1u);
    EXPECT_EQ(Device.ReconfigureExtents[0], (RHI::Extent2D{1024, 768}));
    EXPECT_EQ(Device.GetSurfaceExtent(), (RHI::Extent2D{1024, 768}));

    // Same extent again is a no-op.
    Renderer->RequestReconfigure({1024, 768});
    ASSERT_TRUE(Renderer->RenderFrame().has_value());
    EXPECT_EQ(Device.ReconfigureCount, 1u);
}

TEST_F(FrameRendererTest, ScissorResolvedPerBatch)
{
    const ScissorId clip = Scissors.Define({10, 20, 100, 50});
    SubmitRect(clip);

    ASSERT_TRUE(Renderer->RenderFrame().has_value());
    ASSERT_EQ(Device.Draws.size(), 1u);
    EXPECT_EQ(Device.Draws[0].Scissor, (RHI::ScissorRect{10, 20, 100, 50}));
    EXPECT_EQ(Scissors.Size(), 0u);
}

TEST_F(FrameRendererTest, MaterialsAgeOnlyOnPresentedFrames)
{
    SubmitSprite(Sheets[0]);
    ASSERT_TRUE(Renderer->RenderFrame().has_value());
    EXPECT_TRUE(Materials.Contains(Sheets[0]));

    // A skipped frame does not count as an unused frame.
    Device.AcquireError = Core::ErrorCode::SurfaceTimeout;
    Device.ReconfigureClearsAcquireError = true;
    auto skipped = Renderer->RenderFrame();
    ASSERT_TRUE(skipped.has_value());
    EXPECT_EQ(*skipped, FrameStatus::Skipped);
    EXPECT_TRUE(Materials.Contains(Sheets[0]));

    // A presented frame without the texture evicts it.
    ASSERT_TRUE(Renderer->RenderFrame().has_value());
    EXPECT_FALSE(Materials.Contains(Sheets[0]));
}

TEST_F(FrameRendererTest, UnregisteredTextureDrawsPlaceholder)
{
    VisualRecord record;
    record.Kind = PipelineKind::Sprite;
    record.Texture = 77;
    ASSERT_TRUE(Batcher.Submit(Textures, record));

    ASSERT_TRUE(Renderer->RenderFrame().has_value());
    ASSERT_EQ(Device.Draws.size(), 1u);
    EXPECT_TRUE(Materials.Contains(kPlaceholderTexture));

    const RHI::BindGroupDesc* material = Device.FindBindGroup(Device.Draws[0].Material);
    ASSERT_NE(material, nullptr);
    EXPECT_EQ(material->Texture, Textures.GetTexture(kPlaceholderTexture));
}

TEST_F(FrameRendererTest, UiImageSamplesItsSheet)
{
    SubmitRect();
    ASSERT_TRUE(Batcher.Submit(Textures, MakeUiImage({20.0f, 20.0f, 32.0f, 32.0f}, 1, glm::vec2(800.0f, 600.0f),
                                                     Sheets[1], 3)));

    auto status = Renderer->RenderFrame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, FrameStatus::Presented);

    ASSERT_EQ(Device.Draws.size(), 2u);
    EXPECT_EQ(Device.Draws[0].Pipeline, Pipelines.Get(PipelineKind::UIRect));
    EXPECT_EQ(Device.Draws[1].Pipeline, Pipelines.Get(PipelineKind::UIImage));
    EXPECT_EQ(Device.Draws[1].InstanceCount, 1u);
    EXPECT_TRUE(Materials.Contains(Sheets[1]));

    const RHI::BindGroupDesc* material = Device.FindBindGroup(Device.Draws[1].Material);
    ASSERT_NE(material, nullptr);
    EXPECT_EQ(material->Texture, Textures.GetTexture(Sheets[1]));
}

TEST_F(FrameRendererTest, TextureUnregisteredAfterSubmitStillPresents)
{
    SubmitSprite(Sheets[1]);
    ASSERT_TRUE(Batcher.Submit(Textures, MakeUiImage({0.0f, 0.0f, 16.0f, 16.0f}, 1, glm::vec2(800.0f, 600.0f),
                                                     Sheets[1], 2)));
    ASSERT_TRUE(Textures.Unregister(Device, Sheets[1]).has_value());

    auto status = Renderer->RenderFrame();
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(*status, FrameStatus::Presented);
    EXPECT_EQ(Renderer->GetState(), FrameState::Idle);

    ASSERT_EQ(Device.Draws.size(), 2u);
    EXPECT_FALSE(Materials.Contains(Sheets[1]));
    for (const auto& draw : Device.Draws)
    {
        const RHI::BindGroupDesc* material = Device.FindBindGroup(draw.Material);
        ASSERT_NE(material, nullptr);
        EXPECT_EQ(material->Texture, Textures.GetTexture(kPlaceholderTexture));
    }
}
