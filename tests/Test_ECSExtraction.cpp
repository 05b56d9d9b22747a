#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

import Core;
import RHI;
import Graphics;
import ECS;

#include "FakeRenderDevice.h"

using namespace ECS::Components;

class ECSExtractionTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(Textures.Initialize(Device).has_value());
        auto id = Textures.Register(Device,
                                    Graphics::ProceduralImages::SolidColor(128, 128, Graphics::Color::White),
                                    Graphics::ProceduralImages::SpriteGridSheet(4, 4, 32, 2));
        ASSERT_TRUE(id.has_value());
        Sheet = *id;

        Camera.Update(glm::vec2(0.0f), 1.0f, Viewport);
    }

    void TearDown() override
    {
        Textures.Release(Device);
    }

    entt::entity SpawnSprite(const char* name, glm::vec2 position, float layer = 0.0f)
    {
        entt::entity e = World.CreateEntity(name);
        World.GetRegistry().get<Transform::Component>(e).Position = position;
        World.GetRegistry().emplace<Sprite::Component>(e, Sheet, 0u, false, layer);
        return e;
    }

    void RunCulling()
    {
        ECS::Systems::Visibility::AssignMissingCullSizes(World.GetRegistry(), Textures, CullScratch);
        ECS::Systems::Visibility::OnUpdate(World.GetRegistry(), Camera.GetFrustum(), CullScratch);
    }

    std::vector<Graphics::VisualRecord> Extract()
    {
        std::vector<Graphics::VisualRecord> records;
        ECS::Systems::VisualExtraction::OnUpdate(World.GetRegistry(), Viewport,
                                                 [&](const Graphics::VisualRecord& r) { records.push_back(r); },
                                                 ExtractScratch);
        return records;
    }

    const glm::vec2 Viewport{800.0f, 600.0f};
    FakeRenderDevice Device;
    Graphics::TextureRegistry Textures;
    Graphics::Camera2D Camera;
    ECS::Scene World;
    Graphics::TextureId Sheet = Graphics::kPlaceholderTexture;
    ECS::Systems::Visibility::Scratch CullScratch;
    ECS::Systems::VisualExtraction::Scratch ExtractScratch;
};

TEST_F(ECSExtractionTest, SceneCountsEntities)
{
    const entt::entity a = World.CreateEntity("A");
    World.CreateEntity("B");
    EXPECT_EQ(World.Size(), 2u);
    EXPECT_EQ(World.GetRegistry().get<NameTag::Component>(a).Name, "A");

    World.DestroyEntity(a);
    World.DestroyEntity(a);
    EXPECT_EQ(World.Size(), 1u);
}

TEST_F(ECSExtractionTest, CullSizeComesFromSheet)
{
    const entt::entity e = SpawnSprite("S", glm::vec2(0.0f));
    World.GetRegistry().emplace<Culling::CullSize>(SpawnSprite("Preset", glm::vec2(0.0f)), 5.0f);

    ECS::Systems::Visibility::AssignMissingCullSizes(World.GetRegistry(), Textures, CullScratch);

    ASSERT_TRUE(World.GetRegistry().all_of<Culling::CullSize>(e));
    EXPECT_FLOAT_EQ(World.GetRegistry().get<Culling::CullSize>(e).Radius, 32.0f);

    auto view = World.GetRegistry().view<Culling::CullSize>();
    uint32_t preset = 0;
    for (auto [entity, cull] : view.each())
        if (cull.Radius == 5.0f) ++preset;
    EXPECT_EQ(preset, 1u);
}

TEST_F(ECSExtractionTest, OnlyVisibleSpritesAreSubmitted)
{
    const entt::entity inside = SpawnSprite("Inside", glm::vec2(100.0f, 50.0f));
    const entt::entity outside = SpawnSprite("Outside", glm::vec2(5000.0f, 0.0f));
    RunCulling();

    EXPECT_TRUE(World.GetRegistry().all_of<Culling::VisibleTag>(inside));
    EXPECT_FALSE(World.GetRegistry().all_of<Culling::VisibleTag>(outside));

    const auto records = Extract();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].Kind, Graphics::PipelineKind::Sprite);
    EXPECT_FLOAT_EQ(records[0].Position.x, 100.0f);
    EXPECT_EQ(records[0].Texture, Sheet);
}

TEST_F(ECSExtractionTest, VisibilityFollowsMovement)
{
    const entt::entity e = SpawnSprite("Mover", glm::vec2(0.0f));
    RunCulling();
    EXPECT_TRUE(World.GetRegistry().all_of<Culling::VisibleTag>(e));

    World.GetRegistry().get<Transform::Component>(e).Position = glm::vec2(-9000.0f, 0.0f);
    RunCulling();
    EXPECT_FALSE(World.GetRegistry().all_of<Culling::VisibleTag>(e));
}

TEST_F(ECSExtractionTest, ScaleGrowsCullRadius)
{
    // Centre 40 units beyond the right edge; a 32 radius misses, 3x scale reaches in.
    const entt::entity e = SpawnSprite("Big", glm::vec2(440.0f, 0.0f));
    RunCulling();
    EXPECT_FALSE(World.GetRegistry().all_of<Culling::VisibleTag>(e));

    World.GetRegistry().get<Transform::Component>(e).Scale = glm::vec2(-3.0f, 1.0f);
    RunCulling();
    EXPECT_TRUE(World.GetRegistry().all_of<Culling::VisibleTag>(e));
}

TEST_F(ECSExtractionTest, SpritesEmittedInLayerOrder)
{
    SpawnSprite("Top", glm::vec2(0.0f), 5.0f);
    SpawnSprite("Bottom", glm::vec2(0.0f), -1.0f);
    SpawnSprite("Middle", glm::vec2(0.0f), 2.0f);
    RunCulling();

    const auto records = Extract();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_FLOAT_EQ(records[0].Layer, -1.0f);
    EXPECT_FLOAT_EQ(records[1].Layer, 2.0f);
    EXPECT_FLOAT_EQ(records[2].Layer, 5.0f);
}

TEST_F(ECSExtractionTest, UiComponentsAlwaysSubmitted)
{
    const entt::entity panel = World.CreateEntity("Panel");
    World.GetRegistry().emplace<UiRect::Component>(panel, UiRect::Component{
        .Rect = {0.0f, 0.0f, 400.0f, 300.0f},
        .Layer = 2,
        .Fill = Graphics::Color::Transparent,
        .Outline = Graphics::Color::Red,
        .CornerRadius = {0.02f, 0.02f},
        .Scissor = Graphics::kNoScissor
    });

    const entt::entity glyph = World.CreateEntity("Glyph");
    World.GetRegistry().emplace<Glyph::Component>(glyph, Glyph::Component{
        .Rect = {10.0f, 10.0f, 8.0f, 16.0f},
        .Layer = 3,
        .Atlas = Sheet,
        .Color = Graphics::Color::White,
        .Scissor = Graphics::kNoScissor
    });

    RunCulling();
    const auto records = Extract();
    ASSERT_EQ(records.size(), 2u);

    EXPECT_EQ(records[0].Kind, Graphics::PipelineKind::UIRect);
    EXPECT_FLOAT_EQ(records[0].Position.x, 0.25f);
    EXPECT_FLOAT_EQ(records[0].Position.y, 0.75f);
    EXPECT_EQ(records[0].OutlineColor, Graphics::Color::Red);

    EXPECT_EQ(records[1].Kind, Graphics::PipelineKind::Glyph);
    EXPECT_EQ(records[1].Texture, Sheet);
    EXPECT_FLOAT_EQ(records[1].Layer, 3.0f);
}

TEST_F(ECSExtractionTest, NanLayerSortsLast)
{
    SpawnSprite("Broken", glm::vec2(0.0f), std::numeric_limits<float>::quiet_NaN());
    SpawnSprite("High", glm::vec2(0.0f), 4.0f);
    SpawnSprite("Low", glm::vec2(0.0f), 1.0f);
    RunCulling();

    const auto records = Extract();
    ASSERT_EQ(records.size(), 3u);
    EXPECT_FLOAT_EQ(records[0].Layer, 1.0f);
    EXPECT_FLOAT_EQ(records[1].Layer, 4.0f);
    EXPECT_TRUE(std::isnan(records[2].Layer));
}

TEST_F(ECSExtractionTest, UiImagesAreSubmittedWithTheirCell)
{
    const entt::entity icon = World.CreateEntity("Icon");
    World.GetRegistry().emplace<UiImage::Component>(icon, UiImage::Component{
        .Rect = {400.0f, 0.0f, 80.0f, 60.0f},
        .Layer = 4,
        .Sheet = Sheet,
        .Index = 6,
        .Flip = true,
        .Tint = Graphics::Color::Green,
        .Scissor = Graphics::kNoScissor
    });

    const auto records = Extract();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].Kind, Graphics::PipelineKind::UIImage);
    EXPECT_EQ(records[0].Texture, Sheet);
    EXPECT_EQ(records[0].SpriteIndex, 6u);
    EXPECT_TRUE(records[0].Flip);
    EXPECT_EQ(records[0].Color, Graphics::Color::Green);
    EXPECT_FLOAT_EQ(records[0].Position.x, 0.55f);
    EXPECT_FLOAT_EQ(records[0].Position.y, 0.95f);
    EXPECT_FLOAT_EQ(records[0].Scale.x, 0.1f);
}

TEST_F(ECSExtractionTest, ScratchStorageIsReusedAcrossFrames)
{
    for (int i = 0; i < 20; ++i)
        SpawnSprite("S", glm::vec2(static_cast<float>(i), 0.0f), static_cast<float>(20 - i));
    RunCulling();
    ASSERT_EQ(Extract().size(), 20u);

    const Graphics::VisualRecord* sprites = ExtractScratch.Sprites.data();
    const size_t capacity = ExtractScratch.Sprites.capacity();
    const size_t cullCapacity = CullScratch.Entered.capacity();

    RunCulling();
    ASSERT_EQ(Extract().size(), 20u);
    EXPECT_EQ(ExtractScratch.Sprites.data(), sprites);
    EXPECT_EQ(ExtractScratch.Sprites.capacity(), capacity);
    EXPECT_EQ(CullScratch.Entered.capacity(), cullCapacity);
    EXPECT_TRUE(CullScratch.Entered.empty());
}

TEST_F(ECSExtractionTest, SyncCameraUsesFirstActiveCamera)
{
    Graphics::Camera2D camera;
    camera.SetViewport(Viewport);
    EXPECT_FALSE(ECS::Systems::VisualExtraction::SyncCamera(World.GetRegistry(), camera));

    const entt::entity inactive = World.CreateEntity("Inactive");
    World.GetRegistry().emplace<ECS::Components::Camera::Component>(inactive, 4.0f, false);

    const entt::entity active = World.CreateEntity("Active");
    World.GetRegistry().get<Transform::Component>(active).Position = glm::vec2(30.0f, 40.0f);
    World.GetRegistry().get<Transform::Component>(active).Rotation = 0.5f;
    World.GetRegistry().emplace<ECS::Components::Camera::Component>(active, 2.0f, true);

    ASSERT_TRUE(ECS::Systems::VisualExtraction::SyncCamera(World.GetRegistry(), camera));
    EXPECT_FLOAT_EQ(camera.GetZoom(), 2.0f);
    EXPECT_FLOAT_EQ(camera.GetPosition().x, 30.0f);
    EXPECT_FLOAT_EQ(camera.GetRotation(), 0.5f);
    EXPECT_FLOAT_EQ(camera.GetViewport().x, Viewport.x);
}
