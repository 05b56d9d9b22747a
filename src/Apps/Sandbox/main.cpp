#include <array>
#include <cmath>
#include <cstdint>
#include <random>
#include <vector>
#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

import Core;
import RHI;
import Graphics;
import ECS;
import Runtime.Engine;

using namespace Core;
using namespace Runtime;

namespace
{
    constexpr uint32_t kSheetCols = 4;
    constexpr uint32_t kSheetRows = 4;
    constexpr uint32_t kBoxSize = 32;
    constexpr uint32_t kPadding = 2;
    constexpr int kSpriteCount = 2000;
    constexpr float kWorldHalfExtent = 1200.0f;

    struct Velocity
    {
        glm::vec2 Value{0.0f};
    };
}

// --- The Application Class ---
class SandboxApp : public Engine
{
public:
    SandboxApp() : Engine({.AppName = "Mosaic Sandbox", .Width = 1600, .Height = 900})
    {
    }

    void OnStart() override
    {
        Log::Info("Sandbox Started!");

        auto& renderer = GetRenderer();

        const std::array<uint32_t, 6> palette = {
            Graphics::Color::Red, Graphics::Color::Green, Graphics::Color::Blue,
            Graphics::Color::Yellow, Graphics::Color::FromRgb(0x33CCCC), Graphics::Color::FromRgb(0xCC66FF)
        };
        auto sheet = renderer.RegisterTexture(
            Graphics::ProceduralImages::SpriteGrid(kSheetCols, kSheetRows, kBoxSize, kPadding, palette, Graphics::Color::Black),
            Graphics::ProceduralImages::SpriteGridSheet(kSheetCols, kSheetRows, kBoxSize, kPadding));
        auto tiles = renderer.RegisterTexture(
            Graphics::ProceduralImages::Checkerboard(64, 64, 8, Graphics::Color::White, Graphics::Color::FromRgb(0x808080)));
        if (!sheet || !tiles)
        {
            Log::Error("Sandbox: texture registration failed");
            RequestExit();
            return;
        }
        m_SheetTexture = *sheet;
        m_TileTexture = *tiles;

        auto& registry = m_Scene.GetRegistry();

        m_CameraEntity = m_Scene.CreateEntity("Main Camera");
        registry.emplace<ECS::Components::Camera::Component>(m_CameraEntity);

        std::mt19937 rng(1234);
        std::uniform_real_distribution<float> position(-kWorldHalfExtent, kWorldHalfExtent);
        std::uniform_real_distribution<float> speed(-120.0f, 120.0f);
        std::uniform_int_distribution<uint32_t> cell(0, kSheetCols * kSheetRows - 1);

        for (int i = 0; i < kSpriteCount; ++i)
        {
            entt::entity e = m_Scene.CreateEntity("Sprite");
            auto& transform = registry.get<ECS::Components::Transform::Component>(e);
            transform.Position = {position(rng), position(rng)};

            const bool isTile = (i % 5) == 0;
            registry.emplace<ECS::Components::Sprite::Component>(e, ECS::Components::Sprite::Component{
                .Texture = isTile ? m_TileTexture : m_SheetTexture,
                .Index = isTile ? 0u : cell(rng),
                .Flip = (i % 2) == 0,
                .Layer = static_cast<float>(i % 3)
            });
            registry.emplace<Velocity>(e, glm::vec2(speed(rng), speed(rng)));
        }

        // Outlined panel with a transparent interior and a filled title bar.
        entt::entity panel = m_Scene.CreateEntity("Panel");
        registry.emplace<ECS::Components::UiRect::Component>(panel, ECS::Components::UiRect::Component{
            .Rect = {24.0f, 24.0f, 320.0f, 180.0f},
            .Layer = 1,
            .Fill = Graphics::Color::Transparent,
            .Outline = Graphics::Color::White,
            .CornerRadius = {0.01f, 0.015f},
            .Scissor = Graphics::kNoScissor
        });

        entt::entity title = m_Scene.CreateEntity("TitleBar");
        registry.emplace<ECS::Components::UiRect::Component>(title, ECS::Components::UiRect::Component{
            .Rect = {24.0f, 24.0f, 320.0f, 28.0f},
            .Layer = 2,
            .Fill = Graphics::Color::FromRgba8(20, 20, 20, 200),
            .Outline = 0,
            .CornerRadius = {0.0f, 0.0f},
            .Scissor = Graphics::kNoScissor
        });

        entt::entity icon = m_Scene.CreateEntity("PanelIcon");
        registry.emplace<ECS::Components::UiImage::Component>(icon, ECS::Components::UiImage::Component{
            .Rect = {32.0f, 60.0f, 48.0f, 48.0f},
            .Layer = 3,
            .Sheet = m_SheetTexture,
            .Index = 0,
            .Flip = false,
            .Tint = Graphics::Color::White,
            .Scissor = Graphics::kNoScissor
        });
    }

    void OnUpdate(float deltaTime) override
    {
        auto& registry = m_Scene.GetRegistry();
        auto view = registry.view<ECS::Components::Transform::Component, Velocity>();
        for (auto [entity, transform, velocity] : view.each())
        {
            transform.Position += velocity.Value * deltaTime;
            for (int axis = 0; axis < 2; ++axis)
            {
                if (std::abs(transform.Position[axis]) > kWorldHalfExtent)
                {
                    velocity.Value[axis] = -velocity.Value[axis];
                    transform.Position[axis] = glm::clamp(transform.Position[axis], -kWorldHalfExtent, kWorldHalfExtent);
                }
            }
        }

        m_Time += deltaTime;
        auto& camera = registry.get<ECS::Components::Camera::Component>(m_CameraEntity);
        camera.Zoom = 0.75f + 0.25f * std::sin(m_Time * 0.3f);
    }

    void OnRender() override
    {
        // Clipped immediate-mode row of glyph quads inside the panel.
        auto& renderer = GetRenderer();
        const glm::vec2 viewport = renderer.GetViewport();
        const Graphics::ScissorId clip = renderer.DefineScissor({24, 60, 320, 40});

        for (int i = 0; i < 24; ++i)
        {
            const Graphics::PixelRect rect{32.0f + 16.0f * static_cast<float>(i) - 40.0f * std::fmod(m_Time, 1.0f),
                                           64.0f, 14.0f, 20.0f};
            renderer.SubmitVisual(Graphics::MakeGlyph(rect, 3, viewport, m_TileTexture, Graphics::Color::Yellow, clip));
        }
    }

private:
    entt::entity m_CameraEntity = entt::null;
    Graphics::TextureId m_SheetTexture = Graphics::kPlaceholderTexture;
    Graphics::TextureId m_TileTexture = Graphics::kPlaceholderTexture;
    float m_Time = 0.0f;
};

int main()
{
    SandboxApp app;
    return app.Run();
}
