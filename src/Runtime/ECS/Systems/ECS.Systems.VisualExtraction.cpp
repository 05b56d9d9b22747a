module;
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.VisualExtraction.Impl;
import :Systems.VisualExtraction;
import :Components;
import Graphics;

namespace ECS::Systems::VisualExtraction
{
    namespace
    {
        // NaN compares as the largest layer so the sort keeps a strict weak order.
        bool LayerBefore(const Graphics::VisualRecord& a, const Graphics::VisualRecord& b)
        {
            if (std::isnan(a.Layer)) return false;
            if (std::isnan(b.Layer)) return true;
            return a.Layer < b.Layer;
        }
    }

    ExtractionStats OnUpdate(entt::registry& registry, glm::vec2 viewport, const SubmitFn& submit,
                             Scratch& scratch)
    {
        ExtractionStats stats{};

        std::vector<Graphics::VisualRecord>& sprites = scratch.Sprites;
        sprites.clear();
        auto spriteView = registry.view<Components::Transform::Component,
                                        Components::Sprite::Component,
                                        Components::Culling::VisibleTag>();
        for (auto [entity, transform, sprite] : spriteView.each())
        {
            Graphics::VisualRecord record;
            record.Kind = Graphics::PipelineKind::Sprite;
            record.Position = transform.Position;
            record.Scale = transform.Scale;
            record.Rotation = transform.Rotation;
            record.SpriteIndex = sprite.Index;
            record.Flip = sprite.Flip;
            record.Layer = sprite.Layer;
            record.Texture = sprite.Texture;
            sprites.push_back(record);
        }

        std::stable_sort(sprites.begin(), sprites.end(), LayerBefore);
        for (const auto& record : sprites) submit(record);
        stats.Sprites = static_cast<uint32_t>(sprites.size());

        for (auto [entity, rect] : registry.view<Components::UiRect::Component>().each())
        {
            submit(Graphics::MakeUiRect(rect.Rect, rect.Layer, viewport, {
                .Fill = rect.Fill,
                .Outline = rect.Outline,
                .CornerRadius = rect.CornerRadius,
                .Scissor = rect.Scissor
            }));
            ++stats.UiRects;
        }

        for (auto [entity, glyph] : registry.view<Components::Glyph::Component>().each())
        {
            submit(Graphics::MakeGlyph(glyph.Rect, glyph.Layer, viewport, glyph.Atlas, glyph.Color, glyph.Scissor));
            ++stats.Glyphs;
        }

        for (auto [entity, image] : registry.view<Components::UiImage::Component>().each())
        {
            submit(Graphics::MakeUiImage(image.Rect, image.Layer, viewport, image.Sheet, image.Index,
                                         image.Flip, image.Tint, image.Scissor));
            ++stats.UiImages;
        }

        return stats;
    }

    bool SyncCamera(entt::registry& registry, Graphics::Camera2D& camera)
    {
        auto view = registry.view<Components::Transform::Component, Components::Camera::Component>();
        for (auto [entity, transform, cam] : view.each())
        {
            if (!cam.Active) continue;
            camera.Update(transform.Position, cam.Zoom, camera.GetViewport());
            camera.SetRotation(transform.Rotation);
            return true;
        }
        return false;
    }
}
