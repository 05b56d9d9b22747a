module;
#include <cstdint>
#include <functional>
#include <vector>
#include <entt/fwd.hpp>
#include <glm/glm.hpp>

export module ECS:Systems.VisualExtraction;

import Graphics;

export namespace ECS::Systems::VisualExtraction
{
    using SubmitFn = std::function<void(const Graphics::VisualRecord&)>;

    struct ExtractionStats
    {
        uint32_t Sprites = 0;
        uint32_t UiRects = 0;
        uint32_t Glyphs = 0;
        uint32_t UiImages = 0;
    };

    // Storage reused across frames so a warm extraction does not allocate.
    struct Scratch
    {
        std::vector<Graphics::VisualRecord> Sprites;
    };

    // Turns visible sprites and all UI components into VisualRecords.
    // Sprites are emitted in ascending layer order, ties in registry order;
    // a NaN layer sorts last. viewport is the target size in pixels for the
    // UI conversion.
    ExtractionStats OnUpdate(entt::registry& registry, glm::vec2 viewport, const SubmitFn& submit,
                             Scratch& scratch);

    // Copies the first active camera entity into the render camera. Returns
    // false when there is none.
    bool SyncCamera(entt::registry& registry, Graphics::Camera2D& camera);
}
