module;

#include <cstdint>
#include <optional>
#include <glm/glm.hpp>

export module Graphics:RectFragment;

import :Color;

export namespace Graphics
{
    // Host mirror of ui_rect.frag. Returns the fragment color, or nullopt
    // where the shader discards.
    //
    // The local UV is folded into the nearest corner; within Radius of an
    // edge the outline wins when one is set. A fully transparent fill is not
    // written at all, which leaves holes inside outlined rects.
    [[nodiscard]] inline std::optional<glm::vec4> EvaluateRectFragment(glm::vec2 uv,
                                                                       uint32_t fillColor,
                                                                       uint32_t outlineColor,
                                                                       glm::vec2 radius)
    {
        const glm::vec2 folded = glm::min(uv, glm::vec2(1.0f) - uv);
        const bool inBand = folded.x < radius.x || folded.y < radius.y;

        if (outlineColor != 0 && inBand) return Color::ToVec4(outlineColor);

        const glm::vec4 fill = Color::ToVec4(fillColor);
        if (glm::dot(fill, fill) == 0.0f) return std::nullopt;
        return fill;
    }
}
