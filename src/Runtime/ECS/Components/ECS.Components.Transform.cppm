module;
#include <glm/glm.hpp>

export module ECS:Components.Transform;

export namespace ECS::Components::Transform
{
    // World placement of a 2D entity. Position is in world units (pixels at
    // zoom 1), Rotation in radians about +Z.
    struct Component
    {
        glm::vec2 Position{0.0f};
        float Rotation = 0.0f;
        glm::vec2 Scale{1.0f};
    };
}
