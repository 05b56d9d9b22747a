module;
#include <glm/glm.hpp>

export module ECS:Components.Camera;

export namespace ECS::Components::Camera
{
    // Drives the render camera from the entity's Transform (position and
    // rotation). Only the first active camera is used.
    struct Component
    {
        float Zoom = 1.0f;
        bool Active = true;
    };
}
