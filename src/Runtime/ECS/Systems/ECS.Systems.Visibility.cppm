module;
#include <vector>
#include <entt/fwd.hpp>

export module ECS:Systems.Visibility;

import Graphics;

export namespace ECS::Systems::Visibility
{
    // Entity lists reused across frames; structural changes are deferred
    // until a view has been walked.
    struct Scratch
    {
        std::vector<entt::entity> Pending;
        std::vector<entt::entity> Entered;
        std::vector<entt::entity> Left;
    };

    // Gives sprites without a CullSize one derived from their texture's sheet
    // (the larger cell dimension).
    void AssignMissingCullSizes(entt::registry& registry, const Graphics::TextureRegistry& textures,
                                Scratch& scratch);

    // Adds or removes VisibleTag on every sprite so that it is present
    // exactly when the sprite's bounding sphere touches the frustum.
    void OnUpdate(entt::registry& registry, const Graphics::ViewFrustum& frustum, Scratch& scratch);
}
