module;
#include <cmath>
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.Visibility.Impl;
import :Systems.Visibility;
import :Components;
import Graphics;

namespace ECS::Systems::Visibility
{
    void AssignMissingCullSizes(entt::registry& registry, const Graphics::TextureRegistry& textures,
                                Scratch& scratch)
    {
        std::vector<entt::entity>& pending = scratch.Pending;
        pending.clear();
        auto view = registry.view<Components::Sprite::Component>(entt::exclude<Components::Culling::CullSize>);
        for (entt::entity entity : view) pending.push_back(entity);

        for (entt::entity entity : pending)
        {
            const auto& sprite = registry.get<Components::Sprite::Component>(entity);
            const Graphics::SpriteSheetDescriptor* sheet = textures.GetSheet(sprite.Texture);
            if (!sheet) sheet = textures.GetSheet(Graphics::kPlaceholderTexture);
            const float radius = sheet ? sheet->CullSize() : 0.0f;
            registry.emplace<Components::Culling::CullSize>(entity, radius);
        }
    }

    void OnUpdate(entt::registry& registry, const Graphics::ViewFrustum& frustum, Scratch& scratch)
    {
        std::vector<entt::entity>& entered = scratch.Entered;
        std::vector<entt::entity>& left = scratch.Left;
        entered.clear();
        left.clear();

        auto view = registry.view<Components::Transform::Component,
                                  Components::Sprite::Component,
                                  Components::Culling::CullSize>();
        for (auto [entity, transform, sprite, cull] : view.each())
        {
            const float scale = glm::max(std::abs(transform.Scale.x), std::abs(transform.Scale.y));
            const glm::vec3 center(transform.Position, sprite.Layer);
            const bool visible = frustum.IsSphereVisible(center, cull.Radius * scale);
            const bool tagged = registry.all_of<Components::Culling::VisibleTag>(entity);

            if (visible && !tagged) entered.push_back(entity);
            else if (!visible && tagged) left.push_back(entity);
        }

        // Structural changes after iteration; the view must not be mutated while walked.
        for (entt::entity e : entered) registry.emplace<Components::Culling::VisibleTag>(e);
        for (entt::entity e : left) registry.remove<Components::Culling::VisibleTag>(e);
    }
}
