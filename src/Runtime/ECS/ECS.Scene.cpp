module;
#include <cstddef>
#include <string>
#include <entt/entity/registry.hpp>

module ECS:Scene.Impl;
import :Scene;
import :Components;

namespace ECS
{
    entt::entity Scene::CreateEntity(const std::string& name)
    {
        entt::entity e = m_Registry.create();
        m_Registry.emplace<Components::NameTag::Component>(e, name);
        m_Registry.emplace<Components::Transform::Component>(e);
        return e;
    }

    void Scene::DestroyEntity(entt::entity entity)
    {
        if (m_Registry.valid(entity)) m_Registry.destroy(entity);
    }

    size_t Scene::Size() const
    {
        // Every live entity carries a NameTag.
        const auto* tags = m_Registry.storage<Components::NameTag::Component>();
        return tags ? tags->size() : 0;
    }
}
