module;
#include <cstddef>
#include <string>
#include <entt/entity/registry.hpp>

export module ECS:Scene;

import :Components;

export namespace ECS
{
    // Owns the entity registry. Every entity is created with a name and a
    // Transform.
    class Scene
    {
    public:
        Scene() = default;
        ~Scene() = default;

        Scene(const Scene&) = delete;
        Scene& operator=(const Scene&) = delete;

        entt::entity CreateEntity(const std::string& name);
        void DestroyEntity(entt::entity entity);

        [[nodiscard]] entt::registry& GetRegistry() { return m_Registry; }
        [[nodiscard]] const entt::registry& GetRegistry() const { return m_Registry; }

        [[nodiscard]] size_t Size() const;

    private:
        entt::registry m_Registry;
    };
}
