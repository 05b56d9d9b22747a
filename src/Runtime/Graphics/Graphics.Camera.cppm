module;

#include <array>
#include <cstdint>
#include <glm/glm.hpp>

export module Graphics:Camera;

export namespace Graphics
{
    // std140 block at set 0, binding 0. Order is part of the shader contract.
    struct CameraUniform
    {
        glm::mat4 ViewProj{1.0f};
        glm::mat4 View{1.0f};
        glm::mat4 Proj{1.0f};
        glm::mat4 ViewInv{1.0f};
    };

    static_assert(sizeof(CameraUniform) == 256);

    struct Plane
    {
        glm::vec3 Normal{0.0f, 1.0f, 0.0f};
        float Distance = 0.0f;

        void Normalize()
        {
            float length = glm::length(Normal);
            Normal /= length;
            Distance /= length;
        }

        [[nodiscard]] float SignedDistance(const glm::vec3& point) const
        {
            return glm::dot(Normal, point) + Distance;
        }
    };

    struct ViewFrustum
    {
        // Left, Right, Bottom, Top, Near, Far
        std::array<Plane, 6> Planes;

        // Gribb/Hartmann extraction for a zero-to-one depth clip space.
        static ViewFrustum CreateFromMatrix(const glm::mat4& viewProj);

        [[nodiscard]] bool IsSphereVisible(const glm::vec3& center, float radius) const;
    };

    // Orthographic 2D camera. One world unit is one pixel at zoom 1; the
    // camera looks down -Z with +Y up on screen.
    class Camera2D
    {
    public:
        static constexpr float kMinZoom = 1e-4f;
        static constexpr float kDefaultDepthRange = 1000.0f;

        Camera2D() { Recompute(); }

        // Recomputes all four matrices at once; none is ever left stale.
        void Update(const glm::vec2& position, float zoom, const glm::vec2& viewportSize);
        void SetRotation(float radians);
        void SetViewport(const glm::vec2& viewportSize);
        void SetDepthRange(float depthRange);

        [[nodiscard]] const glm::vec2& GetPosition() const { return m_Position; }
        [[nodiscard]] float GetZoom() const { return m_Zoom; }
        [[nodiscard]] float GetRotation() const { return m_Rotation; }
        [[nodiscard]] const glm::vec2& GetViewport() const { return m_Viewport; }
        [[nodiscard]] const CameraUniform& GetUniform() const { return m_Uniform; }
        [[nodiscard]] const ViewFrustum& GetFrustum() const { return m_Frustum; }

        // Bumped on every recompute so consumers can skip redundant uploads.
        [[nodiscard]] uint64_t GetVersion() const { return m_Version; }

    private:
        glm::vec2 m_Position{0.0f};
        float m_Zoom = 1.0f;
        float m_Rotation = 0.0f;
        glm::vec2 m_Viewport{1.0f};
        float m_DepthRange = kDefaultDepthRange;

        CameraUniform m_Uniform{};
        ViewFrustum m_Frustum{};
        uint64_t m_Version = 0;

        void Recompute();
    };
}
