module;

#include <algorithm>
#include <cmath>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

module Graphics:Camera.Impl;
import :Camera;

namespace Graphics
{
    ViewFrustum ViewFrustum::CreateFromMatrix(const glm::mat4& viewProj)
    {
        ViewFrustum f;
        auto extract = [&](int i, const glm::vec4& row)
        {
            f.Planes[i] = Plane{glm::vec3(row), row.w};
            f.Planes[i].Normalize();
        };

        // glm is column-major: row r is (m[0][r], m[1][r], m[2][r], m[3][r]).
        const glm::mat4 t = glm::transpose(viewProj);
        extract(0, t[3] + t[0]);
        extract(1, t[3] - t[0]);
        extract(2, t[3] + t[1]);
        extract(3, t[3] - t[1]);
        extract(4, t[2]);        // ZO depth: near is z >= 0
        extract(5, t[3] - t[2]);
        return f;
    }

    bool ViewFrustum::IsSphereVisible(const glm::vec3& center, float radius) const
    {
        for (const Plane& plane : Planes)
        {
            if (plane.SignedDistance(center) < -radius) return false;
        }
        return true;
    }

    void Camera2D::Update(const glm::vec2& position, float zoom, const glm::vec2& viewportSize)
    {
        m_Position = position;
        m_Zoom = zoom;
        m_Viewport = viewportSize;
        Recompute();
    }

    void Camera2D::SetRotation(float radians)
    {
        m_Rotation = radians;
        Recompute();
    }

    void Camera2D::SetViewport(const glm::vec2& viewportSize)
    {
        m_Viewport = viewportSize;
        Recompute();
    }

    void Camera2D::SetDepthRange(float depthRange)
    {
        m_DepthRange = depthRange;
        Recompute();
    }

    void Camera2D::Recompute()
    {
        // Degenerate inputs are clamped so the projection is never singular.
        const float zoom = std::max(std::abs(m_Zoom), kMinZoom);
        const float width = std::max(m_Viewport.x, 1.0f);
        const float height = std::max(m_Viewport.y, 1.0f);
        const float depth = std::max(m_DepthRange, 1.0f);

        const glm::mat4 cameraToWorld =
            glm::rotate(glm::translate(glm::mat4(1.0f), glm::vec3(m_Position, 0.0f)), m_Rotation,
                        glm::vec3(0.0f, 0.0f, 1.0f));

        const float halfW = width * 0.5f / zoom;
        const float halfH = height * 0.5f / zoom;

        glm::mat4 proj = glm::orthoRH_ZO(-halfW, halfW, -halfH, halfH, -depth, depth);
        proj[1][1] *= -1.0f; // Vulkan clip space has +Y down

        m_Uniform.ViewInv = cameraToWorld;
        m_Uniform.View = glm::inverse(cameraToWorld);
        m_Uniform.Proj = proj;
        m_Uniform.ViewProj = proj * m_Uniform.View;

        m_Frustum = ViewFrustum::CreateFromMatrix(m_Uniform.ViewProj);
        ++m_Version;
    }
}
