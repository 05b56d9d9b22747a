module;

#include <array>
#include <cstdint>
#include <glm/glm.hpp>

export module Graphics:GeometryTemplate;

import Core;
import RHI;
import :InstanceLayout;

export namespace Graphics
{
    // Unit quad centred on the origin. UV (0,0) is the bottom-left corner.
    inline const std::array<QuadVertex, 4> QuadVertices = {{
        {glm::vec3(-0.5f, 0.5f, 0.0f), glm::vec2(0.0f, 1.0f)},
        {glm::vec3(-0.5f, -0.5f, 0.0f), glm::vec2(0.0f, 0.0f)},
        {glm::vec3(0.5f, -0.5f, 0.0f), glm::vec2(1.0f, 0.0f)},
        {glm::vec3(0.5f, 0.5f, 0.0f), glm::vec2(1.0f, 1.0f)},
    }};

    inline constexpr std::array<uint16_t, 6> QuadIndices = {3, 2, 1, 3, 1, 0};

    // Static vertex and index buffers shared by every draw kind.
    class QuadGeometry
    {
    public:
        [[nodiscard]] Core::Result Create(RHI::IRenderDevice& device);
        void Release(RHI::IRenderDevice& device);

        [[nodiscard]] bool IsValid() const { return m_VertexBuffer.IsValid() && m_IndexBuffer.IsValid(); }
        [[nodiscard]] RHI::BufferHandle GetVertexBuffer() const { return m_VertexBuffer; }
        [[nodiscard]] RHI::BufferHandle GetIndexBuffer() const { return m_IndexBuffer; }
        [[nodiscard]] static constexpr uint32_t GetIndexCount() { return static_cast<uint32_t>(QuadIndices.size()); }

    private:
        RHI::BufferHandle m_VertexBuffer{};
        RHI::BufferHandle m_IndexBuffer{};
    };
}
