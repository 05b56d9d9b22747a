module;

#include <cstdint>

module Graphics:GeometryTemplate.Impl;
import :GeometryTemplate;
import Core;
import RHI;

namespace Graphics
{
    Core::Result QuadGeometry::Create(RHI::IRenderDevice& device)
    {
        if (IsValid()) return Core::Ok();

        auto vertexBuffer = device.CreateBuffer({
            .SizeBytes = sizeof(QuadVertices),
            .Usage = RHI::BufferUsage::Vertex,
            .Domain = RHI::BufferDomain::Static,
            .DebugName = "QuadVertices"
        });
        if (!vertexBuffer) return Core::Err(vertexBuffer.error());

        auto indexBuffer = device.CreateBuffer({
            .SizeBytes = sizeof(QuadIndices),
            .Usage = RHI::BufferUsage::Index,
            .Domain = RHI::BufferDomain::Static,
            .DebugName = "QuadIndices"
        });
        if (!indexBuffer)
        {
            device.DestroyBuffer(*vertexBuffer);
            return Core::Err(indexBuffer.error());
        }

        m_VertexBuffer = *vertexBuffer;
        m_IndexBuffer = *indexBuffer;

        device.WriteBuffer(m_VertexBuffer, QuadVertices.data(), sizeof(QuadVertices));
        device.WriteBuffer(m_IndexBuffer, QuadIndices.data(), sizeof(QuadIndices));
        return Core::Ok();
    }

    void QuadGeometry::Release(RHI::IRenderDevice& device)
    {
        if (m_VertexBuffer.IsValid()) device.DestroyBuffer(m_VertexBuffer);
        if (m_IndexBuffer.IsValid()) device.DestroyBuffer(m_IndexBuffer);
        m_VertexBuffer = {};
        m_IndexBuffer = {};
    }
}
