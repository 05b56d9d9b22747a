module;

export module Graphics:RenderContext;

import RHI;
import :TextureRegistry;
import :MaterialCache;
import :PipelineLibrary;
import :GeometryTemplate;
import :UiLayout;

export namespace Graphics
{
    // The render state shared by the frame components. Owned by whoever
    // composes the renderer and handed down by reference; nothing in Graphics
    // reaches for it through a global.
    struct RenderContext
    {
        RHI::IRenderDevice& Device;
        TextureRegistry& Textures;
        MaterialCache& Materials;
        PipelineLibrary& Pipelines;
        QuadGeometry& Quad;
        ScissorTable& Scissors;
    };
}
