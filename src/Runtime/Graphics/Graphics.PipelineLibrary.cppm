module;

#include <array>
#include <cstdint>
#include <span>
#include <string>

export module Graphics:PipelineLibrary;

import Core;
import RHI;
import :VisualRecord;
import :InstanceLayout;

export namespace Graphics
{
    // Static description of one draw kind. Everything the batcher and the
    // frame renderer need to know about a kind comes from this table.
    struct PipelineTraits
    {
        const char* VertexShader;
        const char* FragmentShader;
        uint32_t InstanceStride;
        std::span<const RHI::VertexAttribute> InstanceAttributes;
        bool UsesMaterial;   // set 1 bound per batch
        bool UsesSpriteSheet; // sprite index validated against the sheet
        bool DepthTest;
        bool DepthWrite;
    };

    inline constexpr std::array<PipelineTraits, kPipelineKindCount> kPipelineTraits = {{
        // Sprite
        {"sprite.vert.spv", "sprite.frag.spv",
         sizeof(SpriteInstance), SpriteInstanceAttributes,
         true, true, true, true},
        // UIRect
        {"ui_rect.vert.spv", "ui_rect.frag.spv",
         sizeof(UiRectInstance), UiRectInstanceAttributes,
         false, false, false, false},
        // Glyph
        {"ui_text.vert.spv", "ui_text.frag.spv",
         sizeof(GlyphInstance), UiRectInstanceAttributes,
         true, false, false, false},
        // UIImage
        {"ui_image.vert.spv", "ui_image.frag.spv",
         sizeof(UiImageInstance), UiImageInstanceAttributes,
         true, true, false, false},
    }};

    [[nodiscard]] constexpr const PipelineTraits& GetPipelineTraits(PipelineKind kind)
    {
        return kPipelineTraits[static_cast<uint32_t>(kind)];
    }

    // Owns one pipeline per PipelineKind. Built once at startup; lookups are
    // an array index.
    class PipelineLibrary
    {
    public:
        PipelineLibrary() = default;
        PipelineLibrary(const PipelineLibrary&) = delete;
        PipelineLibrary& operator=(const PipelineLibrary&) = delete;

        // Creates every pipeline in the table. On failure nothing stays built.
        [[nodiscard]] Core::Result Build(RHI::IRenderDevice& device, const std::string& shaderDirectory);
        void Release(RHI::IRenderDevice& device);

        [[nodiscard]] bool IsBuilt() const { return m_Built; }
        [[nodiscard]] RHI::PipelineHandle Get(PipelineKind kind) const
        {
            return m_Pipelines[static_cast<uint32_t>(kind)];
        }

    private:
        std::array<RHI::PipelineHandle, kPipelineKindCount> m_Pipelines{};
        bool m_Built = false;
    };
}
