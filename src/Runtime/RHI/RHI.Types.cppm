module;
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

export module RHI:Types;

import Core;

// Backend-neutral vocabulary of the render device. Nothing in here names a
// Vulkan type, so headless implementations can share it.
export namespace RHI
{
    struct BufferTag {};
    struct TextureTag {};
    struct BindGroupTag {};
    struct PipelineTag {};

    using BufferHandle = Core::StrongHandle<BufferTag>;
    using TextureHandle = Core::StrongHandle<TextureTag>;
    using BindGroupHandle = Core::StrongHandle<BindGroupTag>;
    using PipelineHandle = Core::StrongHandle<PipelineTag>;

    inline constexpr uint32_t FRAMES_IN_FLIGHT = 2;

    enum class BufferUsage : uint8_t
    {
        Vertex,
        Index,
        Uniform
    };

    // Static buffers hold one physical copy and are written rarely (geometry,
    // sheet uniforms). Dynamic buffers are rewritten every frame and hold one
    // copy per frame slot, so a frame still in flight never sees the writes of
    // the frame being recorded.
    enum class BufferDomain : uint8_t
    {
        Static,
        Dynamic
    };

    struct BufferDesc
    {
        size_t SizeBytes = 0;
        BufferUsage Usage = BufferUsage::Vertex;
        BufferDomain Domain = BufferDomain::Static;
        std::string_view DebugName = "";
    };

    enum class TextureFilter : uint8_t
    {
        Nearest,
        Linear
    };

    // Tightly packed RGBA8 pixels, top row first.
    struct TextureDesc
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        std::span<const uint8_t> Rgba8Pixels;
        TextureFilter Filter = TextureFilter::Nearest;
        std::string_view DebugName = "";
    };

    enum class VertexFormat : uint8_t
    {
        Float,
        Float2,
        Float3,
        Float4,
        Uint
    };

    enum class VertexStepRate : uint8_t
    {
        Vertex,
        Instance
    };

    struct VertexAttribute
    {
        uint32_t Location;
        VertexFormat Format;
        uint32_t Offset;
    };

    struct VertexBufferLayout
    {
        uint32_t Stride = 0;
        VertexStepRate StepRate = VertexStepRate::Vertex;
        std::span<const VertexAttribute> Attributes;
    };

    // Set 0 = Camera (uniform at binding 0).
    // Set 1 = Material (texture + sampler at binding 0, sheet uniform at binding 1).
    enum class BindGroupLayoutKind : uint8_t
    {
        Camera,
        Material
    };

    struct BindGroupDesc
    {
        BindGroupLayoutKind Layout = BindGroupLayoutKind::Camera;
        BufferHandle Uniform{};
        TextureHandle Texture{};
    };

    enum class BlendMode : uint8_t
    {
        Opaque,
        AlphaBlend
    };

    struct PipelineDesc
    {
        std::string DebugName;
        std::string VertexShaderPath;
        std::string FragmentShaderPath;
        std::span<const VertexBufferLayout> VertexLayouts;
        bool UsesMaterial = false;
        bool DepthTest = false;
        bool DepthWrite = false;
        BlendMode Blend = BlendMode::AlphaBlend;
    };

    struct Extent2D
    {
        uint32_t Width = 0;
        uint32_t Height = 0;

        [[nodiscard]] constexpr bool IsEmpty() const { return Width == 0 || Height == 0; }
        constexpr bool operator==(const Extent2D&) const = default;
    };

    struct ScissorRect
    {
        int32_t X = 0;
        int32_t Y = 0;
        uint32_t Width = 0;
        uint32_t Height = 0;

        constexpr bool operator==(const ScissorRect&) const = default;
    };

    // Valid from a successful AcquireSurface until the matching Present.
    struct FrameTarget
    {
        uint32_t FrameSlot = 0;
        uint32_t ImageIndex = 0;
        Extent2D Extent{};
        uint64_t FrameNumber = 0;
    };
}
