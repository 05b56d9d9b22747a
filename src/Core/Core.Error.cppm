module;

#include <cstdint>
#include <string_view>
#include <expected>
#include <utility>

export module Core:Error;

export namespace Core
{
    // -------------------------------------------------------------------------
    // Error Handling Strategy
    // -------------------------------------------------------------------------
    // 1. std::expected<T, E>  - For FALLIBLE operations where failure is expected
    //                          and the caller MUST handle it (resource creation,
    //                          surface acquisition, presentation).
    //
    // 2. std::optional<T>    - For QUERIES where "not found" is a valid outcome
    //                          (cache and registry lookups).
    //
    // 3. Raw pointers (T*)   - ONLY for non-owning observation of existing objects.
    //
    // 4. Assertions          - For INVARIANTS that should never be violated.
    //
    // The render path never throws. Per-frame data problems are dropped and
    // logged; only fatal conditions travel up as an ErrorCode.
    // -------------------------------------------------------------------------

    enum class ErrorCode : uint32_t
    {
        Success = 0,

        // Resource errors (100-199)
        OutOfMemory = 100,
        ResourceNotFound = 101,
        ResourceBusy = 102,

        // Validation errors (300-399)
        InvalidArgument = 300,
        InvalidState = 301,
        InvalidFormat = 302,
        OutOfRange = 303,

        // Graphics/RHI errors (400-499)
        DeviceLost = 400,
        OutOfDeviceMemory = 401,
        ShaderCompilationFailed = 402,
        PipelineCreationFailed = 403,
        SwapchainOutOfDate = 404,
        SurfaceLost = 405,
        SurfaceTimeout = 406,
        RenderLoopFatal = 407,

        // Generic
        Unknown = 999
    };

    constexpr std::string_view ErrorCodeToString(ErrorCode code)
    {
        switch (code)
        {
            case ErrorCode::Success:                 return "Success";
            case ErrorCode::OutOfMemory:             return "OutOfMemory";
            case ErrorCode::ResourceNotFound:        return "ResourceNotFound";
            case ErrorCode::ResourceBusy:            return "ResourceBusy";
            case ErrorCode::InvalidArgument:         return "InvalidArgument";
            case ErrorCode::InvalidState:            return "InvalidState";
            case ErrorCode::InvalidFormat:           return "InvalidFormat";
            case ErrorCode::OutOfRange:              return "OutOfRange";
            case ErrorCode::DeviceLost:              return "DeviceLost";
            case ErrorCode::OutOfDeviceMemory:       return "OutOfDeviceMemory";
            case ErrorCode::ShaderCompilationFailed: return "ShaderCompilationFailed";
            case ErrorCode::PipelineCreationFailed:  return "PipelineCreationFailed";
            case ErrorCode::SwapchainOutOfDate:      return "SwapchainOutOfDate";
            case ErrorCode::SurfaceLost:             return "SurfaceLost";
            case ErrorCode::SurfaceTimeout:          return "SurfaceTimeout";
            case ErrorCode::RenderLoopFatal:         return "RenderLoopFatal";
            default:                                 return "Unknown";
        }
    }

    // Errors a frame can recover from by reconfiguring the surface and skipping.
    constexpr bool IsTransientSurfaceError(ErrorCode code)
    {
        return code == ErrorCode::SurfaceLost ||
               code == ErrorCode::SurfaceTimeout ||
               code == ErrorCode::SwapchainOutOfDate ||
               code == ErrorCode::DeviceLost;
    }

    template<typename T>
    using Expected = std::expected<T, ErrorCode>;

    template<typename T>
    constexpr Expected<T> Ok(T&& value)
    {
        return Expected<T>(std::forward<T>(value));
    }

    template<typename T>
    constexpr Expected<T> Err(ErrorCode code)
    {
        return std::unexpected(code);
    }

    // Void success type for operations that don't return a value
    struct Unit {};
    constexpr Unit unit{};

    using Result = Expected<Unit>;

    constexpr Result Ok()
    {
        return Result(unit);
    }

    constexpr Result Err(ErrorCode code)
    {
        return std::unexpected(code);
    }
}
