module;

#include <cstdint>
#include <vector>

export module Graphics:Image;

export namespace Graphics
{
    // CPU-side RGBA8 pixels, top row first.
    struct Image
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        std::vector<uint8_t> Pixels;

        [[nodiscard]] bool IsValid() const
        {
            return Width > 0 && Height > 0 &&
                   Pixels.size() == static_cast<size_t>(Width) * Height * 4;
        }
    };
}
