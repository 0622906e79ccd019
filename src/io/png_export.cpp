#include <barrace/export.hpp>

// Suppress warnings in third-party STB headers
#if defined(__clang__)
    #pragma clang diagnostic push
    #pragma clang diagnostic ignored "-Wmissing-field-initializers"
    #pragma clang diagnostic ignored "-Wunused-function"
#elif defined(__GNUC__)
    #pragma GCC diagnostic push
    #pragma GCC diagnostic ignored "-Wmissing-field-initializers"
    #pragma GCC diagnostic ignored "-Wunused-function"
#endif

// stb_image_write header-only (implementation in src/io/stb_impl.cpp)
#include "stb_image_write.h"

#if defined(__clang__)
    #pragma clang diagnostic pop
#elif defined(__GNUC__)
    #pragma GCC diagnostic pop
#endif

namespace barrace
{

namespace
{

void append_bytes(void* context, void* data, int size)
{
    auto* out   = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

}  // namespace

std::vector<uint8_t> ImageExporter::encode_png(const uint8_t* rgba_data, uint32_t width, uint32_t height)
{
    std::vector<uint8_t> png;
    if (!rgba_data || width == 0 || height == 0)
    {
        return png;
    }

    // RGBA = 4 channels, stride = width * 4
    int result = stbi_write_png_to_func(append_bytes,
                                        &png,
                                        static_cast<int>(width),
                                        static_cast<int>(height),
                                        4,
                                        rgba_data,
                                        static_cast<int>(width * 4));
    if (result == 0)
        png.clear();
    return png;
}

}  // namespace barrace
