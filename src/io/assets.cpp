#include <barrace/assets.hpp>
#include <barrace/logger.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <system_error>

#include "render/text_renderer.hpp"

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

// stb_image header-only (implementation in src/io/stb_impl.cpp)
#include "stb_image.h"

#if defined(__clang__)
    #pragma clang diagnostic pop
#elif defined(__GNUC__)
    #pragma GCC diagnostic pop
#endif

namespace barrace
{

namespace fs = std::filesystem;

namespace
{

bool is_file(const std::string& path)
{
    std::error_code ec;
    return !path.empty() && fs::is_regular_file(path, ec);
}

// Box-filtered alpha of the source area that maps onto one target pixel.
float area_alpha(const uint8_t* rgba, uint32_t width, uint32_t height, float x0, float x1, float y0, float y1)
{
    float sum    = 0.0f;
    float weight = 0.0f;

    const auto sy0 = static_cast<uint32_t>(std::floor(y0));
    const auto sy1 = std::min(height, static_cast<uint32_t>(std::ceil(y1)));
    const auto sx0 = static_cast<uint32_t>(std::floor(x0));
    const auto sx1 = std::min(width, static_cast<uint32_t>(std::ceil(x1)));

    for (uint32_t y = sy0; y < sy1; ++y)
    {
        float wy = std::min(y1, static_cast<float>(y + 1)) - std::max(y0, static_cast<float>(y));
        if (wy <= 0.0f)
            continue;
        for (uint32_t x = sx0; x < sx1; ++x)
        {
            float wx = std::min(x1, static_cast<float>(x + 1)) - std::max(x0, static_cast<float>(x));
            if (wx <= 0.0f)
                continue;
            sum += wx * wy * rgba[(static_cast<size_t>(y) * width + x) * 4 + 3];
            weight += wx * wy;
        }
    }
    return weight > 0.0f ? sum / weight : 0.0f;
}

}  // namespace

AssetPaths default_asset_paths(const std::string& assets_dir)
{
    fs::path dir(assets_dir);
    return AssetPaths{(dir / "DharmaGothicE-ExBold.ttf").string(), (dir / "novig_logo.png").string()};
}

const std::vector<std::string>& fallback_font_paths()
{
    static const std::vector<std::string> paths = {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/TTF/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans-Bold.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Bold.ttf",
        "/usr/share/fonts/liberation-sans/LiberationSans-Bold.ttf",
        "/usr/share/fonts/truetype/freefont/FreeSansBold.ttf",
    };
    return paths;
}

std::shared_ptr<const TextRenderer> load_font(const std::string& path, float dpi)
{
    auto try_load = [dpi](const std::string& p) -> std::shared_ptr<const TextRenderer>
    {
        if (!is_file(p))
            return nullptr;
        auto text = std::make_shared<TextRenderer>();
        if (!text->init_from_file(p, dpi))
        {
            BARRACE_LOG_WARN("assets", "Font '{}' could not be loaded", p);
            return nullptr;
        }
        return text;
    };

    if (auto text = try_load(path))
    {
        BARRACE_LOG_DEBUG("assets", "Using font {}", path);
        return text;
    }
    if (!path.empty())
        BARRACE_LOG_WARN("assets", "Display font '{}' unavailable, trying system fonts", path);

    for (const auto& candidate : fallback_font_paths())
    {
        if (auto text = try_load(candidate))
        {
            BARRACE_LOG_INFO("assets", "Using fallback font {}", candidate);
            return text;
        }
    }

    BARRACE_LOG_WARN("assets", "No usable font found; text will not be drawn");
    return nullptr;
}

LogoImage prepare_logo(const uint8_t* rgba,
                       uint32_t       width,
                       uint32_t       height,
                       uint32_t       target_height,
                       uint8_t        alpha_threshold)
{
    LogoImage out;
    if (!rgba || width == 0 || height == 0 || target_height == 0)
        return out;

    const double aspect = static_cast<double>(width) / static_cast<double>(height);
    out.height          = target_height;
    out.width           = std::max<uint32_t>(1, static_cast<uint32_t>(target_height * aspect));
    out.rgba.assign(static_cast<size_t>(out.width) * out.height * 4, 0);

    const float sx = static_cast<float>(width) / static_cast<float>(out.width);
    const float sy = static_cast<float>(height) / static_cast<float>(out.height);

    for (uint32_t y = 0; y < out.height; ++y)
    {
        for (uint32_t x = 0; x < out.width; ++x)
        {
            float a = area_alpha(rgba,
                                 width,
                                 height,
                                 static_cast<float>(x) * sx,
                                 static_cast<float>(x + 1) * sx,
                                 static_cast<float>(y) * sy,
                                 static_cast<float>(y + 1) * sy);

            // Pure white with binary alpha
            uint8_t* px = out.rgba.data() + (static_cast<size_t>(y) * out.width + x) * 4;
            px[0]       = 255;
            px[1]       = 255;
            px[2]       = 255;
            px[3]       = std::lround(a) > alpha_threshold ? 255 : 0;
        }
    }
    return out;
}

LogoImage make_fallback_logo(uint32_t target_height)
{
    constexpr int size   = 300;
    constexpr int margin = 30;
    constexpr int stroke = 60;

    std::vector<uint8_t> canvas(static_cast<size_t>(size) * size * 4, 0);
    for (int y = 0; y < size; ++y)
    {
        for (int x = 0; x < size; ++x)
        {
            const float px = static_cast<float>(x) + 0.5f;
            const float py = static_cast<float>(y) + 0.5f;
            if (py < margin || py > size - margin)
                continue;

            bool left  = px >= margin && px <= margin + stroke;
            bool right = px >= size - margin - stroke && px <= size - margin;

            // Diagonal from the top of the left bar to the bottom of the right bar
            const float t         = (py - margin) / static_cast<float>(size - 2 * margin);
            const float diag_left = margin + t * static_cast<float>(size - 2 * margin - stroke);
            bool        diagonal  = px >= diag_left && px <= diag_left + stroke;

            if (left || right || diagonal)
            {
                uint8_t* p = canvas.data() + (static_cast<size_t>(y) * size + x) * 4;
                p[0] = p[1] = p[2] = p[3] = 255;
            }
        }
    }

    return prepare_logo(canvas.data(), size, size, target_height);
}

std::optional<LogoImage> load_logo(const std::string& path, uint32_t target_height)
{
    if (!is_file(path))
    {
        BARRACE_LOG_INFO("assets", "No logo at '{}', frames are drawn without one", path);
        return std::nullopt;
    }

    int      w = 0, h = 0, channels = 0;
    uint8_t* pixels = stbi_load(path.c_str(), &w, &h, &channels, 4);
    if (!pixels)
    {
        BARRACE_LOG_WARN("assets", "Logo '{}' could not be decoded ({}), using fallback mark", path, stbi_failure_reason());
        return make_fallback_logo(target_height);
    }

    LogoImage logo = prepare_logo(pixels, static_cast<uint32_t>(w), static_cast<uint32_t>(h), target_height);
    stbi_image_free(pixels);

    BARRACE_LOG_DEBUG("assets", "Logo {} scaled to {}x{}", path, logo.width, logo.height);
    return logo;
}

RenderAssets load_render_assets(const AssetPaths& paths, const FormatSpec& format)
{
    RenderAssets assets;
    assets.text = load_font(paths.font, format.dpi);
    assets.logo = load_logo(paths.logo, static_cast<uint32_t>(static_cast<double>(format.height) * 0.12));
    return assets;
}

}  // namespace barrace
