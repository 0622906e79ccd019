#pragma once

#include <barrace/chart_options.hpp>
#include <barrace/renderer.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace barrace
{

struct AssetPaths
{
    std::string font;   // branded display font (TTF/OTF)
    std::string logo;   // logo raster (PNG/JPEG)
};

// <dir>/DharmaGothicE-ExBold.ttf and <dir>/novig_logo.png
AssetPaths default_asset_paths(const std::string& assets_dir);

// Bold sans-serif faces tried when the branded font is unavailable.
const std::vector<std::string>& fallback_font_paths();

// Loads the branded font, else the first usable fallback face, else nullptr.
// Never throws; each miss is logged.
std::shared_ptr<const TextRenderer> load_font(const std::string& path, float dpi);

// Decodes, scales to target_height and thresholds the logo. A missing file
// gives nullopt; a file that cannot be decoded gives the fallback mark.
std::optional<LogoImage> load_logo(const std::string& path, uint32_t target_height);

// Scale an RGBA raster to target_height (aspect kept, area filter), force it to
// pure white and cut alpha at the threshold.
LogoImage prepare_logo(const uint8_t* rgba,
                       uint32_t       width,
                       uint32_t       height,
                       uint32_t       target_height,
                       uint8_t        alpha_threshold = 100);

// White "N" mark used when the logo file is unreadable.
LogoImage make_fallback_logo(uint32_t target_height);

// Font and logo for a chart format; the logo targets 12% of the canvas height.
RenderAssets load_render_assets(const AssetPaths& paths, const FormatSpec& format);

}  // namespace barrace
