#include <barrace/renderer.hpp>

#include <cmath>
#include <utility>

#include "canvas.hpp"
#include "text_renderer.hpp"

namespace barrace
{

FrameRenderer::FrameRenderer(RenderAssets assets) : assets_(std::move(assets)) {}

PixelBuffer FrameRenderer::render(const RenderPlan& plan) const
{
    Canvas canvas(plan.width, plan.height);
    canvas.clear(plan.background);

    const TextRenderer* text = assets_.text.get();
    auto draw_text = [&](const TextPlacement& t)
    {
        if (text)
            text->draw_text(canvas, t);
    };

    // Gridlines sit behind the bars
    for (const auto& g : plan.gridlines)
    {
        canvas.vline(g.x, g.y_top, g.y_bottom, g.width, g.color);
        draw_text(g.label);
    }

    for (const auto& b : plan.bars)
        canvas.fill_rounded_rect(b.bar, b.corner_radius, b.color);

    // Highlights sit above every bar, including bars crossing mid-swap
    for (const auto& b : plan.bars)
    {
        if (b.highlighted)
            canvas.fill_rect(b.highlight, b.highlight_color);
    }

    for (const auto& b : plan.bars)
    {
        draw_text(b.name);
        draw_text(b.percent);
    }

    for (const auto& t : plan.headings)
        draw_text(t);
    for (const auto& t : plan.footers)
        draw_text(t);

    if (plan.logo.visible && assets_.logo && !assets_.logo->empty())
    {
        const LogoImage& logo = *assets_.logo;
        const int        x    = static_cast<int>(std::lround(plan.logo.x));
        const int        y    = static_cast<int>(std::lround(plan.logo.bottom)) - static_cast<int>(logo.height);
        canvas.blit_rgba(logo.rgba.data(), static_cast<int>(logo.width), static_cast<int>(logo.height), x, y);
    }

    return canvas.release();
}

}  // namespace barrace
