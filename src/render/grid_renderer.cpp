#include "grid_renderer.hpp"

#include "../grid/bounds_guard.hpp"
#include "color_convert.hpp"
#include "grid_geometry.hpp"

namespace {

Vector2 offset(Vector2 origin, float x, float y) {
    return Vector2{origin.x + x, origin.y + y};
}

} // namespace

void GridRenderer::render(Context &ctx) {
    const auto &cfg = ctx.editor.config();
    const auto &rcfg = ctx.rcfg;
    const float half = rcfg.stroke_width / 2.0f;

    Rectangle area{rcfg.origin.x + half, rcfg.origin.y + half,
                   static_cast<float>(cfg.width_px()),
                   static_cast<float>(cfg.height_px())};
    DrawRectangleRec(area, rcfg.empty_cell_color);

    draw_cells(ctx);
    if (rcfg.show_grid_lines)
        draw_grid_lines(ctx);
    DrawRectangleLinesEx(area, rcfg.stroke_width, rcfg.border_color);
    draw_outline(ctx);
    if (rcfg.show_hover)
        draw_hover(ctx);
}

std::optional<grid::Coord> GridRenderer::pick(const Context &ctx,
                                              Vector2 pos) const {
    const float half = ctx.rcfg.stroke_width / 2.0f;
    return cell_at(pos.x - ctx.rcfg.origin.x - half,
                   pos.y - ctx.rcfg.origin.y - half, ctx.editor.config());
}

void GridRenderer::draw_cells(const Context &ctx) {
    const auto &cfg = ctx.editor.config();
    const float size = static_cast<float>(cfg.cell_size);
    const float half = ctx.rcfg.stroke_width / 2.0f;

    ctx.editor.current().for_each(
        [&](const grid::Coord &c, const grid::CellRecord &rec) {
            if (!grid::in_bounds(c, cfg.rows, cfg.cols))
                return;
            Rectangle r{ctx.rcfg.origin.x + half + c.col * size,
                        ctx.rcfg.origin.y + half + c.row * size, size, size};
            DrawRectangleRec(r, to_color(rec.color));
        });
}

void GridRenderer::draw_grid_lines(const Context &ctx) {
    const float half = ctx.rcfg.stroke_width / 2.0f;
    const Vector2 origin{ctx.rcfg.origin.x + half, ctx.rcfg.origin.y + half};
    for (const Segment &s : grid_lines(ctx.editor.config())) {
        DrawLineEx(offset(origin, s.x0, s.y0), offset(origin, s.x1, s.y1),
                   ctx.rcfg.stroke_width, ctx.rcfg.grid_color);
    }
}

void GridRenderer::draw_outline(const Context &ctx) {
    const auto &cfg = ctx.editor.config();
    const auto visible = grid::clamp(ctx.editor.current(), cfg.rows, cfg.cols);
    for (const Segment &s :
         outline_edges(visible, static_cast<float>(cfg.cell_size),
                       ctx.rcfg.stroke_width)) {
        DrawLineEx(offset(ctx.rcfg.origin, s.x0, s.y0),
                   offset(ctx.rcfg.origin, s.x1, s.y1),
                   ctx.rcfg.outline_width, ctx.rcfg.outline_color);
    }
}

void GridRenderer::draw_hover(const Context &ctx) {
    auto hovered = pick(ctx, GetMousePosition());
    if (!hovered)
        return;
    const float size = static_cast<float>(ctx.editor.config().cell_size);
    const float half = ctx.rcfg.stroke_width / 2.0f;
    Rectangle r{ctx.rcfg.origin.x + half + hovered->col * size,
                ctx.rcfg.origin.y + half + hovered->row * size, size, size};
    DrawRectangleLinesEx(r, 1.0f, ctx.rcfg.hover_color);
}
