#pragma once

#include <optional>

#include <raylib.h>

#include "../grid/coord.hpp"
#include "irenderer.hpp"

/**
 * @brief Draws the grid, the active cells and their outline.
 *
 * Reads the editor's current snapshot only. Cells outside the configured
 * dimensions are not drawn.
 */
class GridRenderer : public IRenderer {
  public:
    GridRenderer() = default;
    ~GridRenderer() override = default;
    GridRenderer(const GridRenderer &) = delete;
    GridRenderer &operator=(const GridRenderer &) = delete;
    GridRenderer(GridRenderer &&) = delete;
    GridRenderer &operator=(GridRenderer &&) = delete;

    void render(Context &ctx) override;

    /**
     * @brief Cell under a window-space position, if any.
     */
    std::optional<grid::Coord> pick(const Context &ctx, Vector2 pos) const;

  private:
    void draw_cells(const Context &ctx);
    void draw_grid_lines(const Context &ctx);
    void draw_outline(const Context &ctx);
    void draw_hover(const Context &ctx);
};
