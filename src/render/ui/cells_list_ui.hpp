#pragma once

#include <imgui.h>

#include "../irenderer.hpp"

/**
 * @brief Lists the active cells of the current snapshot.
 */
class CellsListUI : public IRenderer {
  public:
    CellsListUI() = default;
    ~CellsListUI() override = default;
    CellsListUI(const CellsListUI &) = delete;
    CellsListUI &operator=(const CellsListUI &) = delete;

    void render(Context &ctx) override;
};
