#pragma once

#include <raylib.h>

struct Config {
    // ui
    bool show_ui = true;
    bool show_controls = true;
    bool show_history_ui = true;
    bool show_cells_list = false;

    // grid
    bool show_grid_lines = true;
    float stroke_width = 1.0f;
    Color grid_color = {205, 205, 205, 255}; // light grey cell borders
    Color border_color = {0, 0, 0, 255};
    Color empty_cell_color = {255, 255, 255, 255};

    // outline around active cells
    Color outline_color = {230, 41, 55, 255};
    float outline_width = 2.0f;

    // hover
    bool show_hover = true;
    Color hover_color = {0, 121, 241, 255};

    // background
    Color background_color = {40, 40, 40, 255};

    // top-left corner of the grid in window pixels
    Vector2 origin = {24.0f, 48.0f};
};
