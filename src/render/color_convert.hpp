#pragma once

#include <imgui.h>
#include <raylib.h>

#include "../grid/cell_record.hpp"

inline Color to_color(const grid::Rgba &c) { return Color{c.r, c.g, c.b, c.a}; }

inline grid::Rgba to_rgba(const Color &c) {
    return grid::Rgba{c.r, c.g, c.b, c.a};
}

inline ImVec4 to_imvec4(const grid::Rgba &c) {
    return ImVec4(c.r / 255.f, c.g / 255.f, c.b / 255.f, c.a / 255.f);
}

inline grid::Rgba to_rgba(const ImVec4 &v) {
    return grid::Rgba{static_cast<unsigned char>(v.x * 255),
                      static_cast<unsigned char>(v.y * 255),
                      static_cast<unsigned char>(v.z * 255),
                      static_cast<unsigned char>(v.w * 255)};
}
