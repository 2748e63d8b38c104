#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <fmt/format.h>

namespace grid {

/**
 * @brief Grid coordinate used as the key of a cell store.
 *
 * Ordered row-major so sorted listings read top-to-bottom, left-to-right.
 */
struct Coord {
    int row = 0;
    int col = 0;

    auto operator<=>(const Coord &) const = default;

    Coord up() const { return {row - 1, col}; }
    Coord down() const { return {row + 1, col}; }
    Coord left() const { return {row, col - 1}; }
    Coord right() const { return {row, col + 1}; }
};

/**
 * @brief Check whether a coordinate lies inside [0,rows) x [0,cols).
 */
inline bool in_bounds(const Coord &c, int rows, int cols) {
    return c.row >= 0 && c.row < rows && c.col >= 0 && c.col < cols;
}

struct CoordHash {
    std::size_t operator()(const Coord &c) const noexcept {
        const std::uint64_t key =
            (std::uint64_t(static_cast<std::uint32_t>(c.row)) << 32) |
            static_cast<std::uint32_t>(c.col);
        return std::hash<std::uint64_t>{}(key);
    }
};

} // namespace grid

template <>
struct fmt::formatter<grid::Coord> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const grid::Coord &c, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "({}, {})", c.row, c.col);
    }
};
