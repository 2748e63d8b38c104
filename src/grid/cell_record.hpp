#pragma once

#include <cstdint>
#include <map>
#include <string>

#include <fmt/format.h>

namespace grid {

/**
 * @brief 8-bit RGBA colour, layout compatible with raylib's Color.
 */
struct Rgba {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    bool operator==(const Rgba &) const = default;
};

/**
 * @brief Attributes attached to an active cell.
 *
 * A cell without a record is inactive. Two records compare equal only when
 * every attribute matches; toggling relies on this.
 */
struct CellRecord {
    bool active = true;
    /** @brief Fill colour */
    Rgba color{255, 255, 0, 255};
    /** @brief Draw outline edges where the neighbour is inactive */
    bool outline = true;
    /** @brief Free-form attribute bag carried through history and files */
    std::map<std::string, std::string> tags;

    bool operator==(const CellRecord &) const = default;
};

} // namespace grid

template <>
struct fmt::formatter<grid::Rgba> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const grid::Rgba &c, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "({},{},{},{})", c.r, c.g, c.b, c.a);
    }
};
