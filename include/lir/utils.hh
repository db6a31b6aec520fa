#ifndef LIR_UTILS_HH
#define LIR_UTILS_HH

#include <fmt/color.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace lir {
using namespace std::literals;

namespace fs = std::filesystem;
namespace rgs = std::ranges;
namespace vws = std::ranges::views;

using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using usz = size_t;
using uptr = uintptr_t;

using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;
using isz = ptrdiff_t;

using f32 = float;
using f64 = double;

#define LIR_CAT_(X, Y) X##Y
#define LIR_CAT(X, Y)  LIR_CAT_(X, Y)

// clang-format off
#define LIR_ASSERT(cond, ...) ((cond) ? void(0) :              \
    ::lir::detail::AssertFail(                                 \
        fmt::format(                                           \
            "Assertion failed: \"" #cond "\" in {} at line {}" \
            __VA_OPT__(".\nMessage: {}"), __FILE__, __LINE__   \
            __VA_OPT__(, fmt::format(__VA_ARGS__))             \
        )                                                      \
    )                                                          \
)
// clang-format on

#define LIR_UNREACHABLE() LIR_ASSERT(false, "Unreachable")

template <typename>
concept always_false = false;

/// Helper to cast an enum to its underlying type.
template <typename t>
requires std::is_enum_v<t>
constexpr std::underlying_type_t<t> operator+(t e) {
    return static_cast<std::underlying_type_t<t>>(e);
}
} // namespace lir

/// Internal stuff.
namespace lir::detail {
[[noreturn]] void AssertFail(std::string&& msg);

/// Hash for string maps.
struct StringHash {
    using is_transparent = void;

    [[nodiscard]] usz operator()(std::string_view txt) const { return std::hash<std::string_view>{}(txt); }
    [[nodiscard]] usz operator()(const std::string& txt) const { return std::hash<std::string>{}(txt); }
    [[nodiscard]] usz operator()(const char* txt) const { return std::hash<std::string_view>{}(txt); }
};

/// Enum that has a StringifyEnum() function.
template <typename T>
concept FormattableEnum = requires (T t) {
    requires std::is_enum_v<T>;
    { StringifyEnum(t) } -> std::convertible_to<std::string_view>;
};
} // namespace lir::detail

namespace lir {
/// Map with heterogeneous lookup.
///
/// Use this whenever you need a \c std::unordered_map from strings
/// to some other type; lookups with a \c std::string_view do not
/// need to allocate a \c std::string first.
template <typename Type>
using StringMap = std::unordered_map<std::string, Type, detail::StringHash, std::equal_to<>>;
} // namespace lir

/// More rarely used functions go here so as to not pollute the lir namespace too much.
namespace lir::utils {
/// ANSI Terminal colours.
/// If you are writing something in bold and red, use BoldRed. If you are
/// writing everything in bold, and some things in red, use C(Bold),
/// C(Red) and C(Default).
enum struct Colour {
    Reset = 0,

    // Composable...
    Bold = 1,
    Faint = 2,
    Red = 31,
    Green = 32,
    Yellow = 33,
    Blue = 34,
    Magenta = 35,
    Cyan = 36,
    White = 37,
    Default = 39,

    // Apply bold styling and color.
    BoldRed = 1000,
    BoldGreen,
    BoldYellow,
    BoldBlue,
    BoldMagenta,
    BoldCyan,
    BoldWhite,
};

/// RAII helper to toggle colours when printing.
///
/// Example:
/// \code{.cpp}
///     using enum Colour;
///     Colours C{true};
///     out += C(Red);
///     out += fmt::format("{}foo{}", C(Green), C(Reset));
/// \endcode
struct Colours {
    bool use_colours{};
    constexpr Colours(bool should_use_colours) : use_colours{should_use_colours} {}
    constexpr auto operator()(Colour c) const -> std::string_view {
        if (not use_colours) return "";
        switch (c) {
            case Colour::Reset: return "\033[m";
            case Colour::Bold: return "\033[1m";
            case Colour::Faint: return "\033[2m";
            case Colour::Red: return "\033[31m";
            case Colour::Green: return "\033[32m";
            case Colour::Yellow: return "\033[33m";
            case Colour::Blue: return "\033[34m";
            case Colour::Magenta: return "\033[35m";
            case Colour::Cyan: return "\033[36m";
            case Colour::White: return "\033[37m";
            case Colour::Default: return "\033[39m";

            case Colour::BoldRed: return "\033[1;31m";
            case Colour::BoldGreen: return "\033[1;32m";
            case Colour::BoldYellow: return "\033[1;33m";
            case Colour::BoldBlue: return "\033[1;34m";
            case Colour::BoldMagenta: return "\033[1;35m";
            case Colour::BoldCyan: return "\033[1;36m";
            case Colour::BoldWhite: return "\033[1;37m";
        }
        LIR_UNREACHABLE();
    }
};

/// Determine the width of a number.
auto NumberWidth(usz number, usz base = 10) -> usz;

/// Replace all occurrences of `from` with `to` in `str`.
void ReplaceAll(
    std::string& str,
    std::string_view from,
    std::string_view to
);

/// Remove leading and trailing whitespace.
auto Trim(std::string_view str) -> std::string_view;

/// Decode the escape sequences of a `c"..."` string.
///
/// Escapes are currently kept as written.
auto DecodeEscapes(std::string_view str) -> std::string;

} // namespace lir::utils

template <lir::detail::FormattableEnum T>
struct fmt::formatter<T> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(T t, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", StringifyEnum(t));
    }
};

#endif // LIR_UTILS_HH
