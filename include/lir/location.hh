#ifndef LIR_LOCATION_HH
#define LIR_LOCATION_HH

#include <lir/utils.hh>

namespace lir {
class Context;

/// The line of source text that a location falls on.
struct LocInfo {
    usz line{};
    usz col{};
    const char* line_start{};
    const char* line_end{};
};

/// A byte range in one of the files owned by a Context.
///
/// The parser records one of these for every token; diagnostics
/// use it to show the offending source line.
struct Location {
    /// Byte offset of the first character.
    u32 pos{};

    /// Length in bytes; a length of 0 means there is no location.
    u16 len{};

    /// Index into `Context::files()`.
    u16 file_id{};

    /// Find the line and column of `pos`. The location must be seekable.
    [[nodiscard]]
    auto seek(const Context* ctx) const -> LocInfo;

    /// Whether `pos` lies inside a non-empty file of `ctx`.
    [[nodiscard]]
    auto seekable(const Context* ctx) const -> bool;

    [[nodiscard]]
    auto is_valid() const -> bool { return len != 0; }
};
} // namespace lir

#endif // LIR_LOCATION_HH
