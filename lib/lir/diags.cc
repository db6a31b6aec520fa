#include <lir/context.hh>
#include <lir/detail/defer.hh>
#include <lir/diags.hh>
#include <lir/utils/platform.hh>

#include <algorithm>
#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/// ===========================================================================
///  Diagnostics.
/// ===========================================================================
using Kind = lir::Diag::Kind;

namespace {
/// Get the colour of a diagnostic.
constexpr auto Colour(lir::Diag::Kind kind) -> lir::utils::Colour {
    switch (kind) {
        using enum lir::utils::Colour;
        case Kind::ICError: return Magenta;
        case Kind::Warning: return Yellow;
        case Kind::Note: return Green;

        case Kind::FError:
        case Kind::Error:
            return Red;

        default:
            return Reset;
    }
}

/// Get the name of a diagnostic.
constexpr auto Name(lir::Diag::Kind kind, lir::ErrorKind category) -> std::string_view {
    switch (category) {
        case lir::ErrorKind::SyntaxError: return "Syntax Error";
        case lir::ErrorKind::TypeMismatch: return "Type Mismatch";
        case lir::ErrorKind::Unsupported: return "Unsupported";
        case lir::ErrorKind::None: break;
    }

    switch (kind) {
        case Kind::ICError: return "Internal Compiler Error";
        case Kind::FError: return "Fatal Error";
        case Kind::Error: return "Error";
        case Kind::Warning: return "Warning";
        case Kind::Note: return "Note";
        default: return "Diagnostic";
    }
}
} // namespace

// Exit due to assertion failure.
[[noreturn]]
void lir::detail::AssertFail(std::string&& msg) {
    Diag::ICE("{}", std::move(msg));
}

void lir::Diag::HandleFatalErrors() {
    // Exit on internal compiler error (ICE).
    if (kind == Kind::ICError) {
        if (not context or context->option_diag_backtrace())
            lir::platform::PrintBacktrace();
        std::exit(ICE_EXIT_CODE);
    }

    // Also exit on any fatal error.
    if (kind == Kind::FError)
        std::exit(FATAL_EXIT_CODE);
}

/// Print a diagnostic with no (valid) location info.
void lir::Diag::PrintDiagWithoutLocation() {
    using enum utils::Colour;
    utils::Colours C(ShouldUseColour());

    fmt::print(
        stderr,
        "{}{}{}: {}",
        C(Bold),
        C(Colour(kind)),
        Name(kind, error_kind),
        C(Reset)
    );
    fmt::print(stderr, "{}\n", msg);
    HandleFatalErrors();
}

auto lir::Diag::ShouldUseColour() const -> bool {
    if (context) return context->option_use_colour();
    return lir::platform::StderrIsTerminal();
}

lir::Diag::~Diag() { print(); }

void lir::Diag::print() {
    using enum utils::Colour;

    // If this diagnostic is suppressed, do nothing.
    if (kind == Kind::None) return;

    // Don’t print the same diagnostic twice.
    defer { kind = Kind::None; };

    // Print attached diagnostics to be printed before this one.
    for (auto& [diag, print_before] : attached)
        if (print_before)
            diag.print();

    // Diagnostics to be printed after this one will be printed later.
    defer {
        for (auto& [diag, print_before] : attached)
            if (not print_before)
                diag.print();

        attached.clear();
    };

    // If the diagnostic is an error, set the error flag.
    if (kind == Kind::Error and context) context->set_error();

    // If there is no context, then there is also no location info.
    if (not context) {
        PrintDiagWithoutLocation();
        return;
    }

    // If the location is invalid, either because the specified file does not
    // exist, its position is out of bounds, or its length is 0, then we
    // skip printing the location.
    utils::Colours C(ShouldUseColour());
    const auto& fs = context->files();
    if (not where.seekable(context)) {
        // Even if the location is invalid, print the file name if we can.
        if (where.file_id < fs.size()) {
            const auto& file = *fs[where.file_id].get();
            fmt::print(stderr, "{}{}: ", C(Bold), file.path().string());
        }

        PrintDiagWithoutLocation();
        return;
    }

    // If the location is valid, get the line, line number, and column number.
    const auto [line, col, line_start, line_end] = where.seek(context);

    bool location_is_multiline{false};
    for (auto* it = line_start; it < line_end; ++it) {
        if (*it == '\n') {
            location_is_multiline = true;
            break;
        }
    }

    // Split the line into everything before the range, the range itself, and
    // everything after.
    std::string before(line_start, col);
    std::string range(line_start + col, std::min<usz>(where.len, usz(line_end - (line_start + col))));
    std::string after(std::min(line_start + col + where.len, line_end), line_end);

    // Replace tabs with spaces. We need to do this *after* splitting because
    // this invalidates the offsets.
    utils::ReplaceAll(before, "\t", "    ");
    utils::ReplaceAll(range, "\t", "    ");
    utils::ReplaceAll(after, "\t", "    ");

    // Print the file name, line number, and column number.
    const auto& file = *fs[where.file_id].get();
    fmt::print(stderr, "{}{}:{}:{}: ", C(Bold), file.path().string(), line, col);
    fmt::print(stderr, "{}{}: {}{}\n", C(Colour(kind)), Name(kind, error_kind), C(Reset), msg);

    // Print the line up to the start of the location, the range in the right
    // colour, and the rest of the line.
    fmt::print(stderr, " {} | {}", line, before);
    fmt::print(stderr, "{}{}{}{}", C(Bold), C(Colour(kind)), range, C(Reset));
    fmt::print(stderr, "{}\n", after);

    // Determine the number of digits in the line number.
    const auto digits = utils::NumberWidth(line);

    // Underline the range.
    if (not location_is_multiline) {
        // Pad the line based on the number of digits in the line number
        // and append more spaces to line us up with the range.
        for (usz i = 0; i < digits + before.size() + sizeof("  | ") - 1; ++i)
            fmt::print(stderr, " ");

        fmt::print(stderr, "{}{}", C(Bold), C(Colour(kind)));
        for (usz i = 0; i < std::max<usz>(range.size(), 1); ++i) fmt::print(stderr, "~");
        fmt::print(stderr, "{}\n", C(Reset));
    }

    HandleFatalErrors();
}

void lir::Diag::print_attached() {
    for (auto& [diag, print_before] : attached)
        if (print_before)
            diag.print();

    for (auto& [diag, print_before] : attached)
        if (not print_before)
            diag.print();

    attached.clear();
}
