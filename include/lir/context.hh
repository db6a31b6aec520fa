#ifndef LIR_CONTEXT_HH
#define LIR_CONTEXT_HH

#include <lir/file.hh>
#include <lir/forward.hh>
#include <lir/location.hh>
#include <lir/utils.hh>

namespace lir {
/// Owns the source files of a parse session and the options that
/// control how diagnostics are issued.
///
/// A context is not thread-safe; parse on separate threads with
/// separate contexts.
class Context {
public:
    enum OptionColour : bool {
        DoNotUseColour,
        UseColour = true,
    };
    enum OptionDiagBacktrace : bool {
        DoNotDiagBacktrace,
        DiagBacktrace = true,
    };

    struct Options {
        OptionColour _colour_diagnostics;
        OptionDiagBacktrace _diag_backtrace;
    };

private:
    /// The files owned by the context.
    std::vector<std::unique_ptr<File>> owned_files;

    /// Error flag. This is set-only.
    mutable bool error_flag = false;

    Options _options;

public:
    /// Create a new context.
    explicit Context(const Options& options) : _options(options) {}

    /// Do not allow copying or moving the context.
    Context(const Context&) = delete;
    Context(Context&&) = delete;
    auto operator=(const Context&) -> Context& = delete;
    auto operator=(Context&&) -> Context& = delete;

    /// Create a new file from a name and contents.
    [[nodiscard]]
    auto create_file(fs::path name, std::vector<char> contents) -> File& {
        return make_file(std::move(name), std::move(contents));
    }

    /// Create a new file from a name and text.
    [[nodiscard]]
    auto create_file(fs::path name, std::string_view text) -> File& {
        return make_file(std::move(name), std::vector<char>{text.begin(), text.end()});
    }

    /// Get a list of all files owned by the context.
    [[nodiscard]]
    auto files() const -> const decltype(owned_files)& {
        return owned_files;
    }

    /// Get a file from disk.
    ///
    /// This loads a file from disk or returns a reference to it if
    /// is has already been loaded.
    [[nodiscard]]
    auto get_or_load_file(fs::path path) -> File&;

    /// Check if the error flag is set.
    [[nodiscard]]
    auto has_error() const -> bool { return error_flag; }

    /// Set the error flag.
    ///
    /// \return The previous value of the error flag.
    auto set_error() const -> bool {
        auto old = error_flag;
        error_flag = true;
        return old;
    }

    /// Whether to use colours in diagnostics.
    [[nodiscard]]
    auto option_use_colour() const -> bool { return _options._colour_diagnostics; }

    /// Whether internal errors print a backtrace.
    [[nodiscard]]
    auto option_diag_backtrace() const -> bool { return _options._diag_backtrace; }

private:
    /// Register a file in the context.
    auto make_file(fs::path name, std::vector<char>&& contents) -> File&;
};
} // namespace lir

#endif // LIR_CONTEXT_HH
