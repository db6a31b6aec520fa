#ifndef LIR_DIAGS_HH
#define LIR_DIAGS_HH

#include <lir/forward.hh>
#include <lir/location.hh>
#include <lir/utils.hh>

#include <exception>
#include <string>
#include <utility>
#include <vector>

namespace lir {
/// What went wrong, for errors that a library consumer may want
/// to tell apart.
enum struct ErrorKind {
    None,         ///< Not categorised (notes, warnings, internal errors).
    SyntaxError,  ///< The input does not match the grammar.
    TypeMismatch, ///< A constant or index path does not fit its type.
    Unsupported,  ///< Valid LLVM IR that is not modeled.
};

constexpr auto StringifyEnum(ErrorKind k) -> std::string_view {
    switch (k) {
        case ErrorKind::None: return "none";
        case ErrorKind::SyntaxError: return "syntax error";
        case ErrorKind::TypeMismatch: return "type mismatch";
        case ErrorKind::Unsupported: return "unsupported";
    }
    return "<invalid>";
}

/// A diagnostic. The diagnostic is issued when the destructor is called.
struct Diag {
    /// Diagnostic severity.
    enum struct Kind {
        None,    ///< Not an error. Do not emit this diagnostic.
        Note,    ///< Informational note.
        Warning, ///< Warning, but no hard error.
        Error,   ///< Hard error. The input is ill-formed.
        FError,  ///< Fatal error, but NOT a bug in the library.
        ICError, ///< Internal error (bug in the library).
    };

private:
    Kind kind;
    ErrorKind error_kind{ErrorKind::None};
    const Context* context{};
    Location where{};
    std::string msg{};

    /// Attached diagnostics.
    std::vector<std::pair<Diag, bool>> attached;

    /// Handle fatal error codes.
    void HandleFatalErrors();

    /// Print a diagnostic with no (valid) location info.
    void PrintDiagWithoutLocation();

    /// Determine whether we should use colours at all.
    [[nodiscard]]
    auto ShouldUseColour() const -> bool;

public:
    static constexpr u8 ICE_EXIT_CODE = 17;
    static constexpr u8 FATAL_EXIT_CODE = 18;

    Diag(Diag&& other) noexcept
        : kind(other.kind),
          error_kind(other.error_kind),
          context(other.context),
          where(other.where),
          msg(std::move(other.msg)),
          attached(std::move(other.attached)) {
        other.kind = Kind::None;
    }

    auto operator=(Diag&& other) noexcept -> Diag& {
        if (this == &other) return *this;
        print();
        context = other.context;
        kind = other.kind;
        error_kind = other.error_kind;
        where = other.where;
        msg = std::move(other.msg);
        attached = std::move(other.attached);
        other.kind = Kind::None;
        return *this;
    }

    /// Create an empty diagnostic.
    explicit Diag() : kind(Kind::None) {}

    /// Disallow copying.
    Diag(const Diag&) = delete;
    auto operator=(const Diag&) -> Diag& = delete;

    /// The destructor prints the diagnostic, if it hasn’t been moved from.
    ~Diag();

    /// Issue a diagnostic.
    Diag(const Context* context_, Kind kind_, Location where_, std::string message_)
        : kind(kind_), context(context_), where(where_), msg(std::move(message_)) {}

    /// Issue a diagnostic with no location.
    Diag(Kind kind_, std::string&& message_)
        : kind(kind_), msg(std::move(message_)) {}

    /// Attach another diagnostic to this one.
    ///
    /// \param print_before If true, the diagnostic will be printed
    ///     before this one. Otherwise, it will be printed after this
    ///     one.
    /// \param diag The diagnostic to attach.
    void attach(Diag&& diag, bool print_before = false) {
        attached.emplace_back(std::move(diag), print_before);
    }

    /// Print this diagnostic now. This resets the diagnostic.
    void print();

    /// Print all attached diagnostics now.
    void print_attached();

    /// Suppress this and all attached diagnostics (it will not be printed).
    void suppress(bool issue_attached_diagnostics = false) {
        if (issue_attached_diagnostics) print_attached();
        for (auto& [d, _] : attached) d.suppress();
        kind = Kind::None;
    }

    /// Severity of this diagnostic. A printed or suppressed diagnostic
    /// reports Kind::None.
    [[nodiscard]] auto severity() const -> Kind { return kind; }

    /// Error category.
    [[nodiscard]] auto category() const -> ErrorKind { return error_kind; }

    /// The diagnostic message, without location or severity.
    [[nodiscard]] auto message() const -> const std::string& { return msg; }

    /// Where this diagnostic points.
    [[nodiscard]] auto location() const -> Location { return where; }

    /// Diagnostics attached to this one, in order of attachment.
    [[nodiscard]] auto notes() const -> std::vector<const Diag*> {
        std::vector<const Diag*> out;
        for (auto& [d, _] : attached) out.push_back(&d);
        return out;
    }

    /// Emit a note.
    template <typename... Args>
    static auto Note(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag{Kind::Note, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Emit a note.
    template <typename... Args>
    static auto Note(
        const Context* ctx,
        Location where,
        fmt::format_string<Args...> fmt,
        Args&&... args
    ) -> Diag {
        return Diag{ctx, Kind::Note, where, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Emit a warning.
    template <typename... Args>
    static auto Warning(
        const Context* ctx,
        Location where,
        fmt::format_string<Args...> fmt,
        Args&&... args
    ) -> Diag {
        return Diag{ctx, Kind::Warning, where, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Emit an error.
    template <typename... Args>
    static auto Error(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag{Kind::Error, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Emit an error.
    template <typename... Args>
    static auto Error(
        const Context* ctx,
        Location where,
        fmt::format_string<Args...> fmt,
        Args&&... args
    ) -> Diag {
        return Diag{ctx, Kind::Error, where, fmt::format(fmt, std::forward<Args>(args)...)};
    }

    /// Emit a categorised error.
    template <typename... Args>
    static auto Error(
        ErrorKind category,
        const Context* ctx,
        Location where,
        fmt::format_string<Args...> fmt,
        Args&&... args
    ) -> Diag {
        Diag d{ctx, Kind::Error, where, fmt::format(fmt, std::forward<Args>(args)...)};
        d.error_kind = category;
        return d;
    }

    /// The input does not match the grammar.
    template <typename... Args>
    static auto SyntaxError(
        const Context* ctx,
        Location where,
        fmt::format_string<Args...> fmt,
        Args&&... args
    ) -> Diag {
        return Error(ErrorKind::SyntaxError, ctx, where, fmt, std::forward<Args>(args)...);
    }

    /// A value does not fit the type it is declared with.
    template <typename... Args>
    static auto TypeMismatch(
        const Context* ctx,
        Location where,
        fmt::format_string<Args...> fmt,
        Args&&... args
    ) -> Diag {
        return Error(ErrorKind::TypeMismatch, ctx, where, fmt, std::forward<Args>(args)...);
    }

    /// Valid input that we do not (yet) model.
    template <typename... Args>
    static auto Unsupported(
        const Context* ctx,
        Location where,
        fmt::format_string<Args...> fmt,
        Args&&... args
    ) -> Diag {
        return Error(ErrorKind::Unsupported, ctx, where, fmt, std::forward<Args>(args)...);
    }

    /// Raise an internal compiler error and exit.
    template <typename... Args>
    [[noreturn]]
    static void ICE(fmt::format_string<Args...> fmt, Args&&... args) {
        // The destructor prints the diagnostic, and an ICE exits
        // after printing.
        { Diag _{Kind::ICError, fmt::format(fmt, std::forward<Args>(args)...)}; }
        std::terminate();
    }

    /// Raise a fatal error and exit.
    ///
    /// This is NOT an ICE; instead it is an error that is probably caused by
    /// the underlying system, such as a file that cannot be read.
    template <typename... Args>
    [[noreturn]]
    static void Fatal(fmt::format_string<Args...> fmt, Args&&... args) {
        { Diag _{Kind::FError, fmt::format(fmt, std::forward<Args>(args)...)}; }
        std::terminate();
    }
};
} // namespace lir

#endif // LIR_DIAGS_HH
