#ifndef LIR_SYNTAX_LEXER_HH
#define LIR_SYNTAX_LEXER_HH

#include <lir/diags.hh>
#include <lir/file.hh>
#include <lir/utils.hh>

#include <string_view>
#include <utility>

namespace lir::syntax {
namespace detail {
/// API for the lexer to make sure the lexer code doesn’t
/// try to do funny stuff with `curr`; the next character
/// must ONLY ever be extracted by calling `next()`.
///
/// LLVM IR strings are byte strings, so this does not decode
/// UTF-8; multibyte characters only ever occur in strings and
/// comments, where they are passed through as is.
class CharacterRange {
    const char* curr;
    const char* end;
    const char* begin;
    bool exhausted = false;

public:
    explicit CharacterRange(const File* f)
        : curr(f->data()),
          end(f->data() + f->size()),
          begin(f->data()) {}

    explicit CharacterRange(std::string_view s)
        : curr(s.data()),
          end(s.data() + s.size()),
          begin(s.data()) {}

    /// Get the offset of the last character returned by `next()`.
    [[nodiscard]]
    auto current_offset() const -> u32 {
        return u32(curr - begin) - (exhausted ? 0 : 1);
    }

    /// Whether `next()` has run past the end of the input.
    [[nodiscard]]
    auto at_end() const -> bool { return exhausted; }

    /// Get the next character, or 0 at the end of the input.
    [[nodiscard]]
    auto next() -> u32 {
        if (curr >= end) {
            exhausted = true;
            return 0;
        }

        const auto c = u8(*curr++);

        /// Convert CRLF -> LF, LFCR -> LF, CR -> LF, and LF -> LF.
        if (c == '\r' || c == '\n') {
            if (curr != end && (*curr == '\r' || *curr == '\n')) {
                bool same = c == *curr;

                /// CRCR or LFLF
                if (same) return '\n';

                /// CRLF or LFCR
                curr++;
            }

            return '\n';
        }

        /// A NUL byte is returned as is; use `at_end()` to tell it
        /// apart from the end of the input.
        return c;
    }
};
} // namespace detail

template <typename TToken>
struct Lexer {
    detail::CharacterRange chars;
    TToken tok{};
    Context* context{};
    u32 lastc = ' ';

    Lexer(Context* ctx, const File* file)
        : chars(detail::CharacterRange(file)), context(ctx) {
        tok.location.file_id = (decltype(tok.location.file_id)) file->file_id();
        NextChar();
    }

    [[nodiscard]]
    auto CurrentOffset() const -> u32 { return chars.current_offset(); }

    [[nodiscard]]
    auto AtEnd() const -> bool { return chars.at_end(); }

    void NextChar() {
        lastc = chars.next();
    }

    template <typename... Args>
    auto Error(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag::SyntaxError(context, tok.location, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto Error(Location where, fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag::SyntaxError(context, where, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto Unsupported(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag::Unsupported(context, tok.location, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    auto Note(fmt::format_string<Args...> fmt, Args&&... args) -> Diag {
        return Diag::Note(context, tok.location, fmt, std::forward<Args>(args)...);
    }

    static auto IsSpace(u32 c) -> bool {
        return c == ' ' or c == '\t' or c == '\n'
            or c == '\r' or c == '\f' or c == '\v';
    }
    static auto IsAlpha(u32 c) -> bool {
        return (c >= 'a' and c <= 'z')
            or (c >= 'A' and c <= 'Z');
    }
    static auto IsDigit(u32 c) -> bool {
        return c >= '0' and c <= '9';
    }
    static auto IsHexDigit(u32 c) -> bool {
        return (c >= '0' and c <= '9')
            or (c >= 'a' and c <= 'f')
            or (c >= 'A' and c <= 'F');
    }
    static auto IsAlphaNumeric(u32 c) -> bool {
        return IsAlpha(c) or IsDigit(c);
    }
};
} // namespace lir::syntax

#endif // LIR_SYNTAX_LEXER_HH
