#ifndef LIR_SYNTAX_TOKEN_HH
#define LIR_SYNTAX_TOKEN_HH

#include <lir/location.hh>
#include <lir/utils.hh>

namespace lir::syntax {
template <typename TKind>
requires std::is_enum_v<TKind>
struct Token {
    TKind kind = TKind::Invalid;
    Location location{};
    std::string text{};
    u64 integer_value{};
    f64 float_value{};
};
} // namespace lir::syntax

#endif // LIR_SYNTAX_TOKEN_HH
