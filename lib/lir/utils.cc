#include <lir/utils.hh>

auto lir::utils::NumberWidth(usz number, usz base) -> usz {
    LIR_ASSERT(base > 1);
    usz width = 1;
    while (number >= base) {
        number /= base;
        ++width;
    }
    return width;
}

void lir::utils::ReplaceAll(
    std::string& str,
    std::string_view from,
    std::string_view to
) {
    if (from.empty()) return;
    for (usz i = str.find(from); i != std::string::npos; i = str.find(from, i + to.size()))
        str.replace(i, from.size(), to);
}

auto lir::utils::Trim(std::string_view str) -> std::string_view {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    auto start = str.find_first_not_of(whitespace);
    if (start == std::string_view::npos) return {};
    auto end = str.find_last_not_of(whitespace);
    return str.substr(start, end - start + 1);
}

auto lir::utils::DecodeEscapes(std::string_view str) -> std::string {
    return std::string{str};
}
