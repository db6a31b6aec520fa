#ifndef LIR_DETAIL_DEFER_HH
#define LIR_DETAIL_DEFER_HH

#include <lir/utils.hh>

namespace lir::detail {
template <typename Callable>
struct DeferStage2 {
    Callable cb;
    ~DeferStage2() { cb(); }

    explicit DeferStage2(Callable&& _cb)
        : cb(std::forward<Callable>(_cb)) {}
};

struct DeferStage1 {
    template <typename Callable>
    DeferStage2<Callable> operator->*(Callable&& cb) {
        return DeferStage2<Callable>{std::forward<Callable>(cb)};
    }
};

/// Set a variable for the rest of the scope and restore the old value
/// when the scope is left.
template <typename T>
class TempSet {
    T& ref;
    T old;

public:
    TempSet(T& var, T new_value) : ref(var), old(std::move(var)) { ref = std::move(new_value); }
    ~TempSet() { ref = std::move(old); }

    TempSet(const TempSet&) = delete;
    auto operator=(const TempSet&) -> TempSet& = delete;
};
} // namespace lir::detail

#define defer auto LIR_CAT(_lir_defer_, __COUNTER__) = ::lir::detail::DeferStage1{}->*[&]

#endif // LIR_DETAIL_DEFER_HH
