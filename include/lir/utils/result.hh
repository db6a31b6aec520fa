#ifndef LIR_RESULT_HH
#define LIR_RESULT_HH

#include <lir/diags.hh>
#include <lir/utils.hh>

#include <variant>

namespace lir {
/// Result type that can hold either a value or a diagnostic.
///
/// If the result contains a diagnostic, the diagnostic is
/// issued in the destructor, as it usually would be, unless
/// it was moved out or suppressed first.
template <typename Type>
requires (not std::is_reference_v<Type>)
class [[nodiscard]] Result {
    using ValueType = std::conditional_t<std::is_void_v<Type>, std::monostate, Type>;
    std::variant<ValueType, Diag> data;

    template <typename T>
    struct make_result {
        using type = Result<T>;
        static constexpr bool value = false;
    };

    template <typename T>
    struct make_result<Result<T>> {
        using type = Result<T>;
        static constexpr bool value = true;
    };

    template <typename T>
    using make_result_t = typename make_result<T>::type;

public:
    Result()
    requires std::is_default_constructible_v<ValueType>
        : data(ValueType{}) {}

    /// Create a result that holds a value.
    Result(ValueType value)
    requires (not std::is_void_v<Type>)
        : data(std::move(value)) {}

    /// Create a result that holds a diagnostic.
    Result(Diag diag) : data(std::move(diag)) {}

    /// Create a result from another result.
    template <typename T>
    requires (not std::is_void_v<Type> and not std::is_same_v<T, Type> and std::convertible_to<T, ValueType>)
    Result(Result<T>&& other) {
        if (other.is_diag()) data = std::move(other.diag());
        else data = ValueType(std::move(other.value()));
    }

    /// Get the diagnostic.
    ///
    /// This returns a && to simplify the `return res.diag()` pattern.
    [[nodiscard]] auto diag() -> Diag&& { return std::move(std::get<Diag>(data)); }

    /// Check if the result holds a diagnostic.
    [[nodiscard]] bool is_diag() const { return std::holds_alternative<Diag>(data); }

    /// Check if the result holds a value.
    [[nodiscard]] bool is_value() const { return std::holds_alternative<ValueType>(data); }

    /// Get the value.
    [[nodiscard]] auto value() -> ValueType&
    requires (not std::is_void_v<Type>)
    { return std::get<ValueType>(data); }

    /// Check if this has a value.
    explicit operator bool() const { return is_value(); }

    /// Access the underlying value.
    [[nodiscard]] auto operator*() -> ValueType& { return std::get<ValueType>(data); }

    /// Access the underlying value.
    [[nodiscard]] auto operator->() -> ValueType* { return &std::get<ValueType>(data); }

    /// \brief Monad bind operator for results.
    ///
    /// If this holds a diagnostic, it just returns that diagnostic;
    /// otherwise, it passes the value to \c cb and returns the result
    /// of that call.
    ///
    /// You can use this to avoid writing code like this
    /// \code{.cpp}
    ///     auto ty = ParseType();
    ///     if (not ty) return ty.diag();
    ///     return MakeVector(ty.value());
    /// \endcode
    ///
    /// and turn it into this instead
    /// \code{.cpp}
    ///     return ParseType() >>= MakeVector;
    /// \endcode
    template <typename Callable>
    [[nodiscard]] auto operator>>=(Callable&& cb) -> make_result_t<std::invoke_result_t<Callable, ValueType&>> {
        using ResultType = make_result_t<std::invoke_result_t<Callable, ValueType&>>;
        if (is_diag()) return diag();
        return ResultType{std::invoke(std::forward<Callable>(cb), value())};
    }
};

/// Return true if any of the provided results are errors.
template <typename... ValueTypes>
bool IsError(Result<ValueTypes>&... results) {
    return (results.is_diag() or ...);
}
} // namespace lir

#endif // LIR_RESULT_HH
