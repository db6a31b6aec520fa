#ifndef LIR_RTTI_HH
#define LIR_RTTI_HH

#include <lir/utils.hh>

#include <memory>

namespace lir::detail {
// Check that an object is a pointer to a class type.
template <typename Type>
concept ClassPointer = std::is_pointer_v<std::remove_reference_t<Type>>
                   and std::is_class_v<std::remove_pointer_t<std::remove_reference_t<Type>>>;

template <typename>
struct is_shared_ptr : std::false_type {};

template <typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

// Check that an object is a shared pointer to a class type.
template <typename Type>
concept SharedClassPointer = is_shared_ptr<std::remove_cvref_t<Type>>::value
                         and std::is_class_v<typename std::remove_cvref_t<Type>::element_type>;

// Return const To if either From or To is const.
template <typename From, typename To>
using merge_const = std::conditional_t<std::is_const_v<From>, std::add_const_t<To>, To>;

// This function implements (checked) casting between types.
template <bool checked, typename Target, typename Value>
auto cast_impl(Value&& value) {
    static_assert(
        std::is_same_v<std::remove_cvref_t<Target>, std::remove_const_t<Target>>,
        "Target type of class may at most be const-qualified"
    );

    static_assert(
        std::is_class_v<Target>,
        "Target type of cast must be a (const-qualified) class type"
    );

    static_assert(
        std::is_pointer_v<std::remove_cvref_t<Value>>,
        "Argument of cast function must be a pointer to a class type"
    );

    // Strip references and one level of pointers.
    using ClassType = std::remove_pointer_t<std::remove_reference_t<Value>>;
    using ResultType = merge_const<ClassType, Target>*;

    // Upcasts are always fine.
    if constexpr (std::is_same_v<ClassType, Target> or std::is_base_of_v<Target, ClassType>)
        return static_cast<ResultType>(value);

    // Downcasts consult the dynamic type via Target::classof().
    else if constexpr (std::is_base_of_v<ClassType, Target>) {
        LIR_ASSERT(value, "Cannot perform dynamic cast from null");
        if (Target::classof(value))
            return static_cast<ResultType>(value);

        if constexpr (checked)
            LIR_ASSERT(false, "Unexpected dynamic type");

        return static_cast<ResultType>(nullptr);
    }

    else {
        static_assert(
            always_false<Target>,
            "Cannot cast between unrelated types"
        );
    }
}

// Same as cast_impl(), but keeps shared ownership of the object.
template <bool checked, typename Target, typename Ptr>
auto shared_cast_impl(const Ptr& value) {
    using ClassType = typename Ptr::element_type;
    using ResultType = std::shared_ptr<merge_const<ClassType, Target>>;
    auto raw = cast_impl<checked, Target>(value.get());
    if (not raw) return ResultType{};
    return ResultType{value, raw};
}
} // namespace lir::detail

namespace lir {
/// \brief Cast a value to a target type.
///
/// The \c Target type must be a (possibly const-qualified) class
/// type, and the value must be a pointer to a class type; this
/// function checks if the dynamic type of the value is-a \c Target,
/// and if so, returns a pointer to the value cast to \c Target.
///
/// If the conversion is impossible, e.g. because the types are
/// unrelated, then this is a compile-time error.
///
/// \return A pointer to the value cast to \c Target, or \c nullptr if
///         the dynamic type of the value is-not-a \c Target.
///
/// \see as()
/// \see is()
template <typename Target, detail::ClassPointer Object>
auto cast(Object&& value) { return detail::cast_impl<false, Target>(value); }

/// Cast a shared pointer; the result shares ownership with \p value.
template <typename Target, detail::SharedClassPointer Object>
auto cast(Object&& value) { return detail::shared_cast_impl<false, Target>(value); }

/// \brief Perform a checked cast to a target type.
///
/// This performs the same operation as \c cast(), except
/// that it terminates the program if the cast fails.
template <typename Target, detail::ClassPointer Object>
auto as(Object&& value) { return detail::cast_impl<true, Target>(value); }

/// Checked cast of a shared pointer.
template <typename Target, detail::SharedClassPointer Object>
auto as(Object&& value) { return detail::shared_cast_impl<true, Target>(value); }

/// \brief Check if the dynamic type of a value is one of a set of types.
template <typename... Types, detail::ClassPointer Object>
bool is(Object&& value) { return (bool(detail::cast_impl<false, Types>(value)) or ...); }

template <typename... Types, detail::SharedClassPointer Object>
bool is(Object&& value) { return (bool(detail::cast_impl<false, Types>(value.get())) or ...); }
} // namespace lir

#endif // LIR_RTTI_HH
