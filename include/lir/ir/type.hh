#ifndef LIR_IR_TYPE_HH
#define LIR_IR_TYPE_HH

#include <lir/forward.hh>
#include <lir/utils.hh>
#include <lir/utils/result.hh>

#include <variant>
#include <vector>

namespace lir {
/// A numbered or named partition of the pointer value space.
///
/// A plain `ptr` lives in numbered address space 0.
class AddressSpace {
    std::variant<u64, std::string> _id;

    explicit AddressSpace(std::variant<u64, std::string> id) : _id(std::move(id)) {}

public:
    AddressSpace() : _id(u64(0)) {}

    static auto Numbered(u64 n) -> AddressSpace { return AddressSpace{n}; }
    static auto Named(std::string name) -> AddressSpace { return AddressSpace{std::move(name)}; }

    [[nodiscard]] bool named() const { return std::holds_alternative<std::string>(_id); }
    [[nodiscard]] bool is_default() const { return not named() and number() == 0; }

    /// Only valid if this is a numbered address space.
    [[nodiscard]] auto number() const -> u64 { return std::get<u64>(_id); }

    /// Only valid if this is a named address space.
    [[nodiscard]] auto name() const -> const std::string& { return std::get<std::string>(_id); }

    /// Print as `addrspace(N)` or `addrspace("name")`.
    [[nodiscard]] auto string() const -> std::string;

    bool operator==(const AddressSpace&) const = default;
};

/// Base class of all IR types.
///
/// IR types are immutable and shared. Unlike values, they have no
/// identity: two types are equal iff they are structurally equal.
class Type {
public:
    enum struct Kind {
        Void,
        Function,
        Integer,
        FloatingPoint,
        AMX,
        MMX,
        Pointer,
        TargetExtension,
        Vector,
        Label,
        Token,
        Metadata,
        Array,
        Structure,
        OpaqueStructure,
    };

    const Kind kind;

protected:
    explicit Type(Kind kind) : kind(kind) {}

public:
    /// Builtin types. These have no parameters, so there only ever
    /// needs to be one of each.
    static const TypePtr VoidTy;
    static const TypePtr LabelTy;
    static const TypePtr TokenTy;
    static const TypePtr MetadataTy;
    static const TypePtr AMXTy;
    static const TypePtr MMXTy;
    static const TypePtr OpaqueTy;

    /// Parse a type expression such as `<vscale x 4 x i32>`.
    ///
    /// The whole input must be a single type.
    static auto Parse(Context* ctx, File& file) -> Result<TypePtr>;
    static auto Parse(Context* ctx, std::string_view text) -> Result<TypePtr>;

    /// Whether values of this type can be produced by instructions.
    ///
    /// True for integers, floats, x86_amx, x86_mmx, pointers,
    /// target extension types and vectors.
    [[nodiscard]] bool is_first_class() const;

    /// Whether this type has a well-defined in-memory size.
    ///
    /// True for integers, floats, pointers, vectors, arrays and
    /// (non-opaque) structures. This is a structural property; the
    /// element types of aggregates are not inspected.
    [[nodiscard]] bool is_sized() const;

    [[nodiscard]] bool is_void() const { return kind == Kind::Void; }
    [[nodiscard]] bool is_label() const { return kind == Kind::Label; }
    [[nodiscard]] bool is_ptr() const { return kind == Kind::Pointer; }
    [[nodiscard]] bool is_integer() const { return kind == Kind::Integer; }
    [[nodiscard]] bool is_vector() const { return kind == Kind::Vector; }

    /// Check if this is `iN` for the given N.
    [[nodiscard]] bool is_integer(usz bits) const;

    /// Get a string representation of this type in LLVM syntax.
    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;

    /// Structural equality.
    bool operator==(const Type& other) const;
};

/// Compare two types structurally. Comparing shared pointers with
/// `==` compares identity, which is almost never what you want.
[[nodiscard]] inline bool Equal(const TypePtr& a, const TypePtr& b) {
    if (a == nullptr or b == nullptr) return a.get() == b.get();
    return *a == *b;
}

/// `R (P0, P1, ...)`.
class FunctionType : public Type {
    TypePtr _ret;
    std::vector<TypePtr> _params;
    bool _variadic;

public:
    FunctionType(TypePtr ret, std::vector<TypePtr> params, bool variadic)
        : Type(Kind::Function),
          _ret(std::move(ret)),
          _params(std::move(params)),
          _variadic(variadic) {}

    static auto Get(TypePtr ret, std::vector<TypePtr> params, bool variadic = false) -> std::shared_ptr<const FunctionType>;

    /// Get the return type of this function.
    [[nodiscard]] auto ret() const -> const TypePtr& { return _ret; }

    /// Get the parameter types of this function.
    [[nodiscard]] auto params() const -> const std::vector<TypePtr>& { return _params; }

    /// True if this function type ends in `...`.
    [[nodiscard]] bool variadic() const { return _variadic; }

    static bool classof(const Type* t) { return t->kind == Kind::Function; }
};

/// `iN`.
class IntegerType : public Type {
    usz _width;

public:
    /// LLVM's limit on integer bit widths.
    static constexpr usz MaxBitWidth = (usz(1) << 23) - 1;

    explicit IntegerType(usz width) : Type(Kind::Integer), _width(width) {}

    /// The width must be between 1 and MaxBitWidth.
    static auto Get(usz width) -> std::shared_ptr<const IntegerType>;

    [[nodiscard]] usz bitwidth() const { return _width; }

    static bool classof(const Type* t) { return t->kind == Kind::Integer; }
};

enum struct FloatKind {
    Half,     ///< IEEE binary16.
    BFloat,   ///< Brain floating point.
    Float,    ///< IEEE binary32.
    Double,   ///< IEEE binary64.
    FP128,    ///< IEEE binary128.
    X86_FP80, ///< x87 extended precision.
    PPC_FP128,
};

constexpr auto StringifyEnum(FloatKind k) -> std::string_view {
    switch (k) {
        case FloatKind::Half: return "half";
        case FloatKind::BFloat: return "bfloat";
        case FloatKind::Float: return "float";
        case FloatKind::Double: return "double";
        case FloatKind::FP128: return "fp128";
        case FloatKind::X86_FP80: return "x86_fp80";
        case FloatKind::PPC_FP128: return "ppc_fp128";
    }
    return "<invalid>";
}

class FloatType : public Type {
    FloatKind _float_kind;

public:
    explicit FloatType(FloatKind k) : Type(Kind::FloatingPoint), _float_kind(k) {}

    static auto Get(FloatKind k) -> std::shared_ptr<const FloatType>;

    [[nodiscard]] auto float_kind() const -> FloatKind { return _float_kind; }

    static bool classof(const Type* t) { return t->kind == Kind::FloatingPoint; }
};

/// `ptr [addrspace(...)]`. Pointers are opaque.
class PointerType : public Type {
    AddressSpace _addrspace;

public:
    explicit PointerType(AddressSpace as) : Type(Kind::Pointer), _addrspace(std::move(as)) {}

    static auto Get(AddressSpace as = {}) -> std::shared_ptr<const PointerType>;

    [[nodiscard]] auto address_space() const -> const AddressSpace& { return _addrspace; }

    static bool classof(const Type* t) { return t->kind == Kind::Pointer; }
};

/// `target("name", params...)`.
class TargetExtensionType : public Type {
public:
    /// A parameter is either a type or an integer.
    using Parameter = std::variant<TypePtr, u64>;

private:
    std::string _name;
    std::vector<Parameter> _params;

public:
    TargetExtensionType(std::string name, std::vector<Parameter> params)
        : Type(Kind::TargetExtension),
          _name(std::move(name)),
          _params(std::move(params)) {}

    static auto Get(std::string name, std::vector<Parameter> params = {}) -> std::shared_ptr<const TargetExtensionType>;

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto params() const -> const std::vector<Parameter>& { return _params; }

    static bool classof(const Type* t) { return t->kind == Kind::TargetExtension; }
};

/// `<[vscale x] N x T>`.
class VectorType : public Type {
    usz _length;
    TypePtr _element_type;
    bool _scalable;

public:
    VectorType(usz length, TypePtr element_type, bool scalable)
        : Type(Kind::Vector),
          _length(length),
          _element_type(std::move(element_type)),
          _scalable(scalable) {}

    /// The length must be nonzero.
    static auto Get(usz length, TypePtr element_type, bool scalable = false) -> std::shared_ptr<const VectorType>;

    [[nodiscard]] usz length() const { return _length; }
    [[nodiscard]] auto element_type() const -> const TypePtr& { return _element_type; }
    [[nodiscard]] bool scalable() const { return _scalable; }

    static bool classof(const Type* t) { return t->kind == Kind::Vector; }
};

/// `[N x T]`.
class ArrayType : public Type {
    usz _length;
    TypePtr _element_type;

public:
    ArrayType(usz length, TypePtr element_type)
        : Type(Kind::Array),
          _length(length),
          _element_type(std::move(element_type)) {}

    /// The length must be nonzero.
    static auto Get(usz length, TypePtr element_type) -> std::shared_ptr<const ArrayType>;

    [[nodiscard]] usz length() const { return _length; }
    [[nodiscard]] auto element_type() const -> const TypePtr& { return _element_type; }

    static bool classof(const Type* t) { return t->kind == Kind::Array; }
};

/// `{ T, ... }` or, if packed, `<{ T, ... }>`.
class StructType : public Type {
    std::vector<TypePtr> _members;
    bool _packed;

public:
    StructType(std::vector<TypePtr> members, bool packed)
        : Type(Kind::Structure),
          _members(std::move(members)),
          _packed(packed) {}

    static auto Get(std::vector<TypePtr> members, bool packed = false) -> std::shared_ptr<const StructType>;

    [[nodiscard]] usz member_count() const { return _members.size(); }
    [[nodiscard]] auto members() const -> const std::vector<TypePtr>& { return _members; }
    [[nodiscard]] bool packed() const { return _packed; }

    static bool classof(const Type* t) { return t->kind == Kind::Structure; }
};
} // namespace lir

/// Formatter for types.
template <>
struct fmt::formatter<lir::Type> : formatter<string_view> {
    template <typename FormatContext>
    auto format(const lir::Type& t, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", t.string());
    }
};

#endif // LIR_IR_TYPE_HH
