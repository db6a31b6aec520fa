#ifndef LIR_IR_IR_HH
#define LIR_IR_IR_HH

#include <lir/forward.hh>
#include <lir/ir/type.hh>
#include <lir/location.hh>
#include <lir/utils.hh>
#include <lir/utils/result.hh>
#include <lir/utils/rtti.hh>

#include <compare>
#include <optional>
#include <string>
#include <vector>

namespace lir {
class LabelValue;
using LabelPtr = std::shared_ptr<const LabelValue>;

/// ===========================================================================
///  Attributes.
/// ===========================================================================
/// An attribute of a parameter, argument or return value.
///
/// Some attributes carry a type (`byval(T)`), some an integer
/// (`align 8`, `dereferenceable(16)`), and most nothing at all.
struct ParameterAttribute {
    enum struct Kind {
        ZeroExt,
        SignExt,
        InReg,
        ByVal,
        ByRef,
        Preallocated,
        InAlloca,
        StructRet,
        ElementType,
        Align,
        NoAlias,
        NoCapture,
        NoFree,
        Nest,
        Returned,
        NonNull,
        Dereferenceable,
        DereferenceableOrNull,
        SwiftSelf,
        SwiftAsync,
        SwiftError,
        ImmArg,
        NoUndef,
        AlignStack,
        AllocAlign,
        AllocPtr,
        ReadNone,
        ReadOnly,
        WriteOnly,
        Writable,
        DeadOnUnwind,
    };

    Kind kind;
    TypePtr type{};
    std::optional<u64> integer{};

    /// Whether attributes of this kind are written `kind(T)`.
    [[nodiscard]] static bool TakesType(Kind k);

    /// Whether attributes of this kind are written `kind(N)` or `align N`.
    [[nodiscard]] static bool TakesInteger(Kind k);

    /// Look up an attribute keyword.
    [[nodiscard]] static auto FromKeyword(std::string_view kw) -> std::optional<Kind>;

    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;

    bool operator==(const ParameterAttribute& other) const;
};

constexpr auto StringifyEnum(ParameterAttribute::Kind k) -> std::string_view {
    using K = ParameterAttribute::Kind;
    switch (k) {
        case K::ZeroExt: return "zeroext";
        case K::SignExt: return "signext";
        case K::InReg: return "inreg";
        case K::ByVal: return "byval";
        case K::ByRef: return "byref";
        case K::Preallocated: return "preallocated";
        case K::InAlloca: return "inalloca";
        case K::StructRet: return "sret";
        case K::ElementType: return "elementtype";
        case K::Align: return "align";
        case K::NoAlias: return "noalias";
        case K::NoCapture: return "nocapture";
        case K::NoFree: return "nofree";
        case K::Nest: return "nest";
        case K::Returned: return "returned";
        case K::NonNull: return "nonnull";
        case K::Dereferenceable: return "dereferenceable";
        case K::DereferenceableOrNull: return "dereferenceable_or_null";
        case K::SwiftSelf: return "swiftself";
        case K::SwiftAsync: return "swiftasync";
        case K::SwiftError: return "swifterror";
        case K::ImmArg: return "immarg";
        case K::NoUndef: return "noundef";
        case K::AlignStack: return "alignstack";
        case K::AllocAlign: return "allocalign";
        case K::AllocPtr: return "allocptr";
        case K::ReadNone: return "readnone";
        case K::ReadOnly: return "readonly";
        case K::WriteOnly: return "writeonly";
        case K::Writable: return "writable";
        case K::DeadOnUnwind: return "dead_on_unwind";
    }
    return "<invalid>";
}

/// A `!name !N` attachment on an operation or function.
struct MetadataAttachment {
    /// The name without the leading `!`.
    std::string name;

    /// The attached node, e.g. `!0` or `!{}`.
    std::string node;

    bool operator==(const MetadataAttachment&) const = default;
};

/// ===========================================================================
///  Constants.
/// ===========================================================================
/// A constant literal. Constants are untyped; the type comes from the
/// ConstantValue that wraps them.
class Constant {
public:
    enum struct Kind {
        Void,
        Boolean,
        Integer,
        FloatingPoint,
        NullPointer,
        NoneToken,
        Structure,
        Array,
        Vector,
        Zero,
        Metadata,
        Undefined,
        Poison,
    };

    const Kind kind;

protected:
    explicit Constant(Kind k) : kind(k) {}

public:
    virtual ~Constant() = default;

    /// Constants without a payload.
    static const ConstantPtr VoidConst;
    static const ConstantPtr Null;
    static const ConstantPtr None;
    static const ConstantPtr Zero;
    static const ConstantPtr Undef;
    static const ConstantPtr Poison;

    /// Check whether a constant can be used as a value of a type.
    ///
    /// Zero and Poison fit every type; Undefined fits every type
    /// except label and void. Aggregates must match in element
    /// count and element types.
    [[nodiscard]] bool is_compatible_with(const Type& t) const;

    /// Print the constant without its type.
    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;
};

class BooleanConstant : public Constant {
    bool _value;

public:
    explicit BooleanConstant(bool value) : Constant(Kind::Boolean), _value(value) {}

    static auto Get(bool value) -> ConstantPtr;

    [[nodiscard]] bool value() const { return _value; }

    static bool classof(const Constant* c) { return c->kind == Kind::Boolean; }
};

/// A 64-bit two's complement integer.
class IntegerConstant : public Constant {
    i64 _value;

public:
    explicit IntegerConstant(i64 value) : Constant(Kind::Integer), _value(value) {}

    static auto Get(i64 value) -> ConstantPtr;

    [[nodiscard]] i64 value() const { return _value; }

    static bool classof(const Constant* c) { return c->kind == Kind::Integer; }
};

/// An IEEE double. Narrower float types store their value widened.
class FloatConstant : public Constant {
    f64 _value;

public:
    explicit FloatConstant(f64 value) : Constant(Kind::FloatingPoint), _value(value) {}

    static auto Get(f64 value) -> ConstantPtr;

    [[nodiscard]] f64 value() const { return _value; }

    static bool classof(const Constant* c) { return c->kind == Kind::FloatingPoint; }
};

/// A structure, array or vector of typed values.
class AggregateConstant : public Constant {
    std::vector<ValuePtr> _elements;

public:
    AggregateConstant(Kind k, std::vector<ValuePtr> elements)
        : Constant(k), _elements(std::move(elements)) {
        LIR_ASSERT(
            k == Kind::Structure or k == Kind::Array or k == Kind::Vector,
            "Not an aggregate constant kind"
        );
    }

    static auto Structure(std::vector<ValuePtr> elements) -> ConstantPtr;
    static auto Array(std::vector<ValuePtr> elements) -> ConstantPtr;
    static auto Vector(std::vector<ValuePtr> elements) -> ConstantPtr;

    [[nodiscard]] auto elements() const -> const std::vector<ValuePtr>& { return _elements; }

    static bool classof(const Constant* c) {
        return c->kind == Kind::Structure or c->kind == Kind::Array or c->kind == Kind::Vector;
    }
};

/// A metadata operand, kept as written (`!0`, `!"str"`, `!{...}`).
class MetadataConstant : public Constant {
    std::string _node;

public:
    explicit MetadataConstant(std::string node) : Constant(Kind::Metadata), _node(std::move(node)) {}

    static auto Get(std::string node) -> ConstantPtr;

    [[nodiscard]] auto node() const -> const std::string& { return _node; }

    static bool classof(const Constant* c) { return c->kind == Kind::Metadata; }
};

/// ===========================================================================
///  Values.
/// ===========================================================================
/// Anything that can be used as an operand. Every value has a type.
class Value {
public:
    enum struct Kind {
        Constant,
        Identifier,
        Instruction,
        Global,
        Function,
        Label,
    };

    const Kind kind;

private:
    TypePtr _type;

protected:
    Value(Kind k, TypePtr t) : kind(k), _type(std::move(t)) {
        LIR_ASSERT(_type, "Values must have a type");
    }

public:
    virtual ~Value() = default;

    /// Get the declared or derived type of this value.
    [[nodiscard]] auto type() const -> const TypePtr& { return _type; }

    /// Print the value preceded by its type, e.g. `i32 %x`.
    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;

    /// Print the value without its type, e.g. `%x`.
    [[nodiscard]] auto operand_string(bool use_colour = false) const -> std::string;
};

/// A constant of a given type.
class ConstantValue : public Value {
    ConstantPtr _constant;

    ConstantValue(TypePtr t, ConstantPtr c) : Value(Kind::Constant, std::move(t)), _constant(std::move(c)) {}

public:
    /// Create a constant value. Fails with a type mismatch if the
    /// constant is not compatible with the type.
    static auto Create(
        TypePtr type,
        ConstantPtr constant,
        const Context* ctx = nullptr,
        Location where = {}
    ) -> Result<ValuePtr>;

    /// The `void` value returned by `ret void`.
    static auto Void() -> ValuePtr;

    [[nodiscard]] auto constant() const -> const ConstantPtr& { return _constant; }

    static bool classof(const Value* v) { return v->kind == Kind::Constant; }
};

/// A reference to a named value. The name includes its sigil.
class IdentifierValue : public Value {
    std::string _name;

public:
    IdentifierValue(TypePtr t, std::string name) : Value(Kind::Identifier, std::move(t)), _name(std::move(name)) {
        LIR_ASSERT(
            _name.size() > 1 and (_name[0] == '%' or _name[0] == '@'),
            "Identifier '{}' must start with '%' or '@'",
            _name
        );
    }

    [[nodiscard]] auto name() const -> const std::string& { return _name; }

    /// Whether this names a local (`%`) value.
    [[nodiscard]] bool is_local() const { return _name[0] == '%'; }

    static bool classof(const Value* v) { return v->kind == Kind::Identifier; }
};

/// An instruction used as a value, e.g. a constant expression.
class InstructionValue : public Value {
    InstructionPtr _instruction;

    InstructionValue(TypePtr t, InstructionPtr i) : Value(Kind::Instruction, std::move(t)), _instruction(std::move(i)) {}

public:
    /// Create an instruction value. The type is derived from the
    /// instruction, which fails if e.g. an index path is invalid.
    static auto Create(InstructionPtr instruction, const Context* ctx = nullptr) -> Result<ValuePtr>;

    [[nodiscard]] auto instruction() const -> const InstructionPtr& { return _instruction; }

    static bool classof(const Value* v) { return v->kind == Kind::Instruction; }
};

/// A global variable. Its type is a pointer into its address space.
class GlobalValue : public Value {
    std::string _name;
    TypePtr _value_type;
    AddressSpace _addrspace;

public:
    GlobalValue(std::string name, TypePtr value_type, AddressSpace as = {})
        : Value(Kind::Global, PointerType::Get(as)),
          _name(std::move(name)),
          _value_type(std::move(value_type)),
          _addrspace(std::move(as)) {}

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto value_type() const -> const TypePtr& { return _value_type; }
    [[nodiscard]] auto address_space() const -> const AddressSpace& { return _addrspace; }

    static bool classof(const Value* v) { return v->kind == Kind::Global; }
};

/// A function used as a value. Its type is a pointer into its address space.
class FunctionValue : public Value {
    std::string _name;
    std::shared_ptr<const FunctionType> _function_type;
    AddressSpace _addrspace;

public:
    FunctionValue(std::string name, std::shared_ptr<const FunctionType> ty, AddressSpace as = {})
        : Value(Kind::Function, PointerType::Get(as)),
          _name(std::move(name)),
          _function_type(std::move(ty)),
          _addrspace(std::move(as)) {}

    [[nodiscard]] auto name() const -> const std::string& { return _name; }
    [[nodiscard]] auto function_type() const -> const std::shared_ptr<const FunctionType>& { return _function_type; }
    [[nodiscard]] auto address_space() const -> const AddressSpace& { return _addrspace; }

    static bool classof(const Value* v) { return v->kind == Kind::Function; }
};

/// A reference to a basic block.
class LabelValue : public Value {
    friend parser::Parser;

    std::string _name;

    /// Non-owning. The block belongs to the Function whose body uses
    /// this label, so the pointer is only valid while that function
    /// is alive. The parser binds it before the function is returned
    /// and never changes it afterwards.
    const BasicBlock* _block{};

public:
    explicit LabelValue(std::string name, const BasicBlock* block = nullptr)
        : Value(Kind::Label, Type::LabelTy),
          _name(std::move(name)),
          _block(block) {}

    /// The name including the `%` sigil.
    [[nodiscard]] auto name() const -> const std::string& { return _name; }

    /// The block this label refers to, or null if it is unresolved.
    ///
    /// Do not use the result after the owning function is destroyed.
    [[nodiscard]] auto block() const -> const BasicBlock* { return _block; }

    static bool classof(const Value* v) { return v->kind == Kind::Label; }
};

/// ===========================================================================
///  Flags.
/// ===========================================================================
/// Which kinds of overflow an operation may perform without
/// producing poison. `nuw` forbids unsigned wrapping and `nsw`
/// forbids signed wrapping.
struct AllowedWrapping {
    bool can_wrap_unsigned = true;
    bool can_wrap_signed = true;

    bool operator==(const AllowedWrapping&) const = default;
};

/// Memory ordering of atomic operations.
enum struct Ordering {
    Unordered,
    Monotonic,
    Acquire,
    Release,
    AcquireRelease,
    SequentiallyConsistent,
};

constexpr auto StringifyEnum(Ordering o) -> std::string_view {
    switch (o) {
        case Ordering::Unordered: return "unordered";
        case Ordering::Monotonic: return "monotonic";
        case Ordering::Acquire: return "acquire";
        case Ordering::Release: return "release";
        case Ordering::AcquireRelease: return "acq_rel";
        case Ordering::SequentiallyConsistent: return "seq_cst";
    }
    return "<invalid>";
}

/// Compare the strength of two orderings.
///
/// Orderings form a partial order: acquire and release are
/// unordered with respect to each other.
auto CompareOrderings(Ordering a, Ordering b) -> std::partial_ordering;

enum struct IntegerComparison {
    Equal,
    NotEqual,
    UnsignedGreaterThan,
    UnsignedGreaterOrEqual,
    UnsignedLessThan,
    UnsignedLessOrEqual,
    SignedGreaterThan,
    SignedGreaterOrEqual,
    SignedLessThan,
    SignedLessOrEqual,
};

constexpr auto StringifyEnum(IntegerComparison c) -> std::string_view {
    switch (c) {
        case IntegerComparison::Equal: return "eq";
        case IntegerComparison::NotEqual: return "ne";
        case IntegerComparison::UnsignedGreaterThan: return "ugt";
        case IntegerComparison::UnsignedGreaterOrEqual: return "uge";
        case IntegerComparison::UnsignedLessThan: return "ult";
        case IntegerComparison::UnsignedLessOrEqual: return "ule";
        case IntegerComparison::SignedGreaterThan: return "sgt";
        case IntegerComparison::SignedGreaterOrEqual: return "sge";
        case IntegerComparison::SignedLessThan: return "slt";
        case IntegerComparison::SignedLessOrEqual: return "sle";
    }
    return "<invalid>";
}

enum struct GetPointerKind {
    Regular,
    InBounds,
    InRange,
};

enum struct TailCallHint {
    Indifferent,
    ShouldTail,
    MustTail,
    NeverTail,
};

constexpr auto StringifyEnum(TailCallHint h) -> std::string_view {
    switch (h) {
        case TailCallHint::Indifferent: return "";
        case TailCallHint::ShouldTail: return "tail";
        case TailCallHint::MustTail: return "musttail";
        case TailCallHint::NeverTail: return "notail";
    }
    return "<invalid>";
}

/// ===========================================================================
///  Instructions.
/// ===========================================================================
/// An instruction that does not end a basic block.
class Instruction {
public:
    enum struct Kind {
        /// Binary instructions.
        Add,
        Subtract,
        Multiply,
        UnsignedDivide,
        SignedDivide,
        UnsignedRemainder,
        SignedRemainder,
        ShiftLeft,
        LogicalShiftRight,
        ArithmeticShiftRight,
        And,
        Or,
        ExclusiveOr,

        /// Aggregates.
        ExtractValue,
        InsertValue,

        /// Memory.
        StackAllocate,
        Load,
        AtomicLoad,
        Store,
        AtomicStore,
        Fence,
        GetElementPointer,

        /// Casts.
        Truncate,
        ZeroExtend,
        SignExtend,
        PointerToInteger,
        IntegerToPointer,
        BitCast,
        AddressSpaceCast,

        /// Other.
        CompareIntegers,
        Select,
        Freeze,
        Call,
    };

    const Kind kind;

private:
    Location loc;

protected:
    Instruction(Kind k, Location l) : kind(k), loc(l) {}

public:
    virtual ~Instruction() = default;

    /// Get the source location of this instruction.
    [[nodiscard]] auto location() const -> Location { return loc; }

    /// Derive the type of the value this instruction produces.
    ///
    /// Instructions that produce no value yield `void`.
    [[nodiscard]] auto result_type(const Context* ctx = nullptr) const -> Result<TypePtr>;

    /// Print this instruction in LLVM syntax, without a `%x =` prefix.
    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;
};

constexpr auto StringifyEnum(Instruction::Kind k) -> std::string_view {
    using K = Instruction::Kind;
    switch (k) {
        case K::Add: return "add";
        case K::Subtract: return "sub";
        case K::Multiply: return "mul";
        case K::UnsignedDivide: return "udiv";
        case K::SignedDivide: return "sdiv";
        case K::UnsignedRemainder: return "urem";
        case K::SignedRemainder: return "srem";
        case K::ShiftLeft: return "shl";
        case K::LogicalShiftRight: return "lshr";
        case K::ArithmeticShiftRight: return "ashr";
        case K::And: return "and";
        case K::Or: return "or";
        case K::ExclusiveOr: return "xor";
        case K::ExtractValue: return "extractvalue";
        case K::InsertValue: return "insertvalue";
        case K::StackAllocate: return "alloca";
        case K::Load: return "load";
        case K::AtomicLoad: return "load";
        case K::Store: return "store";
        case K::AtomicStore: return "store";
        case K::Fence: return "fence";
        case K::GetElementPointer: return "getelementptr";
        case K::Truncate: return "trunc";
        case K::ZeroExtend: return "zext";
        case K::SignExtend: return "sext";
        case K::PointerToInteger: return "ptrtoint";
        case K::IntegerToPointer: return "inttoptr";
        case K::BitCast: return "bitcast";
        case K::AddressSpaceCast: return "addrspacecast";
        case K::CompareIntegers: return "icmp";
        case K::Select: return "select";
        case K::Freeze: return "freeze";
        case K::Call: return "call";
    }
    return "<invalid>";
}

/// A binary operator.
class BinaryInst : public Instruction {
    ValuePtr _lhs;
    ValuePtr _rhs;
    AllowedWrapping _wrapping{};
    bool _exact = false;
    bool _disjoint = false;

public:
    BinaryInst(Kind k, ValuePtr lhs, ValuePtr rhs, Location loc = {})
        : Instruction(k, loc), _lhs(std::move(lhs)), _rhs(std::move(rhs)) {
        LIR_ASSERT(k >= Kind::Add and k <= Kind::ExclusiveOr, "Not a binary instruction");
    }

    /// Whether instructions of this kind take `nuw` and `nsw`.
    static bool HasWrappingFlags(Kind k) {
        return k == Kind::Add or k == Kind::Subtract or k == Kind::Multiply or k == Kind::ShiftLeft;
    }

    /// Whether instructions of this kind take `exact`.
    static bool HasExactFlag(Kind k) {
        return k == Kind::UnsignedDivide or k == Kind::SignedDivide
            or k == Kind::LogicalShiftRight or k == Kind::ArithmeticShiftRight;
    }

    [[nodiscard]] auto lhs() const -> const ValuePtr& { return _lhs; }
    [[nodiscard]] auto rhs() const -> const ValuePtr& { return _rhs; }
    [[nodiscard]] auto wrapping() const -> AllowedWrapping { return _wrapping; }
    [[nodiscard]] bool is_exact() const { return _exact; }
    [[nodiscard]] bool is_disjoint() const { return _disjoint; }

    void set_wrapping(AllowedWrapping w) {
        LIR_ASSERT(HasWrappingFlags(kind), "'{}' does not take wrapping flags", kind);
        _wrapping = w;
    }

    void set_exact() {
        LIR_ASSERT(HasExactFlag(kind), "'{}' does not take 'exact'", kind);
        _exact = true;
    }

    void set_disjoint() {
        LIR_ASSERT(kind == Kind::Or, "Only 'or' takes 'disjoint'");
        _disjoint = true;
    }

    static bool classof(const Instruction* i) { return i->kind >= Kind::Add and i->kind <= Kind::ExclusiveOr; }
};

class ExtractValueInst : public Instruction {
    ValuePtr _aggregate;
    std::vector<u64> _indices;

public:
    ExtractValueInst(ValuePtr aggregate, std::vector<u64> indices, Location loc = {})
        : Instruction(Kind::ExtractValue, loc),
          _aggregate(std::move(aggregate)),
          _indices(std::move(indices)) {}

    [[nodiscard]] auto aggregate() const -> const ValuePtr& { return _aggregate; }
    [[nodiscard]] auto indices() const -> const std::vector<u64>& { return _indices; }

    static bool classof(const Instruction* i) { return i->kind == Kind::ExtractValue; }
};

class InsertValueInst : public Instruction {
    ValuePtr _aggregate;
    ValuePtr _element;
    std::vector<u64> _indices;

public:
    InsertValueInst(ValuePtr aggregate, ValuePtr element, std::vector<u64> indices, Location loc = {})
        : Instruction(Kind::InsertValue, loc),
          _aggregate(std::move(aggregate)),
          _element(std::move(element)),
          _indices(std::move(indices)) {}

    [[nodiscard]] auto aggregate() const -> const ValuePtr& { return _aggregate; }
    [[nodiscard]] auto element() const -> const ValuePtr& { return _element; }
    [[nodiscard]] auto indices() const -> const std::vector<u64>& { return _indices; }

    static bool classof(const Instruction* i) { return i->kind == Kind::InsertValue; }
};

/// `alloca`.
class AllocaInst : public Instruction {
    TypePtr _element_type;
    ValuePtr _count{};
    std::optional<u64> _alignment{};
    std::optional<AddressSpace> _addrspace{};
    bool _can_reuse = false;

public:
    explicit AllocaInst(TypePtr element_type, Location loc = {})
        : Instruction(Kind::StackAllocate, loc), _element_type(std::move(element_type)) {}

    [[nodiscard]] auto element_type() const -> const TypePtr& { return _element_type; }

    /// The number of elements, or null if there is only one.
    [[nodiscard]] auto count() const -> const ValuePtr& { return _count; }
    [[nodiscard]] auto alignment() const -> std::optional<u64> { return _alignment; }
    [[nodiscard]] auto address_space() const -> const std::optional<AddressSpace>& { return _addrspace; }

    /// Set by `inalloca`.
    [[nodiscard]] bool can_reuse() const { return _can_reuse; }

    void set_count(ValuePtr count) { _count = std::move(count); }
    void set_alignment(u64 align) { _alignment = align; }
    void set_address_space(AddressSpace as) { _addrspace = std::move(as); }
    void set_can_reuse() { _can_reuse = true; }

    static bool classof(const Instruction* i) { return i->kind == Kind::StackAllocate; }
};

class LoadInst : public Instruction {
    TypePtr _type;
    ValuePtr _pointer;
    std::optional<u64> _alignment{};
    bool _volatile = false;

public:
    LoadInst(TypePtr type, ValuePtr pointer, Location loc = {})
        : Instruction(Kind::Load, loc), _type(std::move(type)), _pointer(std::move(pointer)) {}

    [[nodiscard]] auto type() const -> const TypePtr& { return _type; }
    [[nodiscard]] auto pointer() const -> const ValuePtr& { return _pointer; }
    [[nodiscard]] auto alignment() const -> std::optional<u64> { return _alignment; }
    [[nodiscard]] bool is_volatile() const { return _volatile; }

    void set_alignment(u64 align) { _alignment = align; }
    void set_volatile() { _volatile = true; }

    static bool classof(const Instruction* i) { return i->kind == Kind::Load; }
};

/// Common fields of atomic loads and stores and fences.
class AtomicInst : public Instruction {
    Ordering _ordering;
    std::optional<std::string> _sync_scope{};

protected:
    AtomicInst(Kind k, Ordering o, Location loc) : Instruction(k, loc), _ordering(o) {}

public:
    [[nodiscard]] auto ordering() const -> Ordering { return _ordering; }
    [[nodiscard]] auto sync_scope() const -> const std::optional<std::string>& { return _sync_scope; }

    void set_sync_scope(std::string scope) { _sync_scope = std::move(scope); }

    static bool classof(const Instruction* i) {
        return i->kind == Kind::AtomicLoad or i->kind == Kind::AtomicStore or i->kind == Kind::Fence;
    }
};

class AtomicLoadInst : public AtomicInst {
    TypePtr _type;
    ValuePtr _pointer;
    u64 _alignment;
    bool _volatile = false;

public:
    AtomicLoadInst(TypePtr type, ValuePtr pointer, Ordering o, u64 alignment, Location loc = {})
        : AtomicInst(Kind::AtomicLoad, o, loc),
          _type(std::move(type)),
          _pointer(std::move(pointer)),
          _alignment(alignment) {}

    [[nodiscard]] auto type() const -> const TypePtr& { return _type; }
    [[nodiscard]] auto pointer() const -> const ValuePtr& { return _pointer; }
    [[nodiscard]] u64 alignment() const { return _alignment; }
    [[nodiscard]] bool is_volatile() const { return _volatile; }

    void set_volatile() { _volatile = true; }

    static bool classof(const Instruction* i) { return i->kind == Kind::AtomicLoad; }
};

class StoreInst : public Instruction {
    ValuePtr _value;
    ValuePtr _pointer;
    std::optional<u64> _alignment{};
    bool _volatile = false;

public:
    StoreInst(ValuePtr value, ValuePtr pointer, Location loc = {})
        : Instruction(Kind::Store, loc), _value(std::move(value)), _pointer(std::move(pointer)) {}

    [[nodiscard]] auto value() const -> const ValuePtr& { return _value; }
    [[nodiscard]] auto pointer() const -> const ValuePtr& { return _pointer; }
    [[nodiscard]] auto alignment() const -> std::optional<u64> { return _alignment; }
    [[nodiscard]] bool is_volatile() const { return _volatile; }

    void set_alignment(u64 align) { _alignment = align; }
    void set_volatile() { _volatile = true; }

    static bool classof(const Instruction* i) { return i->kind == Kind::Store; }
};

class AtomicStoreInst : public AtomicInst {
    ValuePtr _value;
    ValuePtr _pointer;
    u64 _alignment;
    bool _volatile = false;

public:
    AtomicStoreInst(ValuePtr value, ValuePtr pointer, Ordering o, u64 alignment, Location loc = {})
        : AtomicInst(Kind::AtomicStore, o, loc),
          _value(std::move(value)),
          _pointer(std::move(pointer)),
          _alignment(alignment) {}

    [[nodiscard]] auto value() const -> const ValuePtr& { return _value; }
    [[nodiscard]] auto pointer() const -> const ValuePtr& { return _pointer; }
    [[nodiscard]] u64 alignment() const { return _alignment; }
    [[nodiscard]] bool is_volatile() const { return _volatile; }

    void set_volatile() { _volatile = true; }

    static bool classof(const Instruction* i) { return i->kind == Kind::AtomicStore; }
};

class FenceInst : public AtomicInst {
public:
    explicit FenceInst(Ordering o, Location loc = {}) : AtomicInst(Kind::Fence, o, loc) {}

    static bool classof(const Instruction* i) { return i->kind == Kind::Fence; }
};

/// `getelementptr`.
class GetElementPtrInst : public Instruction {
    TypePtr _source_type;
    ValuePtr _pointer;
    std::vector<ValuePtr> _indices;
    GetPointerKind _pointer_kind = GetPointerKind::Regular;
    i64 _inrange_low = 0;
    i64 _inrange_high = 0;

public:
    GetElementPtrInst(TypePtr source_type, ValuePtr pointer, std::vector<ValuePtr> indices, Location loc = {})
        : Instruction(Kind::GetElementPointer, loc),
          _source_type(std::move(source_type)),
          _pointer(std::move(pointer)),
          _indices(std::move(indices)) {}

    [[nodiscard]] auto source_type() const -> const TypePtr& { return _source_type; }
    [[nodiscard]] auto pointer() const -> const ValuePtr& { return _pointer; }
    [[nodiscard]] auto indices() const -> const std::vector<ValuePtr>& { return _indices; }
    [[nodiscard]] auto pointer_kind() const -> GetPointerKind { return _pointer_kind; }

    /// Only meaningful if the pointer kind is InRange.
    [[nodiscard]] i64 inrange_low() const { return _inrange_low; }
    [[nodiscard]] i64 inrange_high() const { return _inrange_high; }

    void set_inbounds() { _pointer_kind = GetPointerKind::InBounds; }
    void set_inrange(i64 low, i64 high) {
        _pointer_kind = GetPointerKind::InRange;
        _inrange_low = low;
        _inrange_high = high;
    }

    static bool classof(const Instruction* i) { return i->kind == Kind::GetElementPointer; }
};

/// A conversion to another type.
class CastInst : public Instruction {
    ValuePtr _value;
    TypePtr _target;
    AllowedWrapping _wrapping{};

public:
    CastInst(Kind k, ValuePtr value, TypePtr target, Location loc = {})
        : Instruction(k, loc), _value(std::move(value)), _target(std::move(target)) {
        LIR_ASSERT(k >= Kind::Truncate and k <= Kind::AddressSpaceCast, "Not a cast instruction");
    }

    [[nodiscard]] auto value() const -> const ValuePtr& { return _value; }
    [[nodiscard]] auto target_type() const -> const TypePtr& { return _target; }

    /// Only `trunc` carries wrapping flags.
    [[nodiscard]] auto wrapping() const -> AllowedWrapping { return _wrapping; }

    void set_wrapping(AllowedWrapping w) {
        LIR_ASSERT(kind == Kind::Truncate, "Only 'trunc' takes wrapping flags");
        _wrapping = w;
    }

    static bool classof(const Instruction* i) { return i->kind >= Kind::Truncate and i->kind <= Kind::AddressSpaceCast; }
};

class ICmpInst : public Instruction {
    IntegerComparison _predicate;
    ValuePtr _lhs;
    ValuePtr _rhs;

public:
    ICmpInst(IntegerComparison pred, ValuePtr lhs, ValuePtr rhs, Location loc = {})
        : Instruction(Kind::CompareIntegers, loc),
          _predicate(pred),
          _lhs(std::move(lhs)),
          _rhs(std::move(rhs)) {}

    [[nodiscard]] auto predicate() const -> IntegerComparison { return _predicate; }
    [[nodiscard]] auto lhs() const -> const ValuePtr& { return _lhs; }
    [[nodiscard]] auto rhs() const -> const ValuePtr& { return _rhs; }

    static bool classof(const Instruction* i) { return i->kind == Kind::CompareIntegers; }
};

class SelectInst : public Instruction {
    ValuePtr _condition;
    ValuePtr _if_true;
    ValuePtr _if_false;

public:
    SelectInst(ValuePtr cond, ValuePtr if_true, ValuePtr if_false, Location loc = {})
        : Instruction(Kind::Select, loc),
          _condition(std::move(cond)),
          _if_true(std::move(if_true)),
          _if_false(std::move(if_false)) {}

    [[nodiscard]] auto condition() const -> const ValuePtr& { return _condition; }
    [[nodiscard]] auto if_true() const -> const ValuePtr& { return _if_true; }
    [[nodiscard]] auto if_false() const -> const ValuePtr& { return _if_false; }

    static bool classof(const Instruction* i) { return i->kind == Kind::Select; }
};

class FreezeInst : public Instruction {
    ValuePtr _value;

public:
    explicit FreezeInst(ValuePtr value, Location loc = {})
        : Instruction(Kind::Freeze, loc), _value(std::move(value)) {}

    [[nodiscard]] auto value() const -> const ValuePtr& { return _value; }

    static bool classof(const Instruction* i) { return i->kind == Kind::Freeze; }
};

/// An argument of a call, with its attributes.
struct CallArgument {
    ValuePtr value;
    std::vector<ParameterAttribute> attributes{};
};

/// Everything that describes what a call-like instruction calls.
struct CallSite {
    /// e.g. `fastcc` or `cc 10`.
    std::optional<std::string> calling_convention{};
    std::vector<ParameterAttribute> return_attributes{};
    std::optional<AddressSpace> address_space{};
    std::shared_ptr<const FunctionType> function_type{};
    ValuePtr callee{};
    std::vector<CallArgument> arguments{};

    /// Function attributes as written, e.g. `nounwind` or `#0`.
    std::vector<std::string> function_attributes{};

    /// The name of the callee including its sigil, or the empty
    /// string if the callee is not named.
    [[nodiscard]] auto function_name() const -> std::string;
};

class CallInst : public Instruction {
    CallSite _site;
    TailCallHint _tail = TailCallHint::Indifferent;

public:
    explicit CallInst(CallSite site, Location loc = {})
        : Instruction(Kind::Call, loc), _site(std::move(site)) {
        LIR_ASSERT(_site.function_type and _site.callee, "Call requires a function type and a callee");
    }

    [[nodiscard]] auto site() const -> const CallSite& { return _site; }
    [[nodiscard]] auto function_type() const -> const std::shared_ptr<const FunctionType>& { return _site.function_type; }
    [[nodiscard]] auto callee() const -> const ValuePtr& { return _site.callee; }
    [[nodiscard]] auto args() const -> const std::vector<CallArgument>& { return _site.arguments; }
    [[nodiscard]] auto tail_call_hint() const -> TailCallHint { return _tail; }

    void set_tail_call_hint(TailCallHint h) { _tail = h; }

    static bool classof(const Instruction* i) { return i->kind == Kind::Call; }
};

/// ===========================================================================
///  Terminators.
/// ===========================================================================
/// The last instruction of a basic block.
class Terminator {
public:
    enum struct Kind {
        Return,
        ConditionalBranch,
        Branch,
        Switch,
        IndirectBranch,
        Unreachable,

        /// Exception handling.
        Invoke,
        CallBranch,
        Resume,
        CatchSwitch,
        CatchReturn,
        CleanupReturn,
    };

    const Kind kind;

private:
    Location loc;

protected:
    Terminator(Kind k, Location l) : kind(k), loc(l) {}

public:
    virtual ~Terminator() = default;

    [[nodiscard]] auto location() const -> Location { return loc; }

    /// Get every label this terminator may transfer control to.
    [[nodiscard]] auto successors() const -> std::vector<LabelPtr>;

    /// Print this terminator in LLVM syntax.
    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;
};

class ReturnInst : public Terminator {
    ValuePtr _value;

public:
    /// `ret void` returns ConstantValue::Void().
    explicit ReturnInst(ValuePtr value, Location loc = {})
        : Terminator(Kind::Return, loc), _value(std::move(value)) {}

    [[nodiscard]] auto value() const -> const ValuePtr& { return _value; }

    /// Whether this is `ret void`.
    [[nodiscard]] bool is_void() const { return _value->type()->is_void(); }

    static bool classof(const Terminator* t) { return t->kind == Kind::Return; }
};

class CondBranchInst : public Terminator {
    ValuePtr _condition;
    LabelPtr _if_true;
    LabelPtr _if_false;

public:
    CondBranchInst(ValuePtr cond, LabelPtr if_true, LabelPtr if_false, Location loc = {})
        : Terminator(Kind::ConditionalBranch, loc),
          _condition(std::move(cond)),
          _if_true(std::move(if_true)),
          _if_false(std::move(if_false)) {}

    [[nodiscard]] auto condition() const -> const ValuePtr& { return _condition; }
    [[nodiscard]] auto if_true() const -> const LabelPtr& { return _if_true; }
    [[nodiscard]] auto if_false() const -> const LabelPtr& { return _if_false; }

    static bool classof(const Terminator* t) { return t->kind == Kind::ConditionalBranch; }
};

class BranchInst : public Terminator {
    LabelPtr _destination;

public:
    explicit BranchInst(LabelPtr destination, Location loc = {})
        : Terminator(Kind::Branch, loc), _destination(std::move(destination)) {}

    [[nodiscard]] auto destination() const -> const LabelPtr& { return _destination; }

    static bool classof(const Terminator* t) { return t->kind == Kind::Branch; }
};

class SwitchInst : public Terminator {
public:
    struct Case {
        ValuePtr value;
        LabelPtr destination;
    };

private:
    ValuePtr _value;
    LabelPtr _default;
    std::vector<Case> _cases;

public:
    SwitchInst(ValuePtr value, LabelPtr default_destination, std::vector<Case> cases, Location loc = {})
        : Terminator(Kind::Switch, loc),
          _value(std::move(value)),
          _default(std::move(default_destination)),
          _cases(std::move(cases)) {}

    [[nodiscard]] auto value() const -> const ValuePtr& { return _value; }
    [[nodiscard]] auto default_destination() const -> const LabelPtr& { return _default; }
    [[nodiscard]] auto cases() const -> const std::vector<Case>& { return _cases; }

    static bool classof(const Terminator* t) { return t->kind == Kind::Switch; }
};

class IndirectBranchInst : public Terminator {
    ValuePtr _address;
    std::vector<LabelPtr> _destinations;

public:
    IndirectBranchInst(ValuePtr address, std::vector<LabelPtr> destinations, Location loc = {})
        : Terminator(Kind::IndirectBranch, loc),
          _address(std::move(address)),
          _destinations(std::move(destinations)) {}

    [[nodiscard]] auto address() const -> const ValuePtr& { return _address; }
    [[nodiscard]] auto destinations() const -> const std::vector<LabelPtr>& { return _destinations; }

    static bool classof(const Terminator* t) { return t->kind == Kind::IndirectBranch; }
};

class UnreachableInst : public Terminator {
public:
    explicit UnreachableInst(Location loc = {}) : Terminator(Kind::Unreachable, loc) {}

    static bool classof(const Terminator* t) { return t->kind == Kind::Unreachable; }
};

class InvokeInst : public Terminator {
    CallSite _site;
    LabelPtr _normal;
    LabelPtr _unwind;

public:
    InvokeInst(CallSite site, LabelPtr normal, LabelPtr unwind, Location loc = {})
        : Terminator(Kind::Invoke, loc),
          _site(std::move(site)),
          _normal(std::move(normal)),
          _unwind(std::move(unwind)) {
        LIR_ASSERT(_site.function_type and _site.callee, "Invoke requires a function type and a callee");
    }

    [[nodiscard]] auto site() const -> const CallSite& { return _site; }
    [[nodiscard]] auto normal_destination() const -> const LabelPtr& { return _normal; }
    [[nodiscard]] auto unwind_destination() const -> const LabelPtr& { return _unwind; }

    static bool classof(const Terminator* t) { return t->kind == Kind::Invoke; }
};

class CallBranchInst : public Terminator {
    CallSite _site;
    LabelPtr _fallthrough;
    std::vector<LabelPtr> _indirect;

public:
    CallBranchInst(CallSite site, LabelPtr fallthrough, std::vector<LabelPtr> indirect, Location loc = {})
        : Terminator(Kind::CallBranch, loc),
          _site(std::move(site)),
          _fallthrough(std::move(fallthrough)),
          _indirect(std::move(indirect)) {
        LIR_ASSERT(_site.function_type and _site.callee, "Callbr requires a function type and a callee");
    }

    [[nodiscard]] auto site() const -> const CallSite& { return _site; }
    [[nodiscard]] auto fallthrough_destination() const -> const LabelPtr& { return _fallthrough; }
    [[nodiscard]] auto indirect_destinations() const -> const std::vector<LabelPtr>& { return _indirect; }

    static bool classof(const Terminator* t) { return t->kind == Kind::CallBranch; }
};

class ResumeInst : public Terminator {
    ValuePtr _value;

public:
    explicit ResumeInst(ValuePtr value, Location loc = {})
        : Terminator(Kind::Resume, loc), _value(std::move(value)) {}

    [[nodiscard]] auto value() const -> const ValuePtr& { return _value; }

    static bool classof(const Terminator* t) { return t->kind == Kind::Resume; }
};

class CatchSwitchInst : public Terminator {
    ValuePtr _parent;
    std::vector<LabelPtr> _handlers;
    LabelPtr _unwind;

public:
    /// A null unwind label means `unwind to caller`.
    CatchSwitchInst(ValuePtr parent, std::vector<LabelPtr> handlers, LabelPtr unwind = nullptr, Location loc = {})
        : Terminator(Kind::CatchSwitch, loc),
          _parent(std::move(parent)),
          _handlers(std::move(handlers)),
          _unwind(std::move(unwind)) {}

    /// The parent pad, or `none`.
    [[nodiscard]] auto parent_pad() const -> const ValuePtr& { return _parent; }
    [[nodiscard]] auto handlers() const -> const std::vector<LabelPtr>& { return _handlers; }
    [[nodiscard]] auto unwind_destination() const -> const LabelPtr& { return _unwind; }

    static bool classof(const Terminator* t) { return t->kind == Kind::CatchSwitch; }
};

class CatchReturnInst : public Terminator {
    ValuePtr _token;
    LabelPtr _target;

public:
    CatchReturnInst(ValuePtr token, LabelPtr target, Location loc = {})
        : Terminator(Kind::CatchReturn, loc),
          _token(std::move(token)),
          _target(std::move(target)) {}

    [[nodiscard]] auto token() const -> const ValuePtr& { return _token; }
    [[nodiscard]] auto target() const -> const LabelPtr& { return _target; }

    static bool classof(const Terminator* t) { return t->kind == Kind::CatchReturn; }
};

class CleanupReturnInst : public Terminator {
    ValuePtr _token;
    LabelPtr _unwind;

public:
    /// A null unwind label means `unwind to caller`.
    explicit CleanupReturnInst(ValuePtr token, LabelPtr unwind = nullptr, Location loc = {})
        : Terminator(Kind::CleanupReturn, loc),
          _token(std::move(token)),
          _unwind(std::move(unwind)) {}

    [[nodiscard]] auto token() const -> const ValuePtr& { return _token; }
    [[nodiscard]] auto unwind_destination() const -> const LabelPtr& { return _unwind; }

    static bool classof(const Terminator* t) { return t->kind == Kind::CleanupReturn; }
};
} // namespace lir

#endif // LIR_IR_IR_HH
