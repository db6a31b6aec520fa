#include <lir/context.hh>
#include <lir/diags.hh>
#include <lir/ir/ir.hh>
#include <lir/utils/rtti.hh>

namespace lir {
namespace {
/// Constant without a payload.
class UnitConstant : public Constant {
public:
    explicit UnitConstant(Kind k) : Constant(k) {}
};

/// Follow an extractvalue/insertvalue index path through an aggregate type.
auto FollowIndexPath(
    TypePtr t,
    const std::vector<u64>& indices,
    const Context* ctx,
    Location where
) -> Result<TypePtr> {
    for (auto idx : indices) {
        if (auto s = cast<StructType>(t.get())) {
            if (idx >= s->member_count()) return Diag::TypeMismatch(
                ctx,
                where,
                "Index {} is out of bounds for type '{}'",
                idx,
                *t
            );

            t = s->members()[idx];
            continue;
        }

        if (auto a = cast<ArrayType>(t.get())) {
            if (idx >= a->length()) return Diag::TypeMismatch(
                ctx,
                where,
                "Index {} is out of bounds for type '{}'",
                idx,
                *t
            );

            t = a->element_type();
            continue;
        }

        return Diag::TypeMismatch(ctx, where, "Cannot index into non-aggregate type '{}'", *t);
    }

    return t;
}

bool ElementsHaveType(const std::vector<ValuePtr>& elements, const TypePtr& t) {
    return rgs::all_of(elements, [&](const ValuePtr& v) { return Equal(v->type(), t); });
}
} // namespace

/// ===========================================================================
///  Attributes.
/// ===========================================================================
bool ParameterAttribute::TakesType(Kind k) {
    switch (k) {
        case Kind::ByVal:
        case Kind::ByRef:
        case Kind::Preallocated:
        case Kind::InAlloca:
        case Kind::StructRet:
        case Kind::ElementType:
            return true;
        default:
            return false;
    }
}

bool ParameterAttribute::TakesInteger(Kind k) {
    switch (k) {
        case Kind::Align:
        case Kind::Dereferenceable:
        case Kind::DereferenceableOrNull:
        case Kind::AlignStack:
            return true;
        default:
            return false;
    }
}

auto ParameterAttribute::FromKeyword(std::string_view kw) -> std::optional<Kind> {
    static const StringMap<Kind> keywords = [] {
        StringMap<Kind> m;
        for (int i = 0; i <= +Kind::DeadOnUnwind; i++) {
            auto k = Kind(i);
            m.emplace(std::string{StringifyEnum(k)}, k);
        }
        return m;
    }();

    auto it = keywords.find(kw);
    if (it == keywords.end()) return std::nullopt;
    return it->second;
}

bool ParameterAttribute::operator==(const ParameterAttribute& other) const {
    return kind == other.kind and integer == other.integer and Equal(type, other.type);
}

/// ===========================================================================
///  Constants.
/// ===========================================================================
const ConstantPtr Constant::VoidConst = std::make_shared<UnitConstant>(Kind::Void);
const ConstantPtr Constant::Null = std::make_shared<UnitConstant>(Kind::NullPointer);
const ConstantPtr Constant::None = std::make_shared<UnitConstant>(Kind::NoneToken);
const ConstantPtr Constant::Zero = std::make_shared<UnitConstant>(Kind::Zero);
const ConstantPtr Constant::Undef = std::make_shared<UnitConstant>(Kind::Undefined);
const ConstantPtr Constant::Poison = std::make_shared<UnitConstant>(Kind::Poison);

bool Constant::is_compatible_with(const Type& t) const {
    switch (kind) {
        case Kind::Void: return t.is_void();
        case Kind::Boolean: return t.is_integer(1);
        case Kind::Integer: return t.is_integer();
        case Kind::FloatingPoint: return t.kind == Type::Kind::FloatingPoint;
        case Kind::NullPointer: return t.is_ptr();
        case Kind::NoneToken: return t.kind == Type::Kind::Token;
        case Kind::Metadata: return t.kind == Type::Kind::Metadata;

        case Kind::Structure: {
            auto s = cast<StructType>(&t);
            if (not s) return false;
            auto& elems = as<AggregateConstant>(this)->elements();
            if (elems.size() != s->member_count()) return false;
            for (usz i = 0; i < elems.size(); i++)
                if (not Equal(elems[i]->type(), s->members()[i])) return false;
            return true;
        }

        case Kind::Array: {
            auto a = cast<ArrayType>(&t);
            if (not a) return false;
            auto& elems = as<AggregateConstant>(this)->elements();
            return elems.size() == a->length() and ElementsHaveType(elems, a->element_type());
        }

        case Kind::Vector: {
            auto v = cast<VectorType>(&t);
            if (not v) return false;
            auto& elems = as<AggregateConstant>(this)->elements();
            return elems.size() == v->length() and ElementsHaveType(elems, v->element_type());
        }

        case Kind::Zero:
        case Kind::Poison:
            return true;

        case Kind::Undefined:
            return not t.is_label() and not t.is_void();
    }
    LIR_UNREACHABLE();
}

auto BooleanConstant::Get(bool value) -> ConstantPtr {
    return std::make_shared<BooleanConstant>(value);
}

auto IntegerConstant::Get(i64 value) -> ConstantPtr {
    return std::make_shared<IntegerConstant>(value);
}

auto FloatConstant::Get(f64 value) -> ConstantPtr {
    return std::make_shared<FloatConstant>(value);
}

auto AggregateConstant::Structure(std::vector<ValuePtr> elements) -> ConstantPtr {
    return std::make_shared<AggregateConstant>(Kind::Structure, std::move(elements));
}

auto AggregateConstant::Array(std::vector<ValuePtr> elements) -> ConstantPtr {
    return std::make_shared<AggregateConstant>(Kind::Array, std::move(elements));
}

auto AggregateConstant::Vector(std::vector<ValuePtr> elements) -> ConstantPtr {
    return std::make_shared<AggregateConstant>(Kind::Vector, std::move(elements));
}

auto MetadataConstant::Get(std::string node) -> ConstantPtr {
    return std::make_shared<MetadataConstant>(std::move(node));
}

/// ===========================================================================
///  Values.
/// ===========================================================================
auto ConstantValue::Create(
    TypePtr type,
    ConstantPtr constant,
    const Context* ctx,
    Location where
) -> Result<ValuePtr> {
    LIR_ASSERT(type and constant);
    if (not constant->is_compatible_with(*type)) {
        auto d = Diag::TypeMismatch(
            ctx,
            where,
            "Constant '{}' is not compatible with type '{}'",
            constant->string(),
            *type
        );

        d.attach(Diag::Note("Constant is '{}'", constant->string()));
        d.attach(Diag::Note("Type is '{}'", *type));
        return d;
    }

    return ValuePtr{new ConstantValue(std::move(type), std::move(constant))};
}

auto ConstantValue::Void() -> ValuePtr {
    static const ValuePtr void_value{new ConstantValue(Type::VoidTy, Constant::VoidConst)};
    return void_value;
}

auto InstructionValue::Create(InstructionPtr instruction, const Context* ctx) -> Result<ValuePtr> {
    LIR_ASSERT(instruction);
    auto ty = instruction->result_type(ctx);
    if (not ty) return ty.diag();
    return ValuePtr{new InstructionValue(std::move(*ty), std::move(instruction))};
}

/// ===========================================================================
///  Flags.
/// ===========================================================================
auto CompareOrderings(Ordering a, Ordering b) -> std::partial_ordering {
    const auto Strength = [](Ordering o) -> int {
        switch (o) {
            case Ordering::Unordered: return 0;
            case Ordering::Monotonic: return 1;
            case Ordering::Acquire:
            case Ordering::Release: return 2;
            case Ordering::AcquireRelease: return 3;
            case Ordering::SequentiallyConsistent: return 4;
        }
        LIR_UNREACHABLE();
    };

    if (a == b) return std::partial_ordering::equivalent;
    if (Strength(a) == Strength(b)) return std::partial_ordering::unordered;
    return Strength(a) <=> Strength(b);
}

/// ===========================================================================
///  Instructions.
/// ===========================================================================
auto CallSite::function_name() const -> std::string {
    if (auto i = cast<IdentifierValue>(callee.get())) return i->name();
    if (auto f = cast<FunctionValue>(callee.get())) return f->name();
    if (auto g = cast<GlobalValue>(callee.get())) return g->name();
    return "";
}

auto Instruction::result_type(const Context* ctx) const -> Result<TypePtr> {
    switch (kind) {
        case Kind::Add:
        case Kind::Subtract:
        case Kind::Multiply:
        case Kind::UnsignedDivide:
        case Kind::SignedDivide:
        case Kind::UnsignedRemainder:
        case Kind::SignedRemainder:
        case Kind::ShiftLeft:
        case Kind::LogicalShiftRight:
        case Kind::ArithmeticShiftRight:
        case Kind::And:
        case Kind::Or:
        case Kind::ExclusiveOr:
            return as<BinaryInst>(this)->lhs()->type();

        case Kind::ExtractValue: {
            auto e = as<ExtractValueInst>(this);
            return FollowIndexPath(e->aggregate()->type(), e->indices(), ctx, loc);
        }

        case Kind::InsertValue: {
            auto i = as<InsertValueInst>(this);
            auto path = FollowIndexPath(i->aggregate()->type(), i->indices(), ctx, loc);
            if (not path) return path.diag();
            return i->aggregate()->type();
        }

        case Kind::StackAllocate: {
            auto& addrspace = as<AllocaInst>(this)->address_space();
            return TypePtr{PointerType::Get(addrspace.value_or(AddressSpace{}))};
        }

        case Kind::Load: return as<LoadInst>(this)->type();
        case Kind::AtomicLoad: return as<AtomicLoadInst>(this)->type();

        case Kind::Store:
        case Kind::AtomicStore:
        case Kind::Fence:
            return Type::VoidTy;

        case Kind::GetElementPointer: {
            auto gep = as<GetElementPtrInst>(this);

            /// A vector of base pointers or a vector index
            /// yields a vector of pointers.
            std::optional<std::pair<usz, bool>> vector_shape;
            auto base = gep->pointer()->type();
            if (auto v = cast<VectorType>(base.get())) {
                vector_shape = {v->length(), v->scalable()};
                base = v->element_type();
            }

            auto ptr = cast<PointerType>(base.get());
            if (not ptr) return Diag::TypeMismatch(
                ctx,
                loc,
                "Base of getelementptr must be a pointer, but was '{}'",
                *gep->pointer()->type()
            );

            for (const auto& idx : gep->indices()) {
                if (vector_shape) break;
                if (auto v = cast<VectorType>(idx->type().get()))
                    vector_shape = {v->length(), v->scalable()};
            }

            TypePtr result = PointerType::Get(ptr->address_space());
            if (vector_shape) result = VectorType::Get(vector_shape->first, result, vector_shape->second);
            return result;
        }

        case Kind::Truncate:
        case Kind::ZeroExtend:
        case Kind::SignExtend:
        case Kind::PointerToInteger:
        case Kind::IntegerToPointer:
        case Kind::BitCast:
        case Kind::AddressSpaceCast:
            return as<CastInst>(this)->target_type();

        case Kind::CompareIntegers: {
            TypePtr i1 = IntegerType::Get(1);
            auto operand = as<ICmpInst>(this)->lhs()->type();
            if (auto v = cast<VectorType>(operand.get()))
                return TypePtr{VectorType::Get(v->length(), i1, v->scalable())};
            return i1;
        }

        case Kind::Select: return as<SelectInst>(this)->if_true()->type();
        case Kind::Freeze: return as<FreezeInst>(this)->value()->type();
        case Kind::Call: return as<CallInst>(this)->function_type()->ret();
    }
    LIR_UNREACHABLE();
}

/// ===========================================================================
///  Terminators.
/// ===========================================================================
auto Terminator::successors() const -> std::vector<LabelPtr> {
    switch (kind) {
        case Kind::Return:
        case Kind::Unreachable:
        case Kind::Resume:
            return {};

        case Kind::ConditionalBranch: {
            auto br = as<CondBranchInst>(this);
            return {br->if_true(), br->if_false()};
        }

        case Kind::Branch: return {as<BranchInst>(this)->destination()};

        case Kind::Switch: {
            auto sw = as<SwitchInst>(this);
            std::vector<LabelPtr> out{sw->default_destination()};
            for (const auto& c : sw->cases()) out.push_back(c.destination);
            return out;
        }

        case Kind::IndirectBranch: return as<IndirectBranchInst>(this)->destinations();

        case Kind::Invoke: {
            auto i = as<InvokeInst>(this);
            return {i->normal_destination(), i->unwind_destination()};
        }

        case Kind::CallBranch: {
            auto cb = as<CallBranchInst>(this);
            std::vector<LabelPtr> out{cb->fallthrough_destination()};
            rgs::copy(cb->indirect_destinations(), std::back_inserter(out));
            return out;
        }

        case Kind::CatchSwitch: {
            auto cs = as<CatchSwitchInst>(this);
            auto out = cs->handlers();
            if (cs->unwind_destination()) out.push_back(cs->unwind_destination());
            return out;
        }

        case Kind::CatchReturn: return {as<CatchReturnInst>(this)->target()};

        case Kind::CleanupReturn: {
            auto cr = as<CleanupReturnInst>(this);
            if (cr->unwind_destination()) return {cr->unwind_destination()};
            return {};
        }
    }
    LIR_UNREACHABLE();
}
} // namespace lir
