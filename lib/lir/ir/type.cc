#include <lir/ir/type.hh>
#include <lir/utils/rtti.hh>

namespace lir {
const TypePtr Type::VoidTy{new Type(Kind::Void)};
const TypePtr Type::LabelTy{new Type(Kind::Label)};
const TypePtr Type::TokenTy{new Type(Kind::Token)};
const TypePtr Type::MetadataTy{new Type(Kind::Metadata)};
const TypePtr Type::AMXTy{new Type(Kind::AMX)};
const TypePtr Type::MMXTy{new Type(Kind::MMX)};
const TypePtr Type::OpaqueTy{new Type(Kind::OpaqueStructure)};

auto AddressSpace::string() const -> std::string {
    if (named()) return fmt::format("addrspace(\"{}\")", name());
    return fmt::format("addrspace({})", number());
}

bool Type::is_first_class() const {
    switch (kind) {
        case Kind::Integer:
        case Kind::FloatingPoint:
        case Kind::AMX:
        case Kind::MMX:
        case Kind::Pointer:
        case Kind::TargetExtension:
        case Kind::Vector:
            return true;

        case Kind::Void:
        case Kind::Function:
        case Kind::Label:
        case Kind::Token:
        case Kind::Metadata:
        case Kind::Array:
        case Kind::Structure:
        case Kind::OpaqueStructure:
            return false;
    }
    LIR_UNREACHABLE();
}

bool Type::is_sized() const {
    switch (kind) {
        case Kind::Integer:
        case Kind::FloatingPoint:
        case Kind::Pointer:
        case Kind::Vector:
        case Kind::Array:
        case Kind::Structure:
            return true;

        case Kind::Void:
        case Kind::Function:
        case Kind::AMX:
        case Kind::MMX:
        case Kind::TargetExtension:
        case Kind::Label:
        case Kind::Token:
        case Kind::Metadata:
        case Kind::OpaqueStructure:
            return false;
    }
    LIR_UNREACHABLE();
}

bool Type::is_integer(usz bits) const {
    auto i = cast<IntegerType>(this);
    return i and i->bitwidth() == bits;
}

namespace {
bool EqualTypeLists(const std::vector<TypePtr>& a, const std::vector<TypePtr>& b) {
    if (a.size() != b.size()) return false;
    for (usz i = 0; i < a.size(); i++)
        if (not Equal(a[i], b[i])) return false;
    return true;
}
} // namespace

bool Type::operator==(const Type& other) const {
    if (this == &other) return true;
    if (kind != other.kind) return false;
    switch (kind) {
        case Kind::Void:
        case Kind::AMX:
        case Kind::MMX:
        case Kind::Label:
        case Kind::Token:
        case Kind::Metadata:
        case Kind::OpaqueStructure:
            return true;

        case Kind::Function: {
            auto a = as<FunctionType>(this);
            auto b = as<FunctionType>(&other);
            return a->variadic() == b->variadic()
               and Equal(a->ret(), b->ret())
               and EqualTypeLists(a->params(), b->params());
        }

        case Kind::Integer:
            return as<IntegerType>(this)->bitwidth() == as<IntegerType>(&other)->bitwidth();

        case Kind::FloatingPoint:
            return as<FloatType>(this)->float_kind() == as<FloatType>(&other)->float_kind();

        case Kind::Pointer:
            return as<PointerType>(this)->address_space() == as<PointerType>(&other)->address_space();

        case Kind::TargetExtension: {
            auto a = as<TargetExtensionType>(this);
            auto b = as<TargetExtensionType>(&other);
            if (a->name() != b->name() or a->params().size() != b->params().size()) return false;
            for (usz i = 0; i < a->params().size(); i++) {
                const auto& x = a->params()[i];
                const auto& y = b->params()[i];
                if (x.index() != y.index()) return false;
                if (std::holds_alternative<u64>(x)) {
                    if (std::get<u64>(x) != std::get<u64>(y)) return false;
                } else if (not Equal(std::get<TypePtr>(x), std::get<TypePtr>(y))) {
                    return false;
                }
            }
            return true;
        }

        case Kind::Vector: {
            auto a = as<VectorType>(this);
            auto b = as<VectorType>(&other);
            return a->length() == b->length()
               and a->scalable() == b->scalable()
               and Equal(a->element_type(), b->element_type());
        }

        case Kind::Array: {
            auto a = as<ArrayType>(this);
            auto b = as<ArrayType>(&other);
            return a->length() == b->length() and Equal(a->element_type(), b->element_type());
        }

        case Kind::Structure: {
            auto a = as<StructType>(this);
            auto b = as<StructType>(&other);
            return a->packed() == b->packed() and EqualTypeLists(a->members(), b->members());
        }
    }
    LIR_UNREACHABLE();
}

auto Type::string(bool use_colour) const -> std::string {
    using enum utils::Colour;
    utils::Colours C{use_colour};
    auto ToString = [&](const TypePtr& t) { return t->string(use_colour); };

    switch (kind) {
        case Kind::Void: return fmt::format("{}void{}", C(Cyan), C(Reset));
        case Kind::AMX: return fmt::format("{}x86_amx{}", C(Cyan), C(Reset));
        case Kind::MMX: return fmt::format("{}x86_mmx{}", C(Cyan), C(Reset));
        case Kind::Label: return fmt::format("{}label{}", C(Cyan), C(Reset));
        case Kind::Token: return fmt::format("{}token{}", C(Cyan), C(Reset));
        case Kind::Metadata: return fmt::format("{}metadata{}", C(Cyan), C(Reset));
        case Kind::OpaqueStructure: return fmt::format("{}opaque{}", C(Cyan), C(Reset));

        case Kind::Integer:
            return fmt::format("{}i{}{}", C(Cyan), as<IntegerType>(this)->bitwidth(), C(Reset));

        case Kind::FloatingPoint:
            return fmt::format("{}{}{}", C(Cyan), as<FloatType>(this)->float_kind(), C(Reset));

        case Kind::Pointer: {
            auto& addrspace = as<PointerType>(this)->address_space();
            if (addrspace.is_default()) return fmt::format("{}ptr{}", C(Cyan), C(Reset));
            return fmt::format("{}ptr {}{}", C(Cyan), addrspace.string(), C(Reset));
        }

        case Kind::TargetExtension: {
            auto t = as<TargetExtensionType>(this);
            std::string out = fmt::format("{}target{}(\"{}\"", C(Cyan), C(Reset), t->name());
            for (const auto& p : t->params()) {
                if (std::holds_alternative<u64>(p)) out += fmt::format(", {}{}{}", C(Magenta), std::get<u64>(p), C(Reset));
                else out += fmt::format(", {}", ToString(std::get<TypePtr>(p)));
            }
            out += ")";
            return out;
        }

        case Kind::Vector: {
            auto v = as<VectorType>(this);
            return fmt::format(
                "<{}{}{}{} x {}>",
                v->scalable() ? "vscale x " : "",
                C(Magenta),
                v->length(),
                C(Reset),
                ToString(v->element_type())
            );
        }

        case Kind::Array: {
            auto a = as<ArrayType>(this);
            return fmt::format(
                "[{}{}{} x {}]",
                C(Magenta),
                a->length(),
                C(Reset),
                ToString(a->element_type())
            );
        }

        case Kind::Structure: {
            auto s = as<StructType>(this);
            if (s->members().empty()) return s->packed() ? "<{}>" : "{}";
            return fmt::format(
                "{}{{ {} }}{}",
                s->packed() ? "<" : "",
                fmt::join(vws::transform(s->members(), ToString), ", "),
                s->packed() ? ">" : ""
            );
        }

        case Kind::Function: {
            auto f = as<FunctionType>(this);
            std::vector<std::string> params;
            for (const auto& p : f->params()) params.push_back(ToString(p));
            if (f->variadic()) params.emplace_back("...");
            return fmt::format("{} ({})", ToString(f->ret()), fmt::join(params, ", "));
        }
    }
    LIR_UNREACHABLE();
}

auto FunctionType::Get(TypePtr ret, std::vector<TypePtr> params, bool variadic) -> std::shared_ptr<const FunctionType> {
    LIR_ASSERT(ret, "Function type must have a return type");
    for (const auto& p : params) LIR_ASSERT(p, "Function parameter type must not be null");
    return std::make_shared<const FunctionType>(std::move(ret), std::move(params), variadic);
}

auto IntegerType::Get(usz width) -> std::shared_ptr<const IntegerType> {
    LIR_ASSERT(width >= 1 and width <= MaxBitWidth, "Invalid integer bit width {}", width);
    return std::make_shared<const IntegerType>(width);
}

auto FloatType::Get(FloatKind k) -> std::shared_ptr<const FloatType> {
    return std::make_shared<const FloatType>(k);
}

auto PointerType::Get(AddressSpace as) -> std::shared_ptr<const PointerType> {
    return std::make_shared<const PointerType>(std::move(as));
}

auto TargetExtensionType::Get(std::string name, std::vector<Parameter> params) -> std::shared_ptr<const TargetExtensionType> {
    return std::make_shared<const TargetExtensionType>(std::move(name), std::move(params));
}

auto VectorType::Get(usz length, TypePtr element_type, bool scalable) -> std::shared_ptr<const VectorType> {
    LIR_ASSERT(length > 0, "Vector length must be nonzero");
    LIR_ASSERT(element_type);
    return std::make_shared<const VectorType>(length, std::move(element_type), scalable);
}

auto ArrayType::Get(usz length, TypePtr element_type) -> std::shared_ptr<const ArrayType> {
    LIR_ASSERT(length > 0, "Array length must be nonzero");
    LIR_ASSERT(element_type);
    return std::make_shared<const ArrayType>(length, std::move(element_type));
}

auto StructType::Get(std::vector<TypePtr> members, bool packed) -> std::shared_ptr<const StructType> {
    for (const auto& m : members) LIR_ASSERT(m, "Struct member type must not be null");
    return std::make_shared<const StructType>(std::move(members), packed);
}
} // namespace lir
