#include <lir/ir/function.hh>
#include <lir/ir/ir.hh>
#include <lir/utils/rtti.hh>

#include <bit>
#include <cmath>

namespace lir {
namespace {
/// Prints IR nodes in canonical LLVM syntax.
///
/// Everything printed here must parse back to the same tree.
class LLVMPrinter {
    std::string s{};
    utils::Colours C;

    using enum utils::Colour;
    static constexpr auto TempColour = utils::Colour::Blue;
    static constexpr auto GlobalColour = utils::Colour::Yellow;
    static constexpr auto BlockColour = utils::Colour::Green;
    static constexpr auto ConstColour = utils::Colour::Magenta;

public:
    explicit LLVMPrinter(bool use_colour) : C(use_colour) {}

    /// Take the output.
    auto str() -> std::string {
        s += C(Reset);
        return std::move(s);
    }

    /// Append text to the output.
    template <typename... Args>
    void Print(fmt::format_string<Args...> fmt, Args&&... args) {
        fmt::format_to(std::back_inserter(s), fmt, std::forward<Args>(args)...);
    }

    /// Format a type.
    auto Ty(const TypePtr& t) const -> std::string { return t->string(C.use_colours); }

    /// Format a name.
    auto Name(std::string_view name) const -> std::string {
        return fmt::format("{}{}{}", C(name.starts_with('@') ? GlobalColour : TempColour), name, C(Reset));
    }

    /// Format a label reference.
    auto Label(const LabelPtr& l) const -> std::string {
        return fmt::format("{}label{} {}{}{}", C(Cyan), C(Reset), C(BlockColour), l->name(), C(Reset));
    }

    /// Format a list of labels as `[label %a, label %b]`.
    auto Labels(const std::vector<LabelPtr>& labels) const -> std::string {
        std::vector<std::string> parts;
        for (const auto& l : labels) parts.push_back(Label(l));
        return fmt::format("[{}]", fmt::join(parts, ", "));
    }

    /// Format attributes, each followed by a space.
    auto Attrs(const std::vector<ParameterAttribute>& attrs) const -> std::string {
        std::string out;
        for (const auto& a : attrs) {
            out += a.string(C.use_colours);
            out += ' ';
        }
        return out;
    }

    /// Format a floating point literal so that it lexes as a float
    /// and round-trips exactly.
    auto Float(f64 v) const -> std::string {
        if (not std::isfinite(v)) return fmt::format("0x{:016X}", std::bit_cast<u64>(v));
        auto str = fmt::format("{}", v);
        if (str.find_first_of(".e") == std::string::npos) str += ".0";
        return str;
    }

    /// Format a constant. The type is needed to tell packed
    /// structures apart.
    auto Const(const Constant& c, const Type& t) const -> std::string {
        auto Elements = [&](const std::vector<ValuePtr>& elems) {
            std::vector<std::string> parts;
            for (const auto& e : elems) parts.push_back(Val(e));
            return fmt::format("{}", fmt::join(parts, ", "));
        };

        switch (c.kind) {
            case Constant::Kind::Void: return "";
            case Constant::Kind::Boolean: return fmt::format("{}{}{}", C(ConstColour), as<BooleanConstant>(&c)->value(), C(Reset));
            case Constant::Kind::Integer: return fmt::format("{}{}{}", C(ConstColour), as<IntegerConstant>(&c)->value(), C(Reset));
            case Constant::Kind::FloatingPoint: return fmt::format("{}{}{}", C(ConstColour), Float(as<FloatConstant>(&c)->value()), C(Reset));
            case Constant::Kind::NullPointer: return fmt::format("{}null{}", C(ConstColour), C(Reset));
            case Constant::Kind::NoneToken: return fmt::format("{}none{}", C(ConstColour), C(Reset));
            case Constant::Kind::Zero: return fmt::format("{}zeroinitializer{}", C(ConstColour), C(Reset));
            case Constant::Kind::Undefined: return fmt::format("{}undef{}", C(ConstColour), C(Reset));
            case Constant::Kind::Poison: return fmt::format("{}poison{}", C(ConstColour), C(Reset));
            case Constant::Kind::Metadata: return as<MetadataConstant>(&c)->node();

            case Constant::Kind::Structure: {
                auto& elems = as<AggregateConstant>(&c)->elements();
                auto st = cast<StructType>(&t);
                bool packed = st and st->packed();
                if (elems.empty()) return packed ? "<{}>" : "{}";
                return fmt::format("{}{{ {} }}{}", packed ? "<" : "", Elements(elems), packed ? ">" : "");
            }

            case Constant::Kind::Array:
                return fmt::format("[{}]", Elements(as<AggregateConstant>(&c)->elements()));

            case Constant::Kind::Vector:
                return fmt::format("<{}>", Elements(as<AggregateConstant>(&c)->elements()));
        }
        LIR_UNREACHABLE();
    }

    /// Format a value without its type.
    auto Op(const ValuePtr& v) const -> std::string {
        switch (v->kind) {
            case Value::Kind::Constant: return Const(*as<ConstantValue>(v.get())->constant(), *v->type());
            case Value::Kind::Identifier: return Name(as<IdentifierValue>(v.get())->name());
            case Value::Kind::Global: return Name(as<GlobalValue>(v.get())->name());
            case Value::Kind::Function: return Name(as<FunctionValue>(v.get())->name());
            case Value::Kind::Label: return fmt::format("{}{}{}", C(BlockColour), as<LabelValue>(v.get())->name(), C(Reset));
            case Value::Kind::Instruction: return ConstExpr(*as<InstructionValue>(v.get())->instruction());
        }
        LIR_UNREACHABLE();
    }

    /// Format a value preceded by its type.
    auto Val(const ValuePtr& v) const -> std::string {
        if (v->type()->is_void()) return Ty(v->type());
        return fmt::format("{} {}", Ty(v->type()), Op(v));
    }

    /// Format the `nuw`/`nsw` flags, each preceded by a space.
    static auto Wrapping(AllowedWrapping w) -> std::string {
        std::string out;
        if (not w.can_wrap_unsigned) out += " nuw";
        if (not w.can_wrap_signed) out += " nsw";
        return out;
    }

    /// Format the flags of a binary instruction, each preceded by a space.
    static auto BinaryFlags(const BinaryInst* b) -> std::string {
        auto out = Wrapping(b->wrapping());
        if (b->is_exact()) out += " exact";
        if (b->is_disjoint()) out += " disjoint";
        return out;
    }

    /// Format the index operands of a getelementptr, each preceded by `, `.
    auto GEPOperands(const GetElementPtrInst* gep) const -> std::string {
        std::string out = fmt::format("{}, {}", Ty(gep->source_type()), Val(gep->pointer()));
        for (const auto& idx : gep->indices()) out += fmt::format(", {}", Val(idx));
        return out;
    }

    static auto GEPKind(const GetElementPtrInst* gep) -> std::string {
        switch (gep->pointer_kind()) {
            case GetPointerKind::Regular: return "";
            case GetPointerKind::InBounds: return " inbounds";
            case GetPointerKind::InRange: return fmt::format(" inrange({}, {})", gep->inrange_low(), gep->inrange_high());
        }
        LIR_UNREACHABLE();
    }

    /// Format an instruction that is used as a constant expression.
    auto ConstExpr(const Instruction& i) const -> std::string {
        if (auto b = cast<BinaryInst>(&i)) return fmt::format(
            "{}{} ({}, {})",
            i.kind,
            BinaryFlags(b),
            Val(b->lhs()),
            Val(b->rhs())
        );

        if (auto c = cast<CastInst>(&i)) return fmt::format(
            "{}{} ({} to {})",
            i.kind,
            Wrapping(c->wrapping()),
            Val(c->value()),
            Ty(c->target_type())
        );

        if (auto gep = cast<GetElementPtrInst>(&i))
            return fmt::format("getelementptr{} ({})", GEPKind(gep), GEPOperands(gep));

        if (auto cmp = cast<ICmpInst>(&i)) return fmt::format(
            "icmp {} ({}, {})",
            cmp->predicate(),
            Val(cmp->lhs()),
            Val(cmp->rhs())
        );

        if (auto sel = cast<SelectInst>(&i)) return fmt::format(
            "select ({}, {}, {})",
            Val(sel->condition()),
            Val(sel->if_true()),
            Val(sel->if_false())
        );

        /// Not a constant expression in LLVM; print it as an
        /// instruction so it is at least readable.
        return fmt::format("({})", LLVMPrinter{C.use_colours}.Inst(i));
    }

    /// Format the part of a call-like instruction after the opcode.
    auto Site(const CallSite& site) const -> std::string {
        std::string out;
        if (site.calling_convention) out += fmt::format("{} ", *site.calling_convention);
        out += Attrs(site.return_attributes);
        if (site.address_space) out += fmt::format("{} ", site.address_space->string());

        /// The full function type is only required for varargs.
        auto& fty = site.function_type;
        out += fty->variadic() ? Ty(fty) : Ty(fty->ret());

        std::vector<std::string> args;
        for (const auto& a : site.arguments) {
            if (a.attributes.empty()) args.push_back(Val(a.value));
            else args.push_back(fmt::format("{} {}{}", Ty(a.value->type()), Attrs(a.attributes), Op(a.value)));
        }

        out += fmt::format(" {}({})", Op(site.callee), fmt::join(args, ", "));
        for (const auto& attr : site.function_attributes) out += fmt::format(" {}", attr);
        return out;
    }

    /// Format `[syncscope("s") ]`.
    static auto SyncScope(const AtomicInst* a) -> std::string {
        if (not a->sync_scope()) return "";
        return fmt::format("syncscope(\"{}\") ", *a->sync_scope());
    }

    /// Format an instruction.
    auto Inst(const Instruction& i) -> std::string {
        switch (i.kind) {
            case Instruction::Kind::Add:
            case Instruction::Kind::Subtract:
            case Instruction::Kind::Multiply:
            case Instruction::Kind::UnsignedDivide:
            case Instruction::Kind::SignedDivide:
            case Instruction::Kind::UnsignedRemainder:
            case Instruction::Kind::SignedRemainder:
            case Instruction::Kind::ShiftLeft:
            case Instruction::Kind::LogicalShiftRight:
            case Instruction::Kind::ArithmeticShiftRight:
            case Instruction::Kind::And:
            case Instruction::Kind::Or:
            case Instruction::Kind::ExclusiveOr: {
                auto b = as<BinaryInst>(&i);
                Print("{}{} {}, {}", i.kind, BinaryFlags(b), Val(b->lhs()), Op(b->rhs()));
                break;
            }

            case Instruction::Kind::ExtractValue: {
                auto e = as<ExtractValueInst>(&i);
                Print("extractvalue {}, {}", Val(e->aggregate()), fmt::join(e->indices(), ", "));
                break;
            }

            case Instruction::Kind::InsertValue: {
                auto e = as<InsertValueInst>(&i);
                Print(
                    "insertvalue {}, {}, {}",
                    Val(e->aggregate()),
                    Val(e->element()),
                    fmt::join(e->indices(), ", ")
                );
                break;
            }

            case Instruction::Kind::StackAllocate: {
                auto a = as<AllocaInst>(&i);
                Print("alloca {}{}", a->can_reuse() ? "inalloca " : "", Ty(a->element_type()));
                if (a->count()) Print(", {}", Val(a->count()));
                if (a->alignment()) Print(", align {}", *a->alignment());
                if (a->address_space()) Print(", {}", a->address_space()->string());
                break;
            }

            case Instruction::Kind::Load: {
                auto l = as<LoadInst>(&i);
                Print("load {}{}, {}", l->is_volatile() ? "volatile " : "", Ty(l->type()), Val(l->pointer()));
                if (l->alignment()) Print(", align {}", *l->alignment());
                break;
            }

            case Instruction::Kind::AtomicLoad: {
                auto l = as<AtomicLoadInst>(&i);
                Print(
                    "load atomic {}{}, {} {}{}, align {}",
                    l->is_volatile() ? "volatile " : "",
                    Ty(l->type()),
                    Val(l->pointer()),
                    SyncScope(l),
                    l->ordering(),
                    l->alignment()
                );
                break;
            }

            case Instruction::Kind::Store: {
                auto st = as<StoreInst>(&i);
                Print("store {}{}, {}", st->is_volatile() ? "volatile " : "", Val(st->value()), Val(st->pointer()));
                if (st->alignment()) Print(", align {}", *st->alignment());
                break;
            }

            case Instruction::Kind::AtomicStore: {
                auto st = as<AtomicStoreInst>(&i);
                Print(
                    "store atomic {}{}, {} {}{}, align {}",
                    st->is_volatile() ? "volatile " : "",
                    Val(st->value()),
                    Val(st->pointer()),
                    SyncScope(st),
                    st->ordering(),
                    st->alignment()
                );
                break;
            }

            case Instruction::Kind::Fence: {
                auto f = as<FenceInst>(&i);
                Print("fence {}{}", SyncScope(f), f->ordering());
                break;
            }

            case Instruction::Kind::GetElementPointer: {
                auto gep = as<GetElementPtrInst>(&i);
                Print("getelementptr{} {}", GEPKind(gep), GEPOperands(gep));
                break;
            }

            case Instruction::Kind::Truncate:
            case Instruction::Kind::ZeroExtend:
            case Instruction::Kind::SignExtend:
            case Instruction::Kind::PointerToInteger:
            case Instruction::Kind::IntegerToPointer:
            case Instruction::Kind::BitCast:
            case Instruction::Kind::AddressSpaceCast: {
                auto c = as<CastInst>(&i);
                Print("{}{} {} to {}", i.kind, Wrapping(c->wrapping()), Val(c->value()), Ty(c->target_type()));
                break;
            }

            case Instruction::Kind::CompareIntegers: {
                auto c = as<ICmpInst>(&i);
                Print("icmp {} {}, {}", c->predicate(), Val(c->lhs()), Op(c->rhs()));
                break;
            }

            case Instruction::Kind::Select: {
                auto sel = as<SelectInst>(&i);
                Print("select {}, {}, {}", Val(sel->condition()), Val(sel->if_true()), Val(sel->if_false()));
                break;
            }

            case Instruction::Kind::Freeze:
                Print("freeze {}", Val(as<FreezeInst>(&i)->value()));
                break;

            case Instruction::Kind::Call: {
                auto call = as<CallInst>(&i);
                if (call->tail_call_hint() != TailCallHint::Indifferent) Print("{} ", call->tail_call_hint());
                Print("call {}", Site(call->site()));
                break;
            }
        }

        return str();
    }

    /// Format a terminator.
    auto Term(const Terminator& t) -> std::string {
        switch (t.kind) {
            case Terminator::Kind::Return: {
                auto r = as<ReturnInst>(&t);
                Print("ret {}", Val(r->value()));
                break;
            }

            case Terminator::Kind::ConditionalBranch: {
                auto br = as<CondBranchInst>(&t);
                Print("br {}, {}, {}", Val(br->condition()), Label(br->if_true()), Label(br->if_false()));
                break;
            }

            case Terminator::Kind::Branch:
                Print("br {}", Label(as<BranchInst>(&t)->destination()));
                break;

            case Terminator::Kind::Switch: {
                auto sw = as<SwitchInst>(&t);
                Print("switch {}, {} [", Val(sw->value()), Label(sw->default_destination()));
                for (const auto& c : sw->cases()) Print("\n    {}, {}", Val(c.value), Label(c.destination));
                Print("\n  ]");
                break;
            }

            case Terminator::Kind::IndirectBranch: {
                auto ib = as<IndirectBranchInst>(&t);
                Print("indirectbr {}, {}", Val(ib->address()), Labels(ib->destinations()));
                break;
            }

            case Terminator::Kind::Unreachable:
                Print("unreachable");
                break;

            case Terminator::Kind::Invoke: {
                auto inv = as<InvokeInst>(&t);
                Print(
                    "invoke {} to {} unwind {}",
                    Site(inv->site()),
                    Label(inv->normal_destination()),
                    Label(inv->unwind_destination())
                );
                break;
            }

            case Terminator::Kind::CallBranch: {
                auto cb = as<CallBranchInst>(&t);
                Print(
                    "callbr {} to {} {}",
                    Site(cb->site()),
                    Label(cb->fallthrough_destination()),
                    Labels(cb->indirect_destinations())
                );
                break;
            }

            case Terminator::Kind::Resume:
                Print("resume {}", Val(as<ResumeInst>(&t)->value()));
                break;

            case Terminator::Kind::CatchSwitch: {
                auto cs = as<CatchSwitchInst>(&t);
                Print("catchswitch within {} {} unwind ", Op(cs->parent_pad()), Labels(cs->handlers()));
                if (cs->unwind_destination()) Print("{}", Label(cs->unwind_destination()));
                else Print("to caller");
                break;
            }

            case Terminator::Kind::CatchReturn: {
                auto cr = as<CatchReturnInst>(&t);
                Print("catchret from {} to {}", Op(cr->token()), Label(cr->target()));
                break;
            }

            case Terminator::Kind::CleanupReturn: {
                auto cr = as<CleanupReturnInst>(&t);
                Print("cleanupret from {} unwind ", Op(cr->token()));
                if (cr->unwind_destination()) Print("{}", Label(cr->unwind_destination()));
                else Print("to caller");
                break;
            }
        }

        return str();
    }

    void Metadata(const std::vector<MetadataAttachment>& md) {
        for (const auto& m : md) Print(", !{} {}", m.name, m.node);
    }

    void PrintOperation(const Operation& op) {
        if (op.is_assignment()) Print("{} = ", Name(op.identifier()));
        s += LLVMPrinter{C.use_colours}.Inst(*op.instruction());
        Metadata(op.metadata());
    }

    void PrintBlock(const BasicBlock& b) {
        if (b.name()) Print("{}{}:{}\n", C(BlockColour), *b.name(), C(Reset));
        for (const auto& op : b.operations()) {
            s += "  ";
            PrintOperation(op);
            s += '\n';
        }

        Print("  {}", LLVMPrinter{C.use_colours}.Term(*b.terminator()));
        Metadata(b.terminator_metadata());
        s += '\n';
    }

    void PrintFunction(const Function& f) {
        Print("{} ", f.is_declaration() ? "declare" : "define");
        if (f.linkage != Linkage::External) Print("{} ", f.linkage);
        if (f.preemption != Preemption::Preemptable) Print("{} ", f.preemption);
        if (f.visibility != Visibility::Default) Print("{} ", f.visibility);
        if (f.dll_storage != DLLStorage::None) Print("{} ", f.dll_storage);
        if (f.calling_convention) Print("{} ", *f.calling_convention);
        Print("{}{} {}(", Attrs(f.return_attributes), Ty(f.return_type), Name(f.name));

        std::vector<std::string> params;
        for (const auto& p : f.parameters) {
            auto param = fmt::format("{}", Ty(p.type));
            if (not p.attributes.empty()) param += fmt::format(" {}", utils::Trim(Attrs(p.attributes)));
            if (not p.name.empty()) param += fmt::format(" {}", Name(p.name));
            params.push_back(std::move(param));
        }

        if (f.variadic) params.emplace_back("...");
        Print("{})", fmt::join(params, ", "));

        if (f.unnamed_addr != UnnamedAddr::None) Print(" {}", f.unnamed_addr);
        if (f.address_space) Print(" {}", f.address_space->string());
        for (const auto& a : f.attributes) Print(" {}", a);
        if (f.section) Print(" section \"{}\"", *f.section);
        if (f.partition) Print(" partition \"{}\"", *f.partition);
        if (f.comdat) {
            if (f.comdat->empty()) Print(" comdat");
            else Print(" comdat({})", *f.comdat);
        }
        if (f.alignment) Print(" align {}", *f.alignment);
        if (f.gc) Print(" gc \"{}\"", *f.gc);
        if (f.prefix) Print(" prefix {}", Val(f.prefix));
        if (f.prologue) Print(" prologue {}", Val(f.prologue));
        if (f.personality) Print(" personality {}", Val(f.personality));
        for (const auto& m : f.metadata) Print(" !{} {}", m.name, m.node);

        if (f.is_declaration()) {
            s += '\n';
            return;
        }

        Print(" {{\n");
        bool first = true;
        for (const auto& b : f.blocks) {
            if (first) first = false;
            else s += '\n';
            PrintBlock(*b);
        }
        Print("}}\n");
    }
};
} // namespace

auto ParameterAttribute::string(bool use_colour) const -> std::string {
    utils::Colours C{use_colour};
    if (TakesType(kind)) return fmt::format("{}({})", kind, type->string(use_colour));
    if (kind == Kind::Align) return fmt::format("align {}{}{}", C(utils::Colour::Magenta), integer.value_or(1), C(utils::Colour::Reset));
    if (TakesInteger(kind)) return fmt::format("{}({}{}{})", kind, C(utils::Colour::Magenta), integer.value_or(0), C(utils::Colour::Reset));
    return std::string{StringifyEnum(kind)};
}

auto Constant::string(bool use_colour) const -> std::string {
    if (kind == Kind::Void) return "void";
    return LLVMPrinter{use_colour}.Const(*this, *Type::VoidTy);
}

auto Value::string(bool use_colour) const -> std::string {
    return LLVMPrinter{use_colour}.Val(ValuePtr{ValuePtr{}, this});
}

auto Value::operand_string(bool use_colour) const -> std::string {
    return LLVMPrinter{use_colour}.Op(ValuePtr{ValuePtr{}, this});
}

auto Instruction::string(bool use_colour) const -> std::string {
    return LLVMPrinter{use_colour}.Inst(*this);
}

auto Terminator::string(bool use_colour) const -> std::string {
    return LLVMPrinter{use_colour}.Term(*this);
}

auto Operation::string(bool use_colour) const -> std::string {
    LLVMPrinter p{use_colour};
    p.PrintOperation(*this);
    return p.str();
}

auto BasicBlock::string(bool use_colour) const -> std::string {
    LLVMPrinter p{use_colour};
    p.PrintBlock(*this);
    return p.str();
}

auto Function::string(bool use_colour) const -> std::string {
    LLVMPrinter p{use_colour};
    p.PrintFunction(*this);
    return p.str();
}
} // namespace lir
