#include <fmt/format.h>

#include <lir/context.hh>
#include <lir/diags.hh>
#include <lir/ir/function.hh>
#include <lir/ir/ir.hh>
#include <lir/ir/type.hh>
#include <lir/utils.hh>
#include <lir/utils/rtti.hh>

#include <compare>
#include <functional>
#include <iterator>
#include <optional>
#include <string_view>

using namespace lir;

static utils::Colours C{true};

/// Collects the failed checks of a single test.
class Checker {
    std::string_view test;
    bool ok = true;

public:
    explicit Checker(std::string_view name) : test(name) {}

    [[nodiscard]] bool passed() const { return ok; }

    void check(bool condition, std::string_view what) {
        if (condition) return;
        ok = false;
        fmt::print("  Test `{}`: {}\n", test, what);
    }

    template <typename Got, typename Expected>
    void equal(const Got& got, const Expected& expected, std::string_view what) {
        if (got == expected) return;
        ok = false;
        fmt::print("  Test `{}`: {}: GOT {}, EXPECTED {}\n", test, what, got, expected);
    }

    /// Check that a result is an error of the given category whose
    /// message contains a string. The error is not printed.
    template <typename T>
    void fails(Result<T> r, ErrorKind category, std::string_view message) {
        if (not r.is_diag()) {
            ok = false;
            fmt::print("  Test `{}`: expected '{}' to fail\n", test, message);
            return;
        }

        auto d = std::move(r.diag());
        equal(d.category(), category, "error category");
        check(d.message().find(message) != std::string::npos, fmt::format("message '{}' lacks '{}'", d.message(), message));
        d.suppress();
    }

    /// Unwrap a result that must not be an error.
    template <typename T>
    auto get(Result<T> r, std::string_view what) -> std::optional<T> {
        if (r.is_diag()) {
            ok = false;
            fmt::print("  Test `{}`: {} failed\n", test, what);
            return std::nullopt;
        }

        return std::move(*r);
    }
};

struct ModelTest {
    std::string_view name;
    std::function<void(Context&, Checker&)> run;
};

auto Label(std::string name) -> LabelPtr {
    return std::make_shared<LabelValue>(std::move(name));
}

auto Local(TypePtr t, std::string name) -> ValuePtr {
    return std::make_shared<IdentifierValue>(std::move(t), std::move(name));
}

const ModelTest tests[]{
    {"type predicates", [](Context&, Checker& c) {
         TypePtr i32 = IntegerType::Get(32);
         TypePtr ptr = PointerType::Get();
         TypePtr vec = VectorType::Get(4, i32);
         TypePtr arr = ArrayType::Get(2, i32);
         TypePtr st = StructType::Get({});
         TypePtr fn = FunctionType::Get(i32, {ptr}, true);
         TypePtr ext = TargetExtensionType::Get("spirv.Event");

         c.check(i32->is_first_class() and i32->is_sized(), "i32 is first class and sized");
         c.check(ptr->is_first_class() and ptr->is_sized(), "ptr is first class and sized");
         c.check(vec->is_first_class() and vec->is_sized(), "vectors are first class and sized");
         c.check(ext->is_first_class() and not ext->is_sized(), "target extension types are first class");
         c.check(not arr->is_first_class() and arr->is_sized(), "arrays are sized but not first class");
         c.check(st->is_sized(), "empty structures are sized");
         c.check(not fn->is_first_class() and not fn->is_sized(), "function types are neither");
         c.check(not Type::LabelTy->is_first_class(), "label is not first class");
         c.check(not Type::OpaqueTy->is_sized(), "opaque structures are not sized");
         c.check(not Type::VoidTy->is_sized(), "void is not sized");
         c.check(i32->is_integer(32) and not i32->is_integer(64), "is_integer(N)");
     }},

    {"structural equality", [](Context& ctx, Checker& c) {
         c.check(Equal(IntegerType::Get(32), IntegerType::Get(32)), "i32 == i32");
         c.check(not Equal(IntegerType::Get(32), IntegerType::Get(64)), "i32 != i64");
         c.check(Equal(PointerType::Get(), PointerType::Get(AddressSpace::Numbered(0))), "ptr == ptr addrspace(0)");
         c.check(not Equal(PointerType::Get(AddressSpace::Numbered(1)), PointerType::Get(AddressSpace::Named("1"))), "numbered and named address spaces differ");

         TypePtr i8 = IntegerType::Get(8);
         c.check(not Equal(StructType::Get({i8}, true), StructType::Get({i8})), "packed and unpacked structures differ");
         c.check(not Equal(VectorType::Get(4, i8, true), VectorType::Get(4, i8)), "scalable and fixed vectors differ");
         c.check(not Equal(FunctionType::Get(i8, {}, true), FunctionType::Get(i8, {})), "variadic and fixed function types differ");

         if (auto parsed = c.get(Type::Parse(&ctx, "{ i32, [2 x ptr] }"), "parsing a structure type"))
             c.check(Equal(*parsed, StructType::Get({IntegerType::Get(32), ArrayType::Get(2, PointerType::Get())})), "parsed type equals built type");
     }},

    {"type printing", [](Context&, Checker& c) {
         TypePtr i32 = IntegerType::Get(32);
         c.equal(PointerType::Get(AddressSpace::Numbered(0))->string(), "ptr", "default address space");
         c.equal(PointerType::Get(AddressSpace::Named("local"))->string(), "ptr addrspace(\"local\")", "named address space");
         c.equal(VectorType::Get(2, i32, true)->string(), "<vscale x 2 x i32>", "scalable vector");
         c.equal(FunctionType::Get(Type::VoidTy, {i32, i32})->string(), "void (i32, i32)", "function type");
         c.equal(TargetExtensionType::Get("a", {i32, u64(3)})->string(), "target(\"a\", i32, 3)", "target extension type");
         TypePtr packed = StructType::Get({}, true);
         c.equal(fmt::format("{}", *packed), "<{}>", "packed empty structure");
     }},

    {"constant compatibility", [](Context&, Checker& c) {
         TypePtr i1 = IntegerType::Get(1);
         TypePtr i32 = IntegerType::Get(32);
         TypePtr ptr = PointerType::Get();

         c.check(BooleanConstant::Get(true)->is_compatible_with(*i1), "true is an i1");
         c.check(not BooleanConstant::Get(true)->is_compatible_with(*i32), "true is not an i32");
         c.check(IntegerConstant::Get(-1)->is_compatible_with(*i1), "integers fit any integer type");
         c.check(not IntegerConstant::Get(0)->is_compatible_with(*ptr), "integers are not pointers");
         c.check(Constant::Null->is_compatible_with(*ptr), "null is a pointer");
         c.check(Constant::None->is_compatible_with(*Type::TokenTy), "none is a token");
         c.check(Constant::Zero->is_compatible_with(*StructType::Get({i32, ptr})), "zeroinitializer fits structures");
         c.check(Constant::Poison->is_compatible_with(*Type::LabelTy), "poison fits everything");
         c.check(not Constant::Undef->is_compatible_with(*Type::LabelTy), "undef is not a label");
         c.check(not Constant::Undef->is_compatible_with(*Type::VoidTy), "undef is not void");
         c.check(FloatConstant::Get(1.5)->is_compatible_with(*FloatType::Get(FloatKind::Half)), "floats fit any float type");

         auto one = *ConstantValue::Create(i32, IntegerConstant::Get(1));
         auto two = *ConstantValue::Create(i32, IntegerConstant::Get(2));
         auto arr = AggregateConstant::Array({one, two});
         c.check(arr->is_compatible_with(*ArrayType::Get(2, i32)), "[2 x i32] matches");
         c.check(not arr->is_compatible_with(*ArrayType::Get(3, i32)), "element count must match");
         c.check(not arr->is_compatible_with(*ArrayType::Get(2, IntegerType::Get(64))), "element types must match");
         c.check(not arr->is_compatible_with(*VectorType::Get(2, i32)), "arrays are not vectors");

         auto st = AggregateConstant::Structure({one, *ConstantValue::Create(ptr, Constant::Null)});
         c.check(st->is_compatible_with(*StructType::Get({i32, ptr})), "structure members match");
         c.check(st->is_compatible_with(*StructType::Get({i32, ptr}, true)), "packing does not matter for constants");
         c.check(not st->is_compatible_with(*StructType::Get({ptr, i32})), "member order matters");
     }},

    {"constant value of the wrong type", [](Context&, Checker& c) {
         auto r = ConstantValue::Create(IntegerType::Get(32), BooleanConstant::Get(true));
         c.check(r.is_diag(), "creating 'i32 true' fails");
         if (not r.is_diag()) return;

         auto d = std::move(r.diag());
         c.equal(d.category(), ErrorKind::TypeMismatch, "error category");
         c.equal(d.message(), "Constant 'true' is not compatible with type 'i32'", "message");
         c.equal(d.notes().size(), usz(2), "number of notes");
         d.suppress();
     }},

    {"memory orderings", [](Context&, Checker& c) {
         using enum Ordering;
         c.check(CompareOrderings(Acquire, Release) == std::partial_ordering::unordered, "acquire and release are unordered");
         c.check(CompareOrderings(Monotonic, SequentiallyConsistent) == std::partial_ordering::less, "monotonic < seq_cst");
         c.check(CompareOrderings(AcquireRelease, Release) == std::partial_ordering::greater, "acq_rel > release");
         c.check(CompareOrderings(Unordered, Unordered) == std::partial_ordering::equivalent, "unordered == unordered");
         c.check(CompareOrderings(Acquire, Unordered) == std::partial_ordering::greater, "acquire > unordered");
     }},

    {"instruction result types", [](Context& ctx, Checker& c) {
         TypePtr i32 = IntegerType::Get(32);
         TypePtr i64 = IntegerType::Get(64);
         TypePtr v4 = VectorType::Get(4, i32);

         ICmpInst scalar{IntegerComparison::Equal, Local(i32, "%a"), Local(i32, "%b")};
         if (auto t = c.get(scalar.result_type(&ctx), "scalar icmp")) c.equal((*t)->string(), "i1", "scalar icmp");

         ICmpInst vector{IntegerComparison::SignedLessThan, Local(v4, "%a"), Local(v4, "%b")};
         if (auto t = c.get(vector.result_type(&ctx), "vector icmp")) c.equal((*t)->string(), "<4 x i1>", "vector icmp");

         GetElementPtrInst gep{i32, Local(PointerType::Get(AddressSpace::Numbered(3)), "%p"), {Local(i64, "%i")}};
         if (auto t = c.get(gep.result_type(&ctx), "scalar gep")) c.equal((*t)->string(), "ptr addrspace(3)", "gep keeps the address space");

         GetElementPtrInst vgep{i32, Local(PointerType::Get(), "%p"), {Local(VectorType::Get(2, i64), "%is")}};
         if (auto t = c.get(vgep.result_type(&ctx), "vector gep")) c.equal((*t)->string(), "<2 x ptr>", "vector index");

         GetElementPtrInst bad{i32, Local(i64, "%p"), {}};
         c.fails(bad.result_type(&ctx), ErrorKind::TypeMismatch, "must be a pointer");

         TypePtr agg = StructType::Get({i32, ArrayType::Get(3, i64)});
         ExtractValueInst ev{Local(agg, "%agg"), {1, 2}};
         if (auto t = c.get(ev.result_type(&ctx), "extractvalue")) c.equal((*t)->string(), "i64", "extractvalue path");

         ExtractValueInst oob{Local(agg, "%agg"), {1, 3}};
         c.fails(oob.result_type(&ctx), ErrorKind::TypeMismatch, "Index 3 is out of bounds");

         InsertValueInst iv{Local(agg, "%agg"), Local(i32, "%x"), {0}};
         if (auto t = c.get(iv.result_type(&ctx), "insertvalue")) c.check(Equal(*t, agg), "insertvalue yields the aggregate type");

         AllocaInst alloca{i32};
         if (auto t = c.get(alloca.result_type(&ctx), "alloca")) c.equal((*t)->string(), "ptr", "alloca");

         StoreInst store{Local(i32, "%x"), Local(PointerType::Get(), "%p")};
         if (auto t = c.get(store.result_type(&ctx), "store")) c.check((*t)->is_void(), "store produces no value");
     }},

    {"exception handling terminators", [](Context&, Checker& c) {
         auto fty = FunctionType::Get(Type::VoidTy, {});
         CallSite site{};
         site.function_type = fty;
         site.callee = std::make_shared<FunctionValue>("@f", fty);

         InvokeInst invoke{site, Label("%ok"), Label("%bad")};
         c.equal(invoke.string(), "invoke void @f() to label %ok unwind label %bad", "invoke");
         c.equal(invoke.successors().size(), usz(2), "invoke successors");
         c.equal(invoke.site().function_name(), "@f", "callee name");

         CallBranchInst callbr{site, Label("%next"), {Label("%a"), Label("%b")}};
         c.equal(callbr.string(), "callbr void @f() to label %next [label %a, label %b]", "callbr");
         c.equal(callbr.successors().size(), usz(3), "callbr successors");

         TypePtr exn = StructType::Get({PointerType::Get(), IntegerType::Get(32)});
         ResumeInst resume{Local(exn, "%exn")};
         c.equal(resume.string(), "resume { ptr, i32 } %exn", "resume");
         c.check(resume.successors().empty(), "resume has no successors");

         auto none = *ConstantValue::Create(Type::TokenTy, Constant::None);
         CatchSwitchInst cs{none, {Label("%handler")}};
         c.equal(cs.string(), "catchswitch within none [label %handler] unwind to caller", "catchswitch");
         c.equal(cs.successors().size(), usz(1), "catchswitch successors");

         CatchReturnInst cr{Local(Type::TokenTy, "%pad"), Label("%cont")};
         c.equal(cr.string(), "catchret from %pad to label %cont", "catchret");

         CleanupReturnInst cleanup{Local(Type::TokenTy, "%pad"), Label("%next")};
         c.equal(cleanup.string(), "cleanupret from %pad unwind label %next", "cleanupret");
         c.equal(cleanup.successors().size(), usz(1), "cleanupret successors");
     }},

    {"parsing a block", [](Context& ctx, Checker& c) {
         auto b = c.get(BasicBlock::Parse(&ctx, "call i32 @puts(ptr @.str)\nret i32 0\n"), "parsing the block");
         if (not b) return;

         auto& block = **b;
         c.check(not block.name().has_value(), "the block has no label");
         c.equal(block.operations().size(), usz(1), "number of operations");
         if (block.operations().empty()) return;

         auto& op = block.operations()[0];
         c.check(not op.is_assignment(), "the call is not assigned");
         auto call = cast<CallInst>(op.instruction().get());
         c.check(call != nullptr, "the operation is a call");
         if (call) {
             c.equal(call->site().function_name(), "@puts", "callee");
             c.equal(call->args().size(), usz(1), "number of arguments");
             c.check(call->function_type()->ret()->is_integer(32), "call returns i32");
             c.check(call->args()[0].value->type()->is_ptr(), "argument is a pointer");
         }

         auto ret = cast<ReturnInst>(block.terminator().get());
         c.check(ret != nullptr, "the terminator is a return");
         if (ret) {
             auto v = cast<ConstantValue>(ret->value().get());
             c.check(v and v->type()->is_integer(32), "return value is an i32 constant");
             if (v) {
                 auto i = cast<IntegerConstant>(v->constant().get());
                 c.check(i and i->value() == 0, "return value is 0");
             }
         }

         c.check(block.terminator()->successors().empty(), "return has no successors");
     }},

    {"labels in a standalone block stay unresolved", [](Context& ctx, Checker& c) {
         auto b = c.get(BasicBlock::Parse(&ctx, "br label %next"), "parsing the block");
         if (not b) return;
         auto br = cast<BranchInst>((*b)->terminator().get());
         c.check(br and br->destination()->block() == nullptr, "label is unresolved");
     }},

    {"parsing a function resolves labels", [](Context& ctx, Checker& c) {
         auto f = c.get(
             Function::Parse(
                 &ctx,
                 "define i32 @f(i32 %n) {\n"
                 "entry:\n"
                 "  %c = icmp eq i32 %n, 0\n"
                 "  br i1 %c, label %zero, label %other\n"
                 "zero:\n"
                 "  ret i32 %later\n"
                 "other:\n"
                 "  %later = add i32 %n, 1\n"
                 "  br label %zero\n"
                 "}\n"
             ),
             "parsing the function"
         );
         if (not f) return;

         auto& fn = **f;
         c.check(not fn.is_declaration(), "is a definition");
         c.equal(fn.blocks.size(), usz(3), "number of blocks");
         c.check(fn.find_parameter("%n") != nullptr, "parameter %n exists");
         c.check(fn.find_definition("%later") != nullptr, "%later is defined");
         c.check(fn.find_definition("%missing") == nullptr, "%missing is not defined");
         c.equal(fn.type()->string(), "i32 (i32)", "function type");

         auto zero = fn.find_block("zero");
         auto other = fn.find_block("other");
         c.check(zero and other, "blocks can be found by name");

         auto br = cast<CondBranchInst>(fn.blocks[0]->terminator().get());
         c.check(br != nullptr, "entry ends in a conditional branch");
         if (br) {
             c.check(br->if_true()->block() == zero, "true branch is resolved");
             c.check(br->if_false()->block() == other, "false branch is resolved");
         }

         auto back = cast<BranchInst>(fn.blocks[2]->terminator().get());
         c.check(back and back->destination()->block() == zero, "back edge is resolved");
     }},

    {"parsing a declaration", [](Context& ctx, Checker& c) {
         auto f = c.get(Function::Parse(&ctx, "declare i32 @printf(ptr noundef, ...)"), "parsing the declaration");
         if (not f) return;

         auto& fn = **f;
         c.check(fn.is_declaration(), "is a declaration");
         c.check(fn.variadic, "is variadic");
         c.equal(fn.name, "@printf", "name");
         c.equal(fn.type()->string(), "i32 (ptr, ...)", "function type");
         c.equal(fn.value()->string(), "ptr @printf", "function as a value");
         auto fv = cast<FunctionValue>(fn.value().get());
         c.check(fv and fv->function_type()->variadic(), "function value keeps the function type");
         c.equal(fn.parameters.size(), usz(1), "number of parameters");
         if (not fn.parameters.empty()) {
             c.check(fn.parameters[0].name.empty(), "parameter is unnamed");
             c.equal(fn.parameters[0].attributes.size(), usz(1), "number of parameter attributes");
         }
     }},

    {"parsing types", [](Context& ctx, Checker& c) {
         if (auto t = c.get(Type::Parse(&ctx, "<vscale x 4 x i32>"), "scalable vector")) {
             auto v = cast<VectorType>(t->get());
             c.check(v and v->scalable() and v->length() == 4 and v->element_type()->is_integer(32), "vector shape");
         }

         if (auto t = c.get(Type::Parse(&ctx, "i32"), "integer"))
             c.check(Equal(*t, IntegerType::Get(32)), "i32");

         if (auto t = c.get(Type::Parse(&ctx, "<4 x i32>"), "fixed vector"))
             c.check(Equal(*t, VectorType::Get(4, IntegerType::Get(32), false)), "fixed vector shape");

         if (auto t = c.get(Type::Parse(&ctx, "ptr addrspace(621)"), "numbered address space")) {
             auto p = cast<PointerType>(t->get());
             c.check(p and p->address_space() == AddressSpace::Numbered(621), "address space number");
         }

         if (auto t = c.get(Type::Parse(&ctx, "ptr addrspace(\"UwU\")"), "named address space")) {
             auto p = cast<PointerType>(t->get());
             c.check(p and p->address_space().named() and p->address_space().name() == "UwU", "address space name");
         }

         if (auto t = c.get(Type::Parse(&ctx, "target(\"x\", i8, 4)"), "target extension type")) {
             auto e = cast<TargetExtensionType>(t->get());
             c.check(e and e->name() == "x" and e->params().size() == 2, "target extension parameters");
         }

         if (auto t = c.get(Type::Parse(&ctx, "i8388607"), "widest integer"))
             c.check((*t)->is_integer(IntegerType::MaxBitWidth), "width");
     }},

    {"error categories", [](Context& ctx, Checker& c) {
         c.fails(Type::Parse(&ctx, "i32*"), ErrorKind::Unsupported, "Typed pointers");
         c.fails(Type::Parse(&ctx, "i0"), ErrorKind::SyntaxError, "bit width");
         c.fails(Type::Parse(&ctx, "[0 x i8]"), ErrorKind::SyntaxError, "length zero");
         c.fails(BasicBlock::Parse(&ctx, "ret i32 true"), ErrorKind::TypeMismatch, "not compatible");
         c.fails(BasicBlock::Parse(&ctx, "%x = fmul float 1.0, 2.0\nret void"), ErrorKind::Unsupported, "'fmul'");
         c.fails(BasicBlock::Parse(&ctx, "%x = add i32 1, 2"), ErrorKind::SyntaxError, "end of input");
         c.fails(Function::Parse(&ctx, "define void @f() {\n  br label %x\n}"), ErrorKind::SyntaxError, "Unknown block");
     }},

    {"a NUL byte does not end the input", [](Context& ctx, Checker& c) {
         using namespace std::string_view_literals;
         c.fails(Type::Parse(&ctx, "i32\0 garbage ]]]"sv), ErrorKind::SyntaxError, "NUL byte");
         c.fails(BasicBlock::Parse(&ctx, "ret void\0 this is not ir"sv), ErrorKind::SyntaxError, "NUL byte");
         c.fails(Function::Parse(&ctx, "declare void @f()\0"sv), ErrorKind::SyntaxError, "NUL byte");
         c.fails(BasicBlock::Parse(&ctx, "ret void ; comment\0\n"sv), ErrorKind::SyntaxError, "NUL byte");
         c.fails(Type::Parse(&ctx, "ptr addrspace(\"a\0b\")"sv), ErrorKind::SyntaxError, "NUL byte in string");

         auto r = Type::Parse(&ctx, "i32\0"sv);
         c.check(r.is_diag(), "trailing NUL is rejected");
         if (not r.is_diag()) return;
         auto d = std::move(r.diag());
         c.equal(d.location().pos, u32(3), "NUL position");
         d.suppress();
     }},

    {"calls keep an explicit function type", [](Context& ctx, Checker& c) {
         auto b = c.get(BasicBlock::Parse(&ctx, "%r = call i32 (ptr, ...) @printf(ptr @fmt, i32 1)\nret void"), "parsing the block");
         if (not b or (*b)->operations().empty()) return;
         auto call = cast<CallInst>((*b)->operations()[0].instruction().get());
         c.check(call != nullptr, "the operation is a call");
         if (not call) return;
         c.check(call->function_type()->variadic(), "function type is variadic");
         c.equal(call->function_type()->params().size(), usz(1), "number of fixed parameters");
         c.equal(call->args().size(), usz(2), "number of arguments");
     }},

    {"function types cannot return functions", [](Context& ctx, Checker& c) {
         c.fails(Type::Parse(&ctx, "i32 (i8) (i16)"), ErrorKind::SyntaxError, "cannot return a function type");
         c.fails(BasicBlock::Parse(&ctx, "call void (i8) (i16) @f(i16 1)\nret void"), ErrorKind::SyntaxError, "cannot return a function type");
         if (auto t = c.get(Type::Parse(&ctx, "ptr (i8)"), "function returning a pointer"))
             c.equal((*t)->string(), "ptr (i8)", "function type");
     }},

    {"integer constants are held in 64 bits", [](Context& ctx, Checker& c) {
         c.fails(BasicBlock::Parse(&ctx, "ret i128 18446744073709551616"), ErrorKind::Unsupported, "64 bits");
         if (auto b = c.get(BasicBlock::Parse(&ctx, "ret i64 18446744073709551615"), "largest unsigned literal"))
             c.equal((*b)->terminator()->string(), "ret i64 -1", "printed as signed");
     }},

    {"error locations", [](Context& ctx, Checker& c) {
         auto r = Type::Parse(&ctx, "{ i32, ^ }");
         c.check(r.is_diag(), "stray character is rejected");
         if (not r.is_diag()) return;

         auto d = std::move(r.diag());
         c.equal(d.location().pos, u32(7), "error position");
         d.suppress();
     }},
};

int main() {
    Context context{
        Context::Options{
            Context::DoNotUseColour,
            Context::DoNotDiagBacktrace,
        }
    };

    usz failed = 0;
    for (const auto& t : tests) {
        Checker checker{t.name};
        t.run(context, checker);
        if (not checker.passed()) failed++;
        fmt::print(
            "  {}{}{} {}: {}\n",
            checker.passed() ? C(utils::Colour::BoldGreen) : C(utils::Colour::BoldRed),
            checker.passed() ? 'O' : 'X',
            C(utils::Colour::Reset),
            t.name,
            checker.passed() ? "PASSED" : "FAILED"
        );
    }

    fmt::print(
        "\nFINAL REPORT:\n  {}PASSED:  {}/{}{}\n",
        C(utils::Colour::Green),
        std::size(tests) - failed,
        std::size(tests),
        C(utils::Colour::Reset)
    );

    if (failed) fmt::print("  {}FAILED:  {}{}\n", C(utils::Colour::Red), failed, C(utils::Colour::Reset));

    /// Every expected error is suppressed, so nothing should have been issued.
    if (context.has_error()) {
        fmt::print("  {}Unexpected errors were issued{}\n", C(utils::Colour::Red), C(utils::Colour::Reset));
        return 1;
    }

    return failed ? 1 : 0;
}
