#ifndef LIR_IR_FUNCTION_HH
#define LIR_IR_FUNCTION_HH

#include <lir/forward.hh>
#include <lir/ir/ir.hh>
#include <lir/utils.hh>
#include <lir/utils/result.hh>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lir {
/// An instruction in a basic block, optionally bound to a name.
class Operation {
    std::optional<std::string> _identifier;
    InstructionPtr _instruction;
    std::vector<MetadataAttachment> _metadata;

public:
    /// `%x = <instruction>`.
    Operation(std::string identifier, InstructionPtr instruction, std::vector<MetadataAttachment> metadata = {})
        : _identifier(std::move(identifier)),
          _instruction(std::move(instruction)),
          _metadata(std::move(metadata)) {
        LIR_ASSERT(_instruction);
    }

    /// `<instruction>`.
    explicit Operation(InstructionPtr instruction, std::vector<MetadataAttachment> metadata = {})
        : _instruction(std::move(instruction)),
          _metadata(std::move(metadata)) {
        LIR_ASSERT(_instruction);
    }

    [[nodiscard]] bool is_assignment() const { return _identifier.has_value(); }

    /// The assigned name including the `%` sigil. Only valid if this
    /// is an assignment.
    [[nodiscard]] auto identifier() const -> const std::string& { return *_identifier; }

    [[nodiscard]] auto instruction() const -> const InstructionPtr& { return _instruction; }
    [[nodiscard]] auto metadata() const -> const std::vector<MetadataAttachment>& { return _metadata; }

    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;
};

/// A straight-line sequence of operations ending in a terminator.
class BasicBlock {
    std::optional<std::string> _name;
    std::vector<Operation> _operations;
    TerminatorPtr _terminator;
    std::vector<MetadataAttachment> _terminator_metadata;

public:
    BasicBlock(
        std::optional<std::string> name,
        std::vector<Operation> operations,
        TerminatorPtr terminator,
        std::vector<MetadataAttachment> terminator_metadata = {}
    ) : _name(std::move(name)),
        _operations(std::move(operations)),
        _terminator(std::move(terminator)),
        _terminator_metadata(std::move(terminator_metadata)) {
        LIR_ASSERT(_terminator, "A basic block must end with a terminator");
    }

    /// Parse a single basic block. Labels it branches to are left
    /// unresolved.
    static auto Parse(Context* ctx, File& file) -> Result<std::unique_ptr<BasicBlock>>;
    static auto Parse(Context* ctx, std::string_view text) -> Result<std::unique_ptr<BasicBlock>>;

    /// The label of this block, without the `%` sigil.
    [[nodiscard]] auto name() const -> const std::optional<std::string>& { return _name; }
    [[nodiscard]] auto operations() const -> const std::vector<Operation>& { return _operations; }
    [[nodiscard]] auto terminator() const -> const TerminatorPtr& { return _terminator; }
    [[nodiscard]] auto terminator_metadata() const -> const std::vector<MetadataAttachment>& { return _terminator_metadata; }

    /// Print this block, including its label if it has one.
    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;
};

/// https://llvm.org/docs/LangRef.html#linkage-types
enum struct Linkage {
    Private,
    Internal,
    AvailableExternally,
    LinkOnce,
    Weak,
    Common,
    Appending,
    ExternalWeak,
    LinkOnceODR,
    WeakODR,
    External,
};

constexpr auto StringifyEnum(Linkage l) -> std::string_view {
    switch (l) {
        case Linkage::Private: return "private";
        case Linkage::Internal: return "internal";
        case Linkage::AvailableExternally: return "available_externally";
        case Linkage::LinkOnce: return "linkonce";
        case Linkage::Weak: return "weak";
        case Linkage::Common: return "common";
        case Linkage::Appending: return "appending";
        case Linkage::ExternalWeak: return "extern_weak";
        case Linkage::LinkOnceODR: return "linkonce_odr";
        case Linkage::WeakODR: return "weak_odr";
        case Linkage::External: return "external";
    }
    return "<invalid>";
}

/// https://llvm.org/docs/LangRef.html#runtime-preemption-model
enum struct Preemption {
    Preemptable,
    Local,
};

constexpr auto StringifyEnum(Preemption p) -> std::string_view {
    switch (p) {
        case Preemption::Preemptable: return "dso_preemptable";
        case Preemption::Local: return "dso_local";
    }
    return "<invalid>";
}

enum struct Visibility {
    Default,
    Hidden,
    Protected,
};

constexpr auto StringifyEnum(Visibility v) -> std::string_view {
    switch (v) {
        case Visibility::Default: return "default";
        case Visibility::Hidden: return "hidden";
        case Visibility::Protected: return "protected";
    }
    return "<invalid>";
}

enum struct DLLStorage {
    None,
    Import,
    Export,
};

constexpr auto StringifyEnum(DLLStorage d) -> std::string_view {
    switch (d) {
        case DLLStorage::None: return "";
        case DLLStorage::Import: return "dllimport";
        case DLLStorage::Export: return "dllexport";
    }
    return "<invalid>";
}

enum struct UnnamedAddr {
    None,
    Global,
    Local,
};

constexpr auto StringifyEnum(UnnamedAddr u) -> std::string_view {
    switch (u) {
        case UnnamedAddr::None: return "";
        case UnnamedAddr::Global: return "unnamed_addr";
        case UnnamedAddr::Local: return "local_unnamed_addr";
    }
    return "<invalid>";
}

/// A function definition or declaration.
///
/// Everything in the header except the name, return type and
/// parameters is optional and defaults to what LLVM assumes if
/// it is omitted.
class Function {
public:
    struct Parameter {
        TypePtr type;
        std::vector<ParameterAttribute> attributes{};

        /// Name including the `%` sigil; empty if unnamed.
        std::string name{};
    };

    Linkage linkage = Linkage::External;
    Preemption preemption = Preemption::Preemptable;
    Visibility visibility = Visibility::Default;
    DLLStorage dll_storage = DLLStorage::None;
    std::optional<std::string> calling_convention{};
    std::vector<ParameterAttribute> return_attributes{};
    TypePtr return_type;

    /// Name including the `@` sigil.
    std::string name;
    std::vector<Parameter> parameters{};
    bool variadic = false;
    UnnamedAddr unnamed_addr = UnnamedAddr::None;
    std::optional<AddressSpace> address_space{};

    /// Function attributes as written, e.g. `nounwind` or `#0`.
    std::vector<std::string> attributes{};
    std::optional<std::string> section{};
    std::optional<std::string> partition{};

    /// `comdat` or `comdat($name)`; an empty string is a bare `comdat`.
    std::optional<std::string> comdat{};
    std::optional<u64> alignment{};

    /// The name of the garbage collector, if any.
    std::optional<std::string> gc{};
    ValuePtr prefix{};
    ValuePtr prologue{};
    ValuePtr personality{};
    std::vector<MetadataAttachment> metadata{};

    /// Empty for declarations.
    std::vector<std::unique_ptr<BasicBlock>> blocks{};

    Function(TypePtr return_type_, std::string name_)
        : return_type(std::move(return_type_)), name(std::move(name_)) {}

    /// Parse a `define` or `declare`.
    static auto Parse(Context* ctx, File& file) -> Result<std::unique_ptr<Function>>;
    static auto Parse(Context* ctx, std::string_view text) -> Result<std::unique_ptr<Function>>;

    /// Whether this is `declare` rather than `define`.
    [[nodiscard]] bool is_declaration() const { return blocks.empty(); }

    /// Whether the function uses a garbage collector.
    [[nodiscard]] bool is_garbage_collected() const { return gc.has_value(); }

    /// Get the type of this function.
    [[nodiscard]] auto type() const -> std::shared_ptr<const FunctionType>;

    /// Get this function as a value, e.g. to call it.
    [[nodiscard]] auto value() const -> ValuePtr;

    /// Find a block by name, without the `%` sigil.
    [[nodiscard]] auto find_block(std::string_view block_name) const -> const BasicBlock*;

    /// Find the operation that defines a local name, e.g. `%x`.
    [[nodiscard]] auto find_definition(std::string_view local) const -> const Operation*;

    /// Find a parameter by name, e.g. `%x`.
    [[nodiscard]] auto find_parameter(std::string_view local) const -> const Parameter*;

    [[nodiscard]] auto string(bool use_colour = false) const -> std::string;
};
} // namespace lir

#endif // LIR_IR_FUNCTION_HH
