#include <lir/context.hh>
#include <lir/detail/defer.hh>
#include <lir/ir/function.hh>
#include <lir/ir/ir.hh>
#include <lir/ir/type.hh>
#include <lir/syntax/lexer.hh>
#include <lir/syntax/token.hh>
#include <lir/utils/result.hh>
#include <lir/utils/rtti.hh>

#include <bit>
#include <cerrno>
#include <cstdlib>
#include <deque>
#include <span>

/// Namespace required for friend declarations in ir.hh.
namespace lir::parser {
enum struct TokenKind {
    Invalid,
    Eof,
    Keyword,
    IntegerType,
    LocalIdent,
    GlobalIdent,
    Label,
    Integer,
    Float,
    String,
    CString,
    Metadata,
    AttrGroup,

    LParen,
    RParen,
    LBrack,
    RBrack,
    LBrace,
    RBrace,
    LAngle,
    RAngle,
    Comma,
    Equals,
    Star,
    Ellipsis,
};

constexpr auto StringifyEnum(TokenKind t) -> std::string_view {
    switch (t) {
        case TokenKind::Invalid: break;
        case TokenKind::Eof: return "end of input";
        case TokenKind::Keyword: return "keyword";
        case TokenKind::IntegerType: return "integer type";
        case TokenKind::LocalIdent: return "local identifier";
        case TokenKind::GlobalIdent: return "global identifier";
        case TokenKind::Label: return "label";
        case TokenKind::Integer: return "integer";
        case TokenKind::Float: return "floating point constant";
        case TokenKind::String: return "string";
        case TokenKind::CString: return "c string";
        case TokenKind::Metadata: return "metadata";
        case TokenKind::AttrGroup: return "attribute group";
        case TokenKind::LParen: return "(";
        case TokenKind::RParen: return ")";
        case TokenKind::LBrack: return "[";
        case TokenKind::RBrack: return "]";
        case TokenKind::LBrace: return "{";
        case TokenKind::RBrace: return "}";
        case TokenKind::LAngle: return "<";
        case TokenKind::RAngle: return ">";
        case TokenKind::Comma: return ",";
        case TokenKind::Equals: return "=";
        case TokenKind::Star: return "*";
        case TokenKind::Ellipsis: return "...";
    }

    return "<invalid>";
}

namespace {
/// Map the keywords of the enumerators in [first, last] to their values.
template <typename Enum>
auto KeywordMap(Enum first, Enum last) -> StringMap<Enum> {
    StringMap<Enum> m;
    for (auto i = +first; i <= +last; i++) m.emplace(std::string{StringifyEnum(Enum(i))}, Enum(i));
    return m;
}

template <typename Enum>
auto Lookup(const StringMap<Enum>& m, std::string_view kw) -> std::optional<Enum> {
    auto it = m.find(kw);
    if (it == m.end()) return std::nullopt;
    return it->second;
}

bool Contains(std::span<const std::string_view> list, std::string_view kw) {
    return rgs::find(list, kw) != list.end();
}

/// Opcodes that are valid LLVM but that we do not model.
constexpr std::string_view UnsupportedOpcodes[]{
    "phi",
    "fneg",
    "fadd",
    "fsub",
    "fmul",
    "fdiv",
    "frem",
    "fcmp",
    "fptrunc",
    "fpext",
    "fptoui",
    "fptosi",
    "uitofp",
    "sitofp",
    "extractelement",
    "insertelement",
    "shufflevector",
    "atomicrmw",
    "cmpxchg",
    "va_arg",
    "landingpad",
    "catchpad",
    "cleanuppad",
};

/// Terminators that are modeled but only built programmatically.
constexpr std::string_view UnsupportedTerminators[]{
    "invoke",
    "callbr",
    "resume",
    "catchswitch",
    "catchret",
    "cleanupret",
};

constexpr std::string_view Terminators[]{
    "ret",
    "br",
    "switch",
    "indirectbr",
    "unreachable",
};

constexpr std::string_view CallingConventions[]{
    "ccc",
    "fastcc",
    "coldcc",
    "ghccc",
    "tailcc",
    "swiftcc",
    "swifttailcc",
    "webkit_jscc",
    "anyregcc",
    "preserve_mostcc",
    "preserve_allcc",
    "preserve_nonecc",
    "cxx_fast_tlscc",
    "cfguard_checkcc",
    "x86_stdcallcc",
    "x86_fastcallcc",
    "x86_thiscallcc",
    "x86_vectorcallcc",
    "x86_regcallcc",
    "x86_intrcc",
    "x86_64_sysvcc",
    "win64cc",
    "arm_apcscc",
    "arm_aapcscc",
    "arm_aapcs_vfpcc",
    "aarch64_vector_pcs",
    "aarch64_sve_vector_pcs",
    "riscv_vector_cc",
    "spir_func",
    "spir_kernel",
    "amdgpu_kernel",
    "ptx_kernel",
    "ptx_device",
    "msp430_intrcc",
    "avr_intrcc",
};

/// Function attributes that are written as a bare keyword,
/// optionally followed by a parenthesised argument.
constexpr std::string_view FunctionAttributes[]{
    "alignstack",
    "allockind",
    "allocsize",
    "alwaysinline",
    "argmemonly",
    "builtin",
    "cold",
    "convergent",
    "disable_sanitizer_instrumentation",
    "fn_ret_thunk_extern",
    "hot",
    "inaccessiblememonly",
    "inaccessiblemem_or_argmemonly",
    "inlinehint",
    "jumptable",
    "memory",
    "minsize",
    "mustprogress",
    "naked",
    "nobuiltin",
    "nocallback",
    "nocf_check",
    "noduplicate",
    "nofree",
    "noimplicitfloat",
    "noinline",
    "nomerge",
    "nonlazybind",
    "noprofile",
    "norecurse",
    "noredzone",
    "noreturn",
    "nosanitize_bounds",
    "nosanitize_coverage",
    "nosync",
    "nounwind",
    "null_pointer_is_valid",
    "optforfuzzing",
    "optnone",
    "optsize",
    "presplitcoroutine",
    "readnone",
    "readonly",
    "returns_twice",
    "safestack",
    "sanitize_address",
    "sanitize_hwaddress",
    "sanitize_memory",
    "sanitize_memtag",
    "sanitize_thread",
    "shadowcallstack",
    "skipprofile",
    "speculatable",
    "speculative_load_hardening",
    "ssp",
    "sspreq",
    "sspstrong",
    "strictfp",
    "uwtable",
    "vscale_range",
    "willreturn",
    "writeonly",
};

constexpr std::string_view FastMathFlags[]{
    "fast",
    "nnan",
    "ninf",
    "nsz",
    "arcp",
    "contract",
    "afn",
    "reassoc",
};
} // namespace

class Parser : syntax::Lexer<syntax::Token<TokenKind>> {
    using Tk = TokenKind;
    using Token = syntax::Token<Tk>;
    using K = Instruction::Kind;

    /// Flags that may precede the operands of a binary operator.
    struct BinaryFlags {
        AllowedWrapping wrapping{};
        bool exact = false;
        bool disjoint = false;
    };

    std::string_view source;
    std::deque<Token> lookahead_tokens{};
    bool looking_ahead = false;

    /// Location of the last token that was consumed.
    Location previous{};

    /// The first error the lexer ran into. Every token after
    /// that point is Invalid.
    std::optional<Diag> lexer_error{};

    /// Whether local names are checked and labels resolved. This
    /// is only the case inside a function body.
    bool in_function = false;

    /// Local names (with sigil) defined in the current function.
    StringMap<Location> locals{};

    /// The number the next unnamed value or block gets.
    u64 next_number = 0;

    /// Unresolved values.
    std::vector<std::pair<std::string, Location>> local_fixups{};
    std::vector<std::pair<std::shared_ptr<LabelValue>, Location>> label_fixups{};

public:
    Parser(Context* context, File* file)
        : syntax::Lexer<Token>(context, file),
          source(file->text()) {
        NextToken();
    }

    ~Parser() {
        /// An error that was lexed ahead but never reached.
        if (lexer_error) lexer_error->suppress();
    }

    Parser(const Parser&) = delete;
    auto operator=(const Parser&) -> Parser& = delete;

    auto ParseTypeInput() -> Result<TypePtr>;
    auto ParseBlockInput() -> Result<std::unique_ptr<BasicBlock>>;
    auto ParseFunctionInput() -> Result<std::unique_ptr<Function>>;

private:
    /// Check if we’re at one of a set of tokens.
    [[nodiscard]] static bool Is(const Token* tk, auto... tks) { return ((tk->kind == tks) or ...); }
    [[nodiscard]] bool At(auto... tks) { return Is(&tok, tks...); }
    [[nodiscard]] bool Kw(std::string_view text) { return At(Tk::Keyword) and tok.text == text; }

    /// Like At(), but consume the token if it matches.
    bool Consume(auto... tks) {
        if (At(tks...)) {
            NextToken();
            return true;
        }
        return false;
    }

    /// Like Kw(), but consume the token if it matches.
    bool ConsumeKw(std::string_view text) {
        if (Kw(text)) {
            NextToken();
            return true;
        }
        return false;
    }

    auto ConsumeOrError(Tk t) -> Result<void> {
        if (not Consume(t)) return Expected(fmt::format("'{}'", t));
        return {};
    }

    auto ParseLiteral(std::string_view lit) -> Result<void> {
        if (not ConsumeKw(lit)) return Expected(fmt::format("'{}'", lit));
        return {};
    }

    /// Report that something else was expected at the current token.
    auto Expected(std::string_view what) -> Diag;

    /// Describe the current token for an error message.
    auto Describe() -> std::string;

    /// The source text from the start of `start` to the end of
    /// the last consumed token.
    auto RawText(Location start) const -> std::string_view {
        return source.substr(start.pos, previous.pos + previous.len - start.pos);
    }

    /// Record the first lexer error and invalidate the token.
    void Fail(Diag d) {
        if (not lexer_error) lexer_error.emplace(std::move(d));
        else d.suppress();
        tok.kind = Tk::Invalid;
    }

    void SetTokenLength() {
        tok.location.len = u16(std::max<u32>(1, CurrentOffset() - tok.location.pos));
    }

    auto LookAhead(usz n) -> Token*;
    void NextIdentifier();
    void NextMetadata();

    /// Skip a nested metadata body, including the brackets.
    auto SkipBalanced(u32 open, u32 close) -> bool;
    void NextNumber(bool negative);
    void NextString();
    void NextToken();

    static bool IsIdentStart(u32 c) { return IsAlpha(c) or c == '_' or c == '.' or c == '$' or c == '-'; }
    static bool IsIdentContinue(u32 c) { return IsIdentStart(c) or IsDigit(c); }

    /// Integers.
    auto ParseUnsigned() -> Result<u64>;
    auto ParseSigned() -> Result<i64>;

    /// Types.
    auto ParseAddressSpace() -> Result<AddressSpace>;
    auto ParseBaseType() -> Result<TypePtr>;
    auto ParseType() -> Result<TypePtr>;

    /// Values.
    auto ParseAggregateElements(Tk close) -> Result<std::vector<ValuePtr>>;
    auto ParseConstantExpression() -> Result<ValuePtr>;
    auto ParseLabel() -> Result<LabelPtr>;
    auto ParseUntypedValue(TypePtr ty) -> Result<ValuePtr>;
    auto ParseValue() -> Result<ValuePtr>;
    auto MakeLabel(std::string name, Location loc) -> LabelPtr;

    /// Attributes.
    auto ParseCallingConvention() -> Result<std::optional<std::string>>;
    auto ParseFunctionAttributes() -> Result<std::vector<std::string>>;
    auto ParseMetadataAttachments() -> Result<std::vector<MetadataAttachment>>;
    auto ParseParameterAttributes() -> Result<std::vector<ParameterAttribute>>;

    /// Instructions.
    auto ParseBinaryFlags(K kind) -> Result<BinaryFlags>;
    auto ParseOrdering() -> Result<Ordering>;
    auto ParseSyncScope() -> Result<std::optional<std::string>>;

    auto ParseBinary(K kind) -> Result<InstructionPtr>;
    auto ParseCallSite() -> Result<CallSite>;
    auto ParseCall() -> Result<InstructionPtr>;
    auto ParseCast(K kind) -> Result<InstructionPtr>;
    auto ParseGetElementPtr() -> Result<InstructionPtr>;
    auto ParseInstruction() -> Result<InstructionPtr>;
    auto ParseLoad() -> Result<InstructionPtr>;
    auto ParseStore() -> Result<InstructionPtr>;
    auto ParseTerminator() -> Result<TerminatorPtr>;

    /// Blocks and functions.
    auto AddLocal(std::string name, Location loc) -> Result<void>;
    auto ParseBlock(std::optional<std::string> name) -> Result<std::unique_ptr<BasicBlock>>;
    auto ParseFunction() -> Result<std::unique_ptr<Function>>;
    auto ResolveFixups() -> Result<void>;

    static auto BinaryOpcode(std::string_view kw) -> std::optional<K>;
    static auto CastOpcode(std::string_view kw) -> std::optional<K>;
};

/// ===========================================================================
///  Lexer.
/// ===========================================================================
void Parser::NextIdentifier() {
    tok.kind = Tk::Keyword;
    while (IsIdentContinue(lastc)) {
        tok.text += char(lastc);
        NextChar();
    }
}

auto Parser::SkipBalanced(u32 open, u32 close) -> bool {
    usz depth = 0;
    bool in_string = false;
    do {
        if (lastc == 0) return false;
        if (in_string) {
            if (lastc == '"') in_string = false;
        } else if (lastc == '"') {
            in_string = true;
        } else if (lastc == open) {
            depth++;
        } else if (lastc == close) {
            depth--;
        }

        NextChar();
    } while (depth != 0);
    return true;
}

void Parser::NextMetadata() {
    tok.kind = Tk::Metadata;

    /// `!{...}`.
    if (lastc == '{') {
        if (not SkipBalanced('{', '}')) {
            SetTokenLength();
            return Fail(Error("Unterminated metadata node"));
        }
    }

    /// `!"string"`.
    else if (lastc == '"') {
        do NextChar();
        while (lastc != '"' and lastc != 0);
        if (lastc == 0) {
            SetTokenLength();
            return Fail(Error("Unterminated metadata string"));
        }
        NextChar();
    }

    /// `!name`, `!0` or `!DIExpression(...)`.
    else if (IsIdentContinue(lastc) or lastc == '\\') {
        while (IsIdentContinue(lastc) or lastc == '\\') NextChar();
        if (lastc == '(' and not SkipBalanced('(', ')')) {
            SetTokenLength();
            return Fail(Error("Unterminated metadata node"));
        }
    }

    else {
        SetTokenLength();
        return Fail(Error("Expected metadata after '!'"));
    }

    SetTokenLength();
    tok.text = std::string{source.substr(tok.location.pos, tok.location.len)};
}

void Parser::NextNumber(bool negative) {
    std::string digits;
    tok.kind = Tk::Integer;

    /// Hexadecimal floating point constant.
    if (lastc == '0') {
        NextChar();
        if (lastc == 'x') {
            NextChar();
            if (lastc == 'K' or lastc == 'L' or lastc == 'M' or lastc == 'H' or lastc == 'R') {
                SetTokenLength();
                return Fail(Unsupported("Floating point constants of the form '0x{}...' are not supported", char(lastc)));
            }

            while (IsHexDigit(lastc)) {
                digits += char(lastc);
                NextChar();
            }

            SetTokenLength();
            if (negative) return Fail(Error("Hexadecimal floating point constants cannot be negated"));
            if (digits.empty()) return Fail(Error("Expected hexadecimal digits after '0x'"));
            if (digits.size() > 16) return Fail(Error("Hexadecimal floating point constant '0x{}' is too long", digits));
            tok.kind = Tk::Float;
            tok.float_value = std::bit_cast<f64>(u64(std::strtoull(digits.c_str(), nullptr, 16)));
            tok.text = "0x" + digits;
            return;
        }

        digits += '0';
    }

    while (IsDigit(lastc)) {
        digits += char(lastc);
        NextChar();
    }

    /// A block label such as `1:`.
    if (lastc == ':' and not negative) {
        NextChar();
        SetTokenLength();
        tok.kind = Tk::Label;
        tok.text = std::move(digits);
        return;
    }

    bool is_float = false;
    if (lastc == '.') {
        is_float = true;
        digits += '.';
        NextChar();
        while (IsDigit(lastc)) {
            digits += char(lastc);
            NextChar();
        }
    }

    if (lastc == 'e' or lastc == 'E') {
        is_float = true;
        digits += 'e';
        NextChar();
        if (lastc == '+' or lastc == '-') {
            digits += char(lastc);
            NextChar();
        }

        if (not IsDigit(lastc)) {
            SetTokenLength();
            return Fail(Error("Expected exponent in floating point constant"));
        }

        while (IsDigit(lastc)) {
            digits += char(lastc);
            NextChar();
        }
    }

    SetTokenLength();
    tok.text = negative ? "-" + digits : digits;

    /// Convert the number.
    errno = 0;
    if (is_float) {
        tok.kind = Tk::Float;
        tok.float_value = std::strtod(tok.text.c_str(), nullptr);
        if (errno == ERANGE) return Fail(Error("Floating point constant '{}' is out of range", tok.text));
        return;
    }

    auto value = u64(std::strtoull(digits.c_str(), nullptr, 10));
    if (errno == ERANGE or (negative and value > (u64(1) << 63)))
        return Fail(Unsupported("Integer constant '{}' does not fit in 64 bits; wider constants are not supported", tok.text));
    tok.integer_value = negative ? u64(0) - value : value;
}

void Parser::NextString() {
    NextChar();
    while (lastc != '"' and lastc != 0) {
        tok.text += char(lastc);
        NextChar();
    }

    if (lastc == 0) {
        SetTokenLength();
        if (not AtEnd()) return Fail(Error("Unexpected NUL byte in string"));
        return Fail(Error("Unterminated string"));
    }

    NextChar();
}

void Parser::NextToken() {
    if (not looking_ahead) previous = tok.location;
    if (not looking_ahead and not lookahead_tokens.empty()) {
        tok = std::move(lookahead_tokens.front());
        lookahead_tokens.pop_front();
        return;
    }

    tok.kind = Tk::Invalid;
    tok.text.clear();
    tok.integer_value = 0;
    tok.float_value = 0;

    /// Skip whitespace and comments.
    for (;;) {
        while (IsSpace(lastc)) NextChar();
        if (lastc != ';') break;
        while (lastc != 0 and lastc != '\n') NextChar();
    }

    tok.location.pos = CurrentOffset();
    tok.location.len = 1;

    /// Nothing after a lexer error is meaningful.
    if (lexer_error) return;

    switch (lastc) {
        case 0:
            if (not AtEnd()) {
                NextChar();
                return Fail(Error("Unexpected NUL byte"));
            }

            tok.kind = Tk::Eof;
            if (not source.empty()) tok.location.pos = u32(source.size() - 1);
            else tok.location.len = 0;
            return;

        case '(':
            tok.kind = Tk::LParen;
            NextChar();
            break;

        case ')':
            tok.kind = Tk::RParen;
            NextChar();
            break;

        case '[':
            tok.kind = Tk::LBrack;
            NextChar();
            break;

        case ']':
            tok.kind = Tk::RBrack;
            NextChar();
            break;

        case '{':
            tok.kind = Tk::LBrace;
            NextChar();
            break;

        case '}':
            tok.kind = Tk::RBrace;
            NextChar();
            break;

        case '<':
            tok.kind = Tk::LAngle;
            NextChar();
            break;

        case '>':
            tok.kind = Tk::RAngle;
            NextChar();
            break;

        case ',':
            tok.kind = Tk::Comma;
            NextChar();
            break;

        case '=':
            tok.kind = Tk::Equals;
            NextChar();
            break;

        case '*':
            tok.kind = Tk::Star;
            NextChar();
            break;

        case '.':
            NextChar();
            if (lastc != '.') {
                tok.text = '.';
                NextIdentifier();
                if (lastc == ':') {
                    NextChar();
                    tok.kind = Tk::Label;
                }
                break;
            }

            NextChar();
            if (lastc != '.') {
                SetTokenLength();
                return Fail(Error("Expected '...'"));
            }

            NextChar();
            tok.kind = Tk::Ellipsis;
            break;

        case '%':
        case '@': {
            const bool local = lastc == '%';
            tok.text = char(lastc);
            NextChar();

            if (lastc == '"') {
                SetTokenLength();
                return Fail(Unsupported("Quoted identifiers are not supported"));
            }

            if (IsDigit(lastc)) {
                while (IsDigit(lastc)) {
                    tok.text += char(lastc);
                    NextChar();
                }
            } else if (IsIdentStart(lastc)) {
                NextIdentifier();
            } else {
                SetTokenLength();
                return Fail(Error("Expected identifier after '{}'", tok.text));
            }

            tok.kind = local ? Tk::LocalIdent : Tk::GlobalIdent;
        } break;

        case '!':
            NextChar();
            NextMetadata();
            return;

        case '#':
            tok.text = '#';
            NextChar();
            while (IsDigit(lastc)) {
                tok.text += char(lastc);
                NextChar();
            }

            if (tok.text.size() == 1) {
                SetTokenLength();
                return Fail(Error("Expected attribute group number after '#'"));
            }

            tok.kind = Tk::AttrGroup;
            break;

        case '"':
            tok.kind = Tk::String;
            NextString();
            break;

        case '-':
            NextChar();
            if (IsDigit(lastc)) {
                NextNumber(true);
                return;
            }

            tok.text = '-';
            NextIdentifier();
            if (lastc == ':') {
                NextChar();
                tok.kind = Tk::Label;
            }
            break;

        default:
            if (IsDigit(lastc)) {
                NextNumber(false);
                return;
            }

            if (not IsIdentStart(lastc)) {
                SetTokenLength();
                return Fail(Error("Unexpected character '{}'", char(lastc)));
            }

            NextIdentifier();

            /// `c"..."`.
            if (tok.text == "c" and lastc == '"') {
                tok.text.clear();
                tok.kind = Tk::CString;
                NextString();
                break;
            }

            /// `name:`.
            if (lastc == ':') {
                NextChar();
                tok.kind = Tk::Label;
                break;
            }

            /// Try and parse a number after `i`.
            if (
                tok.text.size() > 1 and
                tok.text[0] == 'i' and
                rgs::all_of(tok.text.substr(1), [](char c) { return IsDigit(u32(c)); })
            ) {
                errno = 0;
                tok.integer_value = u64(std::strtoull(tok.text.c_str() + 1, nullptr, 10));
                if (errno == ERANGE) {
                    SetTokenLength();
                    return Fail(Error("Bit width of integer type '{}' is too large", tok.text));
                }
                tok.kind = Tk::IntegerType;
            }
            break;
    }

    SetTokenLength();
}

auto Parser::LookAhead(usz n) -> Token* {
    if (n == 0) return &tok;

    /// If we already have enough tokens, just return the nth token.
    const auto idx = n - 1;
    if (idx < lookahead_tokens.size()) return &lookahead_tokens[idx];

    /// Otherwise, lex enough tokens.
    lir::detail::TempSet<bool> _{looking_ahead, true};
    auto current = std::move(tok);
    for (usz i = lookahead_tokens.size(); i < n; i++) {
        tok = {};
        tok.location.file_id = current.location.file_id;
        NextToken();
        lookahead_tokens.push_back(std::move(tok));
    }
    tok = std::move(current);

    /// Return the nth token.
    return &lookahead_tokens[idx];
}

auto Parser::Describe() -> std::string {
    if (At(Tk::Eof)) return "end of input";
    return fmt::format("'{}'", source.substr(tok.location.pos, tok.location.len));
}

auto Parser::Expected(std::string_view what) -> Diag {
    if (At(Tk::Invalid) and lexer_error) {
        auto d = std::move(*lexer_error);
        lexer_error.reset();
        return d;
    }

    return Error("Expected {}, got {}", what, Describe());
}

/// ===========================================================================
///  Integers and types.
/// ===========================================================================
auto Parser::ParseUnsigned() -> Result<u64> {
    if (not At(Tk::Integer) or tok.text.starts_with('-')) return Expected("non-negative integer");
    auto value = tok.integer_value;
    NextToken();
    return value;
}

auto Parser::ParseSigned() -> Result<i64> {
    if (not At(Tk::Integer)) return Expected("integer");
    auto value = i64(tok.integer_value);
    NextToken();
    return value;
}

auto Parser::ParseAddressSpace() -> Result<AddressSpace> {
    if (auto lit = ParseLiteral("addrspace"); lit.is_diag()) return lit.diag();
    if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();

    AddressSpace as;
    if (At(Tk::String)) {
        as = AddressSpace::Named(tok.text);
        NextToken();
    } else {
        auto n = ParseUnsigned();
        if (n.is_diag()) return n.diag();
        as = AddressSpace::Numbered(*n);
    }

    if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
    return as;
}

auto Parser::ParseBaseType() -> Result<TypePtr> {
    static const auto FloatKinds = KeywordMap(FloatKind::Half, FloatKind::PPC_FP128);

    if (At(Tk::IntegerType)) {
        auto width = tok.integer_value;
        if (width < 1 or width > IntegerType::MaxBitWidth)
            return Error("Integer bit width must be between 1 and {}, got {}", IntegerType::MaxBitWidth, width);
        NextToken();
        return TypePtr{IntegerType::Get(width)};
    }

    /// Vectors and packed structures.
    if (Consume(Tk::LAngle)) {
        if (Consume(Tk::LBrace)) {
            std::vector<TypePtr> members;
            if (not At(Tk::RBrace)) {
                do {
                    auto m = ParseType();
                    if (m.is_diag()) return m.diag();
                    members.push_back(std::move(*m));
                } while (Consume(Tk::Comma));
            }

            if (auto r = ConsumeOrError(Tk::RBrace); r.is_diag()) return r.diag();
            if (auto r = ConsumeOrError(Tk::RAngle); r.is_diag()) return r.diag();
            return TypePtr{StructType::Get(std::move(members), true)};
        }

        const bool scalable = ConsumeKw("vscale");
        if (scalable) {
            if (auto x = ParseLiteral("x"); x.is_diag()) return x.diag();
        }

        auto length = ParseUnsigned();
        if (length.is_diag()) return length.diag();
        if (*length == 0) return Error("Vector length must be nonzero");
        if (auto x = ParseLiteral("x"); x.is_diag()) return x.diag();
        auto elem = ParseType();
        if (elem.is_diag()) return elem.diag();
        if (auto r = ConsumeOrError(Tk::RAngle); r.is_diag()) return r.diag();
        return TypePtr{VectorType::Get(*length, std::move(*elem), scalable)};
    }

    /// Arrays.
    if (Consume(Tk::LBrack)) {
        auto length = ParseUnsigned();
        if (length.is_diag()) return length.diag();
        if (*length == 0) return Error("Arrays of length zero are not supported");
        if (auto x = ParseLiteral("x"); x.is_diag()) return x.diag();
        auto elem = ParseType();
        if (elem.is_diag()) return elem.diag();
        if (auto r = ConsumeOrError(Tk::RBrack); r.is_diag()) return r.diag();
        return TypePtr{ArrayType::Get(*length, std::move(*elem))};
    }

    /// Structures.
    if (Consume(Tk::LBrace)) {
        std::vector<TypePtr> members;
        if (not At(Tk::RBrace)) {
            do {
                auto m = ParseType();
                if (m.is_diag()) return m.diag();
                members.push_back(std::move(*m));
            } while (Consume(Tk::Comma));
        }

        if (auto r = ConsumeOrError(Tk::RBrace); r.is_diag()) return r.diag();
        return TypePtr{StructType::Get(std::move(members))};
    }

    if (not At(Tk::Keyword)) return Expected("type");

    if (auto fk = Lookup(FloatKinds, tok.text)) {
        NextToken();
        return TypePtr{FloatType::Get(*fk)};
    }

    if (ConsumeKw("void")) return Type::VoidTy;
    if (ConsumeKw("label")) return Type::LabelTy;
    if (ConsumeKw("token")) return Type::TokenTy;
    if (ConsumeKw("metadata")) return Type::MetadataTy;
    if (ConsumeKw("opaque")) return Type::OpaqueTy;
    if (ConsumeKw("x86_amx")) return Type::AMXTy;
    if (ConsumeKw("x86_mmx")) return Type::MMXTy;

    if (ConsumeKw("ptr")) {
        if (not Kw("addrspace")) return TypePtr{PointerType::Get()};
        auto as = ParseAddressSpace();
        if (as.is_diag()) return as.diag();
        return TypePtr{PointerType::Get(std::move(*as))};
    }

    if (ConsumeKw("target")) {
        if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
        if (not At(Tk::String)) return Expected("target extension type name");
        auto name = tok.text;
        NextToken();

        std::vector<TargetExtensionType::Parameter> params;
        while (Consume(Tk::Comma)) {
            if (At(Tk::Integer)) {
                auto n = ParseUnsigned();
                if (n.is_diag()) return n.diag();
                params.emplace_back(*n);
                continue;
            }

            auto t = ParseType();
            if (t.is_diag()) return t.diag();
            params.emplace_back(std::move(*t));
        }

        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
        return TypePtr{TargetExtensionType::Get(std::move(name), std::move(params))};
    }

    return Expected("type");
}

auto Parser::ParseType() -> Result<TypePtr> {
    auto base = ParseBaseType();
    if (base.is_diag()) return base.diag();
    auto ty = std::move(*base);

    /// Function types are written `R (P...)`.
    for (;;) {
        if (At(Tk::Star)) return Unsupported("Typed pointers are not supported; use 'ptr' instead");
        if (not At(Tk::LParen)) return ty;
        if (is<FunctionType>(ty.get())) return Error("Function types cannot return a function type");
        NextToken();

        std::vector<TypePtr> params;
        bool variadic = false;
        while (not At(Tk::RParen)) {
            if (Consume(Tk::Ellipsis)) {
                variadic = true;
                break;
            }

            auto p = ParseType();
            if (p.is_diag()) return p.diag();
            params.push_back(std::move(*p));
            if (not Consume(Tk::Comma)) break;
        }

        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
        ty = FunctionType::Get(std::move(ty), std::move(params), variadic);
    }
}

/// ===========================================================================
///  Values.
/// ===========================================================================
auto Parser::MakeLabel(std::string name, Location loc) -> LabelPtr {
    auto l = std::make_shared<LabelValue>(std::move(name));
    label_fixups.emplace_back(l, loc);
    return l;
}

auto Parser::ParseLabel() -> Result<LabelPtr> {
    if (auto lit = ParseLiteral("label"); lit.is_diag()) return lit.diag();
    if (not At(Tk::LocalIdent)) return Expected("label name");
    auto l = MakeLabel(tok.text, tok.location);
    NextToken();
    return l;
}

auto Parser::ParseAggregateElements(Tk close) -> Result<std::vector<ValuePtr>> {
    std::vector<ValuePtr> elems;
    if (not At(close)) {
        do {
            auto v = ParseValue();
            if (v.is_diag()) return v.diag();
            elems.push_back(std::move(*v));
        } while (Consume(Tk::Comma));
    }

    if (auto r = ConsumeOrError(close); r.is_diag()) return r.diag();
    return elems;
}

auto Parser::ParseConstantExpression() -> Result<ValuePtr> {
    static const auto Predicates = KeywordMap(IntegerComparison::Equal, IntegerComparison::SignedLessOrEqual);
    auto loc = tok.location;
    auto op = tok.text;
    NextToken();

    InstructionPtr inst;
    if (auto kind = BinaryOpcode(op)) {
        auto flags = ParseBinaryFlags(*kind);
        if (flags.is_diag()) return flags.diag();
        if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
        auto lhs = ParseValue();
        if (lhs.is_diag()) return lhs.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto rhs = ParseValue();
        if (rhs.is_diag()) return rhs.diag();
        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();

        auto b = std::make_shared<BinaryInst>(*kind, std::move(*lhs), std::move(*rhs), loc);
        if (BinaryInst::HasWrappingFlags(*kind)) b->set_wrapping(flags->wrapping);
        if (flags->exact) b->set_exact();
        if (flags->disjoint) b->set_disjoint();
        inst = std::move(b);
    }

    else if (auto cast_kind = CastOpcode(op)) {
        AllowedWrapping wrapping{};
        for (;;) {
            if (*cast_kind == K::Truncate and ConsumeKw("nuw")) wrapping.can_wrap_unsigned = false;
            else if (*cast_kind == K::Truncate and ConsumeKw("nsw")) wrapping.can_wrap_signed = false;
            else break;
        }

        if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
        auto val = ParseValue();
        if (val.is_diag()) return val.diag();
        if (auto to = ParseLiteral("to"); to.is_diag()) return to.diag();
        auto ty = ParseType();
        if (ty.is_diag()) return ty.diag();
        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();

        auto c = std::make_shared<CastInst>(*cast_kind, std::move(*val), std::move(*ty), loc);
        if (*cast_kind == K::Truncate) c->set_wrapping(wrapping);
        inst = std::move(c);
    }

    else if (op == "getelementptr") {
        bool inbounds = ConsumeKw("inbounds");
        std::optional<std::pair<i64, i64>> inrange;
        if (ConsumeKw("inrange")) {
            if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
            auto lo = ParseSigned();
            if (lo.is_diag()) return lo.diag();
            if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
            auto hi = ParseSigned();
            if (hi.is_diag()) return hi.diag();
            if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
            inrange = std::pair{*lo, *hi};
        }

        if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
        auto source_type = ParseType();
        if (source_type.is_diag()) return source_type.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto ptr = ParseValue();
        if (ptr.is_diag()) return ptr.diag();

        std::vector<ValuePtr> indices;
        while (Consume(Tk::Comma)) {
            auto idx = ParseValue();
            if (idx.is_diag()) return idx.diag();
            indices.push_back(std::move(*idx));
        }

        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
        auto gep = std::make_shared<GetElementPtrInst>(std::move(*source_type), std::move(*ptr), std::move(indices), loc);
        if (inrange) gep->set_inrange(inrange->first, inrange->second);
        else if (inbounds) gep->set_inbounds();
        inst = std::move(gep);
    }

    else if (op == "icmp") {
        if (not At(Tk::Keyword)) return Expected("comparison predicate");
        auto pred = Lookup(Predicates, tok.text);
        if (not pred) return Expected("comparison predicate");
        NextToken();

        if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
        auto lhs = ParseValue();
        if (lhs.is_diag()) return lhs.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto rhs = ParseValue();
        if (rhs.is_diag()) return rhs.diag();
        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
        inst = std::make_shared<ICmpInst>(*pred, std::move(*lhs), std::move(*rhs), loc);
    }

    else if (op == "select") {
        if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
        auto cond = ParseValue();
        if (cond.is_diag()) return cond.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto a = ParseValue();
        if (a.is_diag()) return a.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto b = ParseValue();
        if (b.is_diag()) return b.diag();
        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
        inst = std::make_shared<SelectInst>(std::move(*cond), std::move(*a), std::move(*b), loc);
    }

    else {
        LIR_UNREACHABLE();
    }

    return InstructionValue::Create(std::move(inst), context);
}

auto Parser::ParseUntypedValue(TypePtr ty) -> Result<ValuePtr> {
    auto loc = tok.location;
    const auto MakeConstant = [&](ConstantPtr c) {
        return ConstantValue::Create(ty, std::move(c), context, loc);
    };

    if (ty->kind == Type::Kind::Metadata and not At(Tk::Metadata))
        return Unsupported("Values wrapped in metadata are not supported");

    switch (tok.kind) {
        case Tk::LocalIdent: {
            auto name = tok.text;
            NextToken();
            if (ty->is_label()) return ValuePtr{MakeLabel(std::move(name), loc)};
            if (in_function) local_fixups.emplace_back(name, loc);
            return ValuePtr{std::make_shared<IdentifierValue>(std::move(ty), std::move(name))};
        }

        case Tk::GlobalIdent: {
            auto name = tok.text;
            NextToken();
            return ValuePtr{std::make_shared<IdentifierValue>(std::move(ty), std::move(name))};
        }

        case Tk::Integer: {
            auto value = i64(tok.integer_value);
            NextToken();
            return MakeConstant(IntegerConstant::Get(value));
        }

        case Tk::Float: {
            auto value = tok.float_value;
            NextToken();
            return MakeConstant(FloatConstant::Get(value));
        }

        case Tk::Metadata: {
            auto node = tok.text;
            NextToken();
            return MakeConstant(MetadataConstant::Get(std::move(node)));
        }

        case Tk::CString: {
            auto text = utils::DecodeEscapes(tok.text);
            NextToken();

            std::vector<ValuePtr> bytes;
            for (char c : text) {
                auto b = ConstantValue::Create(IntegerType::Get(8), IntegerConstant::Get(i64(u8(c))), context, loc);
                if (b.is_diag()) return b.diag();
                bytes.push_back(std::move(*b));
            }

            return MakeConstant(AggregateConstant::Array(std::move(bytes)));
        }

        case Tk::LBrace: {
            NextToken();
            auto elems = ParseAggregateElements(Tk::RBrace);
            if (elems.is_diag()) return elems.diag();
            return MakeConstant(AggregateConstant::Structure(std::move(*elems)));
        }

        case Tk::LBrack: {
            NextToken();
            auto elems = ParseAggregateElements(Tk::RBrack);
            if (elems.is_diag()) return elems.diag();
            return MakeConstant(AggregateConstant::Array(std::move(*elems)));
        }

        case Tk::LAngle: {
            NextToken();

            /// Packed structure.
            if (Consume(Tk::LBrace)) {
                auto elems = ParseAggregateElements(Tk::RBrace);
                if (elems.is_diag()) return elems.diag();
                if (auto r = ConsumeOrError(Tk::RAngle); r.is_diag()) return r.diag();
                auto st = cast<StructType>(ty.get());
                if (not st or not st->packed()) return Diag::TypeMismatch(context, loc, "Packed structure constant is not compatible with type '{}'", *ty);
                return MakeConstant(AggregateConstant::Structure(std::move(*elems)));
            }

            auto elems = ParseAggregateElements(Tk::RAngle);
            if (elems.is_diag()) return elems.diag();
            return MakeConstant(AggregateConstant::Vector(std::move(*elems)));
        }

        case Tk::Keyword: {
            if (ConsumeKw("true")) return MakeConstant(BooleanConstant::Get(true));
            if (ConsumeKw("false")) return MakeConstant(BooleanConstant::Get(false));
            if (ConsumeKw("null")) return MakeConstant(Constant::Null);
            if (ConsumeKw("none")) return MakeConstant(Constant::None);
            if (ConsumeKw("zeroinitializer")) return MakeConstant(Constant::Zero);
            if (ConsumeKw("undef")) return MakeConstant(Constant::Undef);
            if (ConsumeKw("poison")) return MakeConstant(Constant::Poison);

            if (
                BinaryOpcode(tok.text) or
                CastOpcode(tok.text) or
                tok.text == "getelementptr" or
                tok.text == "icmp" or
                tok.text == "select"
            ) {
                auto v = ParseConstantExpression();
                if (v.is_diag()) return v.diag();
                if (not Equal(v.value()->type(), ty)) return Diag::TypeMismatch(
                    context,
                    loc,
                    "Constant expression of type '{}' cannot be used as '{}'",
                    *v.value()->type(),
                    *ty
                );
                return v;
            }

            if (
                Contains(UnsupportedOpcodes, tok.text) or
                tok.text == "blockaddress" or
                tok.text == "dso_local_equivalent" or
                tok.text == "no_cfi"
            ) return Unsupported("'{}' constants are not supported", tok.text);
        } break;

        default: break;
    }

    return Expected("value");
}

auto Parser::ParseValue() -> Result<ValuePtr> {
    auto ty = ParseType();
    if (ty.is_diag()) return ty.diag();
    return ParseUntypedValue(std::move(*ty));
}

/// ===========================================================================
///  Attributes.
/// ===========================================================================
auto Parser::ParseCallingConvention() -> Result<std::optional<std::string>> {
    if (ConsumeKw("cc")) {
        auto n = ParseUnsigned();
        if (n.is_diag()) return n.diag();
        return std::optional<std::string>{fmt::format("cc {}", *n)};
    }

    if (At(Tk::Keyword) and Contains(CallingConventions, tok.text)) {
        auto cc = tok.text;
        NextToken();
        return std::optional<std::string>{std::move(cc)};
    }

    return std::optional<std::string>{};
}

auto Parser::ParseParameterAttributes() -> Result<std::vector<ParameterAttribute>> {
    std::vector<ParameterAttribute> attrs;
    while (At(Tk::Keyword)) {
        auto kind = ParameterAttribute::FromKeyword(tok.text);
        if (not kind) break;
        NextToken();

        ParameterAttribute attr{*kind};
        if (ParameterAttribute::TakesType(*kind)) {
            if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
            auto ty = ParseType();
            if (ty.is_diag()) return ty.diag();
            if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
            attr.type = std::move(*ty);
        }

        /// `align N` and `align(N)` are both valid.
        else if (*kind == ParameterAttribute::Kind::Align) {
            const bool parens = Consume(Tk::LParen);
            auto n = ParseUnsigned();
            if (n.is_diag()) return n.diag();
            if (parens) {
                if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
            }
            attr.integer = *n;
        }

        else if (ParameterAttribute::TakesInteger(*kind)) {
            if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
            auto n = ParseUnsigned();
            if (n.is_diag()) return n.diag();
            if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
            attr.integer = *n;
        }

        attrs.push_back(std::move(attr));
    }

    return attrs;
}

auto Parser::ParseFunctionAttributes() -> Result<std::vector<std::string>> {
    std::vector<std::string> attrs;
    for (;;) {
        auto start = tok.location;

        /// `#0`.
        if (At(Tk::AttrGroup)) {
            attrs.push_back(tok.text);
            NextToken();
            continue;
        }

        /// `"key"` or `"key"="value"`.
        if (Consume(Tk::String)) {
            if (Consume(Tk::Equals)) {
                if (not At(Tk::String)) return Expected("attribute value");
                NextToken();
            }

            attrs.emplace_back(RawText(start));
            continue;
        }

        /// `keyword` or `keyword(...)`.
        if (At(Tk::Keyword) and Contains(FunctionAttributes, tok.text)) {
            NextToken();
            if (Consume(Tk::LParen)) {
                usz depth = 1;
                while (depth != 0) {
                    if (At(Tk::Eof, Tk::Invalid)) return Expected("')'");
                    if (At(Tk::LParen)) depth++;
                    else if (At(Tk::RParen)) depth--;
                    NextToken();
                }
            }

            attrs.emplace_back(RawText(start));
            continue;
        }

        return attrs;
    }
}

auto Parser::ParseMetadataAttachments() -> Result<std::vector<MetadataAttachment>> {
    std::vector<MetadataAttachment> md;
    while (At(Tk::Comma) and LookAhead(1)->kind == Tk::Metadata) {
        NextToken();
        auto name = tok.text.substr(1);
        NextToken();
        if (not At(Tk::Metadata)) return Expected("metadata node");
        md.push_back({std::move(name), tok.text});
        NextToken();
    }
    return md;
}

/// ===========================================================================
///  Instructions.
/// ===========================================================================
auto Parser::BinaryOpcode(std::string_view kw) -> std::optional<K> {
    static const auto Opcodes = KeywordMap(K::Add, K::ExclusiveOr);
    return Lookup(Opcodes, kw);
}

auto Parser::CastOpcode(std::string_view kw) -> std::optional<K> {
    static const auto Opcodes = KeywordMap(K::Truncate, K::AddressSpaceCast);
    return Lookup(Opcodes, kw);
}

auto Parser::ParseBinaryFlags(K kind) -> Result<BinaryFlags> {
    BinaryFlags flags;
    for (;;) {
        auto loc = tok.location;
        if (ConsumeKw("nuw") or ConsumeKw("nsw")) {
            if (not BinaryInst::HasWrappingFlags(kind)) return Error(loc, "'{}' does not take wrapping flags", kind);
            if (source.substr(loc.pos, loc.len) == "nuw") flags.wrapping.can_wrap_unsigned = false;
            else flags.wrapping.can_wrap_signed = false;
        } else if (ConsumeKw("exact")) {
            if (not BinaryInst::HasExactFlag(kind)) return Error(loc, "'{}' does not take 'exact'", kind);
            flags.exact = true;
        } else if (ConsumeKw("disjoint")) {
            if (kind != K::Or) return Error(loc, "Only 'or' takes 'disjoint'");
            flags.disjoint = true;
        } else {
            return flags;
        }
    }
}

auto Parser::ParseOrdering() -> Result<Ordering> {
    static const auto Orderings = KeywordMap(Ordering::Unordered, Ordering::SequentiallyConsistent);
    if (not At(Tk::Keyword)) return Expected("memory ordering");
    auto o = Lookup(Orderings, tok.text);
    if (not o) return Expected("memory ordering");
    NextToken();
    return *o;
}

auto Parser::ParseSyncScope() -> Result<std::optional<std::string>> {
    if (not ConsumeKw("syncscope")) return std::optional<std::string>{};
    if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
    if (not At(Tk::String)) return Expected("synchronisation scope");
    auto scope = tok.text;
    NextToken();
    if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
    return std::optional<std::string>{std::move(scope)};
}

auto Parser::ParseBinary(K kind) -> Result<InstructionPtr> {
    auto loc = tok.location;
    NextToken();
    auto flags = ParseBinaryFlags(kind);
    if (flags.is_diag()) return flags.diag();
    auto lhs = ParseValue();
    if (lhs.is_diag()) return lhs.diag();
    if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
    auto rhs = ParseUntypedValue(lhs.value()->type());
    if (rhs.is_diag()) return rhs.diag();

    auto inst = std::make_shared<BinaryInst>(kind, std::move(*lhs), std::move(*rhs), loc);
    if (BinaryInst::HasWrappingFlags(kind)) inst->set_wrapping(flags->wrapping);
    if (flags->exact) inst->set_exact();
    if (flags->disjoint) inst->set_disjoint();
    return InstructionPtr{std::move(inst)};
}

auto Parser::ParseCast(K kind) -> Result<InstructionPtr> {
    auto loc = tok.location;
    NextToken();

    AllowedWrapping wrapping{};
    for (;;) {
        if (kind == K::Truncate and ConsumeKw("nuw")) wrapping.can_wrap_unsigned = false;
        else if (kind == K::Truncate and ConsumeKw("nsw")) wrapping.can_wrap_signed = false;
        else break;
    }

    auto val = ParseValue();
    if (val.is_diag()) return val.diag();
    if (auto to = ParseLiteral("to"); to.is_diag()) return to.diag();
    auto ty = ParseType();
    if (ty.is_diag()) return ty.diag();

    auto inst = std::make_shared<CastInst>(kind, std::move(*val), std::move(*ty), loc);
    if (kind == K::Truncate) inst->set_wrapping(wrapping);
    return InstructionPtr{std::move(inst)};
}

auto Parser::ParseLoad() -> Result<InstructionPtr> {
    auto loc = tok.location;
    NextToken();
    const bool atomic = ConsumeKw("atomic");
    const bool is_volatile = ConsumeKw("volatile");

    auto ty = ParseType();
    if (ty.is_diag()) return ty.diag();
    if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
    auto ptr = ParseValue();
    if (ptr.is_diag()) return ptr.diag();

    if (atomic) {
        auto scope = ParseSyncScope();
        if (scope.is_diag()) return scope.diag();
        auto ordering = ParseOrdering();
        if (ordering.is_diag()) return ordering.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        if (auto a = ParseLiteral("align"); a.is_diag()) return a.diag();
        auto align = ParseUnsigned();
        if (align.is_diag()) return align.diag();

        auto inst = std::make_shared<AtomicLoadInst>(std::move(*ty), std::move(*ptr), *ordering, *align, loc);
        if (is_volatile) inst->set_volatile();
        if (*scope) inst->set_sync_scope(std::move(**scope));
        return InstructionPtr{std::move(inst)};
    }

    auto inst = std::make_shared<LoadInst>(std::move(*ty), std::move(*ptr), loc);
    if (is_volatile) inst->set_volatile();
    if (At(Tk::Comma) and Is(LookAhead(1), Tk::Keyword) and LookAhead(1)->text == "align") {
        NextToken();
        NextToken();
        auto align = ParseUnsigned();
        if (align.is_diag()) return align.diag();
        inst->set_alignment(*align);
    }

    return InstructionPtr{std::move(inst)};
}

auto Parser::ParseStore() -> Result<InstructionPtr> {
    auto loc = tok.location;
    NextToken();
    const bool atomic = ConsumeKw("atomic");
    const bool is_volatile = ConsumeKw("volatile");

    auto val = ParseValue();
    if (val.is_diag()) return val.diag();
    if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
    auto ptr = ParseValue();
    if (ptr.is_diag()) return ptr.diag();

    if (atomic) {
        auto scope = ParseSyncScope();
        if (scope.is_diag()) return scope.diag();
        auto ordering = ParseOrdering();
        if (ordering.is_diag()) return ordering.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        if (auto a = ParseLiteral("align"); a.is_diag()) return a.diag();
        auto align = ParseUnsigned();
        if (align.is_diag()) return align.diag();

        auto inst = std::make_shared<AtomicStoreInst>(std::move(*val), std::move(*ptr), *ordering, *align, loc);
        if (is_volatile) inst->set_volatile();
        if (*scope) inst->set_sync_scope(std::move(**scope));
        return InstructionPtr{std::move(inst)};
    }

    auto inst = std::make_shared<StoreInst>(std::move(*val), std::move(*ptr), loc);
    if (is_volatile) inst->set_volatile();
    if (At(Tk::Comma) and Is(LookAhead(1), Tk::Keyword) and LookAhead(1)->text == "align") {
        NextToken();
        NextToken();
        auto align = ParseUnsigned();
        if (align.is_diag()) return align.diag();
        inst->set_alignment(*align);
    }

    return InstructionPtr{std::move(inst)};
}

auto Parser::ParseGetElementPtr() -> Result<InstructionPtr> {
    auto loc = tok.location;
    NextToken();

    bool inbounds = ConsumeKw("inbounds");
    std::optional<std::pair<i64, i64>> inrange;
    if (ConsumeKw("inrange")) {
        if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
        auto lo = ParseSigned();
        if (lo.is_diag()) return lo.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto hi = ParseSigned();
        if (hi.is_diag()) return hi.diag();
        if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
        inrange = std::pair{*lo, *hi};
    }

    auto source_type = ParseType();
    if (source_type.is_diag()) return source_type.diag();
    if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
    auto ptr = ParseValue();
    if (ptr.is_diag()) return ptr.diag();

    std::vector<ValuePtr> indices;
    while (At(Tk::Comma) and not Is(LookAhead(1), Tk::Metadata)) {
        NextToken();
        auto idx = ParseValue();
        if (idx.is_diag()) return idx.diag();
        indices.push_back(std::move(*idx));
    }

    auto inst = std::make_shared<GetElementPtrInst>(std::move(*source_type), std::move(*ptr), std::move(indices), loc);
    if (inrange) inst->set_inrange(inrange->first, inrange->second);
    else if (inbounds) inst->set_inbounds();
    return InstructionPtr{std::move(inst)};
}

auto Parser::ParseCallSite() -> Result<CallSite> {
    CallSite site;
    if (At(Tk::Keyword) and Contains(FastMathFlags, tok.text))
        return Unsupported("Fast-math flags are not supported");

    auto cc = ParseCallingConvention();
    if (cc.is_diag()) return cc.diag();
    site.calling_convention = std::move(*cc);

    auto ret_attrs = ParseParameterAttributes();
    if (ret_attrs.is_diag()) return ret_attrs.diag();
    site.return_attributes = std::move(*ret_attrs);

    if (Kw("addrspace")) {
        auto as = ParseAddressSpace();
        if (as.is_diag()) return as.diag();
        site.address_space = std::move(*as);
    }

    /// Either the return type or the whole function type.
    auto ty = ParseType();
    if (ty.is_diag()) return ty.diag();

    auto callee = ParseUntypedValue(PointerType::Get(site.address_space.value_or(AddressSpace{})));
    if (callee.is_diag()) return callee.diag();
    site.callee = std::move(*callee);

    if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
    std::vector<TypePtr> arg_types;
    while (not At(Tk::RParen)) {
        auto arg_ty = ParseType();
        if (arg_ty.is_diag()) return arg_ty.diag();
        auto attrs = ParseParameterAttributes();
        if (attrs.is_diag()) return attrs.diag();
        auto val = ParseUntypedValue(*arg_ty);
        if (val.is_diag()) return val.diag();

        arg_types.push_back(std::move(*arg_ty));
        site.arguments.push_back({std::move(*val), std::move(*attrs)});
        if (not Consume(Tk::Comma)) break;
    }

    if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
    if (At(Tk::LBrack)) return Unsupported("Operand bundles are not supported");

    auto fn_attrs = ParseFunctionAttributes();
    if (fn_attrs.is_diag()) return fn_attrs.diag();
    site.function_attributes = std::move(*fn_attrs);

    if (auto fty = cast<FunctionType>(*ty)) site.function_type = std::move(fty);
    else site.function_type = FunctionType::Get(std::move(*ty), std::move(arg_types));
    return site;
}

auto Parser::ParseCall() -> Result<InstructionPtr> {
    auto loc = tok.location;
    auto hint = TailCallHint::Indifferent;
    if (ConsumeKw("tail")) hint = TailCallHint::ShouldTail;
    else if (ConsumeKw("musttail")) hint = TailCallHint::MustTail;
    else if (ConsumeKw("notail")) hint = TailCallHint::NeverTail;
    if (auto c = ParseLiteral("call"); c.is_diag()) return c.diag();

    auto site = ParseCallSite();
    if (site.is_diag()) return site.diag();
    auto inst = std::make_shared<CallInst>(std::move(*site), loc);
    inst->set_tail_call_hint(hint);
    return InstructionPtr{std::move(inst)};
}

auto Parser::ParseInstruction() -> Result<InstructionPtr> {
    static const auto Predicates = KeywordMap(IntegerComparison::Equal, IntegerComparison::SignedLessOrEqual);
    if (not At(Tk::Keyword)) return Expected("instruction");
    if (Contains(UnsupportedOpcodes, tok.text)) return Unsupported("'{}' instructions are not supported", tok.text);

    auto loc = tok.location;
    auto inst = [&]() -> Result<InstructionPtr> {
        if (auto kind = BinaryOpcode(tok.text)) return ParseBinary(*kind);
        if (auto kind = CastOpcode(tok.text)) return ParseCast(*kind);
        if (Kw("load")) return ParseLoad();
        if (Kw("store")) return ParseStore();
        if (Kw("getelementptr")) return ParseGetElementPtr();
        if (Kw("call") or Kw("tail") or Kw("musttail") or Kw("notail")) return ParseCall();

        if (ConsumeKw("extractvalue")) {
            auto agg = ParseValue();
            if (agg.is_diag()) return agg.diag();

            std::vector<u64> indices;
            do {
                if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
                auto idx = ParseUnsigned();
                if (idx.is_diag()) return idx.diag();
                indices.push_back(*idx);
            } while (At(Tk::Comma) and Is(LookAhead(1), Tk::Integer));

            return InstructionPtr{std::make_shared<ExtractValueInst>(std::move(*agg), std::move(indices), loc)};
        }

        if (ConsumeKw("insertvalue")) {
            auto agg = ParseValue();
            if (agg.is_diag()) return agg.diag();
            if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
            auto elem = ParseValue();
            if (elem.is_diag()) return elem.diag();

            std::vector<u64> indices;
            do {
                if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
                auto idx = ParseUnsigned();
                if (idx.is_diag()) return idx.diag();
                indices.push_back(*idx);
            } while (At(Tk::Comma) and Is(LookAhead(1), Tk::Integer));

            return InstructionPtr{std::make_shared<InsertValueInst>(std::move(*agg), std::move(*elem), std::move(indices), loc)};
        }

        if (ConsumeKw("alloca")) {
            const bool inalloca = ConsumeKw("inalloca");
            auto ty = ParseType();
            if (ty.is_diag()) return ty.diag();

            auto alloca = std::make_shared<AllocaInst>(std::move(*ty), loc);
            if (inalloca) alloca->set_can_reuse();

            /// `, T n`, `, align A` and `, addrspace(N)`, in that order.
            if (At(Tk::Comma) and not Is(LookAhead(1), Tk::Metadata, Tk::Keyword)) {
                NextToken();
                auto count = ParseValue();
                if (count.is_diag()) return count.diag();
                alloca->set_count(std::move(*count));
            }

            if (At(Tk::Comma) and Is(LookAhead(1), Tk::Keyword) and LookAhead(1)->text == "align") {
                NextToken();
                NextToken();
                auto align = ParseUnsigned();
                if (align.is_diag()) return align.diag();
                alloca->set_alignment(*align);
            }

            if (At(Tk::Comma) and Is(LookAhead(1), Tk::Keyword) and LookAhead(1)->text == "addrspace") {
                NextToken();
                auto as = ParseAddressSpace();
                if (as.is_diag()) return as.diag();
                alloca->set_address_space(std::move(*as));
            }

            return InstructionPtr{std::move(alloca)};
        }

        if (ConsumeKw("fence")) {
            auto scope = ParseSyncScope();
            if (scope.is_diag()) return scope.diag();
            auto ordering = ParseOrdering();
            if (ordering.is_diag()) return ordering.diag();
            auto fence = std::make_shared<FenceInst>(*ordering, loc);
            if (*scope) fence->set_sync_scope(std::move(**scope));
            return InstructionPtr{std::move(fence)};
        }

        if (ConsumeKw("icmp")) {
            if (not At(Tk::Keyword)) return Expected("comparison predicate");
            auto pred = Lookup(Predicates, tok.text);
            if (not pred) return Expected("comparison predicate");
            NextToken();

            auto lhs = ParseValue();
            if (lhs.is_diag()) return lhs.diag();
            if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
            auto rhs = ParseUntypedValue(lhs.value()->type());
            if (rhs.is_diag()) return rhs.diag();
            return InstructionPtr{std::make_shared<ICmpInst>(*pred, std::move(*lhs), std::move(*rhs), loc)};
        }

        if (ConsumeKw("select")) {
            auto cond = ParseValue();
            if (cond.is_diag()) return cond.diag();
            if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
            auto a = ParseValue();
            if (a.is_diag()) return a.diag();
            if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
            auto b = ParseValue();
            if (b.is_diag()) return b.diag();
            return InstructionPtr{std::make_shared<SelectInst>(std::move(*cond), std::move(*a), std::move(*b), loc)};
        }

        if (ConsumeKw("freeze")) {
            auto val = ParseValue();
            if (val.is_diag()) return val.diag();
            return InstructionPtr{std::make_shared<FreezeInst>(std::move(*val), loc)};
        }

        return Expected("instruction");
    }();

    /// Make sure the instruction has a well-formed type.
    if (inst.is_diag()) return inst.diag();
    if (auto ty = inst.value()->result_type(context); ty.is_diag()) return ty.diag();
    return inst;
}

auto Parser::ParseTerminator() -> Result<TerminatorPtr> {
    auto loc = tok.location;
    if (Contains(UnsupportedTerminators, tok.text))
        return Unsupported("Parsing '{}' is not supported", tok.text);

    if (ConsumeKw("ret")) {
        if (ConsumeKw("void")) return TerminatorPtr{std::make_shared<ReturnInst>(ConstantValue::Void(), loc)};
        auto val = ParseValue();
        if (val.is_diag()) return val.diag();
        return TerminatorPtr{std::make_shared<ReturnInst>(std::move(*val), loc)};
    }

    if (ConsumeKw("br")) {
        if (Kw("label")) {
            auto dest = ParseLabel();
            if (dest.is_diag()) return dest.diag();
            return TerminatorPtr{std::make_shared<BranchInst>(std::move(*dest), loc)};
        }

        auto cond = ParseValue();
        if (cond.is_diag()) return cond.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto then = ParseLabel();
        if (then.is_diag()) return then.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto els = ParseLabel();
        if (els.is_diag()) return els.diag();
        return TerminatorPtr{std::make_shared<CondBranchInst>(std::move(*cond), std::move(*then), std::move(*els), loc)};
    }

    if (ConsumeKw("switch")) {
        auto val = ParseValue();
        if (val.is_diag()) return val.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        auto def = ParseLabel();
        if (def.is_diag()) return def.diag();
        if (auto l = ConsumeOrError(Tk::LBrack); l.is_diag()) return l.diag();

        std::vector<SwitchInst::Case> cases;
        while (not At(Tk::RBrack)) {
            auto c = ParseValue();
            if (c.is_diag()) return c.diag();
            if (auto com = ConsumeOrError(Tk::Comma); com.is_diag()) return com.diag();
            auto dest = ParseLabel();
            if (dest.is_diag()) return dest.diag();
            cases.push_back({std::move(*c), std::move(*dest)});
        }

        NextToken();
        return TerminatorPtr{std::make_shared<SwitchInst>(std::move(*val), std::move(*def), std::move(cases), loc)};
    }

    if (ConsumeKw("indirectbr")) {
        auto addr = ParseValue();
        if (addr.is_diag()) return addr.diag();
        if (auto c = ConsumeOrError(Tk::Comma); c.is_diag()) return c.diag();
        if (auto l = ConsumeOrError(Tk::LBrack); l.is_diag()) return l.diag();

        std::vector<LabelPtr> dests;
        if (not At(Tk::RBrack)) {
            do {
                auto dest = ParseLabel();
                if (dest.is_diag()) return dest.diag();
                dests.push_back(std::move(*dest));
            } while (Consume(Tk::Comma));
        }

        if (auto r = ConsumeOrError(Tk::RBrack); r.is_diag()) return r.diag();
        return TerminatorPtr{std::make_shared<IndirectBranchInst>(std::move(*addr), std::move(dests), loc)};
    }

    if (ConsumeKw("unreachable")) return TerminatorPtr{std::make_shared<UnreachableInst>(loc)};
    return Expected("terminator");
}

/// ===========================================================================
///  Blocks and functions.
/// ===========================================================================
auto Parser::AddLocal(std::string name, Location loc) -> Result<void> {
    if (not in_function) return {};
    if (locals.contains(name)) return Error(loc, "Duplicate definition of '{}'", name);

    /// Numbered values and blocks are counted in order.
    auto number = std::string_view{name}.substr(1);
    if (rgs::all_of(number, [](char c) { return IsDigit(u32(c)); }))
        next_number = std::strtoull(std::string{number}.c_str(), nullptr, 10) + 1;

    locals.emplace(std::move(name), loc);
    return {};
}

auto Parser::ParseBlock(std::optional<std::string> name) -> Result<std::unique_ptr<BasicBlock>> {
    std::vector<Operation> operations;
    for (;;) {
        /// `%x = <instruction>`.
        if (At(Tk::LocalIdent)) {
            auto id = tok.text;
            auto loc = tok.location;
            NextToken();
            if (auto eq = ConsumeOrError(Tk::Equals); eq.is_diag()) return eq.diag();
            if (At(Tk::Keyword) and Contains(UnsupportedTerminators, tok.text))
                return Unsupported("Parsing '{}' is not supported", tok.text);

            auto inst = ParseInstruction();
            if (inst.is_diag()) return inst.diag();
            if (inst.value()->result_type(context).value()->is_void())
                return Error(loc, "Cannot assign '{}' because '{}' does not produce a value", id, inst.value()->kind);
            if (auto added = AddLocal(id, loc); added.is_diag()) return added.diag();

            auto md = ParseMetadataAttachments();
            if (md.is_diag()) return md.diag();
            operations.emplace_back(std::move(id), std::move(*inst), std::move(*md));
            continue;
        }

        if (not At(Tk::Keyword)) return Expected("instruction or terminator");

        /// The terminator ends the block.
        if (Contains(Terminators, tok.text) or Contains(UnsupportedTerminators, tok.text)) {
            auto term = ParseTerminator();
            if (term.is_diag()) return term.diag();
            auto md = ParseMetadataAttachments();
            if (md.is_diag()) return md.diag();
            return std::make_unique<BasicBlock>(
                std::move(name),
                std::move(operations),
                std::move(*term),
                std::move(*md)
            );
        }

        auto loc = tok.location;
        auto inst = ParseInstruction();
        if (inst.is_diag()) return inst.diag();

        /// An unassigned value still takes up a number.
        if (not inst.value()->result_type(context).value()->is_void()) {
            if (auto added = AddLocal(fmt::format("%{}", next_number), loc); added.is_diag())
                return added.diag();
        }

        auto md = ParseMetadataAttachments();
        if (md.is_diag()) return md.diag();
        operations.emplace_back(std::move(*inst), std::move(*md));
    }
}

auto Parser::ResolveFixups() -> Result<void> {
    for (auto& [name, loc] : local_fixups)
        if (not locals.contains(name))
            return Error(loc, "Unknown value '{}'", name);
    return {};
}

auto Parser::ParseFunction() -> Result<std::unique_ptr<Function>> {
    static const auto Linkages = KeywordMap(Linkage::Private, Linkage::External);
    static const auto Visibilities = KeywordMap(Visibility::Default, Visibility::Protected);

    bool definition = false;
    if (ConsumeKw("define")) definition = true;
    else if (not ConsumeKw("declare")) return Expected("'define' or 'declare'");

    /// Header up to the return type.
    auto linkage = Linkage::External;
    auto preemption = Preemption::Preemptable;
    auto visibility = Visibility::Default;
    auto dll_storage = DLLStorage::None;
    if (At(Tk::Keyword)) {
        if (auto l = Lookup(Linkages, tok.text)) {
            linkage = *l;
            NextToken();
        }
    }

    if (ConsumeKw("dso_local")) preemption = Preemption::Local;
    else (void) ConsumeKw("dso_preemptable");

    if (At(Tk::Keyword)) {
        if (auto v = Lookup(Visibilities, tok.text)) {
            visibility = *v;
            NextToken();
        }
    }

    if (ConsumeKw("dllimport")) dll_storage = DLLStorage::Import;
    else if (ConsumeKw("dllexport")) dll_storage = DLLStorage::Export;

    auto cc = ParseCallingConvention();
    if (cc.is_diag()) return cc.diag();
    auto ret_attrs = ParseParameterAttributes();
    if (ret_attrs.is_diag()) return ret_attrs.diag();
    auto ret = ParseType();
    if (ret.is_diag()) return ret.diag();

    if (not At(Tk::GlobalIdent)) return Expected("function name");
    auto f = std::make_unique<Function>(std::move(*ret), tok.text);
    NextToken();

    f->linkage = linkage;
    f->preemption = preemption;
    f->visibility = visibility;
    f->dll_storage = dll_storage;
    f->calling_convention = std::move(*cc);
    f->return_attributes = std::move(*ret_attrs);

    /// Parameters.
    in_function = definition;
    if (auto l = ConsumeOrError(Tk::LParen); l.is_diag()) return l.diag();
    while (not At(Tk::RParen)) {
        if (Consume(Tk::Ellipsis)) {
            f->variadic = true;
            break;
        }

        auto ty = ParseType();
        if (ty.is_diag()) return ty.diag();
        auto attrs = ParseParameterAttributes();
        if (attrs.is_diag()) return attrs.diag();

        Function::Parameter param{std::move(*ty), std::move(*attrs)};
        if (At(Tk::LocalIdent)) {
            param.name = tok.text;
            if (auto added = AddLocal(tok.text, tok.location); added.is_diag()) return added.diag();
            NextToken();
        } else if (auto added = AddLocal(fmt::format("%{}", next_number), previous); added.is_diag()) {
            return added.diag();
        }

        f->parameters.push_back(std::move(param));
        if (not Consume(Tk::Comma)) break;
    }

    if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();

    /// Header after the parameters.
    if (ConsumeKw("unnamed_addr")) f->unnamed_addr = UnnamedAddr::Global;
    else if (ConsumeKw("local_unnamed_addr")) f->unnamed_addr = UnnamedAddr::Local;

    if (Kw("addrspace")) {
        auto as = ParseAddressSpace();
        if (as.is_diag()) return as.diag();
        f->address_space = std::move(*as);
    }

    auto attrs = ParseFunctionAttributes();
    if (attrs.is_diag()) return attrs.diag();
    f->attributes = std::move(*attrs);

    if (ConsumeKw("section")) {
        if (not At(Tk::String)) return Expected("section name");
        f->section = tok.text;
        NextToken();
    }

    if (ConsumeKw("partition")) {
        if (not At(Tk::String)) return Expected("partition name");
        f->partition = tok.text;
        NextToken();
    }

    if (ConsumeKw("comdat")) {
        f->comdat = "";
        if (Consume(Tk::LParen)) {
            if (not At(Tk::Keyword) or not tok.text.starts_with('$')) return Expected("comdat name");
            f->comdat = tok.text;
            NextToken();
            if (auto r = ConsumeOrError(Tk::RParen); r.is_diag()) return r.diag();
        }
    }

    if (ConsumeKw("align")) {
        auto align = ParseUnsigned();
        if (align.is_diag()) return align.diag();
        f->alignment = *align;
    }

    if (ConsumeKw("gc")) {
        if (not At(Tk::String)) return Expected("garbage collector name");
        f->gc = tok.text;
        NextToken();
    }

    if (ConsumeKw("prefix")) {
        auto v = ParseValue();
        if (v.is_diag()) return v.diag();
        f->prefix = std::move(*v);
    }

    if (ConsumeKw("prologue")) {
        auto v = ParseValue();
        if (v.is_diag()) return v.diag();
        f->prologue = std::move(*v);
    }

    if (ConsumeKw("personality")) {
        auto v = ParseValue();
        if (v.is_diag()) return v.diag();
        f->personality = std::move(*v);
    }

    while (At(Tk::Metadata)) {
        auto name = tok.text.substr(1);
        NextToken();
        if (not At(Tk::Metadata)) return Expected("metadata node");
        f->metadata.push_back({std::move(name), tok.text});
        NextToken();
    }

    if (not definition) return f;

    /// Body.
    if (auto l = ConsumeOrError(Tk::LBrace); l.is_diag()) return l.diag();
    while (not At(Tk::RBrace)) {
        std::optional<std::string> name;
        if (At(Tk::Label)) {
            name = tok.text;
            if (auto added = AddLocal("%" + tok.text, tok.location); added.is_diag()) return added.diag();
            NextToken();
        } else {
            /// Unnamed blocks are numbered. Only the entry block is
            /// printed without a label.
            auto number = next_number;
            if (auto added = AddLocal(fmt::format("%{}", number), tok.location); added.is_diag()) return added.diag();
            if (not f->blocks.empty()) name = std::to_string(number);
        }

        auto b = ParseBlock(std::move(name));
        if (b.is_diag()) return b.diag();
        f->blocks.push_back(std::move(*b));
    }

    if (f->blocks.empty()) return Expected("basic block");
    NextToken();

    /// Fix up labels.
    for (auto& [label, loc] : label_fixups) {
        auto b = f->find_block(std::string_view{label->name()}.substr(1));
        if (not b) return Error(loc, "Unknown block '{}'", label->name());
        label->_block = b;
    }

    /// Fix up values.
    if (auto res = ResolveFixups(); res.is_diag()) return res.diag();
    return f;
}

auto Parser::ParseTypeInput() -> Result<TypePtr> {
    auto ty = ParseType();
    if (ty.is_diag()) return ty.diag();
    if (not At(Tk::Eof)) return Expected("end of input");
    return ty;
}

auto Parser::ParseBlockInput() -> Result<std::unique_ptr<BasicBlock>> {
    std::optional<std::string> name;
    if (At(Tk::Label)) {
        name = tok.text;
        NextToken();
    }

    auto b = ParseBlock(std::move(name));
    if (b.is_diag()) return b.diag();
    if (not At(Tk::Eof)) return Expected("end of input");
    return b;
}

auto Parser::ParseFunctionInput() -> Result<std::unique_ptr<Function>> {
    auto f = ParseFunction();
    if (f.is_diag()) return f.diag();
    if (not At(Tk::Eof)) return Expected("end of input");
    return f;
}
} // namespace lir::parser

auto lir::Type::Parse(Context* ctx, File& file) -> Result<TypePtr> {
    parser::Parser p{ctx, &file};
    return p.ParseTypeInput();
}

auto lir::Type::Parse(Context* ctx, std::string_view text) -> Result<TypePtr> {
    LIR_ASSERT(ctx, "Parsing requires a context");
    return Parse(ctx, ctx->create_file("<type>", text));
}

auto lir::BasicBlock::Parse(Context* ctx, File& file) -> Result<std::unique_ptr<BasicBlock>> {
    parser::Parser p{ctx, &file};
    return p.ParseBlockInput();
}

auto lir::BasicBlock::Parse(Context* ctx, std::string_view text) -> Result<std::unique_ptr<BasicBlock>> {
    LIR_ASSERT(ctx, "Parsing requires a context");
    return Parse(ctx, ctx->create_file("<block>", text));
}

auto lir::Function::Parse(Context* ctx, File& file) -> Result<std::unique_ptr<Function>> {
    parser::Parser p{ctx, &file};
    return p.ParseFunctionInput();
}

auto lir::Function::Parse(Context* ctx, std::string_view text) -> Result<std::unique_ptr<Function>> {
    LIR_ASSERT(ctx, "Parsing requires a context");
    return Parse(ctx, ctx->create_file("<function>", text));
}
