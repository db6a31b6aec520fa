#include <fmt/format.h>

#include <lir/context.hh>
#include <lir/diags.hh>
#include <lir/file.hh>
#include <lir/ir/function.hh>
#include <lir/ir/ir.hh>
#include <lir/ir/type.hh>
#include <lir/utils.hh>

#include <filesystem>
#include <iterator>

static lir::utils::Colours C{true};

struct TestNameAndResult {
    std::string_view name{};
    bool passed{true};
};

struct TestContext {
    lir::Context& context;
    std::vector<TestNameAndResult> results{};

    bool option_per_directory_count{true};
};

/// What the input of a test is parsed as.
enum struct TestKind {
    Type,
    Block,
    Function,
};

struct IRTest {
    std::string_view name;
    std::string_view input;
    std::string_view expected;
    TestKind kind{TestKind::Function};

    /// If set, the input must be rejected with this kind of error,
    /// and the expected section is a part of the error message.
    std::optional<lir::ErrorKind> failure{};
};

auto collect_tests_from_file(
    TestContext& out,
    std::filesystem::path test_file
) -> std::vector<IRTest> {
    std::vector<IRTest> tests{};

    auto& f = out.context.get_or_load_file(test_file);
    auto contents = f.data();
    unsigned int offset = 0;
    lir::Location location{};
    while (offset < f.size()) {
        location.pos = offset;
        location.len = 1;
        switch (contents[offset]) {
            default: {
                lir::Diag::Error(
                    &out.context,
                    location,
                    "Invalid input in IR test"
                );
                return {};
            }

            /// Blank lines between tests.
            case '\n': ++offset; break;

            case '=': {
                IRTest test{};

                // Until newline
                while (offset < f.size() and contents[++offset] != '\n');
                // Skip newline
                ++offset;

                // Test name begins here
                auto test_name_begin = offset;

                // Until newline
                while (offset < f.size() and contents[++offset] != '\n');
                auto test_name_end = offset;

                test.name = {
                    contents + test_name_begin,
                    contents + test_name_end
                };

                if (test.name.empty()) {
                    location.pos = offset;
                    lir::Diag::Error(
                        &out.context,
                        location,
                        "Expected test to be given a name"
                    );
                    return {};
                }

                // Skip newline
                ++offset;

                // Specifiers
                // `:<specifier>` following name line before name closing line of '='
                while (offset < f.size() and contents[offset] == ':') {
                    // Eat `:`
                    ++offset;
                    auto specifier_begin = offset;
                    location.pos = specifier_begin;
                    // Until newline
                    while (offset < f.size() and contents[++offset] != '\n');
                    auto specifier_end = offset;
                    // Skip newline
                    ++offset;
                    std::string_view specifier{
                        contents + specifier_begin,
                        contents + specifier_end
                    };

                    if (specifier == "type") test.kind = TestKind::Type;
                    else if (specifier == "block") test.kind = TestKind::Block;
                    else if (specifier == "function") test.kind = TestKind::Function;
                    else if (specifier == "fail syntax") test.failure = lir::ErrorKind::SyntaxError;
                    else if (specifier == "fail type") test.failure = lir::ErrorKind::TypeMismatch;
                    else if (specifier == "fail unsupported") test.failure = lir::ErrorKind::Unsupported;
                    else {
                        lir::Diag::Error(
                            &out.context,
                            location,
                            "Unrecognized test specifier: `{}`",
                            specifier
                        );
                        return {};
                    }
                }

                if (offset >= f.size() or contents[offset] != '=') {
                    location.pos = offset;
                    lir::Diag::Error(
                        &out.context,
                        location,
                        "Expected line of '=' to close test name of test {}",
                        test.name
                    );
                    return {};
                }

                // Until newline
                while (offset < f.size() and contents[++offset] != '\n');
                // Skip newline
                ++offset;

                auto test_ir_input_begin = offset;

                // until EOF or line that starts with `-`...
                {
                    bool at_bol{true};
                    while (offset < f.size()) {
                        if (at_bol and contents[offset] == '-')
                            break;

                        at_bol = contents[offset] == '\n';

                        ++offset;
                    }
                }
                auto test_ir_input_end = offset;

                test.input = {
                    contents + test_ir_input_begin,
                    contents + test_ir_input_end
                };

                if (offset >= f.size() or contents[offset] != '-') {
                    location.pos = offset;
                    lir::Diag::Error(
                        &out.context,
                        location,
                        "Expected beginning of matcher (line of `-`) following test input of test {}",
                        test.name
                    );
                    return {};
                }

                // Until newline
                while (offset < f.size() and contents[++offset] != '\n');
                // Skip newline
                ++offset;

                // until EOF or line that starts with `=` (another test)
                auto test_ir_expected_begin = offset;
                {
                    bool at_bol{true};
                    while (offset < f.size()) {
                        if (at_bol and contents[offset] == '=')
                            break;

                        at_bol = contents[offset] == '\n';

                        ++offset;
                    }
                }
                auto test_ir_expected_end = std::min<lir::usz>(offset, f.size());

                test.expected = {
                    contents + test_ir_expected_begin,
                    contents + test_ir_expected_end
                };

                tests.emplace_back(test);
            } break;
        }
    }

    return tests;
}

/// Parse the input of a test and print it back, or return the
/// diagnostic the parser issued.
auto parse_and_print(lir::Context& context, TestKind kind, lir::File& file) -> lir::Result<std::string> {
    switch (kind) {
        case TestKind::Type: {
            auto ty = lir::Type::Parse(&context, file);
            if (ty.is_diag()) return ty.diag();
            return ty.value()->string();
        }

        case TestKind::Block: {
            auto b = lir::BasicBlock::Parse(&context, file);
            if (b.is_diag()) return b.diag();
            return b.value()->string();
        }

        case TestKind::Function: {
            auto f = lir::Function::Parse(&context, file);
            if (f.is_diag()) return f.diag();
            return f.value()->string();
        }
    }

    LIR_UNREACHABLE();
}

/// Check that a test produces what it is expected to produce.
bool run_test(lir::Context& context, const IRTest& t) {
    auto& got_f = context.create_file(fmt::format("got.{}", t.name), t.input);
    auto got = parse_and_print(context, t.kind, got_f);
    auto expected = lir::utils::Trim(t.expected);

    if (t.failure) {
        if (not got.is_diag()) {
            fmt::print("  Test `{}` was expected to fail, but printed:\n{}\n", t.name, *got);
            return false;
        }

        /// The failure is what we want; don't print it.
        auto d = std::move(got.diag());
        const bool passed = d.category() == *t.failure and d.message().find(expected) != std::string::npos;
        if (not passed) {
            fmt::print(
                "  Test `{}`: GOT {} '{}', EXPECTED {} containing '{}'\n",
                t.name,
                d.category(),
                d.message(),
                *t.failure,
                expected
            );
        }

        d.suppress();
        return passed;
    }

    if (got.is_diag()) return false;
    if (lir::utils::Trim(*got) != expected) {
        fmt::print("  Test `{}`:\nGOT:\n{}\nEXPECTED:\n{}\n", t.name, lir::utils::Trim(*got), expected);
        return false;
    }

    /// Printed IR must parse to the same thing again.
    auto& again_f = context.create_file(fmt::format("again.{}", t.name), std::string_view{*got});
    auto again = parse_and_print(context, t.kind, again_f);
    if (again.is_diag()) return false;
    if (*again != *got) {
        fmt::print("  Test `{}` does not round-trip:\n{}\n", t.name, *again);
        return false;
    }

    return true;
}

[[nodiscard]]
auto print_test_passedfailed(const TestNameAndResult& result) -> std::string {
    return fmt::format(
        "  {} {}: {}\n",
        fmt::format(
            "{}{}{}",
            result.passed ? C(lir::utils::Colour::BoldGreen) : C(lir::utils::Colour::BoldRed),
            result.passed ? 'O' : 'X',
            C(lir::utils::Colour::Reset)
        ),
        result.name,
        result.passed ? "PASSED" : "FAILED"
    );
}

[[nodiscard]]
auto print_passedfailed(const std::vector<TestNameAndResult>& results) -> std::string {
    std::string out{};

    unsigned int count_passed{};
    unsigned int count_failed{};
    for (auto result : results) {
        if (result.passed)
            ++count_passed;
        else ++count_failed;
    }
    fmt::format_to(
        std::back_inserter(out),
        "  {}PASSED:  {}/{}{}\n",
        C(lir::utils::Colour::Green),
        count_passed,
        results.size(),
        C(lir::utils::Colour::Reset)
    );
    if (count_failed) {
        fmt::format_to(
            std::back_inserter(out),
            "  {}FAILED:  {}{}\n",
            C(lir::utils::Colour::Red),
            count_failed,
            C(lir::utils::Colour::Reset)
        );
    }

    return out;
}

void visit_directory(
    TestContext& out,
    std::filesystem::path directory_path
) {
    for (const auto& entry : std::filesystem::directory_iterator(directory_path)) {
        if (entry.is_directory())
            visit_directory(out, entry.path());
        if (not entry.is_regular_file() or entry.path().extension() != ".ll")
            continue;

        if (out.option_per_directory_count)
            fmt::print("{}:\n", entry.path().lexically_normal().string());

        auto tests = collect_tests_from_file(out, entry.path());
        if (tests.empty()) out.results.emplace_back("<malformed test file>", false);

        std::vector<TestNameAndResult> results{};
        for (const auto& t : tests) {
            results.emplace_back(t.name, run_test(out.context, t));
            if (out.option_per_directory_count)
                fmt::print("{}", print_test_passedfailed(results.back()));
        }

        if (out.option_per_directory_count)
            fmt::print("{}", print_passedfailed(results));

        out.results.insert(out.results.end(), results.begin(), results.end());
    }
}

int main(int argc, char** argv) {
    lir::Context context{
        lir::Context::Options{
            lir::Context::DoNotUseColour,
            lir::Context::DoNotDiagBacktrace,
        }
    };

    TestContext test_context{context};
    visit_directory(test_context, argc > 1 ? argv[1] : "corpus");

    fmt::print(
        "\nFINAL REPORT:\n{}",
        print_passedfailed(test_context.results)
    );

    bool failed = false;
    for (auto result : test_context.results) {
        if (result.passed)
            continue;
        failed = true;
        fmt::print("{}", print_test_passedfailed(result));
    }

    return failed ? 1 : 0;
}
