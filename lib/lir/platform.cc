#include <lir/utils.hh>
#include <lir/utils/platform.hh>

#include <cstdio>
#include <cstdlib>
#include <span>
#include <string_view>

#ifdef _WIN32
#    define NOMINMAX
#    include <io.h>
#    include <Windows.h>
#    define isatty _isatty
#else
#    include <unistd.h>
#endif

#ifdef __linux__
#    include <execinfo.h>
#endif

// -p  pretty print
// -C  do demangling
// -f  function name
static constexpr std::string_view backtrace_addr2line_options = "-p -C -f";

void lir::platform::PrintBacktrace() {
#ifdef __linux__
    static constexpr usz size = 128;
    static void* trace[size]{};
    int n = backtrace(trace, size);

    // Skip PrintBacktrace() entry
    int skip_value = 1;
    if (n <= skip_value) return;

    // The program counter points one past the executing instruction.
    for (int i = skip_value; i < n; ++i) trace[i] = (void*) ((std::uintptr_t) trace[i] - 1);

    std::span<void*> trace_view{&trace[skip_value], &trace[n]};
    std::string command = fmt::format(
        "addr2line {} -e {} {}",
        backtrace_addr2line_options,
        fs::canonical("/proc/self/exe").native(),
        fmt::join(trace_view, " ")
    );

    std::fflush(stderr);
    if (std::system(command.data()) != 0) {
        for (int i = skip_value; i < n; ++i)
            fmt::print(stderr, "{}: {}\n", i - skip_value, trace[i]);
    }
#endif
}

bool lir::platform::StderrIsTerminal() {
    return isatty(fileno(stderr));
}
