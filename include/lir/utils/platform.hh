#ifndef LIR_PLATFORM_HH
#define LIR_PLATFORM_HH

/// Operating system services used by diagnostics. System
/// headers stay in platform.cc.

namespace lir::platform {
/// Print a stack trace of the calling thread to stderr,
/// resolving symbols with addr2line where it is available.
void PrintBacktrace();

/// Whether diagnostics are going to a terminal, in which
/// case they default to colour.
bool StderrIsTerminal();
} // namespace lir::platform

#endif // LIR_PLATFORM_HH
