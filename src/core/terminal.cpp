#include <homelib/core/terminal.hpp>

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace homelib {

namespace {

bool IsTerminal(std::FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

} // anonymous namespace

bool IsStderrTty() { return IsTerminal(stderr); }

bool IsStdoutTty() { return IsTerminal(stdout); }

bool NoColorEnvSet() {
    const char* value = std::getenv("NO_COLOR");
    return value != nullptr;
}

bool ResolveColor(bool force_color, bool force_no_color, bool is_tty) {
    if (force_no_color) return false;
    if (NoColorEnvSet()) return false;
    if (force_color) return true;
    return is_tty;
}

} // namespace homelib
