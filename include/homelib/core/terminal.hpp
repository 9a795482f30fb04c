#pragma once

namespace homelib {

/// True when stderr is attached to a terminal (coloured log lines).
bool IsStderrTty();

/// True when stdout is attached to a terminal (coloured tables and results).
bool IsStdoutTty();

/// True when NO_COLOR is set (https://no-color.org/).
bool NoColorEnvSet();

/// --no-color and NO_COLOR always disable colour; otherwise --color forces it
/// and a terminal enables it.
bool ResolveColor(bool force_color, bool force_no_color, bool is_tty);

} // namespace homelib
