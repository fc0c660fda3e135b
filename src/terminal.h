#ifndef SHELLFRAME_TERMINAL_H
#define SHELLFRAME_TERMINAL_H

namespace shellframe {

inline constexpr int default_terminal_columns = 80;

// Column count of the controlling terminal. Tries stdout, then stderr,
// then the COLUMNS environment variable and falls back to 80.
[[nodiscard]] auto terminal_columns() -> int;

}  // namespace shellframe

#endif
