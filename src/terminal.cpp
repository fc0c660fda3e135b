#include "terminal.h"

#include <sys/ioctl.h>
#include <unistd.h>

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace shellframe {

namespace {

[[nodiscard]] auto columns_of(int fd) -> int {
    if (isatty(fd) == 0) {
        return 0;
    }

    winsize size {};
    if (ioctl(fd, TIOCGWINSZ, &size) != 0) {
        return 0;
    }

    return size.ws_col;
}

[[nodiscard]] auto columns_from_environment() -> int {
    const char *value = std::getenv("COLUMNS");
    if (value == nullptr) {
        return 0;
    }

    const auto text = std::string_view {value};
    int columns = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), columns);
    if (ec != std::errc {} || ptr != text.data() + text.size() || columns < 0) {
        return 0;
    }

    return columns;
}

}  // namespace

auto terminal_columns() -> int {
    for (const auto fd : {STDOUT_FILENO, STDERR_FILENO}) {
        if (const auto columns = columns_of(fd); columns > 0) {
            return columns;
        }
    }

    if (const auto columns = columns_from_environment(); columns > 0) {
        return columns;
    }

    return default_terminal_columns;
}

}  // namespace shellframe
