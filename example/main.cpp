#include "config.h"
#include "errors.h"
#include "scaffold.h"

#include <spdlog/spdlog.h>

#include <charconv>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

struct Options {
    std::optional<std::string> config_file {};
    std::optional<std::string> font_dir {};
    std::optional<std::string> input_file {};
    std::string output_file {"out.png"};
    std::optional<std::string> command {};
    int columns {0};
    bool no_decoration {false};
    bool no_shadow {false};
    bool clip_canvas {false};
    bool raw {false};
    spdlog::level::level_enum log_level {spdlog::level::warn};
};

auto print_usage(const char *argv0) -> void {
    std::cerr << "Usage: " << argv0
              << " [--config <json>] [--fonts <dir>] [--file <input>] [--output <png>]\n"
                 "       [--columns N] [--command <text>] [--no-decoration] [--no-shadow]\n"
                 "       [--clip-canvas] [--raw] [--verbose|--quiet]\n"
                 "\n"
                 "Renders ANSI colored text from stdin or --file as a terminal window "
                 "screenshot.\n";
}

auto parse_arguments(int argc, char **argv) -> std::optional<Options> {
    auto options = Options {};

    for (int i = 1; i < argc; ++i) {
        const auto arg = std::string_view {argv[i]};

        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << "\n";
                return std::nullopt;
            }
            return std::string {argv[++i]};
        };

        if (arg == "--config" || arg == "--fonts" || arg == "--file" ||
            arg == "--output" || arg == "--command" || arg == "--columns") {
            const auto value = next();
            if (!value) {
                return std::nullopt;
            }

            if (arg == "--config") {
                options.config_file = *value;
            } else if (arg == "--fonts") {
                options.font_dir = *value;
            } else if (arg == "--file") {
                options.input_file = *value;
            } else if (arg == "--output") {
                options.output_file = *value;
            } else if (arg == "--command") {
                options.command = *value;
            } else {
                const auto [ptr, ec] = std::from_chars(
                    value->data(), value->data() + value->size(), options.columns);
                if (ec != std::errc {} || ptr != value->data() + value->size() ||
                    options.columns < 0) {
                    std::cerr << "Invalid column count: " << *value << "\n";
                    return std::nullopt;
                }
            }
        } else if (arg == "--no-decoration") {
            options.no_decoration = true;
        } else if (arg == "--no-shadow") {
            options.no_shadow = true;
        } else if (arg == "--clip-canvas") {
            options.clip_canvas = true;
        } else if (arg == "--raw") {
            options.raw = true;
        } else if (arg == "--verbose") {
            options.log_level = spdlog::level::debug;
        } else if (arg == "--quiet") {
            options.log_level = spdlog::level::err;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return std::nullopt;
        }
    }

    return options;
}

auto render(const Options &options) -> void {
    using namespace shellframe;

    auto config = options.config_file ? load_config(*options.config_file) : Config {};
    if (options.font_dir) {
        config.font_dir = *options.font_dir;
    }

    auto scaffold = Scaffold {config};
    scaffold.set_columns(options.columns);
    scaffold.clip_canvas(options.clip_canvas);
    if (options.no_decoration) {
        scaffold.draw_decorations(false);
    }
    if (options.no_shadow) {
        scaffold.draw_shadow(false);
    }

    if (options.command) {
        const auto args = std::vector<std::string> {*options.command};
        scaffold.add_command(args);
    }

    if (options.input_file) {
        auto in = std::ifstream {*options.input_file, std::ios::binary};
        if (!in) {
            throw InputStreamError("Unable to open input file " + *options.input_file);
        }
        scaffold.add_content(in);
    } else {
        scaffold.add_content(std::cin);
    }

    if (options.raw) {
        scaffold.write_raw(std::cout);
        return;
    }

    scaffold.write_png(std::filesystem::path {options.output_file});
    spdlog::info("shellframe: wrote {}", options.output_file);
}

}  // namespace

auto main(int argc, char **argv) -> int {
    const auto options = parse_arguments(argc, argv);
    if (!options) {
        print_usage(argv[0]);
        return 2;
    }

    spdlog::set_level(options->log_level);

    try {
        render(*options);
    } catch (const shellframe::Error &exc) {
        spdlog::error("{}", exc.what());
        return 1;
    }
    return 0;
}
