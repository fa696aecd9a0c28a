#include "./include/proflame.hpp"
#include "./include/parallel_proflame.hpp"
#include <chrono>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace proflame;

namespace {

struct CommandLine {
    FlameGraphConfig config;
    RenderRequest request;
    std::string input;
    std::string output;
    bool all = false;
    bool verbose = false;
    bool help = false;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [OPTIONS] <input> <output.html|output.json>\n\n"
              << "Options:\n"
              << "  -t, --type NAME       sample type to display (name or index)\n"
              << "  -d, --default NAME    sample type used when --type is absent\n"
              << "      --title TEXT      page title (default: profile file name)\n"
              << "      --assets DIR      inline d3.v7.min.js, d3-flamegraph.js, d3-flamegraph-tooltip.js,\n"
              << "                        d3-flamegraph.css from DIR\n"
              << "      --base-url URL    base URL of the sample type links (default: /flamegraph)\n"
              << "      --width N         chart width in pixels (default: fit)\n"
              << "      --cell-height N   frame height in pixels (default: 18)\n"
              << "      --all             one page per sample type, <output> is used as prefix\n"
              << "  -v, --verbose         print progress\n"
              << "  -h, --help            show this help\n";
}

int parse_int_option(std::string_view name, const char* value) {
    int parsed = 0;
    if (! parse_integer(std::string_view(value), parsed)) {
        throw ConfigException(std::string("invalid value for ") + std::string(name) + ": " + value);
    }
    return parsed;
}

CommandLine parse_command_line(int argc, char* argv[]) {
    CommandLine cmd;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto next_value = [&]() -> const char* {
            if (i + 1 >= argc) {
                throw ConfigException(std::string("missing value for ") + std::string(arg));
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            cmd.help = true;
        } else if (arg == "-v" || arg == "--verbose") {
            cmd.verbose = true;
        } else if (arg == "--all") {
            cmd.all = true;
        } else if (arg == "-t" || arg == "--type") {
            cmd.request.sample_type = next_value();
        } else if (arg == "-d" || arg == "--default") {
            cmd.config.default_sample_type = next_value();
        } else if (arg == "--title") {
            cmd.config.title = next_value();
        } else if (arg == "--assets") {
            cmd.config.assets_dir = next_value();
        } else if (arg == "--base-url") {
            cmd.config.base_url = next_value();
        } else if (arg == "--width") {
            cmd.config.width = parse_int_option(arg, next_value());
        } else if (arg == "--cell-height") {
            cmd.config.cell_height = parse_int_option(arg, next_value());
        } else if (! arg.empty() && arg[0] == '-') {
            throw ConfigException(std::string("unknown option: ") + std::string(arg));
        } else {
            positional.emplace_back(arg);
        }
    }

    if (cmd.help) {
        return cmd;
    }
    if (positional.size() != 2) {
        throw std::invalid_argument("expected <input> and <output>");
    }
    if (cmd.all && ! cmd.request.sample_type.empty()) {
        throw std::invalid_argument("--type cannot be combined with --all");
    }
    cmd.input = positional[0];
    cmd.output = positional[1];
    cmd.config.validate();
    return cmd;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        CommandLine cmd = parse_command_line(argc, argv);
        if (cmd.help) {
            print_usage(argv[0]);
            return 0;
        }

        auto start = std::chrono::steady_clock::now();

        if (cmd.all) {
            ParallelFlameGraphGenerator generator(cmd.config);
            auto format = file_suffix(cmd.output);
            std::string prefix = cmd.output;
            if (format.empty()) {
                format = "html";
            } else {
                prefix.resize(prefix.size() - format.size() - 1);
            }
            for (const auto& path : generator.generate_all(cmd.input, prefix, format)) {
                if (cmd.verbose) std::cout << "✅ wrote " << path << "\n";
            }
        } else {
            FlameGraphGenerator generator(cmd.config);
            for (const auto& message : generator.generate(cmd.input, cmd.output, cmd.request)) {
                std::cerr << "⚠️  " << message << "\n";
            }
            if (cmd.verbose) std::cout << "✅ wrote " << cmd.output << "\n";
        }

        if (cmd.verbose) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            std::cout << "Generation completed in " << elapsed.count() << " ms\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "❌ Error: " << e.what() << std::endl;
        if (argc < 3) {
            print_usage(argv[0]);
        }
        return 1;
    }
}
