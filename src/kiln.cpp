#include "kiln/artifact.hpp"
#include "kiln/config.hpp"
#include "kiln/errors.hpp"
#include "kiln/parser.hpp"
#include "kiln/session.hpp"
#include "kiln/utility.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <optional>
#include <print>
#include <string>

void print_help() {
    std::println("Usage: kiln [options]");
    std::println("Options:");
    std::println("  -h, --help           Show this help message");
    std::println("  --version            Show version");
    std::println("  -d <dir>             Change working directory before doing anything");
    std::println("  -c <file>            Use <file> as the configuration (default: kiln.config.json)");
    std::println("  -o <file>            Write the artifact as JSON to <file> (default: stdout)");
    std::println("  --analyzer <name>    Parser backend: tree or stream");
    std::println("  --force              Ignore the file tracker and reanalyse every file");
    std::println("  --sync               Fail instead of waiting on pending values");
    std::println("  -v, --verbose        Print per-file and cache diagnostics");
    std::println("  -q, --quiet          Print errors only");
}

void print_version() {
    std::println("kiln {}", KILN_PROJ_VER);
}

int main(const int argc, const char *const *argv) {
    kiln::BuildOptions options;
    std::string config_path(kiln::CONFIG_FILE);
    std::optional<std::string> output_path;
    std::optional<std::string> analyzer;
    std::optional<kiln::Verbosity> verbosity;
    std::filesystem::path work_dir = ".";

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        auto value = [&]() -> const char * {
            if (i + 1 < argc)
                return argv[++i];
            std::println(std::cerr, "Missing argument for {}", arg);
            return nullptr;
        };

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--version") {
            print_version();
            return 0;
        } else if (arg == "-d") {
            const char *dir = value();
            if (!dir)
                return 1;
            work_dir = dir;
        } else if (arg == "-c") {
            const char *file = value();
            if (!file)
                return 1;
            config_path = file;
        } else if (arg == "-o") {
            const char *file = value();
            if (!file)
                return 1;
            output_path = file;
        } else if (arg == "--analyzer") {
            const char *name = value();
            if (!name)
                return 1;
            analyzer = name;
        } else if (arg == "--force") {
            options.force = true;
        } else if (arg == "--sync") {
            options.mode = kiln::BuildMode::Sync;
        } else if (arg == "-v" || arg == "--verbose") {
            verbosity = kiln::Verbosity::Verbose;
        } else if (arg == "-q" || arg == "--quiet") {
            verbosity = kiln::Verbosity::Quiet;
        } else {
            std::println(std::cerr, "Unknown argument: {}", arg);
            print_help();
            return 1;
        }
    }

    if (work_dir != ".") {
        std::error_code ec;
        std::filesystem::current_path(work_dir, ec);
        if (ec) {
            std::println(std::cerr, "Failed to change directory to {}: {}", work_dir.string(), ec.message());
            return 1;
        }
    }

    auto config = kiln::load_config(config_path);
    if (!config) {
        std::println(std::cerr, "Failed to load configuration: {}", config.error());
        return 1;
    }
    if (analyzer) {
        if (!kiln::make_adapter(*analyzer, {})) {
            std::println(std::cerr, "Unknown analyzer: {}", *analyzer);
            return 1;
        }
        config->analyzer = *analyzer;
    }
    if (verbosity)
        config->verbosity = *verbosity;
    kiln::set_verbosity(config->verbosity);

    kiln::BuilderSession session{std::move(*config)};
    auto artifact = session.build(options);
    if (!artifact) {
        std::println(std::cerr, "Build failed: {}", kiln::format_error(artifact.error()));
        return 1;
    }

    std::string json = kiln::artifact_to_json(*artifact).dump(2);
    if (output_path) {
        std::ofstream out(*output_path);
        if (!out || !(out << json << '\n')) {
            std::println(std::cerr, "Failed to write {}", *output_path);
            return 1;
        }
    } else {
        std::println("{}", json);
    }

    const auto &report = artifact->report;
    kiln::log(kiln::Verbosity::Normal, "{} elements ({} cached, {} analysed, {} warnings) in {:.1f} ms",
              artifact->elements.size(), report.cache.hits, report.cache.misses, report.warnings.size(),
              report.duration_ms);
    return 0;
}
