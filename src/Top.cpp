#include <iostream>
#include <memory>
#include <string>

#include "Environment.h"
#include "libtrigrams/CommandLine.h"
#include "libtrigrams/Config.h"
#include "libtrigrams/Coordinator.h"
#include "libtrigrams/ReportWriter.h"
#include "libtrigrams/Responses.h"
#include "libtrigrams/Utils.h"
#include "spdlog/spdlog.h"

void print_usage(const std::string &exec_name) {
    // clang-format off
    fmt::print(stderr, "Usage: {} [option] [-f file1.txt file2.txt ...]\n", exec_name);
    fmt::print(stderr, "    [-f, --files]             analyze the given files instead of stdin\n");
    fmt::print(stderr, "    [-t, --threads <n>]       number of threads, one list per file, default: 1\n");
    fmt::print(stderr, "    [-n, --limit <n>]         sequences listed per unit, default: 100\n");
    fmt::print(stderr, "    [-c, --config <path>]     JSON configuration file\n");
    fmt::print(stderr, "    [-j, --json]              print a JSON report\n");
    fmt::print(stderr, "    [-v, --verbose]           debug logging\n");
    fmt::print(stderr, "Examples:\n");
    fmt::print(stderr, "    {} -f file1.txt file2.txt        single list for both files\n", exec_name);
    fmt::print(stderr, "    {} -f file1.txt file2.txt -t 2   one list per file, 2 threads\n", exec_name);
    fmt::print(stderr, "    cat file1.txt | {}               read from stdin\n", exec_name);
    // clang-format on
}

int main(int argc, char *argv[]) {
    setup_logging();

    const std::string exec_name = argc >= 1 ? argv[0] : "trigrams_top";

    CommandLine cmd;
    try {
        cmd = parse_command_line(argc, argv);
    } catch (const usage_error &ex) {
        spdlog::error("{}", ex.what());
        print_usage(exec_name);
        return 1;
    }

    if (cmd.help) {
        print_usage(exec_name);
        return 0;
    }

    if (cmd.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }

    spdlog::debug("Trigrams v{}", get_version_string());

    try {
        AnalyzerConfig config;
        if (cmd.config) {
            config = AnalyzerConfig::load(*cmd.config);
        }
        if (cmd.limit) {
            config.set(ConfigKey::max_sequences(), *cmd.limit);
        }

        uint64_t max_workers = host_parallelism();
        uint64_t config_workers = config.get(ConfigKey::max_workers());
        if (config_workers != 0 && config_workers < max_workers) {
            max_workers = config_workers;
        }

        uint64_t worker_count = resolve_worker_count(cmd.threads, max_workers);
        AnalysisMode mode = select_mode(cmd.files, worker_count);
        spdlog::debug("files: {}, workers: {}", cmd.files.size(), worker_count);

        AnalysisReport report =
            run_analysis(mode, cmd.files, worker_count, std::cin);

        std::unique_ptr<ReportWriter> writer;
        uint64_t max_sequences = config.get(ConfigKey::max_sequences());
        if (cmd.json) {
            writer = std::make_unique<JsonReportWriter>(&std::cout,
                                                        max_sequences);
        } else {
            writer = std::make_unique<TextReportWriter>(&std::cout,
                                                        max_sequences);
        }
        writer->write(report);
    } catch (const std::runtime_error &ex) {
        spdlog::error("Runtime error: {}", ex.what());
        if (cmd.json) {
            std::cout << Response::error(ex.what()).to_string() << std::endl;
        }
        return 1;
    } catch (const json::exception &ex) {
        spdlog::error("JSON error: {}", ex.what());
        if (cmd.json) {
            std::cout << Response::error(ex.what()).to_string() << std::endl;
        }
        return 1;
    }

    return 0;
}
