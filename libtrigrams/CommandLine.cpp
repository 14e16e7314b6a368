#include "CommandLine.h"

#include <getopt.h>

#include <cstdlib>

static std::optional<uint64_t> parse_uint(const char *str) {
    char *end = nullptr;
    uint64_t value = std::strtoull(str, &end, 10);
    if (*str == '\0' || *str == '-' || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

CommandLine parse_command_line(int argc, char *argv[]) {
    CommandLine cmd;
    bool files_flag = false;

    // clang-format off
    static const struct option long_options[] = {
        {"files", no_argument, nullptr, 'f'},
        {"threads", required_argument, nullptr, 't'},
        {"limit", required_argument, nullptr, 'n'},
        {"config", required_argument, nullptr, 'c'},
        {"json", no_argument, nullptr, 'j'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}};
    // clang-format on

    // Restart the scan, the parser may run more than once per process.
    optind = 0;

    int c;
    while ((c = getopt_long(argc, argv, "ft:n:c:jvh", long_options,
                            nullptr)) != -1) {
        switch (c) {
            case 'f':
                files_flag = true;
                break;
            case 't':
                cmd.threads = std::string(optarg);
                break;
            case 'n':
                cmd.limit = parse_uint(optarg);
                if (!cmd.limit) {
                    throw usage_error("Invalid argument for -n: " +
                                      std::string(optarg));
                }
                break;
            case 'c':
                cmd.config = std::string(optarg);
                break;
            case 'j':
                cmd.json = true;
                break;
            case 'v':
                cmd.verbose = true;
                break;
            case 'h':
                cmd.help = true;
                return cmd;
            default:
                throw usage_error("Failed to parse command line.");
        }
    }

    cmd.files.assign(argv + optind, argv + argc);
    if (!cmd.files.empty() && !files_flag) {
        throw usage_error(
            "Input given without specifying --files (-f) option.");
    }

    return cmd;
}
