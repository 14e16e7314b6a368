#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class usage_error : public std::runtime_error {
   public:
    explicit usage_error(const std::string &message)
        : runtime_error(message) {}
};

struct CommandLine {
    // input files, only allowed together with --files
    std::vector<std::string> files;

    // requested number of worker threads, validated later
    std::optional<std::string> threads;

    // number of sequences listed per unit
    std::optional<uint64_t> limit;

    // path to the configuration file
    std::optional<std::string> config;

    bool json = false;
    bool verbose = false;
    bool help = false;
};

// Parses program arguments with getopt_long. Throws usage_error for unknown
// options, a malformed --limit, or input files given without --files.
CommandLine parse_command_line(int argc, char *argv[]);
