#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "Core.h"

// Everything that should be presented to the user after a single run.
struct AnalysisReport {
    // Analyzed units, in presentation order.
    std::vector<FileResult> units;
    // Rejected input files, aggregated over the whole run.
    std::vector<std::string> invalid_files;
};

// Default number of workers, used when nothing (or garbage) was requested.
constexpr uint64_t DEFAULT_WORKER_COUNT = 1;

// Converts the requested worker count into a usable value. Non-numeric and
// non-positive requests fall back to DEFAULT_WORKER_COUNT, requests above
// `max_workers` are reduced to it. Both cases are reported with a warning.
uint64_t resolve_worker_count(const std::optional<std::string> &requested,
                              uint64_t max_workers);

// Picks the processing strategy for the given inputs.
AnalysisMode select_mode(const std::vector<std::string> &files,
                         uint64_t worker_count);

// Analyzes all valid files as a single text, tagged with the whole file list.
AnalysisReport analyze_files_as_one(const std::vector<std::string> &files);

// Analyzes every file separately. Files are split into `worker_count` chunks,
// each processed by a dedicated thread. Results keep the input order. If any
// worker fails, the first error (in chunk order) is rethrown after all
// workers have finished.
AnalysisReport analyze_files_in_parallel(const std::vector<std::string> &files,
                                         uint64_t worker_count);

// Analyzes the stream line by line as a single text tagged as "stdin".
AnalysisReport analyze_stream(std::istream &in);

// Runs the analysis in the given mode.
AnalysisReport run_analysis(AnalysisMode mode,
                            const std::vector<std::string> &files,
                            uint64_t worker_count, std::istream &in);
