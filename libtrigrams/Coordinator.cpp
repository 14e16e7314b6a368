#include "Coordinator.h"

#include <cmath>
#include <cstdlib>
#include <exception>
#include <istream>
#include <stdexcept>
#include <utility>

#include "Normalizer.h"
#include "Partition.h"
#include "ThreadGroup.h"
#include "Utils.h"
#include "Worker.h"
#include "spdlog/spdlog.h"

uint64_t resolve_worker_count(const std::optional<std::string> &requested,
                              uint64_t max_workers) {
    if (!requested) {
        return DEFAULT_WORKER_COUNT;
    }

    const char *begin = requested->c_str();
    char *end = nullptr;
    double value = std::strtod(begin, &end);
    bool parsed = !requested->empty() && *end == '\0' && std::isfinite(value);

    if (!parsed || value < 0.5) {
        spdlog::warn(
            "Invalid argument for -t. Using default number of threads.");
        return DEFAULT_WORKER_COUNT;
    }

    if (value > static_cast<double>(max_workers)) {
        spdlog::warn(
            "WARNING: Maximum of {} allowed. The program will run using {} "
            "instead of {}",
            max_workers, max_workers, *requested);
        return max_workers;
    }

    return static_cast<uint64_t>(std::llround(value));
}

AnalysisMode select_mode(const std::vector<std::string> &files,
                         uint64_t worker_count) {
    if (files.empty()) {
        return AnalysisMode::STREAM;
    }
    if (worker_count > DEFAULT_WORKER_COUNT) {
        return AnalysisMode::FILES_IN_PARALLEL;
    }
    return AnalysisMode::FILES_AS_ONE;
}

AnalysisReport analyze_files_as_one(const std::vector<std::string> &files) {
    AnalysisReport report;
    std::string text;

    for (const auto &fname : files) {
        if (!has_valid_suffix(fname)) {
            report.invalid_files.push_back(fname);
            continue;
        }

        std::string normalized = read_normalized(fname);
        if (normalized.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += ' ';
        }
        text += normalized;
    }

    report.units.push_back(
        FileResult{join_strings(files, ", "), analyze_text(text), true});
    return report;
}

AnalysisReport analyze_files_in_parallel(const std::vector<std::string> &files,
                                         uint64_t worker_count) {
    std::vector<std::vector<std::string>> chunks =
        split_into_chunks(files, worker_count);

    // Every worker writes only to its own slot.
    std::vector<WorkerResult> results(chunks.size());
    std::vector<std::exception_ptr> errors(chunks.size());

    // If spawning fails, the group still joins the workers already running
    // before the error leaves this function.
    ThreadGroup workers;
    for (size_t i = 0; i < chunks.size(); i++) {
        workers.spawn([i, &chunks, &results, &errors]() {
            uint64_t start_ms = get_milli_timestamp();
            spdlog::debug("JOB: {}: start: {} files", i, chunks[i].size());
            try {
                results[i] = process_chunk(chunks[i]);
            } catch (...) {
                errors[i] = std::current_exception();
                spdlog::debug("JOB: {}: failed", i);
                return;
            }
            spdlog::debug("JOB: {}: done ({}ms)", i,
                          get_milli_timestamp() - start_ms);
        });
    }

    workers.join_all();

    for (const auto &error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    AnalysisReport report;
    for (auto &result : results) {
        report.invalid_files.insert(report.invalid_files.end(),
                                    result.invalid_files.begin(),
                                    result.invalid_files.end());
        for (auto &unit : result.results) {
            report.units.push_back(std::move(unit));
        }
    }
    spdlog::debug("ALL: {} workers complete, {} files analyzed",
                  chunks.size(), report.units.size());
    return report;
}

AnalysisReport analyze_stream(std::istream &in) {
    AnalysisReport report;
    std::string text = normalize_lines(in);
    report.units.push_back(
        FileResult{std::string(STDIN_SOURCE), analyze_text(text), true});
    return report;
}

AnalysisReport run_analysis(AnalysisMode mode,
                            const std::vector<std::string> &files,
                            uint64_t worker_count, std::istream &in) {
    spdlog::debug("MODE: {}", get_analysis_mode_name(mode));

    switch (mode) {
        case AnalysisMode::FILES_AS_ONE:
            return analyze_files_as_one(files);
        case AnalysisMode::FILES_IN_PARALLEL:
            return analyze_files_in_parallel(files, worker_count);
        case AnalysisMode::STREAM:
            return analyze_stream(in);
    }

    throw std::runtime_error("unhandled analysis mode");
}
