#include "Worker.h"

#include <utility>

#include "MemMap.h"
#include "Normalizer.h"
#include "Ranker.h"
#include "SequenceCounter.h"
#include "Utils.h"
#include "spdlog/spdlog.h"

std::string read_normalized(const std::string &fname) {
    return normalize_text(read_text_file(fname));
}

RankedSequences analyze_text(const std::string &normalized) {
    return rank_sequences(count_sequences(normalized));
}

void FileAnalyzer::analyze(const std::string &target) {
    if (!has_valid_suffix(target)) {
        spdlog::debug("Invalid file name (skip): {}", target);
        result.invalid_files.push_back(target);
        return;
    }

    RankedSequences sequences = analyze_text(read_normalized(target));
    spdlog::debug("{}: {} distinct sequences", target, sequences.size());
    result.results.push_back(FileResult{target, std::move(sequences), true});
}

WorkerResult FileAnalyzer::finalize() {
    WorkerResult out = std::move(result);
    result = WorkerResult{};
    return out;
}

WorkerResult process_chunk(const std::vector<std::string> &chunk) {
    FileAnalyzer analyzer;

    for (const auto &target : chunk) {
        analyzer.analyze(target);
    }

    return analyzer.finalize();
}
