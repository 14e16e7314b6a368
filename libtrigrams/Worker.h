#pragma once

#include <string>
#include <vector>

#include "Core.h"

struct WorkerResult {
    // Files rejected because of their name, in input order.
    std::vector<std::string> invalid_files;
    // One entry per analyzed file, in input order.
    std::vector<FileResult> results;
};

// Analyzes files one after another. Files without a valid suffix are only
// recorded. Failing to read a file with a valid suffix is fatal, and the
// exception is propagated to the caller.
class FileAnalyzer {
    WorkerResult result;

   public:
    FileAnalyzer() : result{} {}
    void analyze(const std::string &target);
    WorkerResult finalize();
};

// Reads and normalizes a single file.
std::string read_normalized(const std::string &fname);

// Ranks all sequences found in a normalized text.
RankedSequences analyze_text(const std::string &normalized);

// Worker unit: processes a whole chunk of files sequentially.
WorkerResult process_chunk(const std::vector<std::string> &chunk);
