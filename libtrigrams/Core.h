#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// Number of tokens in a single sequence.
constexpr size_t SEQUENCE_LENGTH = 3;

// Default number of ranked sequences reported for a single unit of text.
constexpr uint64_t DEFAULT_MAX_SEQUENCES = 100;

// Only files with this suffix are analyzed.
constexpr std::string_view VALID_FILE_SUFFIX = ".txt";

// Source name used for text read from the standard input.
constexpr std::string_view STDIN_SOURCE = "stdin";

// Largest text (in bytes) analyzed as a single piece. ICU indexes strings
// with int32_t.
constexpr uint64_t MAX_TEXT_SIZE = 2147483647;

class text_size_error : public std::runtime_error {
   public:
    explicit text_size_error(const std::string &message)
        : runtime_error(message) {}
};

// Trigram ("a b c") -> number of occurrences.
using FrequencyTable = std::unordered_map<std::string, uint64_t>;

// (trigram, count) pairs ordered by count, descending.
using RankedSequences = std::vector<std::pair<std::string, uint64_t>>;

struct FileResult {
    std::string source;
    RankedSequences sequences;
    // Always true: rejected inputs never become units, they are only listed
    // in the report's invalid files.
    bool valid;
};

enum class AnalysisMode { FILES_AS_ONE = 1, FILES_IN_PARALLEL = 2, STREAM = 3 };

std::string get_analysis_mode_name(AnalysisMode mode);
