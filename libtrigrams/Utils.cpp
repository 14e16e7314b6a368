#include "Utils.h"

#include <chrono>
#include <random>

#include "Core.h"
#include "Version.h"

std::string_view get_version_string() { return trigrams_version_string; }

std::string random_hex_string(uint64_t length) {
    constexpr static char charset[] = "0123456789abcdef";
    thread_local static std::random_device rd;
    thread_local static std::seed_seq seed{
        rd(), rd(), rd(), rd()};  // A bit better than pathetic default
    thread_local static std::mt19937_64 random(seed);
    thread_local static std::uniform_int_distribution<int> pick(
        0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);

    for (uint64_t i = 0; i < length; i++) {
        result += charset[pick(random)];
    }

    return result;
}

uint64_t get_milli_timestamp() {
    namespace c = std::chrono;
    auto timestamp = c::steady_clock::now().time_since_epoch();
    return c::duration_cast<c::milliseconds>(timestamp).count();
}

bool has_valid_suffix(std::string_view fname) {
    if (fname.size() < VALID_FILE_SUFFIX.size()) {
        return false;
    }
    return fname.compare(fname.size() - VALID_FILE_SUFFIX.size(),
                         VALID_FILE_SUFFIX.size(), VALID_FILE_SUFFIX) == 0;
}

std::string join_strings(const std::vector<std::string> &parts,
                         std::string_view separator) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i != 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}
