#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "Core.h"
#include "Json.h"

class ConfigKey {
    // Key name, as used in the configuration file.
    std::string key_;

    // Default value, used when the key was not configured explicitly.
    uint64_t defval_;

    // Minimum allowed value for this key.
    uint64_t min_;

    // Maximum allowed value for this key.
    uint64_t max_;

    explicit ConfigKey(std::string key, uint64_t defval, uint64_t min,
                       uint64_t max)
        : key_(std::move(key)), defval_(defval), min_(min), max_(max) {}

   public:
    const std::string &key() const { return key_; }
    uint64_t defval() const { return defval_; }
    uint64_t min() const { return min_; }
    uint64_t max() const { return max_; }

    static std::optional<ConfigKey> parse(std::string_view value);

    // Returns a list of supported config keys.
    static std::vector<ConfigKey> available() {
        return {max_sequences(), max_workers()};
    }

    // How many ranked sequences are reported for a single unit of text.
    // Every sequence is still counted, this only limits the report.
    const static ConfigKey max_sequences() {
        return ConfigKey("max_sequences", DEFAULT_MAX_SEQUENCES, 1,
                         4294967295);
    }

    // Upper bound for the number of worker threads. The default 0 means that
    // only the number of CPUs available on the host is used as the limit.
    const static ConfigKey max_workers() {
        return ConfigKey("max_workers", 0, 0, 1024);
    }

    bool operator==(const ConfigKey &other) const { return other.key_ == key_; }
};

class AnalyzerConfig {
    json config_;

   public:
    // Constructs an empty config instance.
    AnalyzerConfig() : config_(std::unordered_map<std::string, uint64_t>()) {}

    // Constructs a new instance using given json. Throws if any known key
    // has an invalid value.
    explicit AnalyzerConfig(json config);

    // Reads the configuration from a JSON file.
    static AnalyzerConfig load(const std::string &fname);

    // Gets the current value of a given key, or returns a default.
    uint64_t get(const ConfigKey &key) const;

    // Checks is it possible to set key to a given value.
    bool can_set(const ConfigKey &key, uint64_t value) const;

    // Sets the key to the given value, or throws an exception if it's invalid.
    void set(const ConfigKey &key, uint64_t value);

    // Gets all key-value pairs, including defaults.
    std::unordered_map<std::string, uint64_t> get_all() const;
};
