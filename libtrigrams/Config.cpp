#include "Config.h"

#include <fstream>
#include <stdexcept>

#include "spdlog/spdlog.h"

AnalyzerConfig::AnalyzerConfig(json config) : config_(json::object()) {
    if (!config.is_object()) {
        throw std::runtime_error("configuration must be a JSON object");
    }

    for (const auto &elm : config.items()) {
        auto key = ConfigKey::parse(elm.key());
        if (!key) {
            spdlog::warn("Unexpected config: {}={}", elm.key(),
                         elm.value().dump());
            continue;
        }
        if (!elm.value().is_number_unsigned()) {
            throw std::runtime_error("config " + elm.key() +
                                     " must be a non-negative integer");
        }
        spdlog::debug("CONFIG: {}={}", elm.key(), elm.value().dump());
        set(*key, elm.value().get<uint64_t>());
    }
}

AnalyzerConfig AnalyzerConfig::load(const std::string &fname) {
    std::ifstream in(fname);
    if (!in) {
        throw std::runtime_error("failed to open config file " + fname);
    }

    json config;
    in >> config;
    return AnalyzerConfig(std::move(config));
}

std::optional<ConfigKey> ConfigKey::parse(std::string_view value) {
    for (const auto &opt : ConfigKey::available()) {
        if (opt.key() == value) {
            return opt;
        }
    }
    return std::nullopt;
}

uint64_t AnalyzerConfig::get(const ConfigKey &key) const {
    if (const auto &it = config_.find(key.key()); it != config_.end()) {
        return it->get<uint64_t>();
    }
    return key.defval();
}

bool AnalyzerConfig::can_set(const ConfigKey &key, uint64_t value) const {
    if (value < key.min()) {
        return false;
    }
    if (value > key.max()) {
        return false;
    }
    return true;
}

void AnalyzerConfig::set(const ConfigKey &key, uint64_t value) {
    if (!can_set(key, value)) {
        throw std::runtime_error("Tried to set config " + key.key() +
                                 " to invalid value " + std::to_string(value));
    }
    config_[key.key()] = value;
}

std::unordered_map<std::string, uint64_t> AnalyzerConfig::get_all() const {
    std::unordered_map<std::string, uint64_t> result;
    for (const auto &key : ConfigKey::available()) {
        result.emplace(key.key(), get(key));
    }
    return result;
}
