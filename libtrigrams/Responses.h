#pragma once

#include <cstdint>
#include <string>

#include "Coordinator.h"
#include "Json.h"

class Response {
    json content;

    explicit Response(const std::string &type) { content["type"] = type; }

   public:
    // Every unit with at most `max_sequences` top sequences, and the list of
    // rejected files.
    static Response report(const AnalysisReport &report,
                           uint64_t max_sequences);
    static Response error(const std::string &message);
    const json &get_raw() const { return content; }
    std::string to_string() const;
};
