#include "Responses.h"

#include <algorithm>
#include <vector>

#include "Utils.h"

Response Response::report(const AnalysisReport &report,
                          uint64_t max_sequences) {
    Response r("report");
    std::vector<json> units_json;
    for (const auto &unit : report.units) {
        json unit_json;
        unit_json["source"] = unit.source;
        unit_json["valid"] = unit.valid;
        unit_json["total_sequences"] = unit.sequences.size();

        std::vector<json> sequences_json;
        uint64_t limit = std::min<uint64_t>(max_sequences,
                                            unit.sequences.size());
        for (uint64_t i = 0; i < limit; i++) {
            json sequence_json;
            sequence_json["sequence"] = unit.sequences[i].first;
            sequence_json["count"] = unit.sequences[i].second;
            sequences_json.push_back(sequence_json);
        }
        unit_json["sequences"] = sequences_json;
        units_json.push_back(unit_json);
    }
    r.content["result"]["units"] = units_json;
    r.content["result"]["invalid_files"] = report.invalid_files;
    r.content["result"]["trigrams_version"] =
        std::string(get_version_string());
    return r;
}

Response Response::error(const std::string &message) {
    Response r("error");
    r.content["error"]["message"] = message;
    return r;
}

std::string Response::to_string() const { return content.dump(); }
