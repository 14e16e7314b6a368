#include "Ranker.h"

#include <algorithm>

RankedSequences rank_sequences(const FrequencyTable &table) {
    RankedSequences ranked(table.begin(), table.end());

    std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
        if (a.second != b.second) {
            return a.second > b.second;
        }
        return a.first < b.first;
    });

    return ranked;
}
