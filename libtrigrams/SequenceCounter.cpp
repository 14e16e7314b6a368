#include "SequenceCounter.h"

#include <deque>

void gen_sequences(std::string_view normalized, const SequenceCallback &cb) {
    std::deque<std::string_view> window;
    size_t offset = 0;

    while (offset < normalized.size()) {
        size_t next = normalized.find(' ', offset);
        if (next == std::string_view::npos) {
            next = normalized.size();
        }

        window.push_back(normalized.substr(offset, next - offset));
        offset = next + 1;

        if (window.size() > SEQUENCE_LENGTH) {
            window.pop_front();
        }

        if (window.size() == SEQUENCE_LENGTH) {
            std::string sequence(window[0]);
            for (size_t i = 1; i < SEQUENCE_LENGTH; i++) {
                sequence += ' ';
                sequence += window[i];
            }
            cb(sequence);
        }
    }
}

FrequencyTable count_sequences(std::string_view normalized) {
    FrequencyTable table;

    gen_sequences(normalized,
                  [&table](const std::string &sequence) { table[sequence]++; });

    return table;
}
