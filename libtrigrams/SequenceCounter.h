#pragma once

#include <functional>
#include <string>
#include <string_view>

#include "Core.h"

using SequenceCallback = std::function<void(const std::string &)>;

// Sequence generator - will call callback for every window of
// SEQUENCE_LENGTH consecutive tokens in the normalized text. Windows overlap,
// so "a b c d" yields "a b c" and "b c d".
void gen_sequences(std::string_view normalized, const SequenceCallback &cb);

// Counts occurrences of every sequence in the normalized text.
FrequencyTable count_sequences(std::string_view normalized);
