#pragma once

#include "Core.h"

// Orders all entries of the table by count, descending. Entries with equal
// counts are ordered by the sequence text, so the result is reproducible.
RankedSequences rank_sequences(const FrequencyTable &table);
