#pragma once

#include <cstddef>
#include <stdexcept>
#include <vector>

// Splits items into exactly `count` contiguous chunks. Chunk sizes differ by
// at most one, larger chunks come first. When there are fewer items than
// chunks, the trailing chunks are empty.
template <typename T>
std::vector<std::vector<T>> split_into_chunks(const std::vector<T> &items,
                                              size_t count) {
    if (count == 0) {
        throw std::runtime_error("can't split items into zero chunks");
    }

    std::vector<std::vector<T>> chunks;
    chunks.reserve(count);

    auto chunk_start = items.begin();
    for (size_t i = 0; i < count; i++) {
        size_t remaining = items.end() - chunk_start;
        size_t slots_left = count - i;
        size_t chunk_size = (remaining + slots_left - 1) / slots_left;

        auto chunk_end = chunk_start + chunk_size;
        chunks.emplace_back(chunk_start, chunk_end);
        chunk_start = chunk_end;
    }

    return chunks;
}
