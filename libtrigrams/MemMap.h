#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

class MemMap {
    int fd;
    std::string fname;
    uint8_t *mmap_ptr;
    uint64_t fsize;

   public:
    explicit MemMap(const std::string &fname);
    ~MemMap();

    // Disables copy constructor - we DO NOT want to accidentaly copy MemMap
    // object
    MemMap(const MemMap &other) = delete;

    const uint8_t *data() const { return mmap_ptr; }

    size_t size() const { return fsize; }
};

class empty_file_error : public std::runtime_error {
   public:
    explicit empty_file_error(const std::string &fname)
        : runtime_error("empty file: " + fname) {}
};

class file_open_error : public std::runtime_error {
   public:
    explicit file_open_error(const std::string &message)
        : runtime_error(message) {}
};

// Reads the whole file into memory. Empty files are read as empty text.
// Throws file_open_error when the file can't be opened or mapped, and
// text_size_error when it is larger than MAX_TEXT_SIZE.
std::string read_text_file(const std::string &fname);
