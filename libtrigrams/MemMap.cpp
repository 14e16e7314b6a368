#include "MemMap.h"

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

#include "Core.h"
#include "spdlog/spdlog.h"

MemMap::MemMap(const std::string &fname)
    : fd(-1), fname(fname), mmap_ptr(nullptr), fsize(0) {
    fd = open(fname.c_str(), O_RDONLY, static_cast<mode_t>(0600));

    if (fd == -1) {
        throw file_open_error("failed to open " + fname + ": " +
                              std::strerror(errno));
    }

    struct stat st;
    if (fstat(fd, &st) != 0 || !S_ISREG(st.st_mode)) {
        close(fd);
        fd = -1;
        throw file_open_error("not a regular file: " + fname);
    }

    off_t fsize_tmp = lseek(fd, 0, SEEK_END);

    if (fsize_tmp == 0) {
        close(fd);
        fd = -1;
        throw empty_file_error(fname);
    }

    if (fsize_tmp == -1) {
        close(fd);
        fd = -1;
        throw file_open_error("lseek failed for " + fname);
    }

    fsize = static_cast<uint64_t>(fsize_tmp);
    void *ptr = mmap(nullptr, fsize, PROT_READ, MAP_SHARED, fd, 0);

    if (ptr == MAP_FAILED) {
        close(fd);
        fd = -1;
        throw file_open_error("mmap failed for " + fname);
    }

    mmap_ptr = static_cast<uint8_t *>(ptr);
}

MemMap::~MemMap() {
    if (mmap_ptr != nullptr) {
        munmap(mmap_ptr, fsize);
    }

    if (fd != -1) {
        close(fd);
    }
}

std::string read_text_file(const std::string &fname) {
    try {
        MemMap mmap(fname);
        if (mmap.size() > MAX_TEXT_SIZE) {
            throw text_size_error(fname + " is too large (" +
                                  std::to_string(mmap.size()) + " bytes)");
        }
        return std::string(reinterpret_cast<const char *>(mmap.data()),
                           mmap.size());
    } catch (empty_file_error &e) {
        spdlog::debug("Empty file: {}", fname);
        return std::string();
    }
}
