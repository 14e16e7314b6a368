#pragma once

#include <cstdint>
#include <experimental/filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::experimental::filesystem;

std::string_view get_version_string();
std::string random_hex_string(uint64_t length);

uint64_t get_milli_timestamp();

// Checks if the file name ends with VALID_FILE_SUFFIX.
bool has_valid_suffix(std::string_view fname);

std::string join_strings(const std::vector<std::string> &parts,
                         std::string_view separator);
