#pragma once

#include "types.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace habitat_seg::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
std::vector<fs::path> list_files_with_extension(const fs::path& dir, const std::string& ext);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_file(const fs::path& path);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool ends_with(const std::string& str, const std::string& suffix);
std::vector<std::string> split(const std::string& str, char delimiter);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// "1,2,3" -> {1, 2, 3}; throws ConfigError on malformed entries
std::vector<int> parse_int_list(const std::string& text);

} // namespace habitat_seg::core
