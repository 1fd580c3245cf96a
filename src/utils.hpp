#pragma once
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string &data);
// Streams the file through SHA-256; nullopt when it cannot be read.
std::optional<std::string> sha256_file_hex(const std::filesystem::path& file);

std::string format_size(uint64_t bytes);
std::string format_duration_compact(std::chrono::steady_clock::duration elapsed);

// ISO-8601 UTC with seconds, e.g. 2025-11-02T17:04:55Z
std::string utc_timestamp_now();

// Keeps alphanumerics and "._- " so remote names are safe as local file names.
std::string sanitize_file_name(const std::string& name);
// Single-quotes a value for /bin/sh.
std::string shell_quote(const std::string& value);
