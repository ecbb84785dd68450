#pragma once

#include <cstdint>
#include <string>
#include <vector>

// String and file utility functions

// Check if a string starts with a prefix
bool startsWith(const std::string &str, const std::string &prefix);

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s);

// Strip leading/trailing whitespace (returns a copy)
std::string trim_copy(const std::string &s);

// Split a single CSV line on commas (no quoting support)
std::vector<std::string> split_csv_line(const std::string &line);

// Check if output path is a pipe (-, pipe:, pipe:1, etc.)
bool is_pipe_output(const char *path);

// Human readable size, e.g. "512.0 MiB"
std::string format_bytes(uint64_t bytes);

// Whole-file helpers; throw std::runtime_error on I/O failure
std::vector<uint8_t> read_file_bytes(const std::string &path);
void write_file_bytes(const std::string &path, const std::vector<uint8_t> &data);
