#include "utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <stdexcept>

bool startsWith(const std::string &str, const std::string &prefix)
{
    if (prefix.size() > str.size())
        return false;
    return str.compare(0, prefix.size(), prefix) == 0;
}

// Convert string to lowercase (returns a copy)
std::string lowercase_copy(const std::string &s)
{
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim_copy(const std::string &s)
{
    size_t first = 0;
    while (first < s.size() && std::isspace(static_cast<unsigned char>(s[first])))
        ++first;
    size_t last = s.size();
    while (last > first && std::isspace(static_cast<unsigned char>(s[last - 1])))
        --last;
    return s.substr(first, last - first);
}

std::vector<std::string> split_csv_line(const std::string &line)
{
    std::vector<std::string> fields;
    size_t start = 0;
    while (true)
    {
        size_t comma = line.find(',', start);
        if (comma == std::string::npos)
        {
            fields.push_back(trim_copy(line.substr(start)));
            break;
        }
        fields.push_back(trim_copy(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

// Check if output path is a pipe (-, pipe:, pipe:1, etc.)
bool is_pipe_output(const char *path)
{
    if (!path)
        return false;
    return (std::strcmp(path, "-") == 0) ||
           (std::strcmp(path, "pipe:") == 0) ||
           (std::strcmp(path, "pipe:1") == 0) ||
           (std::strncmp(path, "pipe:", 5) == 0);
}

std::string format_bytes(uint64_t bytes)
{
    static const char *units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(units) / sizeof(units[0]))
    {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0)
        snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    else
        snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    return buf;
}

std::vector<uint8_t> read_file_bytes(const std::string &path)
{
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in)
        throw std::runtime_error("Cannot open " + path + ": " + std::strerror(errno));

    std::streamsize size = in.tellg();
    if (size < 0)
        throw std::runtime_error("Cannot determine size of " + path);
    in.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    if (size > 0 && !in.read(reinterpret_cast<char *>(data.data()), size))
        throw std::runtime_error("Failed to read " + path);
    return data;
}

void write_file_bytes(const std::string &path, const std::vector<uint8_t> &data)
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("Cannot create " + path + ": " + std::strerror(errno));
    if (!data.empty())
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out)
        throw std::runtime_error("Failed to write " + path);
}
