#include "media_source.h"
#include "logger.h"
#include "utils.h"

#include <atomic>
#include <cstdio>
#include <filesystem>
#include <random>
#include <stdexcept>
#include <system_error>

struct MediaSource::TemporaryFile
{
    explicit TemporaryFile(std::string p) : path(std::move(p)) {}
    ~TemporaryFile()
    {
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec)
            LOG_WARN("Could not remove temporary file %s: %s", path.c_str(), ec.message().c_str());
    }

    std::string path;
};

MediaSource MediaSource::fromFile(const std::string &path)
{
    std::error_code ec;
    uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec)
        throw std::runtime_error("Cannot open " + path + ": " + ec.message());

    MediaSource src;
    src.m_path = path;
    src.m_name = std::filesystem::path(path).filename().string();
    src.m_size = static_cast<uint64_t>(size);
    return src;
}

MediaSource MediaSource::fromBuffer(ByteBuffer bytes, std::string name)
{
    MediaSource src;
    src.m_size = bytes.size();
    src.m_bytes = std::make_shared<const ByteBuffer>(std::move(bytes));
    src.m_name = std::move(name);
    return src;
}

MediaSource MediaSource::fromTemporaryFile(const std::string &path)
{
    // Take ownership first so the file is removed even if it cannot be stat'ed
    auto guard = std::make_shared<TemporaryFile>(path);
    MediaSource src = fromFile(path);
    src.m_temporary = std::move(guard);
    return src;
}

const ByteBuffer &MediaSource::bytes() const
{
    if (!m_bytes)
        throw std::logic_error("MediaSource::bytes() called on a file source");
    return *m_bytes;
}

ByteBuffer MediaSource::readAll() const
{
    if (m_bytes)
        return *m_bytes;
    return read_file_bytes(m_path);
}

std::string make_temp_path(const std::string &suffix)
{
    static std::atomic<unsigned> s_counter{0};
    static const unsigned s_session = std::random_device{}();

    char name[64];
    snprintf(name, sizeof(name), "tovl-%08x-%u", s_session, s_counter.fetch_add(1));
    std::filesystem::path p = std::filesystem::temp_directory_path() / (std::string(name) + suffix);
    return p.string();
}
