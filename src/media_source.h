#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "pipeline_types.h"

// Random-access byte source for a video: a file on disk or an in-memory buffer.
// Copies share the underlying data. Sources produced by the transcoder own a
// temporary file that is removed when the last copy goes away.
class MediaSource
{
public:
    MediaSource() = default;

    static MediaSource fromFile(const std::string &path);
    static MediaSource fromBuffer(ByteBuffer bytes, std::string name = "memory");
    static MediaSource fromTemporaryFile(const std::string &path);

    bool isFile() const { return !m_path.empty(); }
    bool empty() const { return m_size == 0; }
    uint64_t size() const { return m_size; }
    const std::string &name() const { return m_name; }

    // Valid only for file sources
    const std::string &path() const { return m_path; }

    // Valid only for buffer sources
    const ByteBuffer &bytes() const;

    // Full contents, read from disk for file sources
    ByteBuffer readAll() const;

private:
    struct TemporaryFile;

    std::string m_path;
    std::string m_name;
    std::shared_ptr<const ByteBuffer> m_bytes;
    std::shared_ptr<TemporaryFile> m_temporary;
    uint64_t m_size = 0;
};

// Unique path in the system temp directory, e.g. /tmp/tovl-1a2b3c-0.mp4
std::string make_temp_path(const std::string &suffix);
