#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind
{
    ParseFailure,
    NoVideoTrack,
    UnsupportedCodec,
    NoKeyframe,
    UnsupportedConfiguration,
    EmptyOutput,
    Cancelled,
    TranscodeFailure,
    CodecFailure,
    MuxFailure
};

const char *error_kind_name(ErrorKind kind);

// Terminal failure of a processing run. what() is the human-readable message,
// detail() carries optional diagnostics such as captured tool output.
class PipelineError : public std::runtime_error
{
public:
    PipelineError(ErrorKind kind, const std::string &message, std::string detail = {});

    ErrorKind kind() const noexcept { return m_kind; }
    const std::string &detail() const noexcept { return m_detail; }

private:
    ErrorKind m_kind;
    std::string m_detail;
};

// Raised by container writers when the container layer rejects a stream,
// the header, a packet or the trailer. The buffered muxer retries video-only on it.
class ContainerMuxError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
