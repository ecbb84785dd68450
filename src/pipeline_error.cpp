#include "pipeline_error.h"

#include <utility>

const char *error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::ParseFailure:
        return "ParseFailure";
    case ErrorKind::NoVideoTrack:
        return "NoVideoTrack";
    case ErrorKind::UnsupportedCodec:
        return "UnsupportedCodec";
    case ErrorKind::NoKeyframe:
        return "NoKeyframe";
    case ErrorKind::UnsupportedConfiguration:
        return "UnsupportedConfiguration";
    case ErrorKind::EmptyOutput:
        return "EmptyOutput";
    case ErrorKind::Cancelled:
        return "Cancelled";
    case ErrorKind::TranscodeFailure:
        return "TranscodeFailure";
    case ErrorKind::CodecFailure:
        return "CodecFailure";
    case ErrorKind::MuxFailure:
        return "MuxFailure";
    default:
        return "Unknown";
    }
}

PipelineError::PipelineError(ErrorKind kind, const std::string &message, std::string detail)
    : std::runtime_error(message), m_kind(kind), m_detail(std::move(detail))
{
}
