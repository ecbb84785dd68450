#pragma once

#include <cstdint>

#include "external_transcoder.h"
#include "media_source.h"
#include "pipeline_types.h"

// Parse a container into normalized microsecond samples for the best video track
// and, when the container layer can carry it, the best audio track.
// Throws PipelineError(NoVideoTrack) or PipelineError(ParseFailure).
DemuxResult demux(const MediaSource &source);

// demux() with one repair attempt: when the first parse throws or finds no video
// samples, the container is repacked by the transcoder and parsed again. Sources of
// repackMaxBytes or more are not repaired. On success the result never has an
// empty videoSamples list. usedSource, when given, receives the source that parsed.
DemuxResult demux_with_fallback(const MediaSource &source,
                                IExternalTranscoder &transcoder,
                                const ProgressCallback &onProgress,
                                uint64_t repackMaxBytes,
                                MediaSource *usedSource = nullptr);

// Encode planning input for a parsed source
VideoMeta describe_video(const DemuxResult &result, uint64_t fileSizeBytes);
