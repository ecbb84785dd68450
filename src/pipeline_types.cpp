#include "pipeline_types.h"

const char *phase_name(ProcessingPhase phase)
{
    switch (phase)
    {
    case ProcessingPhase::Demuxing:
        return "demuxing";
    case ProcessingPhase::Encoding:
        return "encoding";
    case ProcessingPhase::Processing:
        return "processing";
    case ProcessingPhase::Muxing:
        return "muxing";
    case ProcessingPhase::Complete:
        return "complete";
    default:
        return "unknown";
    }
}

const char *hardware_tier_name(HardwareTier tier)
{
    switch (tier)
    {
    case HardwareTier::PreferHardware:
        return "prefer-hardware";
    case HardwareTier::NoPreference:
        return "no-preference";
    case HardwareTier::PreferSoftware:
        return "prefer-software";
    default:
        return "unknown";
    }
}
