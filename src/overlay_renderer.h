#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "pipeline_types.h"

// Writable view of a packed RGBA image
struct RgbaSurface
{
    uint8_t *data = nullptr;
    int stride = 0; // bytes per row
    int width = 0;
    int height = 0;
};

// Draws the telemetry overlay for one video instant onto a frame-sized surface.
// telemetry is null when the timeline has no data for the instant.
class IOverlayRenderer
{
public:
    virtual ~IOverlayRenderer() = default;
    virtual void render(RgbaSurface &surface, const TelemetryFrame *telemetry,
                        int width, int height, const OverlayConfig &config) = 0;
};

// Corner panel with one line per enabled metric, drawn with a 5x7 bitmap font.
// Templates: "classic" (labelled lines on a translucent panel), "minimal" (values only, shadowed).
class PanelOverlayRenderer : public IOverlayRenderer
{
public:
    void render(RgbaSurface &surface, const TelemetryFrame *telemetry,
                int width, int height, const OverlayConfig &config) override;

    // Text lines the panel shows for a sample
    static std::vector<std::string> overlayLines(const TelemetryFrame &telemetry, const OverlayConfig &config);
};

bool is_known_overlay_template(const std::string &templateId);

// Glyph scale for a frame height: 1080p at 100% draws 3x3 pixel dots
int overlay_glyph_scale(int frameHeight, int fontSizePercent);
