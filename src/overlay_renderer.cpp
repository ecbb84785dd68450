#include "overlay_renderer.h"
#include "telemetry.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

struct Glyph
{
    char ch;
    uint8_t rows[7]; // bit 4 is the leftmost column
};

static const Glyph kGlyphs[] = {
    {'0', {0x0E, 0x11, 0x13, 0x15, 0x19, 0x11, 0x0E}},
    {'1', {0x04, 0x0C, 0x04, 0x04, 0x04, 0x04, 0x0E}},
    {'2', {0x0E, 0x11, 0x01, 0x02, 0x04, 0x08, 0x1F}},
    {'3', {0x1F, 0x02, 0x04, 0x02, 0x01, 0x11, 0x0E}},
    {'4', {0x02, 0x06, 0x0A, 0x12, 0x1F, 0x02, 0x02}},
    {'5', {0x1F, 0x10, 0x1E, 0x01, 0x01, 0x11, 0x0E}},
    {'6', {0x06, 0x08, 0x10, 0x1E, 0x11, 0x11, 0x0E}},
    {'7', {0x1F, 0x01, 0x02, 0x04, 0x08, 0x08, 0x08}},
    {'8', {0x0E, 0x11, 0x11, 0x0E, 0x11, 0x11, 0x0E}},
    {'9', {0x0E, 0x11, 0x11, 0x0F, 0x01, 0x02, 0x0C}},
    {':', {0x00, 0x0C, 0x0C, 0x00, 0x0C, 0x0C, 0x00}},
    {'.', {0x00, 0x00, 0x00, 0x00, 0x00, 0x0C, 0x0C}},
    {'-', {0x00, 0x00, 0x00, 0x1F, 0x00, 0x00, 0x00}},
    {'/', {0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x00}},
    {'A', {0x0E, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}},
    {'B', {0x1E, 0x11, 0x11, 0x1E, 0x11, 0x11, 0x1E}},
    {'C', {0x0E, 0x11, 0x10, 0x10, 0x10, 0x11, 0x0E}},
    {'D', {0x1C, 0x12, 0x11, 0x11, 0x11, 0x12, 0x1C}},
    {'E', {0x1F, 0x10, 0x10, 0x1E, 0x10, 0x10, 0x1F}},
    {'H', {0x11, 0x11, 0x11, 0x1F, 0x11, 0x11, 0x11}},
    {'I', {0x0E, 0x04, 0x04, 0x04, 0x04, 0x04, 0x0E}},
    {'K', {0x11, 0x12, 0x14, 0x18, 0x14, 0x12, 0x11}},
    {'M', {0x11, 0x1B, 0x15, 0x15, 0x11, 0x11, 0x11}},
    {'P', {0x1E, 0x11, 0x11, 0x1E, 0x10, 0x10, 0x10}},
    {'R', {0x1E, 0x11, 0x11, 0x1E, 0x14, 0x12, 0x11}},
    {'S', {0x0F, 0x10, 0x10, 0x0E, 0x01, 0x01, 0x1E}},
    {'T', {0x1F, 0x04, 0x04, 0x04, 0x04, 0x04, 0x04}},
};

static constexpr int kGlyphWidth = 5;
static constexpr int kGlyphHeight = 7;
static constexpr int kAdvance = kGlyphWidth + 1;
static constexpr int kLineHeight = kGlyphHeight + 3;

static const Glyph *find_glyph(char c)
{
    for (const Glyph &g : kGlyphs)
    {
        if (g.ch == c)
            return &g;
    }
    return nullptr; // drawn as a blank
}

static void blend_pixel(uint8_t *px, uint8_t r, uint8_t g, uint8_t b, double alpha)
{
    px[0] = static_cast<uint8_t>(std::lround(px[0] * (1.0 - alpha) + r * alpha));
    px[1] = static_cast<uint8_t>(std::lround(px[1] * (1.0 - alpha) + g * alpha));
    px[2] = static_cast<uint8_t>(std::lround(px[2] * (1.0 - alpha) + b * alpha));
    px[3] = 255;
}

static void fill_rect(RgbaSurface &s, int x, int y, int w, int h, uint8_t r, uint8_t g, uint8_t b, double alpha)
{
    int x0 = std::max(0, x);
    int y0 = std::max(0, y);
    int x1 = std::min(s.width, x + w);
    int y1 = std::min(s.height, y + h);
    for (int yy = y0; yy < y1; ++yy)
    {
        uint8_t *row = s.data + static_cast<size_t>(yy) * s.stride;
        for (int xx = x0; xx < x1; ++xx)
            blend_pixel(row + xx * 4, r, g, b, alpha);
    }
}

static void draw_text(RgbaSurface &s, const std::string &text, int x, int y, int scale,
                      uint8_t r, uint8_t g, uint8_t b)
{
    for (size_t i = 0; i < text.size(); ++i)
    {
        const Glyph *glyph = find_glyph(text[i]);
        if (!glyph)
            continue;
        int gx = x + static_cast<int>(i) * kAdvance * scale;
        for (int row = 0; row < kGlyphHeight; ++row)
        {
            for (int col = 0; col < kGlyphWidth; ++col)
            {
                if (glyph->rows[row] & (0x10 >> col))
                    fill_rect(s, gx + col * scale, y + row * scale, scale, scale, r, g, b, 1.0);
            }
        }
    }
}

bool is_known_overlay_template(const std::string &templateId)
{
    return templateId == "classic" || templateId == "minimal";
}

int overlay_glyph_scale(int frameHeight, int fontSizePercent)
{
    double scale = frameHeight / 360.0 * std::max(1, fontSizePercent) / 100.0;
    return std::max(1, static_cast<int>(std::lround(scale)));
}

std::vector<std::string> PanelOverlayRenderer::overlayLines(const TelemetryFrame &telemetry, const OverlayConfig &config)
{
    bool labels = config.templateId != "minimal";
    std::vector<std::string> lines;
    char buf[64];

    if (config.showHr)
    {
        if (telemetry.hr)
            snprintf(buf, sizeof(buf), "%d BPM", *telemetry.hr);
        else
            snprintf(buf, sizeof(buf), "-- BPM");
        lines.push_back(labels ? std::string("HR ") + buf : buf);
    }
    if (config.showPace)
    {
        std::string pace = telemetry.paceSecondsPerKm ? format_pace(*telemetry.paceSecondsPerKm) : "--:--";
        lines.push_back((labels ? "PACE " : "") + pace + " /KM");
    }
    if (config.showDistance)
    {
        snprintf(buf, sizeof(buf), "%.2f KM", telemetry.distanceKm);
        lines.push_back(labels ? std::string("DIST ") + buf : buf);
    }
    if (config.showTime)
        lines.push_back((labels ? "TIME " : "") + telemetry.elapsedTime);
    return lines;
}

void PanelOverlayRenderer::render(RgbaSurface &surface, const TelemetryFrame *telemetry,
                                  int width, int height, const OverlayConfig &config)
{
    if (!telemetry || !surface.data)
        return;

    std::vector<std::string> lines = overlayLines(*telemetry, config);
    if (lines.empty())
        return;

    int scale = overlay_glyph_scale(height, config.fontSizePercent);
    size_t longest = 0;
    for (const auto &line : lines)
        longest = std::max(longest, line.size());

    int pad = 4 * scale;
    int margin = 12 * scale;
    int panelW = static_cast<int>(longest) * kAdvance * scale - scale + 2 * pad;
    int panelH = static_cast<int>(lines.size()) * kLineHeight * scale - 3 * scale + 2 * pad;

    bool left = config.position == OverlayPosition::TopLeft || config.position == OverlayPosition::BottomLeft;
    bool top = config.position == OverlayPosition::TopLeft || config.position == OverlayPosition::TopRight;
    int x = left ? margin : width - margin - panelW;
    int y = top ? margin : height - margin - panelH;

    bool minimal = config.templateId == "minimal";
    if (!minimal)
    {
        double opacity = std::clamp(config.backgroundOpacity, 0.0, 1.0);
        fill_rect(surface, x, y, panelW, panelH, 0, 0, 0, opacity);
    }

    for (size_t i = 0; i < lines.size(); ++i)
    {
        int tx = x + pad;
        int ty = y + pad + static_cast<int>(i) * kLineHeight * scale;
        if (minimal)
            draw_text(surface, lines[i], tx + scale, ty + scale, scale, 0, 0, 0);
        draw_text(surface, lines[i], tx, ty, scale, 255, 255, 255);
    }
}
