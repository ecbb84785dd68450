#include <catch2/catch.hpp>

#include "overlay_renderer.h"

struct GrayImage
{
    GrayImage(int w, int h) : width(w), height(h), pixels(static_cast<size_t>(w) * h * 4, 200) {}

    RgbaSurface surface()
    {
        RgbaSurface s;
        s.data = pixels.data();
        s.stride = width * 4;
        s.width = width;
        s.height = height;
        return s;
    }

    uint8_t red(int x, int y) const { return pixels[(static_cast<size_t>(y) * width + x) * 4]; }

    int width;
    int height;
    std::vector<uint8_t> pixels;
};

static TelemetryFrame sample_frame()
{
    TelemetryFrame t;
    t.hr = 150;
    t.paceSecondsPerKm = 330;
    t.distanceKm = 3.25;
    t.elapsedTime = "12:34";
    return t;
}

TEST_CASE("Overlay lines per template", "[overlay]")
{
    OverlayConfig config;
    auto classic = PanelOverlayRenderer::overlayLines(sample_frame(), config);
    REQUIRE(classic.size() == 4);
    CHECK(classic[0] == "HR 150 BPM");
    CHECK(classic[1] == "PACE 5:30 /KM");
    CHECK(classic[2] == "DIST 3.25 KM");
    CHECK(classic[3] == "TIME 12:34");

    config.templateId = "minimal";
    auto minimal = PanelOverlayRenderer::overlayLines(sample_frame(), config);
    REQUIRE(minimal.size() == 4);
    CHECK(minimal[0] == "150 BPM");
    CHECK(minimal[1] == "5:30 /KM");
    CHECK(minimal[3] == "12:34");
}

TEST_CASE("Missing metrics are shown as dashes", "[overlay]")
{
    TelemetryFrame t;
    t.elapsedTime = "0:00";
    auto lines = PanelOverlayRenderer::overlayLines(t, OverlayConfig());
    CHECK(lines[0] == "HR -- BPM");
    CHECK(lines[1] == "PACE --:-- /KM");
    CHECK(lines[2] == "DIST 0.00 KM");
}

TEST_CASE("Disabled metrics are left out", "[overlay]")
{
    OverlayConfig config;
    config.showHr = false;
    config.showDistance = false;
    auto lines = PanelOverlayRenderer::overlayLines(sample_frame(), config);
    REQUIRE(lines.size() == 2);
    CHECK(lines[0] == "PACE 5:30 /KM");
    CHECK(lines[1] == "TIME 12:34");
}

TEST_CASE("Template names and glyph scale", "[overlay]")
{
    CHECK(is_known_overlay_template("classic"));
    CHECK(is_known_overlay_template("minimal"));
    CHECK_FALSE(is_known_overlay_template("fancy"));

    CHECK(overlay_glyph_scale(1080, 100) == 3);
    CHECK(overlay_glyph_scale(360, 100) == 1);
    CHECK(overlay_glyph_scale(2160, 50) == 3);
    CHECK(overlay_glyph_scale(240, 10) == 1);
}

TEST_CASE("Classic panel is drawn in the configured corner", "[overlay]")
{
    PanelOverlayRenderer renderer;
    TelemetryFrame t = sample_frame();
    OverlayConfig config;

    SECTION("bottom left")
    {
        GrayImage img(640, 360);
        RgbaSurface s = img.surface();
        renderer.render(s, &t, 640, 360, config);
        // Panel corner at the margin, background blended at 60%
        CHECK(img.red(12, 303) == 80);
        CHECK(img.red(11, 303) == 200);
        CHECK(img.red(0, 0) == 200);
        CHECK(img.red(600, 20) == 200);
    }

    SECTION("top right")
    {
        config.position = OverlayPosition::TopRight;
        GrayImage img(640, 360);
        RgbaSurface s = img.surface();
        renderer.render(s, &t, 640, 360, config);
        CHECK(img.red(543, 12) == 80);
        CHECK(img.red(12, 303) == 200);
    }
}

TEST_CASE("Minimal template draws text without a panel", "[overlay]")
{
    PanelOverlayRenderer renderer;
    TelemetryFrame t = sample_frame();
    OverlayConfig config;
    config.templateId = "minimal";

    GrayImage img(640, 360);
    RgbaSurface s = img.surface();
    renderer.render(s, &t, 640, 360, config);
    CHECK(img.red(12, 303) == 200);
    CHECK(img.red(18, 307) == 255); // top of the "1" in "150 BPM"
}

TEST_CASE("No telemetry leaves the frame untouched", "[overlay]")
{
    PanelOverlayRenderer renderer;
    GrayImage img(320, 240);
    std::vector<uint8_t> before = img.pixels;
    RgbaSurface s = img.surface();
    renderer.render(s, nullptr, 320, 240, OverlayConfig());
    CHECK(img.pixels == before);
}
