#pragma once

extern "C"
{
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

#include <functional>
#include <memory>

#include "ffmpeg_utils.h"
#include "overlay_renderer.h"
#include "pipeline_types.h"

// Turns a decoded frame into an encoder-ready frame with the overlay burned in.
// The result carries the decoded frame's pts and duration.
class IFrameCompositor
{
public:
    virtual ~IFrameCompositor() = default;
    virtual FramePtr composite(const AVFrame *decoded, const TelemetryFrame *telemetry) = 0;
};

using FrameCompositorFactory =
    std::function<std::unique_ptr<IFrameCompositor>(int width, int height, AVPixelFormat format)>;

// CPU path: decoded -> RGBA at the encode size -> overlay -> encoder pixel format
class SwsFrameCompositor : public IFrameCompositor
{
public:
    SwsFrameCompositor(IOverlayRenderer &renderer, OverlayConfig config,
                       int dstW, int dstH, AVPixelFormat dstFormat);
    ~SwsFrameCompositor() override;

    SwsFrameCompositor(const SwsFrameCompositor &) = delete;
    SwsFrameCompositor &operator=(const SwsFrameCompositor &) = delete;

    FramePtr composite(const AVFrame *decoded, const TelemetryFrame *telemetry) override;

private:
    void shutdown();

    IOverlayRenderer &m_renderer;
    OverlayConfig m_config;
    int m_dstW = 0, m_dstH = 0;
    AVPixelFormat m_dstFormat = AV_PIX_FMT_NONE;

    SwsContext *m_sws_to_rgba = nullptr;
    SwsContext *m_sws_to_out = nullptr;
    int m_last_src_format = AV_PIX_FMT_NONE;
    int m_last_src_w = 0, m_last_src_h = 0;

    FramePtr m_rgba{nullptr, &av_frame_free_single};
};

// Factory for SwsFrameCompositor sharing one renderer and overlay config
FrameCompositorFactory sws_compositor_factory(IOverlayRenderer &renderer, const OverlayConfig &config);
