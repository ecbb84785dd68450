#include "frame_compositor.h"
#include "logger.h"

extern "C"
{
#include <libavutil/pixdesc.h>
}

#include <stdexcept>

SwsFrameCompositor::SwsFrameCompositor(IOverlayRenderer &renderer, OverlayConfig config,
                                       int dstW, int dstH, AVPixelFormat dstFormat)
    : m_renderer(renderer), m_config(std::move(config)), m_dstW(dstW), m_dstH(dstH), m_dstFormat(dstFormat)
{
    m_rgba = make_frame();
    m_rgba->format = AV_PIX_FMT_RGBA;
    m_rgba->width = m_dstW;
    m_rgba->height = m_dstH;
    ff_check(av_frame_get_buffer(m_rgba.get(), 32), "alloc RGBA surface");

    m_sws_to_out = sws_getContext(
        m_dstW, m_dstH, AV_PIX_FMT_RGBA,
        m_dstW, m_dstH, m_dstFormat,
        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_sws_to_out)
        throw std::runtime_error(std::string("Cannot convert RGBA to ") + av_get_pix_fmt_name(m_dstFormat));
    const int *coeffs = sws_getCoefficients(SWS_CS_ITU709);
    sws_setColorspaceDetails(m_sws_to_out, coeffs, 1, coeffs, 0, 0, 1 << 16, 1 << 16);
}

SwsFrameCompositor::~SwsFrameCompositor()
{
    shutdown();
}

FramePtr SwsFrameCompositor::composite(const AVFrame *decoded, const TelemetryFrame *telemetry)
{
    if (!decoded)
        throw std::invalid_argument("composite: null frame");

    // Rebuild the input converter when the decoded format or size changes
    if (!m_sws_to_rgba || m_last_src_format != decoded->format ||
        m_last_src_w != decoded->width || m_last_src_h != decoded->height)
    {
        if (m_sws_to_rgba)
            sws_freeContext(m_sws_to_rgba);
        m_sws_to_rgba = sws_getContext(
            decoded->width, decoded->height, (AVPixelFormat)decoded->format,
            m_dstW, m_dstH, AV_PIX_FMT_RGBA,
            SWS_BILINEAR, nullptr, nullptr, nullptr);
        if (!m_sws_to_rgba)
            throw std::runtime_error("Cannot convert decoded frames to RGBA");
        const int *coeffs = (decoded->colorspace == AVCOL_SPC_BT2020_NCL)
                                ? sws_getCoefficients(SWS_CS_BT2020)
                                : sws_getCoefficients(SWS_CS_ITU709);
        int srcRange = decoded->color_range == AVCOL_RANGE_JPEG ? 1 : 0;
        sws_setColorspaceDetails(m_sws_to_rgba, coeffs, srcRange, coeffs, 1, 0, 1 << 16, 1 << 16);
        m_last_src_format = decoded->format;
        m_last_src_w = decoded->width;
        m_last_src_h = decoded->height;
        LOG_DEBUG("Compositor input %dx%d %s -> %dx%d %s", decoded->width, decoded->height,
                  av_get_pix_fmt_name((AVPixelFormat)decoded->format), m_dstW, m_dstH,
                  av_get_pix_fmt_name(m_dstFormat));
    }

    ff_check(av_frame_make_writable(m_rgba.get()), "make RGBA surface writable");
    sws_scale(m_sws_to_rgba, decoded->data, decoded->linesize, 0, decoded->height,
              m_rgba->data, m_rgba->linesize);

    RgbaSurface surface;
    surface.data = m_rgba->data[0];
    surface.stride = m_rgba->linesize[0];
    surface.width = m_dstW;
    surface.height = m_dstH;
    m_renderer.render(surface, telemetry, m_dstW, m_dstH, m_config);

    // A fresh frame per call: the encoder queue keeps it until it is encoded
    FramePtr out = make_frame();
    out->format = m_dstFormat;
    out->width = m_dstW;
    out->height = m_dstH;
    ff_check(av_frame_get_buffer(out.get(), 32), "alloc encoder frame");
    sws_scale(m_sws_to_out, m_rgba->data, m_rgba->linesize, 0, m_dstH, out->data, out->linesize);

    out->pts = decoded->pts;
    out->duration = decoded->duration;
    out->color_range = AVCOL_RANGE_MPEG;
    out->colorspace = AVCOL_SPC_BT709;
    return out;
}

void SwsFrameCompositor::shutdown()
{
    if (m_sws_to_rgba)
    {
        sws_freeContext(m_sws_to_rgba);
        m_sws_to_rgba = nullptr;
    }
    if (m_sws_to_out)
    {
        sws_freeContext(m_sws_to_out);
        m_sws_to_out = nullptr;
    }
}

FrameCompositorFactory sws_compositor_factory(IOverlayRenderer &renderer, const OverlayConfig &config)
{
    return [&renderer, config](int width, int height, AVPixelFormat format) -> std::unique_ptr<IFrameCompositor>
    {
        return std::make_unique<SwsFrameCompositor>(renderer, config, width, height, format);
    };
}
