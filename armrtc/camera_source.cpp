#include "camera_source.h"
#include "armrtc.h"
#include <fmt/core.h>
#include "robot_link.h"
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <thread>

#define GRAB_RETRY_SLEEP_MS 10

//-------------------------------------------------------------
// CameraSource
CameraSource::CameraSource(unsigned int width_in, unsigned int height_in, int max_retries_in)
    : width(width_in), height(height_in), max_retries(max_retries_in)
{
    if (width == 0 || height == 0)
        throw std::invalid_argument("CameraSource: width and height must be > 0");
    if (max_retries < 1)
        throw std::invalid_argument("CameraSource: max_retries must be >= 1");
}

void CameraSource::start() {
    if (running) return;
    do_start();
    running = true;
    fmt::print("[CAM] {} camera started ({}x{})\n", get_type(), width, height);
}

void CameraSource::stop() {
    if (!running) return;
    running = false;
    do_stop();
    fmt::print("[CAM] {} camera stopped\n", get_type());
}

std::optional<RgbFrame> CameraSource::grab() {
    if (!running) {
        n_dropped++;
        return std::nullopt;
    }
    for (int attempt = 0; attempt < max_retries; ++attempt) {
        std::optional<RgbFrame> f = try_grab();
        if (f && !f->empty()) {
            if (f->width != width || f->height != height)
                return crop_and_resize(*f, width, height);
            return f;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(GRAB_RETRY_SLEEP_MS));
    }
    n_dropped++;
    fmt::print(stderr, "[CAM] No frame after {} attempts\n", max_retries);
    return std::nullopt;
}

RgbFrame crop_and_resize(const RgbFrame& in, unsigned int out_width, unsigned int out_height) {
    if (in.width == 0 || in.height == 0 || in.data.size() != size_t(in.width) * in.height * 3)
        throw std::invalid_argument("crop_and_resize: malformed input frame");

    if (in.width == out_width && in.height == out_height) return in;

    unsigned int x0 = 0, y0 = 0, cw = in.width, ch = in.height;
    const uint64_t src_span = uint64_t(in.width) * out_height;
    const uint64_t dst_span = uint64_t(in.height) * out_width;
    if (src_span > dst_span) {
        // wider: crop the sides
        cw = std::max(1u, static_cast<unsigned int>(dst_span / out_height));
        x0 = (in.width - cw) / 2;
    } else if (src_span < dst_span) {
        // taller: crop top and bottom
        ch = std::max(1u, static_cast<unsigned int>(src_span / out_width));
        y0 = (in.height - ch) / 2;
    }

    RgbFrame out;
    out.width = out_width;
    out.height = out_height;
    out.data.resize(size_t(out_width) * out_height * 3);
    for (unsigned int y = 0; y < out_height; ++y) {
        const unsigned int sy = y0 + static_cast<unsigned int>((y + 0.5) * ch / out_height);
        for (unsigned int x = 0; x < out_width; ++x) {
            const unsigned int sx = x0 + static_cast<unsigned int>((x + 0.5) * cw / out_width);
            std::memcpy(&out.data[(size_t(y) * out_width + x) * 3],
                        &in.data[(size_t(sy) * in.width + sx) * 3], 3);
        }
    }
    return out;
}

//-------------------------------------------------------------
// SyntheticCamera
SyntheticCamera::SyntheticCamera(unsigned int width_in, unsigned int height_in)
    : CameraSource(width_in, height_in, 1)
{}

void SyntheticCamera::do_start() { frame_cnt = 0; }
void SyntheticCamera::do_stop() {}

std::optional<RgbFrame> SyntheticCamera::try_grab() {
    RgbFrame f;
    f.width = width;
    f.height = height;
    f.data.resize(size_t(width) * height * 3);
    const unsigned int shift = static_cast<unsigned int>(frame_cnt++ % 256);
    for (unsigned int y = 0; y < height; ++y) {
        for (unsigned int x = 0; x < width; ++x) {
            uint8_t* px = &f.data[(size_t(y) * width + x) * 3];
            px[0] = static_cast<uint8_t>((x * 255 / width + shift) % 256);
            px[1] = static_cast<uint8_t>(y * 255 / height);
            px[2] = static_cast<uint8_t>(shift);
        }
    }
    return f;
}

//-------------------------------------------------------------
// ShmCamera
ShmCamera::ShmCamera(const std::string& stream_in, unsigned int width_in, unsigned int height_in,
                     int max_retries_in, unsigned int frame_timeout_ms)
    : CameraSource(width_in, height_in, max_retries_in),
      stream(stream_in),
      frame_timeout(frame_timeout_ms)
{}

ShmCamera::~ShmCamera() {
    if (open) ImageStreamIO_closeIm(&im);
}

void ShmCamera::do_start() {
    if (ImageStreamIO_openIm(&im, stream.c_str()) != IMAGESTREAMIO_SUCCESS)
        throw HardwareFault("Failed to open camera SHM \"" + stream + "\"");
    if (im.md->datatype != _DATATYPE_UINT8 || im.md->naxis != 3 || im.md->size[0] != 3) {
        ImageStreamIO_closeIm(&im);
        throw HardwareFault("Camera SHM \"" + stream + "\" is not an interleaved 8-bit RGB stream");
    }
    open = true;
    last_cnt = im.md->cnt0;
}

void ShmCamera::do_stop() {
    if (!open) return;
    ImageStreamIO_closeIm(&im);
    open = false;
}

std::optional<RgbFrame> ShmCamera::try_grab() {
    // Wait for a frame newer than the last one we handed out.
    const auto deadline = std::chrono::steady_clock::now() + frame_timeout;
    while (im.md->cnt0 == last_cnt || im.md->write) {
        if (std::chrono::steady_clock::now() > deadline) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    const uint64_t cnt = im.md->cnt0;

    RgbFrame f;
    f.width = im.md->size[1];
    f.height = im.md->size[2];
    f.data.assign(im.array.UI8, im.array.UI8 + size_t(f.width) * f.height * 3);
    if (im.md->cnt0 != cnt) return std::nullopt; // overwritten while copying
    last_cnt = cnt;
    return f;
}

//-------------------------------------------------------------
std::unique_ptr<CameraSource> make_camera(const arm_camera& cfg) {
    if (cfg.backend == "synthetic") {
        return std::make_unique<SyntheticCamera>(cfg.width, cfg.height);
    } else if (cfg.backend == "shm") {
        return std::make_unique<ShmCamera>(cfg.stream, cfg.width, cfg.height,
                                           cfg.max_retries, cfg.frame_timeout_ms);
    }
    throw std::runtime_error("Invalid camera backend: " + cfg.backend);
}
