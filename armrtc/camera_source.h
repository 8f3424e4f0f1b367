#pragma once

#include "arm_types.h"
#include <ImageStreamIO.h>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

// Fixed-shape RGB frames for the policy. start()/stop() are idempotent and
// grab() retries a bounded number of times before reporting a dropped frame
// as an empty optional.
class CameraSource {
public:
    CameraSource(unsigned int width, unsigned int height, int max_retries);
    virtual ~CameraSource() = default;

    void start();
    void stop();
    bool is_running() const { return running; }

    std::optional<RgbFrame> grab();

    unsigned int get_width() const { return width; }
    unsigned int get_height() const { return height; }
    long get_dropped() const { return n_dropped; }
    virtual std::string get_type() const = 0;

protected:
    virtual void do_start() = 0;
    virtual void do_stop() = 0;
    // One capture attempt, in whatever shape the device delivers.
    virtual std::optional<RgbFrame> try_grab() = 0;

    unsigned int width, height;

private:
    int max_retries;
    bool running = false;
    long n_dropped = 0;
};

// Centre crop to the output aspect ratio, then nearest-neighbour resize.
RgbFrame crop_and_resize(const RgbFrame& in, unsigned int out_width, unsigned int out_height);

// ============================ SyntheticCamera ================================
// Moving colour ramp. Lets the whole loop run with no camera attached.
class SyntheticCamera : public CameraSource {
public:
    SyntheticCamera(unsigned int width, unsigned int height);
    std::string get_type() const override { return "synthetic"; }

protected:
    void do_start() override;
    void do_stop() override;
    std::optional<RgbFrame> try_grab() override;

private:
    unsigned long frame_cnt = 0;
};

// =============================== ShmCamera ===================================
// Interleaved 8-bit RGB ImageStreamIO stream: naxis 3, size = {3, W, H}.
class ShmCamera : public CameraSource {
public:
    ShmCamera(const std::string& stream, unsigned int width, unsigned int height,
              int max_retries, unsigned int frame_timeout_ms);
    ~ShmCamera() override;
    std::string get_type() const override { return "shm"; }

protected:
    void do_start() override;
    void do_stop() override;
    std::optional<RgbFrame> try_grab() override;

private:
    std::string stream;
    std::chrono::milliseconds frame_timeout;
    IMAGE im;
    bool open = false;
    uint64_t last_cnt = 0;
};

struct arm_camera;
// Factory: "synthetic" or "shm".
std::unique_ptr<CameraSource> make_camera(const arm_camera& cfg);
