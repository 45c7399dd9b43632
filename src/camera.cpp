#include "bsl_translate/camera.hpp"
#include <iostream>
#include <cstring>
#include <cerrno>
#include <algorithm>
#include <cmath>
#include <chrono>
#include <thread>

// Raw frame reader: fixed-size frames from a popen'd command (ffmpeg,
// rpicam-vid, gst-launch) or from a file/FIFO.
//  - Resilient to short reads (retries before giving up)
//  - Frames are handed out with the configured rotation metadata; the
//    analysis side is responsible for making them upright

namespace bsl
{
namespace camera
{

    size_t Frame::expected_size() const
    {
        switch (format)
        {
        case PixelFormat::RGB888:
            return static_cast<size_t>(width) * height * 3;
        case PixelFormat::RGBA8888:
            return static_cast<size_t>(width) * height * 4;
        case PixelFormat::YUV420:
            return static_cast<size_t>(width) * height * 3 / 2;
        default:
            return 0;
        }
    }

    FrameProxy::FrameProxy(const Frame *frame, std::function<void()> on_close)
        : frame_(frame), on_close_(std::move(on_close)) {}

    FrameProxy::~FrameProxy() { close(); }

    void FrameProxy::close()
    {
        if (!frame_)
            return;
        frame_ = nullptr;
        if (on_close_)
        {
            auto cb = std::move(on_close_);
            on_close_ = nullptr;
            cb();
        }
    }

    PixelFormat string_to_format(const std::string &s)
    {
        if (s == "rgb" || s == "rgb24" || s == "RGB888")
            return PixelFormat::RGB888;
        if (s == "rgba" || s == "RGBA8888")
            return PixelFormat::RGBA8888;
        if (s == "yuv420" || s == "yuv420p" || s == "i420" || s == "YUV420")
            return PixelFormat::YUV420;
        return PixelFormat::UNKNOWN;
    }

    std::string format_to_string(PixelFormat format)
    {
        switch (format)
        {
        case PixelFormat::RGB888:
            return "rgb";
        case PixelFormat::RGBA8888:
            return "rgba";
        case PixelFormat::YUV420:
            return "yuv420";
        default:
            return "unknown";
        }
    }

    FrameReader::FrameReader()
        : stream_(nullptr), from_pipe_(false), frame_bytes_(0), frame_count_(0) {}

    FrameReader::~FrameReader() { stop(); }

    bool FrameReader::init(const ReaderConfig &config)
    {
        config_ = config;
        if (config_.command.empty() == config_.path.empty())
        {
            last_error_ = "Exactly one of command or path must be set";
            std::cerr << "[FrameReader][ERROR] " << last_error_ << "\n";
            return false;
        }
        if (config_.width == 0 || config_.height == 0)
        {
            last_error_ = "Invalid frame size";
            std::cerr << "[FrameReader][ERROR] " << last_error_ << "\n";
            return false;
        }
        if (config_.rotation_degrees % 90 != 0)
        {
            last_error_ = "Rotation must be a multiple of 90 degrees";
            std::cerr << "[FrameReader][ERROR] " << last_error_ << "\n";
            return false;
        }

        current_frame_.width = config_.width;
        current_frame_.height = config_.height;
        current_frame_.format = config_.format;
        current_frame_.rotation_degrees = config_.rotation_degrees;
        frame_bytes_ = current_frame_.expected_size();
        if (frame_bytes_ == 0)
        {
            last_error_ = "Unsupported pixel format";
            std::cerr << "[FrameReader][ERROR] " << last_error_ << "\n";
            return false;
        }
        current_frame_.data.resize(frame_bytes_);
        current_frame_.size = frame_bytes_;
        current_frame_.stride = config_.format == PixelFormat::RGBA8888 ? config_.width * 4
                                : config_.format == PixelFormat::RGB888 ? config_.width * 3
                                                                        : config_.width;
        if (config_.verbose)
            std::cerr << "[FrameReader] Initialized: " << config_.width << "x" << config_.height
                      << " " << format_to_string(config_.format) << ", " << frame_bytes_ << " bytes/frame\n";
        return true;
    }

    bool FrameReader::start()
    {
        if (frame_bytes_ == 0)
        {
            last_error_ = "Reader not initialized";
            return false;
        }
        if (stream_)
            return true;

        if (!config_.command.empty())
        {
            stream_ = popen(config_.command.c_str(), "r");
            from_pipe_ = true;
        }
        else
        {
            stream_ = std::fopen(config_.path.c_str(), "rb");
            from_pipe_ = false;
        }
        if (!stream_)
        {
            last_error_ = std::string("Failed to open source: ") + std::strerror(errno);
            std::cerr << "[FrameReader][ERROR] " << last_error_ << "\n";
            return false;
        }
        frame_count_ = 0;
        if (config_.verbose)
            std::cerr << "[FrameReader] Started ("
                      << (from_pipe_ ? config_.command : config_.path) << ")\n";
        return true;
    }

    void FrameReader::stop()
    {
        if (!stream_)
            return;
        if (from_pipe_)
            pclose(stream_);
        else
            std::fclose(stream_);
        stream_ = nullptr;
        if (config_.verbose)
            std::cerr << "[FrameReader] Stopped after " << frame_count_ << " frames\n";
    }

    Frame *FrameReader::read_frame()
    {
        if (!stream_)
        {
            last_error_ = "Reader not running";
            return nullptr;
        }

        size_t read_total = 0;
        const int max_retries = 4;
        int retries = 0;
        while (read_total < frame_bytes_)
        {
            size_t n = std::fread(current_frame_.data.data() + read_total, 1, frame_bytes_ - read_total, stream_);
            if (n == 0)
            {
                int err = errno;
                if (std::feof(stream_))
                {
                    last_error_ = "End of stream";
                    if (read_total != 0)
                        std::cerr << "[FrameReader][WARN] Truncated frame at end of stream ("
                                  << read_total << "/" << frame_bytes_ << " bytes)\n";
                    stop();
                    return nullptr;
                }
                if (std::ferror(stream_))
                {
                    last_error_ = std::string("Read error: ") + std::strerror(err);
                    std::cerr << "[FrameReader][ERROR] " << last_error_ << "\n";
                    stop();
                    return nullptr;
                }
                if (++retries > max_retries)
                {
                    last_error_ = "Short read retries exceeded (" + std::to_string(read_total) + "/" +
                                  std::to_string(frame_bytes_) + " bytes)";
                    std::cerr << "[FrameReader][ERROR] " << last_error_ << "\n";
                    stop();
                    return nullptr;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                continue;
            }
            read_total += n;
        }

        auto now = std::chrono::steady_clock::now();
        current_frame_.timestamp_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
        frame_count_++;
        return &current_frame_;
    }

    // Utility functions
    namespace utils
    {

        void yuv420_to_rgb888(const uint8_t *yuv, uint8_t *rgb,
                              uint32_t width, uint32_t height)
        {
            size_t y_size = static_cast<size_t>(width) * height;
            size_t uv_size = (width / 2) * (height / 2);

            const uint8_t *y_plane = yuv;
            const uint8_t *u_plane = yuv + y_size;
            const uint8_t *v_plane = yuv + y_size + uv_size;

            for (uint32_t y = 0; y < height; y++)
            {
                for (uint32_t x = 0; x < width; x++)
                {
                    size_t y_idx = static_cast<size_t>(y) * width + x;
                    size_t uv_idx = (y / 2) * (width / 2) + (x / 2);

                    int Y = y_plane[y_idx];
                    int U = u_plane[uv_idx] - 128;
                    int V = v_plane[uv_idx] - 128;

                    int R = static_cast<int>(Y + (1.402 * V));
                    int G = static_cast<int>(Y - (0.344136 * U) - (0.714136 * V));
                    int B = static_cast<int>(Y + (1.772 * U));

                    size_t rgb_idx = y_idx * 3;
                    rgb[rgb_idx] = static_cast<uint8_t>(std::clamp(R, 0, 255));
                    rgb[rgb_idx + 1] = static_cast<uint8_t>(std::clamp(G, 0, 255));
                    rgb[rgb_idx + 2] = static_cast<uint8_t>(std::clamp(B, 0, 255));
                }
            }
        }

        void rgba8888_to_rgb888(const uint8_t *rgba, uint8_t *rgb,
                                uint32_t width, uint32_t height, int stride)
        {
            size_t row_bytes = stride > 0 ? static_cast<size_t>(stride) : static_cast<size_t>(width) * 4;
            for (uint32_t y = 0; y < height; y++)
            {
                const uint8_t *src = rgba + y * row_bytes;
                uint8_t *dst = rgb + static_cast<size_t>(y) * width * 3;
                for (uint32_t x = 0; x < width; x++)
                {
                    dst[x * 3] = src[x * 4];
                    dst[x * 3 + 1] = src[x * 4 + 1];
                    dst[x * 3 + 2] = src[x * 4 + 2];
                }
            }
        }

        bool rotate_rgb888(const uint8_t *src, uint8_t *dst,
                           uint32_t width, uint32_t height, int degrees,
                           uint32_t &dst_w, uint32_t &dst_h)
        {
            int d = ((degrees % 360) + 360) % 360;
            if (d % 90 != 0)
                return false;

            dst_w = (d == 90 || d == 270) ? height : width;
            dst_h = (d == 90 || d == 270) ? width : height;

            for (uint32_t y = 0; y < height; y++)
            {
                for (uint32_t x = 0; x < width; x++)
                {
                    uint32_t nx = x, ny = y;
                    switch (d)
                    {
                    case 90:
                        nx = height - 1 - y;
                        ny = x;
                        break;
                    case 180:
                        nx = width - 1 - x;
                        ny = height - 1 - y;
                        break;
                    case 270:
                        nx = y;
                        ny = width - 1 - x;
                        break;
                    default:
                        break;
                    }
                    const uint8_t *s = src + (static_cast<size_t>(y) * width + x) * 3;
                    uint8_t *t = dst + (static_cast<size_t>(ny) * dst_w + nx) * 3;
                    t[0] = s[0];
                    t[1] = s[1];
                    t[2] = s[2];
                }
            }
            return true;
        }

        void resize_bilinear(const uint8_t *src, uint8_t *dst,
                             uint32_t src_w, uint32_t src_h,
                             uint32_t dst_w, uint32_t dst_h,
                             int channels)
        {
            const int sw = static_cast<int>(src_w);
            const int sh = static_cast<int>(src_h);
            for (uint32_t y = 0; y < dst_h; ++y)
            {
                float src_y = (y + 0.5f) * sh / dst_h - 0.5f;
                int y0 = static_cast<int>(std::floor(src_y));
                int y1 = std::min(y0 + 1, sh - 1);
                float wy = src_y - y0;
                y0 = std::clamp(y0, 0, sh - 1);
                y1 = std::max(y1, 0);
                for (uint32_t x = 0; x < dst_w; ++x)
                {
                    float src_x = (x + 0.5f) * sw / dst_w - 0.5f;
                    int x0 = static_cast<int>(std::floor(src_x));
                    int x1 = std::min(x0 + 1, sw - 1);
                    float wx = src_x - x0;
                    x0 = std::clamp(x0, 0, sw - 1);
                    x1 = std::max(x1, 0);
                    for (int c = 0; c < channels; ++c)
                    {
                        float v00 = src[(y0 * sw + x0) * channels + c];
                        float v01 = src[(y0 * sw + x1) * channels + c];
                        float v10 = src[(y1 * sw + x0) * channels + c];
                        float v11 = src[(y1 * sw + x1) * channels + c];
                        float v0 = v00 * (1 - wx) + v01 * wx;
                        float v1 = v10 * (1 - wx) + v11 * wx;
                        float v = v0 * (1 - wy) + v1 * wy;
                        dst[(y * dst_w + x) * channels + c] = static_cast<uint8_t>(std::clamp(v, 0.0f, 255.0f));
                    }
                }
            }
        }

        bool frame_to_image(const Frame &frame, Image &image)
        {
            size_t needed = frame.expected_size();
            if (needed != 0 && frame.stride > 0 && frame.height > 0 &&
                (frame.format == PixelFormat::RGB888 || frame.format == PixelFormat::RGBA8888))
            {
                const size_t bpp = frame.format == PixelFormat::RGBA8888 ? 4 : 3;
                needed = static_cast<size_t>(frame.stride) * (frame.height - 1) + frame.width * bpp;
            }
            if (needed == 0 || frame.data.size() < needed)
            {
                std::cerr << "[Camera][ERROR] Frame buffer too small: " << frame.data.size()
                          << "/" << needed << " bytes\n";
                return false;
            }

            std::vector<uint8_t> rgb(static_cast<size_t>(frame.width) * frame.height * 3);
            switch (frame.format)
            {
            case PixelFormat::RGB888:
                if (frame.stride > 0 && static_cast<uint32_t>(frame.stride) != frame.width * 3)
                {
                    for (uint32_t row = 0; row < frame.height; ++row)
                        std::memcpy(&rgb[static_cast<size_t>(row) * frame.width * 3],
                                    &frame.data[static_cast<size_t>(row) * frame.stride], frame.width * 3);
                }
                else
                {
                    std::memcpy(rgb.data(), frame.data.data(), rgb.size());
                }
                break;
            case PixelFormat::RGBA8888:
                rgba8888_to_rgb888(frame.data.data(), rgb.data(), frame.width, frame.height, frame.stride);
                break;
            case PixelFormat::YUV420:
                yuv420_to_rgb888(frame.data.data(), rgb.data(), frame.width, frame.height);
                break;
            default:
                return false;
            }

            if (frame.rotation_degrees % 360 == 0)
            {
                image.pixels = std::move(rgb);
                image.width = frame.width;
                image.height = frame.height;
                return true;
            }

            image.pixels.resize(rgb.size());
            return rotate_rgb888(rgb.data(), image.pixels.data(), frame.width, frame.height,
                                 frame.rotation_degrees, image.width, image.height);
        }

    } // namespace utils

} // namespace camera
} // namespace bsl
