#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <memory>
#include <vector>
#include <functional>

namespace bsl
{
namespace camera
{

    // Pixel layout of a delivered frame
    enum class PixelFormat
    {
        RGB888,   // 24-bit RGB
        RGBA8888, // 32-bit RGBA
        YUV420,   // YUV 4:2:0 planar (I420)
        UNKNOWN
    };

    // A single camera frame as delivered by a frame source
    struct Frame
    {
        std::vector<uint8_t> data; // Raw pixel data
        size_t size;               // Data size in bytes
        uint32_t width;            // Frame width
        uint32_t height;           // Frame height
        PixelFormat format;        // Pixel format
        int rotation_degrees;      // Clockwise rotation needed to make the frame upright
        uint64_t timestamp_ns;     // Capture timestamp (nanoseconds)
        int stride;                // Bytes per row (RGB/RGBA only)

        Frame() : data(), size(0), width(0), height(0),
                  format(PixelFormat::UNKNOWN), rotation_degrees(0),
                  timestamp_ns(0), stride(0) {}

        // Expected byte count for width/height/format
        size_t expected_size() const;
    };

    // Upright RGB888 image owned by the analysis side
    struct Image
    {
        std::vector<uint8_t> pixels;
        uint32_t width{0};
        uint32_t height{0};

        bool empty() const { return pixels.empty() || width == 0 || height == 0; }
    };

    // A frame on loan from its source. The source does not deliver the next
    // frame until close() has been called, so holders must close as soon as
    // the pixels have been copied. Destroying an open proxy closes it.
    class FrameProxy
    {
    public:
        FrameProxy(const Frame *frame, std::function<void()> on_close);
        ~FrameProxy();

        const Frame &frame() const { return *frame_; }
        void close();
        bool is_closed() const { return frame_ == nullptr; }

    private:
        const Frame *frame_;
        std::function<void()> on_close_;

        FrameProxy(const FrameProxy &) = delete;
        FrameProxy &operator=(const FrameProxy &) = delete;
    };

    // Raw stream configuration
    struct ReaderConfig
    {
        std::string command;    // Shell command writing raw frames to stdout (popen)
        std::string path;       // Alternatively a file or FIFO with raw frames
        uint32_t width;         // Frame width
        uint32_t height;        // Frame height
        PixelFormat format;     // Layout of the raw stream
        int rotation_degrees;   // Rotation metadata attached to every frame
        bool verbose;           // Enable verbose logging

        ReaderConfig() : width(640), height(480), format(PixelFormat::YUV420),
                         rotation_degrees(0), verbose(false) {}
    };

    // Reads fixed-size raw frames from a pipe or a file
    class FrameReader
    {
    public:
        FrameReader();
        ~FrameReader();

        // Validate configuration and size the read buffer
        bool init(const ReaderConfig &config);

        // Open the command pipe or the file
        bool start();

        // Close the stream
        void stop();

        // Read the next frame (blocking)
        // Returns pointer to frame (valid until next read), nullptr at end of
        // stream or on error
        Frame *read_frame();

        const ReaderConfig &get_config() const { return config_; }
        bool is_running() const { return stream_ != nullptr; }
        const std::string &get_error() const { return last_error_; }
        uint64_t frames_read() const { return frame_count_; }

    private:
        ReaderConfig config_;
        FILE *stream_;
        bool from_pipe_;
        size_t frame_bytes_;
        uint64_t frame_count_;
        std::string last_error_;
        Frame current_frame_;

        FrameReader(const FrameReader &) = delete;
        FrameReader &operator=(const FrameReader &) = delete;
    };

    PixelFormat string_to_format(const std::string &s);
    std::string format_to_string(PixelFormat format);

    // Utility functions for image processing
    namespace utils
    {
        // Convert YUV420 to RGB888
        void yuv420_to_rgb888(const uint8_t *yuv, uint8_t *rgb,
                              uint32_t width, uint32_t height);

        // Drop the alpha channel of RGBA8888 rows
        void rgba8888_to_rgb888(const uint8_t *rgba, uint8_t *rgb,
                                uint32_t width, uint32_t height, int stride);

        // Rotate an RGB888 image clockwise by 0, 90, 180 or 270 degrees
        // dst must hold width*height*3 bytes; dst_w/dst_h receive the new size
        bool rotate_rgb888(const uint8_t *src, uint8_t *dst,
                           uint32_t width, uint32_t height, int degrees,
                           uint32_t &dst_w, uint32_t &dst_h);

        // Bilinear resize
        void resize_bilinear(const uint8_t *src, uint8_t *dst,
                             uint32_t src_w, uint32_t src_h,
                             uint32_t dst_w, uint32_t dst_h,
                             int channels);

        // Copy a frame into an upright RGB888 image
        bool frame_to_image(const Frame &frame, Image &image);
    }

} // namespace camera
} // namespace bsl
