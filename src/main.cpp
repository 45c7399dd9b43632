#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

#include "bsl_translate/analyzer_config.hpp"
#include "bsl_translate/camera.hpp"
#include "bsl_translate/pipeline.hpp"
#include "bsl_translate/sign_analyzer.hpp"

namespace {

std::atomic<bool> g_interrupted{false};

void on_signal(int)
{
    g_interrupted = true;
}

void print_usage()
{
    std::cout << "bsl_translate options:\n"
              << "  --config <file.json>   Analyzer configuration (models, resources, window)\n"
              << "  --source <cmd>         Command writing raw frames to stdout\n"
              << "  --input <path>         File or FIFO with raw frames (instead of --source)\n"
              << "  --width <n>            Frame width (default 640)\n"
              << "  --height <n>           Frame height (default 480)\n"
              << "  --format <fmt>         rgb | rgba | yuv420 (default yuv420)\n"
              << "  --rotation <deg>       Clockwise rotation to make frames upright\n"
              << "  --verbose              Verbose logging\n"
              << "  --help                 Show this help\n\n"
              << "Example:\n"
              << "  bsl_translate --config bsl.json \\\n"
              << "    --source \"ffmpeg -loglevel error -f v4l2 -i /dev/video0 -f rawvideo -pix_fmt yuv420p -s 640x480 -\"\n";
}

bool parse_uint(const std::string &s, uint32_t &out)
{
    char *end = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &end, 10);
    if (s.empty() || *end != '\0' || v == 0 || v > 16384)
        return false;
    out = static_cast<uint32_t>(v);
    return true;
}

} // namespace

int main(int argc, char **argv)
{
    using namespace bsl;

    std::string config_path;
    camera::ReaderConfig reader_cfg;
    bool verbose = false;

    // ---------------------------------------------------------------------------
    // Argument parsing (lightweight, no external deps)
    // ---------------------------------------------------------------------------
    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        auto next = [&](std::string &out) -> bool
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Missing value for " << arg << "\n";
                return false;
            }
            out = argv[++i];
            return true;
        };

        std::string value;
        if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            verbose = true;
        }
        else if (arg == "--config")
        {
            if (!next(config_path))
                return 2;
        }
        else if (arg == "--source")
        {
            if (!next(reader_cfg.command))
                return 2;
        }
        else if (arg == "--input")
        {
            if (!next(reader_cfg.path))
                return 2;
        }
        else if (arg == "--width" || arg == "--height")
        {
            if (!next(value))
                return 2;
            uint32_t &dst = arg == "--width" ? reader_cfg.width : reader_cfg.height;
            if (!parse_uint(value, dst))
            {
                std::cerr << "Invalid " << arg << ": " << value << "\n";
                return 2;
            }
        }
        else if (arg == "--format")
        {
            if (!next(value))
                return 2;
            reader_cfg.format = camera::string_to_format(value);
            if (reader_cfg.format == camera::PixelFormat::UNKNOWN)
            {
                std::cerr << "Unknown pixel format: " << value << "\n";
                return 2;
            }
        }
        else if (arg == "--rotation")
        {
            if (!next(value))
                return 2;
            reader_cfg.rotation_degrees = std::atoi(value.c_str());
        }
        else
        {
            std::cerr << "Unknown option: " << arg << "\n\n";
            print_usage();
            return 2;
        }
    }

    if (reader_cfg.command.empty() && reader_cfg.path.empty())
    {
        std::cerr << "No frame source given (--source or --input)\n\n";
        print_usage();
        return 2;
    }

    analysis::AnalyzerConfig config;
    if (!config_path.empty() && !config.load_from_file(config_path))
        return 1;
    if (verbose)
    {
        config.verbose = true;
        config.extractor.verbose = true;
        config.classifier.verbose = true;
    }
    reader_cfg.verbose = config.verbose;

    camera::FrameReader reader;
    if (!reader.init(reader_cfg) || !reader.start())
    {
        std::cerr << "Frame source failed: " << reader.get_error() << "\n";
        return 1;
    }

    auto analyzer = analysis::create_analyzer(config);
    if (!analyzer)
    {
        std::cerr << "Failed to start the analysis session\n";
        return 1;
    }

    // Print only when the displayed text changes
    std::mutex print_mutex;
    std::string last_printed;
    auto printer = std::make_shared<analysis::OutputListener>(
        [&](const std::string &text)
        {
            std::lock_guard<std::mutex> lock(print_mutex);
            if (text.empty() || text == last_printed)
                return;
            last_printed = text;
            std::cout << text << std::endl;
        });
    analyzer->add_listener(printer);

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    pipeline::PipelineConfig pipe_cfg;
    pipe_cfg.debug = config.verbose;
    auto next_frame = [&]() -> const camera::Frame *
    {
        if (g_interrupted)
            return nullptr;
        return reader.read_frame();
    };
    pipeline::Pipeline pipe(pipe_cfg, next_frame, *analyzer);
    pipe.start();
    pipe.wait();
    pipe.stop();

    auto stats = analyzer->get_stats();
    analyzer->stop();
    reader.stop();

    std::cerr << "[bsl_translate] " << stats.frames_analyzed << " frames analyzed, "
              << stats.labels_emitted << " signs emitted";
    if (stats.classification_failures > 0)
        std::cerr << ", " << stats.classification_failures << " classification failures";
    std::cerr << "\n";
    const std::string transcript = analyzer->transcript();
    if (!transcript.empty())
        std::cerr << "[bsl_translate] Transcript: " << transcript << "\n";
    return 0;
}
