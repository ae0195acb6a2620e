#ifndef MEDIA_MEDIAPROBE_HPP
#define MEDIA_MEDIAPROBE_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

extern "C" {
#include <libavformat/avformat.h>
}

// Reads container and stream parameters of audio/video files through libavformat,
// for the one-line type label of the binary preview.
class MediaProbe {
public:
    struct Stream {
        std::string type;
        std::string codec;
        int sample_rate = 0;
        int channels = 0;
        int width = 0;
        int height = 0;
    };

    struct Summary {
        std::string format;
        double duration_seconds = 0.0;
        std::int64_t bit_rate = 0;
        std::string title;
        std::string artist;
        std::vector<Stream> streams;
    };

    // Blocking I/O inside libav is abandoned once deadline passes.
    explicit MediaProbe(std::chrono::steady_clock::time_point deadline);
    ~MediaProbe();

    MediaProbe(const MediaProbe&) = delete;
    MediaProbe& operator=(const MediaProbe&) = delete;

    // Throws std::runtime_error when the file is not a media container with audio or video.
    Summary Probe(const std::string& path);

    // Container name, one indented line per stream, then duration, bitrate and tags.
    static std::string Describe(const Summary& summary);

    static std::string FormatDuration(double seconds);

private:
    void OpenInputFile(const std::string& path);
    void Cleanup();
    static int InterruptCallback(void* opaque);

    std::chrono::steady_clock::time_point deadline_;
    AVFormatContext* input_ctx_;
};

#endif // MEDIA_MEDIAPROBE_HPP
