#include "media/MediaProbe.hpp"

#include <cstdio>
#include <sstream>
#include <stdexcept>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/avutil.h>
#include <libavutil/dict.h>
#include <libavutil/log.h>
}

MediaProbe::MediaProbe(std::chrono::steady_clock::time_point deadline)
    : deadline_(deadline),
      input_ctx_(nullptr) {
    // Probing arbitrary binaries is expected to fail; keep libav quiet about it.
    av_log_set_level(AV_LOG_QUIET);
}

MediaProbe::~MediaProbe() {
    Cleanup();
}

int MediaProbe::InterruptCallback(void* opaque) {
    const MediaProbe* self = static_cast<const MediaProbe*>(opaque);
    return std::chrono::steady_clock::now() >= self->deadline_ ? 1 : 0;
}

void MediaProbe::OpenInputFile(const std::string& path) {
    input_ctx_ = avformat_alloc_context();
    if (input_ctx_ == nullptr) {
        throw std::runtime_error("Could not allocate format context");
    }
    input_ctx_->interrupt_callback.callback = &MediaProbe::InterruptCallback;
    input_ctx_->interrupt_callback.opaque = this;

    // avformat_open_input frees the context on failure.
    if (avformat_open_input(&input_ctx_, path.c_str(), nullptr, nullptr) < 0) {
        input_ctx_ = nullptr;
        throw std::runtime_error("Could not open input file: " + path);
    }

    if (avformat_find_stream_info(input_ctx_, nullptr) < 0) {
        throw std::runtime_error("Could not find stream information");
    }
}

void MediaProbe::Cleanup() {
    if (input_ctx_ != nullptr) {
        avformat_close_input(&input_ctx_);
        input_ctx_ = nullptr;
    }
}

MediaProbe::Summary MediaProbe::Probe(const std::string& path) {
    Cleanup();
    OpenInputFile(path);

    Summary summary;
    if (input_ctx_->iformat != nullptr && input_ctx_->iformat->name != nullptr) {
        summary.format = input_ctx_->iformat->name;
    }
    if (input_ctx_->duration != AV_NOPTS_VALUE && input_ctx_->duration > 0) {
        summary.duration_seconds = static_cast<double>(input_ctx_->duration) / AV_TIME_BASE;
    }
    summary.bit_rate = input_ctx_->bit_rate;

    const AVDictionaryEntry* title = av_dict_get(input_ctx_->metadata, "title", nullptr, 0);
    const AVDictionaryEntry* artist = av_dict_get(input_ctx_->metadata, "artist", nullptr, 0);
    if (title != nullptr) {
        summary.title = title->value;
    }
    if (artist != nullptr) {
        summary.artist = artist->value;
    }

    for (unsigned i = 0; i < input_ctx_->nb_streams; ++i) {
        const AVCodecParameters* params = input_ctx_->streams[i]->codecpar;
        Stream stream;
        if (params->codec_type == AVMEDIA_TYPE_AUDIO) {
            stream.type = "audio";
            stream.sample_rate = params->sample_rate;
            stream.channels = params->ch_layout.nb_channels;
        } else if (params->codec_type == AVMEDIA_TYPE_VIDEO) {
            stream.type = "video";
            stream.width = params->width;
            stream.height = params->height;
        } else {
            continue;
        }
        stream.codec = avcodec_get_name(params->codec_id);
        summary.streams.push_back(stream);
    }

    Cleanup();

    if (summary.streams.empty()) {
        throw std::runtime_error("No audio or video stream found in " + path);
    }
    return summary;
}

std::string MediaProbe::FormatDuration(double seconds) {
    const long total = static_cast<long>(seconds + 0.5);
    const long hours = total / 3600;
    const long minutes = (total % 3600) / 60;
    const long secs = total % 60;

    char buffer[32];
    if (hours > 0) {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld:%02ld", hours, minutes, secs);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%ld:%02ld", minutes, secs);
    }
    return buffer;
}

std::string MediaProbe::Describe(const Summary& summary) {
    std::ostringstream out;
    out << summary.format;
    for (const Stream& stream : summary.streams) {
        out << "\n  " << stream.type << ": " << stream.codec;
        if (stream.type == "audio") {
            if (stream.sample_rate > 0) {
                out << ", " << stream.sample_rate << " Hz";
            }
            if (stream.channels > 0) {
                out << ", " << stream.channels << " ch";
            }
        } else if (stream.width > 0 && stream.height > 0) {
            out << ", " << stream.width << "x" << stream.height;
        }
    }
    if (summary.duration_seconds > 0.0) {
        out << "\n  duration: " << FormatDuration(summary.duration_seconds);
    }
    if (summary.bit_rate > 0) {
        out << "\n  bitrate: " << summary.bit_rate / 1000 << " kb/s";
    }
    if (!summary.title.empty()) {
        out << "\n  title: " << summary.title;
    }
    if (!summary.artist.empty()) {
        out << "\n  artist: " << summary.artist;
    }
    return out.str();
}
