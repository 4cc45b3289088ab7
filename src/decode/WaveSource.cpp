// Repository: AudioInject
// Component: WaveSource
// Purpose: Decode an audio file container into interleaved 16-bit PCM bytes
//          using libavformat/libavcodec.
// Copyright (c) 2026 AudioInject

#include "audioinject/decode/WaveSource.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "audioinject/util/Errors.hpp"
#include "audioinject/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/samplefmt.h>
}

namespace audioinject::decode {

namespace {

using util::Logger;

std::string AvErrorString(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

struct FormatContextCloser {
  void operator()(AVFormatContext* ctx) const { avformat_close_input(&ctx); }
};
struct CodecContextFreer {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct FrameFreer {
  void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct PacketFreer {
  void operator()(AVPacket* packet) const { av_packet_free(&packet); }
};

using FormatContextPtr = std::unique_ptr<AVFormatContext, FormatContextCloser>;
using CodecContextPtr = std::unique_ptr<AVCodecContext, CodecContextFreer>;
using FramePtr = std::unique_ptr<AVFrame, FrameFreer>;
using PacketPtr = std::unique_ptr<AVPacket, PacketFreer>;

// Accumulates decoded frames into the interleaved output buffer, honoring the
// sample-frame cap.
class PcmCollector {
 public:
  PcmCollector(audio::RawAudioBuffer* out, int64_t max_sample_frames)
      : out_(out), max_sample_frames_(max_sample_frames) {}

  // Returns true once the cap has been reached.
  bool Append(const AVFrame* frame) {
    const int64_t room = max_sample_frames_ - sample_frames_;
    const int64_t take = std::min<int64_t>(frame->nb_samples, room);
    if (take <= 0) return true;

    const auto fmt = static_cast<AVSampleFormat>(frame->format);
    const size_t channels = static_cast<size_t>(out_->channels);
    const size_t frame_bytes = channels * audio::kRequiredSampleWidthBytes;
    const size_t offset = out_->bytes.size();
    out_->bytes.resize(offset + static_cast<size_t>(take) * frame_bytes);
    uint8_t* dst = out_->bytes.data() + offset;

    if (fmt == AV_SAMPLE_FMT_S16) {
      std::memcpy(dst, frame->data[0], static_cast<size_t>(take) * frame_bytes);
    } else if (fmt == AV_SAMPLE_FMT_S16P) {
      for (int64_t i = 0; i < take; ++i) {
        for (size_t ch = 0; ch < channels; ++ch) {
          std::memcpy(dst, frame->extended_data[ch] + i * audio::kRequiredSampleWidthBytes,
                      audio::kRequiredSampleWidthBytes);
          dst += audio::kRequiredSampleWidthBytes;
        }
      }
    } else {
      const char* name = av_get_sample_fmt_name(fmt);
      throw FormatError(std::string("decoder produced unsupported sample format ") +
                        (name ? name : "unknown"));
    }

    sample_frames_ += take;
    return sample_frames_ >= max_sample_frames_;
  }

  int64_t sample_frames() const { return sample_frames_; }

 private:
  audio::RawAudioBuffer* out_;
  int64_t max_sample_frames_;
  int64_t sample_frames_ = 0;
};

// Pulls every available frame out of the decoder.  Returns true if the cap
// was reached.
bool DrainDecoder(AVCodecContext* codec_ctx, AVFrame* frame, PcmCollector& collector,
                  const std::string& path) {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx, frame);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) return false;
    if (ret < 0) {
      throw SourceReadError("decode failed for " + path + ": " + AvErrorString(ret));
    }
    bool capped = collector.Append(frame);
    av_frame_unref(frame);
    if (capped) return true;
  }
}

}  // namespace

WaveSource::WaveSource(std::string path, int max_read_seconds)
    : path_(std::move(path)), max_read_seconds_(max_read_seconds) {
  if (max_read_seconds_ <= 0) {
    throw std::invalid_argument("max_read_seconds must be positive");
  }
}

audio::DecodedAudio WaveSource::Read() const {
  av_log_set_level(AV_LOG_ERROR);

  AVFormatContext* raw_format_ctx = nullptr;
  int ret = avformat_open_input(&raw_format_ctx, path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    throw SourceReadError("cannot open " + path_ + ": " + AvErrorString(ret));
  }
  FormatContextPtr format_ctx(raw_format_ctx);

  ret = avformat_find_stream_info(format_ctx.get(), nullptr);
  if (ret < 0) {
    throw SourceReadError("cannot read stream info from " + path_ + ": " + AvErrorString(ret));
  }

  const AVCodec* codec = nullptr;
  const int stream_index =
      av_find_best_stream(format_ctx.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
  if (stream_index < 0) {
    throw SourceReadError("no audio stream in " + path_ + ": " + AvErrorString(stream_index));
  }
  const AVCodecParameters* codecpar = format_ctx->streams[stream_index]->codecpar;

  // Width check on declared metadata, before a single sample is decoded.
  const int declared_bits = av_get_bits_per_sample(codecpar->codec_id);
  if (declared_bits == 0) {
    throw FormatError("unsupported codec " + std::string(avcodec_get_name(codecpar->codec_id)) +
                      " in " + path_ + " (only 16-bit PCM is accepted)");
  }
  if (declared_bits != audio::kRequiredSampleWidthBytes * 8) {
    throw FormatError("unsupported sample width: " + std::to_string(declared_bits) +
                      "-bit in " + path_ + " (only 16-bit PCM is accepted)");
  }
  if (codec == nullptr) {
    throw SourceReadError("no decoder for " + std::string(avcodec_get_name(codecpar->codec_id)));
  }

  CodecContextPtr codec_ctx(avcodec_alloc_context3(codec));
  if (!codec_ctx) {
    throw SourceReadError("cannot allocate decoder context for " + path_);
  }
  ret = avcodec_parameters_to_context(codec_ctx.get(), codecpar);
  if (ret < 0) {
    throw SourceReadError("cannot copy codec parameters for " + path_ + ": " + AvErrorString(ret));
  }
  ret = avcodec_open2(codec_ctx.get(), codec, nullptr);
  if (ret < 0) {
    throw SourceReadError("cannot open decoder for " + path_ + ": " + AvErrorString(ret));
  }

  audio::DecodedAudio decoded;
  decoded.sample_rate_hz = codecpar->sample_rate;
  decoded.buffer.channels = codecpar->ch_layout.nb_channels;
  decoded.buffer.sample_width_bytes = declared_bits / 8;
  if (decoded.sample_rate_hz <= 0 || decoded.buffer.channels <= 0) {
    throw SourceReadError("invalid stream parameters in " + path_ + " (rate=" +
                          std::to_string(decoded.sample_rate_hz) + ", channels=" +
                          std::to_string(decoded.buffer.channels) + ")");
  }

  const int64_t max_sample_frames =
      static_cast<int64_t>(decoded.sample_rate_hz) * max_read_seconds_;
  PcmCollector collector(&decoded.buffer, max_sample_frames);

  FramePtr frame(av_frame_alloc());
  PacketPtr packet(av_packet_alloc());
  if (!frame || !packet) {
    throw SourceReadError("cannot allocate decode buffers for " + path_);
  }

  bool capped = false;
  while (!capped) {
    ret = av_read_frame(format_ctx.get(), packet.get());
    if (ret == AVERROR_EOF) break;
    if (ret < 0) {
      throw SourceReadError("read failed for " + path_ + ": " + AvErrorString(ret));
    }
    if (packet->stream_index != stream_index) {
      av_packet_unref(packet.get());
      continue;
    }
    ret = avcodec_send_packet(codec_ctx.get(), packet.get());
    if (ret == AVERROR(EAGAIN)) {
      // Decoder output full: drain, then resubmit the same packet.
      capped = DrainDecoder(codec_ctx.get(), frame.get(), collector, path_);
      ret = capped ? 0 : avcodec_send_packet(codec_ctx.get(), packet.get());
    }
    av_packet_unref(packet.get());
    if (ret < 0) {
      throw SourceReadError("decode failed for " + path_ + ": " + AvErrorString(ret));
    }
    if (!capped) {
      capped = DrainDecoder(codec_ctx.get(), frame.get(), collector, path_);
    }
  }

  if (!capped) {
    // Flush frames still buffered inside the decoder.
    ret = avcodec_send_packet(codec_ctx.get(), nullptr);
    if (ret < 0 && ret != AVERROR_EOF) {
      throw SourceReadError("decoder flush failed for " + path_ + ": " + AvErrorString(ret));
    }
    capped = DrainDecoder(codec_ctx.get(), frame.get(), collector, path_);
  }

  if (capped) {
    Logger::Warn("[WaveSource] read cap reached: kept first " +
                 std::to_string(max_read_seconds_) + " s of " + path_);
  }

  Logger::Info("[WaveSource] decoded " + path_ + ": " +
               std::to_string(collector.sample_frames()) + " sample frames, " +
               std::to_string(decoded.sample_rate_hz) + " Hz, " +
               std::to_string(decoded.buffer.channels) + " ch, " +
               std::to_string(decoded.buffer.sample_width_bytes * 8) + "-bit");
  return decoded;
}

}  // namespace audioinject::decode
