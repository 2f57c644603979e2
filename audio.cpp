//
//  audio.cpp
//
//  Copyright (c) 2019 2025 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the MIT license
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
//

#include <boost/algorithm/string.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/process.hpp>
#include <algorithm>
#include <cstring>
#include <fstream>
#include <iterator>
#include <whisper.h>

#include "audio.hpp"
#include "error.hpp"
#include "log.hpp"

namespace fs = boost::filesystem;
namespace bp = boost::process;

constexpr uint16_t wave_format_pcm = 0x0001;
constexpr uint16_t wave_format_extensible = 0xFFFE;

TempFile::TempFile(const std::string &suffix) {
  path_ = fs::temp_directory_path() /
          fs::unique_path("whisper-%%%%-%%%%-%%%%" + suffix);
  std::ofstream create(path_.string(), std::ios::binary);
  if (!create) {
    throw Error("cannot create temporary file " + path_.string());
  }
  BOOST_LOG_TRIVIAL(debug) << "audio:: created temporary file " << path_;
}

TempFile::~TempFile() {
  boost::system::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "audio:: cannot remove " << path_ << ": "
                               << ec.message();
  }
}

std::vector<float> read_wav(const std::string &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw NotFoundError(path);
  }
  std::vector<uint8_t> buf((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());

  if (buf.size() < 12 || std::memcmp(buf.data(), "RIFF", 4) != 0 ||
      std::memcmp(buf.data() + 8, "WAVE", 4) != 0) {
    throw FormatError(path + " is not a RIFF/WAVE file");
  }

  uint16_t audio_format{0};
  uint16_t channels{0};
  uint32_t sample_rate{0};
  uint16_t bits_per_sample{0};
  size_t data_off{0};
  size_t data_size{0};
  bool has_fmt{false};
  bool has_data{false};

  size_t off = 12;
  while (off + 8 <= buf.size()) {
    const uint8_t *tag = buf.data() + off;
    uint32_t chunk_size = boost::endian::load_little_u32(buf.data() + off + 4);
    size_t chunk_off = off + 8;

    if (std::memcmp(tag, "fmt ", 4) == 0) {
      if (chunk_size < 16 || chunk_off + chunk_size > buf.size()) {
        throw FormatError(path + " has a truncated fmt chunk");
      }
      const uint8_t *fmt = buf.data() + chunk_off;
      audio_format = boost::endian::load_little_u16(fmt);
      channels = boost::endian::load_little_u16(fmt + 2);
      sample_rate = boost::endian::load_little_u32(fmt + 4);
      bits_per_sample = boost::endian::load_little_u16(fmt + 14);
      if (audio_format == wave_format_extensible && chunk_size >= 40) {
        /* first two bytes of the sub-format GUID */
        audio_format = boost::endian::load_little_u16(fmt + 24);
      }
      has_fmt = true;
    } else if (std::memcmp(tag, "data", 4) == 0) {
      data_off = chunk_off;
      /* streamed files may carry a bogus size */
      data_size = std::min<size_t>(chunk_size, buf.size() - chunk_off);
      has_data = true;
      break;
    }

    off = chunk_off + chunk_size;
    if (off & 1)
      off++;
  }

  if (!has_fmt) {
    throw FormatError(path + " has no fmt chunk");
  }
  if (!has_data) {
    throw FormatError(path + " has no data chunk");
  }
  if (audio_format != wave_format_pcm) {
    throw FormatError(path + " is not PCM encoded");
  }
  if (channels != 1 && channels != 2) {
    throw FormatError("WAV file must be mono or stereo");
  }
  if (sample_rate != WHISPER_SAMPLE_RATE) {
    throw FormatError("WAV file must be " +
                      std::to_string(WHISPER_SAMPLE_RATE) + " Hz");
  }
  if (bits_per_sample != 16) {
    throw FormatError("WAV file must be 16-bit");
  }

  size_t bytes_per_frame = channels * sizeof(int16_t);
  size_t frames = data_size / bytes_per_frame;
  BOOST_LOG_TRIVIAL(debug) << "audio:: " << path << " channels "
                           << channels << " frames " << frames;

  std::vector<float> pcmf32(frames);
  const uint8_t *in = buf.data() + data_off;
  for (size_t i = 0; i < frames; i++, in += bytes_per_frame) {
    if (channels == 1) {
      pcmf32[i] =
          static_cast<float>(boost::endian::load_little_s16(in)) / 32768.0f;
    } else {
      float left = boost::endian::load_little_s16(in);
      float right = boost::endian::load_little_s16(in + 2);
      pcmf32[i] = (left + right) / 65536.0f;
    }
  }
  return pcmf32;
}

void convert_media(const std::string &input, const std::string &output) {
  auto ffmpeg = bp::search_path("ffmpeg");
  if (ffmpeg.empty()) {
    throw ConversionUnavailableError("ffmpeg");
  }

  BOOST_LOG_TRIVIAL(info) << "audio:: converting " << input << " with "
                          << ffmpeg.string();
  int rc;
  try {
    rc = bp::system(ffmpeg, "-nostdin", "-i", input, "-ac", "1", "-ar",
                    std::to_string(WHISPER_SAMPLE_RATE), "-acodec",
                    "pcm_s16le", "-y", output, bp::std_in < bp::null,
                    bp::std_out > bp::null, bp::std_err > bp::null);
  } catch (const bp::process_error &e) {
    BOOST_LOG_TRIVIAL(error) << "audio:: cannot run ffmpeg: " << e.what();
    throw ConversionFailedError(input, e.code().value());
  }
  if (rc != 0) {
    throw ConversionFailedError(input, rc);
  }
}

std::vector<float> load_audio(const std::string &path) {
  if (!fs::exists(path)) {
    throw NotFoundError(path);
  }

  if (boost::algorithm::iequals(fs::path(path).extension().string(),
                                ".wav")) {
    return read_wav(path);
  }

  TempFile wav(".wav");
  convert_media(path, wav.path().string());
  return read_wav(wav.path().string());
}
