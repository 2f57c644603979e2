//
//  audio.hpp
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

#ifndef _AUDIO_HPP_
#define _AUDIO_HPP_

#include <boost/filesystem.hpp>
#include <cstdint>
#include <string>
#include <vector>

/*
 * Load a media file as mono 16 kHz float PCM.
 * WAV files are parsed directly, anything else goes through ffmpeg first.
 * Throws NotFoundError, FormatError, ConversionUnavailableError and
 * ConversionFailedError.
 */
std::vector<float> load_audio(const std::string &path);

/* 16-bit PCM, 16 kHz, mono or stereo WAV to float PCM */
std::vector<float> read_wav(const std::string &path);

/* transcode media to a mono 16 kHz 16-bit WAV at output */
void convert_media(const std::string &input, const std::string &output);

/* temporary file removed when the object goes out of scope */
class TempFile {
public:
  explicit TempFile(const std::string &suffix);
  TempFile(const TempFile &) = delete;
  TempFile &operator=(const TempFile &) = delete;
  ~TempFile();

  const boost::filesystem::path &path() const { return path_; }

private:
  boost::filesystem::path path_;
};

#endif
