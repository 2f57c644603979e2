//
//  transcriber.hpp
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

#ifndef _TRANSCRIBER_HPP_
#define _TRANSCRIBER_HPP_

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "language_detector.hpp"
#include "params.hpp"
#include "segment.hpp"
#include "whisper.hpp"

/* called from the decoding thread for every new segment */
using SegmentCallback =
    std::function<void(const Segment &segment, const std::string &language)>;
using ParamOverrides = std::map<std::string, std::string>;

struct Transcription {
  std::vector<Segment> segments;
  std::string language;
};

/*
 * A loaded model and its decoding parameters.
 *
 * Each instance owns its own whisper context. Concurrent calls on the same
 * instance must be serialized by the caller.
 */
class Transcriber {
public:
  static std::unique_ptr<Transcriber> create(const Config &config);

  Transcriber(const std::string &model, const std::string &models_dir,
              SamplingStrategy strategy, const LogTarget &log_target,
              const ParamOverrides &params = {});
  Transcriber() = delete;
  Transcriber(const Transcriber &) = delete;
  Transcriber &operator=(const Transcriber &) = delete;

  /* params are merged into the instance parameters before decoding */
  Transcription transcribe(const std::string &media,
                           std::optional<int> n_processors = std::nullopt,
                           const SegmentCallback &callback = nullptr,
                           const ParamOverrides &params = {});
  Transcription transcribe(const std::vector<float> &pcm,
                           std::optional<int> n_processors = std::nullopt,
                           const SegmentCallback &callback = nullptr,
                           const ParamOverrides &params = {});

  LanguageDetection detect_language(const std::string &media,
                                    int offset_ms = 0, int n_threads = 4);
  LanguageDetection detect_language(const std::vector<float> &pcm,
                                    int offset_ms = 0, int n_threads = 4);

  std::map<std::string, std::string> get_params() const;
  static const std::vector<ParamInfo> &get_params_schema();

  static int lang_max_id();
  static const std::vector<std::string> &available_languages();
  static std::string system_info();
  void print_timings();

  const std::string &get_model_path() const {
    return whisper_.get_model_path();
  }

private:
  Params params_;
  Whisper whisper_;
};

#endif
