//
//  transcriber.cpp
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

#include <exception>

#include "audio.hpp"
#include "error.hpp"
#include "log.hpp"
#include "models.hpp"
#include "transcriber.hpp"
#include "utils.hpp"

/* per call state handed to whisper.cpp as new segment user data */
struct CallbackContext {
  const SegmentCallback &callback;
  std::exception_ptr error;
  /* segments already handed to callback */
  size_t delivered{0};
};

static void new_segment_callback(whisper_context * /* ctx */,
                                 whisper_state *state, int n_new,
                                 void *user_data) {
  auto context = static_cast<CallbackContext *>(user_data);
  if (context->error) {
    return;
  }
  /* exceptions must not unwind through whisper.cpp */
  try {
    int n = whisper_full_n_segments_from_state(state);
    auto segments = Whisper::get_segments(state, n - n_new, n);
    const auto &language =
        Whisper::language(whisper_full_lang_id_from_state(state));
    for (const auto &segment : segments) {
      context->callback(segment, language);
      context->delivered++;
    }
  } catch (...) {
    context->error = std::current_exception();
  }
}

static Params make_params(SamplingStrategy strategy,
                          const ParamOverrides &overrides) {
  auto params = Params::create(strategy);
  params.apply(overrides);
  return params;
}

std::unique_ptr<Transcriber> Transcriber::create(const Config &config) {
  return std::make_unique<Transcriber>(
      config.get_model(), config.get_models_dir(),
      config.get_sampling_strategy(), config.get_log_target(),
      config.get_params());
}

Transcriber::Transcriber(const std::string &model,
                         const std::string &models_dir,
                         SamplingStrategy strategy, const LogTarget &log_target,
                         const ParamOverrides &params)
    : params_(make_params(strategy, params)),
      whisper_(resolve_model(model, models_dir), log_target) {
  BOOST_LOG_TRIVIAL(info) << "transcriber:: init with model "
                          << whisper_.get_model_path() << ", strategy "
                          << to_string(strategy);
}

Transcription Transcriber::transcribe(const std::string &media,
                                      std::optional<int> n_processors,
                                      const SegmentCallback &callback,
                                      const ParamOverrides &params) {
  return transcribe(load_audio(media), n_processors, callback, params);
}

Transcription Transcriber::transcribe(const std::vector<float> &pcm,
                                      std::optional<int> n_processors,
                                      const SegmentCallback &callback,
                                      const ParamOverrides &params) {
  params_.apply(params);

  whisper_full_params wparams = params_.full_params();
  CallbackContext context{callback, nullptr, 0};
  if (callback) {
    wparams.new_segment_callback = new_segment_callback;
    wparams.new_segment_callback_user_data = &context;
  }

  BOOST_LOG_TRIVIAL(info) << "transcriber:: transcribing " << pcm.size()
                          << " samples ...";
  {
    TimeElapsed timer("transcriber:: inference");
    whisper_.full(wparams, pcm, n_processors.value_or(0));
  }
  if (context.error) {
    std::rethrow_exception(context.error);
  }

  Transcription result;
  result.segments = whisper_.get_segments(0, whisper_.n_segments());
  result.language = Whisper::language(whisper_.lang_id());
  BOOST_LOG_TRIVIAL(debug) << "transcriber:: " << result.segments.size()
                           << " segments, language " << result.language;

  /* whisper_full_parallel reports only the first chunk to the callback */
  if (callback) {
    for (size_t i = context.delivered; i < result.segments.size(); i++) {
      callback(result.segments[i], result.language);
    }
  }
  return result;
}

LanguageDetection Transcriber::detect_language(const std::string &media,
                                               int offset_ms, int n_threads) {
  return LanguageDetector(whisper_).detect(media, offset_ms, n_threads);
}

LanguageDetection Transcriber::detect_language(const std::vector<float> &pcm,
                                               int offset_ms, int n_threads) {
  return LanguageDetector(whisper_).detect(pcm, offset_ms, n_threads);
}

std::map<std::string, std::string> Transcriber::get_params() const {
  return params_.snapshot();
}

const std::vector<ParamInfo> &Transcriber::get_params_schema() {
  return Params::schema();
}

int Transcriber::lang_max_id() { return Whisper::lang_max_id(); }

const std::vector<std::string> &Transcriber::available_languages() {
  return Whisper::languages();
}

std::string Transcriber::system_info() { return Whisper::system_info(); }

void Transcriber::print_timings() { whisper_.print_timings(); }
