//
//  whisper.cpp
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

#include "error.hpp"
#include "utils.hpp"
#include "whisper.hpp"

Whisper::Whisper(const std::string &model_path, const LogTarget &log_target)
    : model_path_(model_path) {
  BOOST_LOG_TRIVIAL(info) << "whisper:: initializing the model " << model_path;

  whisper_context *ctx;
  {
    StderrRedirect redirect(log_target);
    whisper_context_params cparams = whisper_context_default_params();
    ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);
  }
  if (ctx == nullptr) {
    throw EngineError("failed to initialize whisper context from " +
                      model_path);
  }
  ctx_.reset(ctx);
}

void Whisper::full(const whisper_full_params &params,
                   const std::vector<float> &pcm, int n_processors) {
  int rc;
  if (n_processors > 0) {
    BOOST_LOG_TRIVIAL(debug) << "whisper:: full parallel on " << n_processors
                             << " processors, samples " << pcm.size();
    rc = whisper_full_parallel(ctx_.get(), params, pcm.data(),
                               static_cast<int>(pcm.size()), n_processors);
  } else {
    BOOST_LOG_TRIVIAL(debug) << "whisper:: full, samples " << pcm.size();
    rc = whisper_full(ctx_.get(), params, pcm.data(),
                      static_cast<int>(pcm.size()));
  }
  if (rc != 0) {
    throw EngineError("whisper_full failed with code " + std::to_string(rc));
  }
}

int Whisper::n_segments() const { return whisper_full_n_segments(ctx_.get()); }

Segment Whisper::make_segment(int64_t t0, int64_t t1, const char *text) {
  return Segment(t0, t1, boost::algorithm::trim_copy(sanitize_utf8(text)));
}

std::vector<Segment> Whisper::get_segments(int start, int end) const {
  int n = n_segments();
  if (start < 0 || start > end || end > n) {
    throw EngineError("segment range [" + std::to_string(start) + ", " +
                      std::to_string(end) + ") out of " + std::to_string(n));
  }
  std::vector<Segment> segments;
  segments.reserve(end - start);
  for (int i = start; i < end; i++) {
    segments.push_back(
        make_segment(whisper_full_get_segment_t0(ctx_.get(), i),
                     whisper_full_get_segment_t1(ctx_.get(), i),
                     whisper_full_get_segment_text(ctx_.get(), i)));
  }
  return segments;
}

std::vector<Segment> Whisper::get_segments(whisper_state *state, int start,
                                           int end) {
  int n = whisper_full_n_segments_from_state(state);
  if (start < 0 || start > end || end > n) {
    throw EngineError("segment range [" + std::to_string(start) + ", " +
                      std::to_string(end) + ") out of " + std::to_string(n));
  }
  std::vector<Segment> segments;
  segments.reserve(end - start);
  for (int i = start; i < end; i++) {
    segments.push_back(
        make_segment(whisper_full_get_segment_t0_from_state(state, i),
                     whisper_full_get_segment_t1_from_state(state, i),
                     whisper_full_get_segment_text_from_state(state, i)));
  }
  return segments;
}

int Whisper::lang_id() const { return whisper_full_lang_id(ctx_.get()); }

void Whisper::pcm_to_mel(const std::vector<float> &pcm, int n_threads) {
  int rc = whisper_pcm_to_mel(ctx_.get(), pcm.data(),
                              static_cast<int>(pcm.size()), n_threads);
  if (rc != 0) {
    throw EngineError("whisper_pcm_to_mel failed with code " +
                      std::to_string(rc));
  }
}

int Whisper::lang_auto_detect(int offset_ms, int n_threads,
                              std::vector<float> &probs) {
  probs.assign(lang_max_id(), 0.0f);
  int id = whisper_lang_auto_detect(ctx_.get(), offset_ms, n_threads,
                                    probs.data());
  if (id < 0 || id >= lang_max_id()) {
    throw EngineError("whisper_lang_auto_detect failed with code " +
                      std::to_string(id));
  }
  return id;
}

void Whisper::print_timings() { whisper_print_timings(ctx_.get()); }

int Whisper::lang_max_id() { return whisper_lang_max_id() + 1; }

const std::vector<std::string> &Whisper::languages() {
  static const std::vector<std::string> languages = [] {
    std::vector<std::string> codes;
    for (int id = 0; id < lang_max_id(); id++) {
      codes.emplace_back(whisper_lang_str(id));
    }
    return codes;
  }();
  return languages;
}

const std::string &Whisper::language(int id) {
  const auto &codes = languages();
  if (id < 0 || id >= static_cast<int>(codes.size())) {
    throw EngineError("invalid language id " + std::to_string(id));
  }
  return codes[id];
}

std::string Whisper::system_info() { return whisper_print_system_info(); }
