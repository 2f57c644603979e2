//
//  whisper.hpp
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

#ifndef _WHISPER_HPP_
#define _WHISPER_HPP_

#include <memory>
#include <string>
#include <vector>
#include <whisper.h>

#include "log.hpp"
#include "segment.hpp"

/*
 * Owner of one whisper.cpp context.
 *
 * The context is created in the constructor and freed exactly once in the
 * destructor. Calls are not synchronized, callers serialize access.
 */
class Whisper {
public:
  Whisper(const std::string &model_path, const LogTarget &log_target);
  Whisper(const Whisper &) = delete;
  Whisper &operator=(const Whisper &) = delete;

  /* whisper_full, or whisper_full_parallel when n_processors > 0 */
  void full(const whisper_full_params &params, const std::vector<float> &pcm,
            int n_processors = 0);

  int n_segments() const;
  std::vector<Segment> get_segments(int start, int end) const;
  int lang_id() const;

  void pcm_to_mel(const std::vector<float> &pcm, int n_threads);
  /* fills probs (lang_max_id() entries), returns the best language id */
  int lang_auto_detect(int offset_ms, int n_threads, std::vector<float> &probs);

  void print_timings();
  const std::string &get_model_path() const { return model_path_; }

  /* segments [start, end) of the decoding run behind state */
  static std::vector<Segment> get_segments(whisper_state *state, int start,
                                           int end);

  /* number of supported languages */
  static int lang_max_id();
  static const std::vector<std::string> &languages();
  static const std::string &language(int id);
  static std::string system_info();

private:
  struct ContextDeleter {
    void operator()(whisper_context *ctx) const { whisper_free(ctx); }
  };

  static Segment make_segment(int64_t t0, int64_t t1, const char *text);

  std::string model_path_;
  std::unique_ptr<whisper_context, ContextDeleter> ctx_;
};

#endif
