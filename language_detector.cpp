//
//  language_detector.cpp
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

#include "audio.hpp"
#include "error.hpp"
#include "language_detector.hpp"
#include "log.hpp"

LanguageDetection LanguageDetector::detect(const std::string &media,
                                           int offset_ms, int n_threads) {
  return detect(load_audio(media), offset_ms, n_threads);
}

LanguageDetection LanguageDetector::detect(const std::vector<float> &pcm,
                                           int offset_ms, int n_threads) {
  if (n_threads < 1) {
    throw UsageError("n_threads must be at least 1, got " +
                     std::to_string(n_threads));
  }
  BOOST_LOG_TRIVIAL(info) << "detector:: detecting language, offset "
                          << offset_ms << " ms, threads " << n_threads;
  whisper_.pcm_to_mel(pcm, n_threads);

  std::vector<float> probs;
  int id = whisper_.lang_auto_detect(offset_ms, n_threads, probs);

  const auto &languages = Whisper::languages();
  LanguageDetection result;
  result.language = languages[id];
  result.probability = probs[id];
  for (size_t i = 0; i < languages.size(); i++) {
    result.probabilities[languages[i]] = probs[i];
  }

  BOOST_LOG_TRIVIAL(info) << "detector:: detected language "
                          << result.language << " with probability "
                          << result.probability;
  return result;
}
