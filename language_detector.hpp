//
//  language_detector.hpp
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

#ifndef _LANGUAGE_DETECTOR_HPP_
#define _LANGUAGE_DETECTOR_HPP_

#include <map>
#include <string>
#include <vector>

#include "whisper.hpp"

struct LanguageDetection {
  std::string language;
  float probability{0};
  std::map<std::string, float> probabilities;
};

class LanguageDetector {
public:
  explicit LanguageDetector(Whisper &whisper) : whisper_(whisper) {}

  LanguageDetection detect(const std::string &media, int offset_ms = 0,
                           int n_threads = 4);
  LanguageDetection detect(const std::vector<float> &pcm, int offset_ms = 0,
                           int n_threads = 4);

private:
  Whisper &whisper_;
};

#endif
