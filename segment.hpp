//
//  segment.hpp
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

#ifndef _SEGMENT_HPP_
#define _SEGMENT_HPP_

#include <cstdint>
#include <ostream>
#include <string>
#include <utility>

/* one transcribed span, times are whisper ticks passed through unchanged */
class Segment {
public:
  Segment(int64_t t0, int64_t t1, std::string text)
      : t0_(t0), t1_(t1), text_(std::move(text)) {}

  int64_t t0() const { return t0_; }
  int64_t t1() const { return t1_; }
  const std::string &text() const { return text_; }

  bool operator==(const Segment &other) const {
    return t0_ == other.t0_ && t1_ == other.t1_ && text_ == other.text_;
  }
  bool operator!=(const Segment &other) const { return !(*this == other); }

private:
  int64_t t0_;
  int64_t t1_;
  std::string text_;
};

inline std::ostream &operator<<(std::ostream &os, const Segment &segment) {
  return os << "t0=" << segment.t0() << ", t1=" << segment.t1()
            << ", text=" << segment.text();
}

#endif
