//
//  utils.cpp
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

#include <cstdio>

#include "utils.hpp"

std::string to_timestamp(int64_t t, bool comma) {
  int64_t msec = t * 10;
  int64_t hr = msec / (1000 * 60 * 60);
  msec = msec - hr * (1000 * 60 * 60);
  int64_t min = msec / (1000 * 60);
  msec = msec - min * (1000 * 60);
  int64_t sec = msec / 1000;
  msec = msec - sec * 1000;

  char buf[32];
  snprintf(buf, sizeof(buf), "%02d:%02d:%02d%s%03d", (int)hr, (int)min,
           (int)sec, comma ? "," : ".", (int)msec);
  return std::string(buf);
}

/* length of the valid UTF-8 sequence at in, or 0 with bad set to the
   length of the longest valid prefix to replace */
static size_t utf8_sequence(const unsigned char *in, size_t avail,
                            size_t &bad) {
  unsigned char c = in[0];
  size_t len;
  unsigned char lo = 0x80, hi = 0xBF;

  if (c < 0x80) {
    return 1;
  } else if (c >= 0xC2 && c <= 0xDF) {
    len = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    len = 3;
    if (c == 0xE0)
      lo = 0xA0;
    else if (c == 0xED)
      hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    len = 4;
    if (c == 0xF0)
      lo = 0x90;
    else if (c == 0xF4)
      hi = 0x8F;
  } else {
    bad = 1;
    return 0;
  }

  for (size_t i = 1; i < len; i++) {
    if (i >= avail) {
      bad = i;
      return 0;
    }
    /* the second byte range depends on the lead byte */
    unsigned char min = (i == 1) ? lo : 0x80;
    unsigned char max = (i == 1) ? hi : 0xBF;
    if (in[i] < min || in[i] > max) {
      bad = i;
      return 0;
    }
  }
  return len;
}

std::string sanitize_utf8(const char *text) {
  static const char replacement[] = "\xEF\xBF\xBD";
  std::string out;
  if (text == nullptr) {
    return out;
  }

  auto in = reinterpret_cast<const unsigned char *>(text);
  size_t size = std::char_traits<char>::length(text);
  out.reserve(size);
  size_t pos = 0;
  while (pos < size) {
    size_t bad = 0;
    size_t len = utf8_sequence(in + pos, size - pos, bad);
    if (len > 0) {
      out.append(text + pos, len);
      pos += len;
    } else {
      out.append(replacement);
      pos += bad;
    }
  }
  return out;
}
