//
//  output.cpp
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

#include <algorithm>
#include <fstream>

#include "error.hpp"
#include "log.hpp"
#include "output.hpp"
#include "utils.hpp"

void write_txt(std::ostream &os, const std::vector<Segment> &segments) {
  for (const auto &segment : segments) {
    os << segment.text() << '\n';
  }
}

void write_srt(std::ostream &os, const std::vector<Segment> &segments) {
  int index = 1;
  for (const auto &segment : segments) {
    os << index++ << '\n'
       << to_timestamp(segment.t0(), true) << " --> "
       << to_timestamp(segment.t1(), true) << '\n'
       << segment.text() << "\n\n";
  }
}

void write_vtt(std::ostream &os, const std::vector<Segment> &segments) {
  os << "WEBVTT\n\n";
  for (const auto &segment : segments) {
    os << to_timestamp(segment.t0()) << " --> " << to_timestamp(segment.t1())
       << '\n'
       << segment.text() << "\n\n";
  }
}

static std::string csv_quote(const std::string &text) {
  std::string quoted("\"");
  for (char c : text) {
    if (c == '"')
      quoted += '"';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void write_csv(std::ostream &os, const std::vector<Segment> &segments) {
  os << "start,end,text\n";
  for (const auto &segment : segments) {
    /* milliseconds */
    os << segment.t0() * 10 << ',' << segment.t1() * 10 << ','
       << csv_quote(segment.text()) << '\n';
  }
}

const std::vector<std::string> &output_formats() {
  static const std::vector<std::string> formats{"txt", "srt", "vtt", "csv"};
  return formats;
}

std::string write_output(const std::string &format, const std::string &base,
                         const std::vector<Segment> &segments) {
  const auto &formats = output_formats();
  if (std::find(formats.begin(), formats.end(), format) == formats.end()) {
    throw UsageError("unknown output format " + format);
  }

  std::string path = base + "." + format;
  std::ofstream file(path);
  if (!file) {
    throw Error("cannot open " + path + " for writing");
  }

  if (format == "txt") {
    write_txt(file, segments);
  } else if (format == "srt") {
    write_srt(file, segments);
  } else if (format == "vtt") {
    write_vtt(file, segments);
  } else {
    write_csv(file, segments);
  }

  file.close();
  if (!file) {
    throw Error("cannot write " + path);
  }
  BOOST_LOG_TRIVIAL(info) << "output:: saved " << path;
  return path;
}
