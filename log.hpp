//
//  log.hpp
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

#ifndef _LOG_HPP_
#define _LOG_HPP_

#include <boost/log/trivial.hpp>
#include <string>

class Config;

void log_init(const Config &config);

/* where whisper.cpp output goes while the model context is created */
struct LogTarget {
  enum class Kind { keep, null, stdout_stream, stderr_stream, file, log };

  Kind kind{Kind::keep};
  std::string path;

  static LogTarget parse(const std::string &value);
  std::string to_string() const;
};

/* swaps file descriptor 2 for the lifetime of the object */
class StderrRedirect {
public:
  explicit StderrRedirect(const LogTarget &target);
  StderrRedirect(const StderrRedirect &) = delete;
  StderrRedirect &operator=(const StderrRedirect &) = delete;
  ~StderrRedirect();

  bool active() const { return saved_fd_ >= 0; }

private:
  int saved_fd_{-1};
  bool hooked_{false};
};

#endif
