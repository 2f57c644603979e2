//
//  log.cpp
//
//  Copyright (c) 2019 2020 Andrea Bondavalli. All rights reserved.
//
//  This program is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  any later version.
//
//  This program is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with this program.  If not, see <http://www.gnu.org/licenses/>.
//

#include <boost/algorithm/string.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/setup/console.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <iostream>
#include <whisper.h>

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"

namespace logging = boost::log;
namespace expr = boost::log::expressions;
namespace keywords = boost::log::keywords;

void log_init(const Config &config) {
  boost::shared_ptr<logging::core> core = logging::core::get();
  // remove all sink in case of re-configuration
  core->remove_all_sinks();
  logging::add_console_log(
      std::clog, keywords::format = (expr::stream
                                     << "[" << logging::trivial::severity
                                     << "] " << expr::smessage));
  // set log level
  core->set_filter(logging::trivial::severity >=
                   static_cast<logging::trivial::severity_level>(
                       config.get_log_severity()));
}

LogTarget LogTarget::parse(const std::string &value) {
  LogTarget target;
  if (value.empty() || value == "keep") {
    target.kind = Kind::keep;
  } else if (value == "null" || value == "none") {
    target.kind = Kind::null;
  } else if (value == "stdout") {
    target.kind = Kind::stdout_stream;
  } else if (value == "stderr") {
    target.kind = Kind::stderr_stream;
  } else if (value == "log") {
    target.kind = Kind::log;
  } else {
    target.kind = Kind::file;
    target.path = value;
  }
  return target;
}

std::string LogTarget::to_string() const {
  switch (kind) {
  case Kind::keep:
    return "keep";
  case Kind::null:
    return "null";
  case Kind::stdout_stream:
    return "stdout";
  case Kind::stderr_stream:
    return "stderr";
  case Kind::log:
    return "log";
  case Kind::file:
    return path;
  }
  return "keep";
}

/* forwards whisper.cpp / ggml log lines to boost log */
static void whisper_log_hook(ggml_log_level level, const char *text,
                             void * /* user_data */) {
  static std::string line;
  static ggml_log_level line_level = GGML_LOG_LEVEL_INFO;

  if (level != GGML_LOG_LEVEL_CONT) {
    line_level = level;
  }
  if (text) {
    line += text;
  }
  if (line.empty() || line.back() != '\n') {
    return;
  }

  boost::algorithm::trim_right(line);
  switch (line_level) {
  case GGML_LOG_LEVEL_ERROR:
    BOOST_LOG_TRIVIAL(error) << "whisper:: " << line;
    break;
  case GGML_LOG_LEVEL_WARN:
    BOOST_LOG_TRIVIAL(warning) << "whisper:: " << line;
    break;
  case GGML_LOG_LEVEL_DEBUG:
    BOOST_LOG_TRIVIAL(trace) << "whisper:: " << line;
    break;
  default:
    BOOST_LOG_TRIVIAL(debug) << "whisper:: " << line;
    break;
  }
  line.clear();
}

StderrRedirect::StderrRedirect(const LogTarget &target) {
  int fd{-1};
  bool owned{false};

  switch (target.kind) {
  case LogTarget::Kind::keep:
  case LogTarget::Kind::stderr_stream:
    return;
  case LogTarget::Kind::log:
    whisper_log_set(whisper_log_hook, nullptr);
    hooked_ = true;
    return;
  case LogTarget::Kind::null:
    fd = ::open("/dev/null", O_WRONLY);
    owned = true;
    break;
  case LogTarget::Kind::stdout_stream:
    std::fflush(stdout);
    std::cout.flush();
    fd = STDOUT_FILENO;
    break;
  case LogTarget::Kind::file:
    fd = ::open(target.path.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
    owned = true;
    break;
  }

  if (fd < 0) {
    throw Error("cannot open log target " + target.to_string() + ": " +
                std::strerror(errno));
  }

  std::fflush(stderr);
  std::cerr.flush();
  saved_fd_ = ::dup(STDERR_FILENO);
  if (saved_fd_ < 0 || ::dup2(fd, STDERR_FILENO) < 0) {
    int err = errno;
    if (saved_fd_ >= 0) {
      ::close(saved_fd_);
      saved_fd_ = -1;
    }
    if (owned) {
      ::close(fd);
    }
    throw Error(std::string("cannot redirect stderr: ") + std::strerror(err));
  }
  if (owned) {
    ::close(fd);
  }
  BOOST_LOG_TRIVIAL(debug) << "log:: stderr redirected to "
                           << target.to_string();
}

StderrRedirect::~StderrRedirect() {
  if (hooked_) {
    whisper_log_set(nullptr, nullptr);
  }
  if (saved_fd_ >= 0) {
    std::fflush(stderr);
    std::cerr.flush();
    ::dup2(saved_fd_, STDERR_FILENO);
    ::close(saved_fd_);
  }
}
