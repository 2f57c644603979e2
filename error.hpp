//
//  error.hpp
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

#ifndef _ERROR_HPP_
#define _ERROR_HPP_

#include <stdexcept>
#include <string>

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/* media or model file does not exist */
class NotFoundError : public Error {
public:
  explicit NotFoundError(const std::string &path)
      : Error("no such file: " + path), path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

/* unsupported WAV layout or malformed container */
class FormatError : public Error {
public:
  using Error::Error;
};

/* external tool (ffmpeg, curl) not found on PATH */
class ConversionUnavailableError : public Error {
public:
  explicit ConversionUnavailableError(const std::string &tool)
      : Error(tool + " is not installed or not in PATH"), tool_(tool) {}

  const std::string &tool() const { return tool_; }

private:
  std::string tool_;
};

class ConversionFailedError : public Error {
public:
  ConversionFailedError(const std::string &media, int exit_code)
      : Error("conversion of " + media + " failed with exit code " +
              std::to_string(exit_code)),
        exit_code_(exit_code) {}

  int exit_code() const { return exit_code_; }

private:
  int exit_code_;
};

/* unknown parameter name, bad parameter value, bad option */
class UsageError : public Error {
public:
  using Error::Error;
};

/* opaque whisper.cpp failure */
class EngineError : public Error {
public:
  using Error::Error;
};

class DownloadError : public Error {
public:
  using Error::Error;
};

#endif
