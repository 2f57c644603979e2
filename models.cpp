//
//  models.cpp
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
#include <boost/filesystem.hpp>
#include <boost/process.hpp>
#include <cstdlib>

#include "error.hpp"
#include "log.hpp"
#include "models.hpp"
#include "utils.hpp"

namespace fs = boost::filesystem;
namespace bp = boost::process;

static const std::string models_url(
    "https://huggingface.co/ggerganov/whisper.cpp/resolve/main");
static const std::string app_dir("whisper-transcribe");

std::string default_models_dir() {
  const char *data_home = std::getenv("XDG_DATA_HOME");
  if (data_home != nullptr && *data_home != '\0') {
    return (fs::path(data_home) / app_dir / "models").string();
  }
  const char *home = std::getenv("HOME");
  if (home != nullptr && *home != '\0') {
    return (fs::path(home) / ".local" / "share" / app_dir / "models").string();
  }
  return "models";
}

const std::vector<std::string> &available_models() {
  static const std::vector<std::string> models{
      "tiny",           "tiny-q5_1",           "tiny-q8_0",
      "tiny.en",        "tiny.en-q5_1",        "tiny.en-q8_0",
      "base",           "base-q5_1",           "base-q8_0",
      "base.en",        "base.en-q5_1",        "base.en-q8_0",
      "small",          "small-q5_1",          "small-q8_0",
      "small.en",       "small.en-q5_1",       "small.en-q8_0",
      "medium",         "medium-q5_0",         "medium-q8_0",
      "medium.en",      "medium.en-q5_0",      "medium.en-q8_0",
      "large-v1",       "large-v2",            "large-v2-q5_0",
      "large-v2-q8_0",  "large-v3",            "large-v3-q5_0",
      "large-v3-turbo", "large-v3-turbo-q5_0", "large-v3-turbo-q8_0"};
  return models;
}

static std::string model_file_name(const std::string &name) {
  return "ggml-" + name + ".bin";
}

std::string model_url(const std::string &name) {
  return models_url + "/" + model_file_name(name);
}

std::string download_model(const std::string &name,
                           const std::string &models_dir) {
  fs::path dir(models_dir);
  fs::create_directories(dir);
  fs::path target = dir / model_file_name(name);
  fs::path partial = target;
  partial += ".part";

  auto curl = bp::search_path("curl");
  if (curl.empty()) {
    throw ConversionUnavailableError("curl");
  }

  auto url = model_url(name);
  BOOST_LOG_TRIVIAL(info) << "models:: downloading " << url << " to "
                          << target;
  int rc;
  {
    TimeElapsed timer("models:: download of " + name);
    try {
      rc = bp::system(curl, "-f", "-L", "-sS", "-o", partial.string(), url,
                      bp::std_in < bp::null);
    } catch (const bp::process_error &e) {
      boost::system::error_code ec;
      fs::remove(partial, ec);
      throw DownloadError("cannot run curl: " + std::string(e.what()));
    }
  }
  if (rc != 0) {
    boost::system::error_code ec;
    fs::remove(partial, ec);
    throw DownloadError("download of " + url + " failed with exit code " +
                        std::to_string(rc));
  }

  fs::rename(partial, target);
  return target.string();
}

std::string resolve_model(const std::string &name_or_path,
                          const std::string &models_dir) {
  if (fs::is_regular_file(name_or_path)) {
    return name_or_path;
  }

  const auto &models = available_models();
  if (std::find(models.begin(), models.end(), name_or_path) == models.end()) {
    BOOST_LOG_TRIVIAL(error) << "models:: invalid model name " << name_or_path
                             << ", see --models for the available ones";
    throw NotFoundError(name_or_path);
  }

  fs::path dir(models_dir.empty() ? default_models_dir() : models_dir);
  fs::path path = dir / model_file_name(name_or_path);
  if (fs::exists(path)) {
    BOOST_LOG_TRIVIAL(debug) << "models:: model " << name_or_path
                             << " found in " << dir;
    return path.string();
  }
  return download_model(name_or_path, dir.string());
}
