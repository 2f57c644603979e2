//
//  main.cpp
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

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <optional>

#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "models.hpp"
#include "output.hpp"
#include "transcriber.hpp"
#include "utils.hpp"

namespace po = boost::program_options;
namespace postyle = boost::program_options::command_line_style;
namespace fs = boost::filesystem;

static const std::string version("whisper-transcribe-1.0.0");

static void print_segment(const Segment &segment) {
  std::cout << "[" << to_timestamp(segment.t0()) << " --> "
            << to_timestamp(segment.t1()) << "] " << segment.text()
            << std::endl;
}

static std::string output_base(const Config &config,
                               const std::string &media) {
  fs::path path(media);
  fs::path dir = config.get_output_dir().empty()
                     ? path.parent_path()
                     : fs::path(config.get_output_dir());
  return (dir / path.stem()).string();
}

static void detect(Transcriber &transcriber, const Config &config,
                   const std::string &media) {
  auto result = transcriber.detect_language(media, config.get_offset_ms(),
                                            config.get_threads());
  std::cout << media << ": " << result.language << " (p = " << std::fixed
            << std::setprecision(4) << result.probability << ")"
            << std::defaultfloat << std::endl;
  for (const auto &[language, probability] : result.probabilities) {
    BOOST_LOG_TRIVIAL(debug) << "main:: " << language << " " << probability;
  }
}

static void transcribe(Transcriber &transcriber, const Config &config,
                       const std::string &media, bool print_segments) {
  SegmentCallback callback;
  if (print_segments) {
    callback = [](const Segment &segment, const std::string &) {
      print_segment(segment);
    };
  }

  std::optional<int> processors;
  if (config.get_processors() > 0) {
    processors = config.get_processors();
  }

  auto result = transcriber.transcribe(media, processors, callback);
  BOOST_LOG_TRIVIAL(info) << "main:: " << media << " language "
                          << result.language << ", "
                          << result.segments.size() << " segments";

  if (config.get_output_formats().empty()) {
    if (!print_segments) {
      write_txt(std::cout, result.segments);
    }
    return;
  }
  for (const auto &format : config.get_output_formats()) {
    write_output(format, output_base(config, media), result.segments);
  }
}

int main(int argc, char *argv[]) {
  int rc(EXIT_SUCCESS);
  po::options_description desc("Options");
  desc.add_options()
      ("version,v", "Print version and exit")
      ("model,m", po::value<std::string>()->default_value("tiny"), "Model name or path to a ggml model file")
      ("models_dir", po::value<std::string>()->default_value(""), "Directory where models are stored and downloaded")
      ("sampling_strategy,s", po::value<std::string>()->default_value("greedy"), "Sampling strategy greedy or beam_search")
      ("param,p", po::value<std::vector<std::string>>()->composing(), "Whisper parameter as name=value, repeatable")
      ("processors,n", po::value<int>()->default_value(0), "Split audio across processors using whisper_full_parallel")
      ("redirect_logs,r", po::value<std::string>()->default_value("keep"), "Whisper init logs: keep, null, stdout, stderr, log or a file path")
      ("detect_language", po::bool_switch(), "Detect language instead of transcribing")
      ("offset_ms", po::value<int>()->default_value(0), "Language detection offset in ms")
      ("threads,t", po::value<int>()->default_value(4), "Language detection threads")
      ("output_format,o", po::value<std::vector<std::string>>()->composing(), "Output format txt, srt, vtt or csv, repeatable")
      ("output_dir", po::value<std::string>()->default_value(""), "Output directory, defaults to the media directory")
      ("print_segments", po::bool_switch(), "Print segments as they are decoded")
      ("print_params", po::bool_switch(), "Print the whisper parameters in use")
      ("print_schema", "Print the whisper parameters schema and exit")
      ("languages", "Print the supported languages and exit")
      ("models", "Print the available model names and exit")
      ("system_info", "Print whisper system info and exit")
      ("print_timings", po::bool_switch(), "Print whisper timings at exit")
      ("log_level,d", po::value<int>()->default_value(2), "Log level from 0=trace to 5=fatal")
      ("media", po::value<std::vector<std::string>>(), "Media files to process")
      ("help,h", "Print this help " "message");
  po::positional_options_description pos;
  pos.add("media", -1);
  int unix_style = postyle::unix_style | postyle::short_allow_next;

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(pos)
                  .style(unix_style)
                  .run(),
              vm);

    po::notify(vm);

    if (vm.count("version")) {
      std::cout << version << '\n';
      return EXIT_SUCCESS;
    }
    if (vm.count("help")) {
      std::cout << "USAGE: " << argv[0] << " [options] media...\n"
                << desc << '\n';
      return EXIT_SUCCESS;
    }

  } catch (po::error &poe) {
    std::cerr << poe.what() << '\n'
              << "USAGE: " << argv[0] << " [options] media...\n"
              << desc << '\n';
    return EXIT_FAILURE;
  }

  Config config;
  config.set_log_severity(vm["log_level"].as<int>());

  /* init logging */
  log_init(config);

  BOOST_LOG_TRIVIAL(debug) << "main:: initializing ...";
  try {
    if (vm.count("models")) {
      for (const auto &name : available_models()) {
        std::cout << name << '\n';
      }
      return EXIT_SUCCESS;
    }
    if (vm.count("languages")) {
      for (const auto &code : Transcriber::available_languages()) {
        std::cout << code << '\n';
      }
      return EXIT_SUCCESS;
    }
    if (vm.count("system_info")) {
      std::cout << Transcriber::system_info() << std::endl;
      return EXIT_SUCCESS;
    }
    if (vm.count("print_schema")) {
      for (const auto &info : Transcriber::get_params_schema()) {
        std::cout << std::left << std::setw(24) << info.name << std::setw(6)
                  << to_string(info.type) << info.description << '\n';
      }
      return EXIT_SUCCESS;
    }

    config.set_model(vm["model"].as<std::string>());
    config.set_models_dir(vm["models_dir"].as<std::string>());
    config.set_sampling_strategy(
        parse_sampling_strategy(vm["sampling_strategy"].as<std::string>()));
    config.set_log_target(
        LogTarget::parse(vm["redirect_logs"].as<std::string>()));
    config.set_processors(vm["processors"].as<int>());
    config.set_detect_language(vm["detect_language"].as<bool>());
    config.set_offset_ms(vm["offset_ms"].as<int>());
    config.set_threads(vm["threads"].as<int>());
    config.set_output_dir(vm["output_dir"].as<std::string>());
    if (vm.count("output_format")) {
      config.set_output_formats(
          vm["output_format"].as<std::vector<std::string>>());
    }
    if (vm.count("param")) {
      for (const auto &param : vm["param"].as<std::vector<std::string>>()) {
        auto eq = param.find('=');
        if (eq == std::string::npos || eq == 0) {
          throw UsageError("parameter " + param + " is not name=value");
        }
        config.set_param(param.substr(0, eq), param.substr(eq + 1));
      }
    }
    for (const auto &format : config.get_output_formats()) {
      const auto &formats = output_formats();
      if (std::find(formats.begin(), formats.end(), format) == formats.end()) {
        throw UsageError("unknown output format " + format);
      }
    }

    auto transcriber = Transcriber::create(config);
    BOOST_LOG_TRIVIAL(debug) << "main:: init done";

    if (vm["print_params"].as<bool>()) {
      for (const auto &[name, value] : transcriber->get_params()) {
        std::cout << name << " = " << value << '\n';
      }
    }

    std::vector<std::string> media;
    if (vm.count("media")) {
      media = vm["media"].as<std::vector<std::string>>();
    }
    for (const auto &file : media) {
      if (config.get_detect_language()) {
        detect(*transcriber, config, file);
      } else {
        transcribe(*transcriber, config, file,
                   vm["print_segments"].as<bool>());
      }
    }

    if (vm["print_timings"].as<bool>()) {
      transcriber->print_timings();
    }
  } catch (std::exception &e) {
    BOOST_LOG_TRIVIAL(fatal) << "main:: fatal exception error: " << e.what();
    rc = EXIT_FAILURE;
  }

  return rc;
}
