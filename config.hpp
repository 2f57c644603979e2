//
//  config.hpp
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

#ifndef _CONFIG_HPP_
#define _CONFIG_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "log.hpp"
#include "params.hpp"

class Config {
 public:
  const std::string& get_model() const { return model_; }
  const std::string& get_models_dir() const { return models_dir_; }
  SamplingStrategy get_sampling_strategy() const { return sampling_strategy_; }
  const LogTarget& get_log_target() const { return log_target_; }
  const std::map<std::string, std::string>& get_params() const {
    return params_;
  }
  int get_processors() const { return processors_; }
  int get_log_severity() const { return log_severity_; };
  bool get_detect_language() const { return detect_language_; };
  int get_offset_ms() const { return offset_ms_; };
  int get_threads() const { return threads_; };
  const std::vector<std::string>& get_output_formats() const {
    return output_formats_;
  };
  const std::string& get_output_dir() const { return output_dir_; };

  void set_model(const std::string& model) { model_ = model; }
  void set_models_dir(const std::string& models_dir) {
    models_dir_ = models_dir;
  }
  void set_sampling_strategy(SamplingStrategy sampling_strategy) {
    sampling_strategy_ = sampling_strategy;
  }
  void set_log_target(const LogTarget& log_target) {
    log_target_ = log_target;
  }
  void set_param(const std::string& name, const std::string& value) {
    params_[name] = value;
  }
  void set_processors(int processors) { processors_ = processors; }
  void set_log_severity(int log_severity) { log_severity_ = log_severity; };
  void set_detect_language(bool detect_language) {
    detect_language_ = detect_language;
  };
  void set_offset_ms(int offset_ms) { offset_ms_ = offset_ms; };
  void set_threads(int threads) { threads_ = threads; };
  void set_output_formats(const std::vector<std::string>& output_formats) {
    output_formats_ = output_formats;
  };
  void set_output_dir(const std::string& output_dir) {
    output_dir_ = output_dir;
  };

 private:
  std::string model_{"tiny"};
  std::string models_dir_;
  SamplingStrategy sampling_strategy_{SamplingStrategy::greedy};
  LogTarget log_target_;
  std::map<std::string, std::string> params_;
  int processors_{0};
  int log_severity_{2};
  bool detect_language_{false};
  int offset_ms_{0};
  int threads_{4};
  std::vector<std::string> output_formats_;
  std::string output_dir_;
};

#endif
