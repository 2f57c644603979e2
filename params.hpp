//
//  params.hpp
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

#ifndef _PARAMS_HPP_
#define _PARAMS_HPP_

#include <functional>
#include <map>
#include <string>
#include <vector>
#include <whisper.h>

enum class SamplingStrategy { greedy, beam_search };

SamplingStrategy parse_sampling_strategy(const std::string &name);
std::string to_string(SamplingStrategy strategy);

struct ParamInfo {
  enum class Type { integer, real, boolean, text };

  std::string name;
  Type type;
  std::string description;
};

std::string to_string(ParamInfo::Type type);

/*
 * Typed view over whisper_full_params.
 *
 * Fields are addressed by the names in schema(); the new segment callback
 * and the other engine hooks are not part of it and are wired per call.
 */
class Params {
public:
  static Params create(SamplingStrategy strategy);

  /* all-or-nothing, throws UsageError on unknown name or bad value */
  void apply(const std::map<std::string, std::string> &overrides);
  std::map<std::string, std::string> snapshot() const;

  static const std::vector<ParamInfo> &schema();
  static bool has(const std::string &name);

  SamplingStrategy strategy() const { return strategy_; }
  int n_threads() const { return params_.n_threads; }
  void set_n_threads(int n_threads);
  const std::string &language() const { return language_; }
  void set_language(const std::string &language);
  bool translate() const { return params_.translate; }
  void set_translate(bool translate) { params_.translate = translate; }

  /* engine struct pointing into this object, valid while it lives */
  whisper_full_params full_params() const;

private:
  struct Field {
    ParamInfo info;
    std::function<void(Params &, const std::string &)> set;
    std::function<std::string(const Params &)> get;
  };

  explicit Params(SamplingStrategy strategy);

  static const std::vector<Field> &fields();
  template <typename T>
  static Field field(const char *name, const char *description,
                     T whisper_full_params::*member);

  void set(const std::string &name, const std::string &value);

  SamplingStrategy strategy_;
  whisper_full_params params_;
  std::string language_;
  std::string initial_prompt_;
};

#endif
