//
//  params.cpp
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

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <sstream>

#include "error.hpp"
#include "log.hpp"
#include "params.hpp"

SamplingStrategy parse_sampling_strategy(const std::string &name) {
  auto value = boost::algorithm::to_lower_copy(name);
  if (value == "greedy" || value == "0") {
    return SamplingStrategy::greedy;
  }
  if (value == "beam_search" || value == "beam" || value == "1") {
    return SamplingStrategy::beam_search;
  }
  throw UsageError("unknown sampling strategy " + name);
}

std::string to_string(SamplingStrategy strategy) {
  return strategy == SamplingStrategy::greedy ? "greedy" : "beam_search";
}

std::string to_string(ParamInfo::Type type) {
  switch (type) {
  case ParamInfo::Type::integer:
    return "int";
  case ParamInfo::Type::real:
    return "float";
  case ParamInfo::Type::boolean:
    return "bool";
  case ParamInfo::Type::text:
    return "str";
  }
  return "str";
}

template <typename T> struct param_type;
template <> struct param_type<int> {
  static constexpr ParamInfo::Type value = ParamInfo::Type::integer;
};
template <> struct param_type<float> {
  static constexpr ParamInfo::Type value = ParamInfo::Type::real;
};
template <> struct param_type<bool> {
  static constexpr ParamInfo::Type value = ParamInfo::Type::boolean;
};

static UsageError bad_value(const std::string &name, const std::string &value,
                            ParamInfo::Type type) {
  return UsageError("invalid value '" + value + "' for parameter " + name +
                    ", expected " + to_string(type));
}

template <typename T>
static T parse_value(const std::string &name, const std::string &value) {
  try {
    return boost::lexical_cast<T>(boost::algorithm::trim_copy(value));
  } catch (const boost::bad_lexical_cast &) {
    throw bad_value(name, value, param_type<T>::value);
  }
}

template <>
bool parse_value<bool>(const std::string &name, const std::string &value) {
  auto v = boost::algorithm::to_lower_copy(boost::algorithm::trim_copy(value));
  if (v == "true" || v == "1" || v == "yes" || v == "on") {
    return true;
  }
  if (v == "false" || v == "0" || v == "no" || v == "off") {
    return false;
  }
  throw bad_value(name, value, ParamInfo::Type::boolean);
}

static std::string format_value(int value) { return std::to_string(value); }

static std::string format_value(float value) {
  std::ostringstream os;
  os << value;
  return os.str();
}

static std::string format_value(bool value) {
  return value ? "true" : "false";
}

template <typename T>
Params::Field Params::field(const char *name, const char *description,
                            T whisper_full_params::*member) {
  std::string key(name);
  return Field{ParamInfo{key, param_type<T>::value, description},
               [key, member](Params &p, const std::string &value) {
                 p.params_.*member = parse_value<T>(key, value);
               },
               [member](const Params &p) {
                 return format_value(p.params_.*member);
               }};
}

const std::vector<Params::Field> &Params::fields() {
  using P = whisper_full_params;
  static const std::vector<Field> fields{
      Field{ParamInfo{"n_threads", ParamInfo::Type::integer,
                      "Number of threads to allocate for the inference"},
            [](Params &p, const std::string &value) {
              p.set_n_threads(parse_value<int>("n_threads", value));
            },
            [](const Params &p) { return format_value(p.params_.n_threads); }},
      field("n_max_text_ctx", "Max tokens to use from past text as prompt",
            &P::n_max_text_ctx),
      field("offset_ms", "Start offset in ms", &P::offset_ms),
      field("duration_ms", "Audio duration to process in ms", &P::duration_ms),
      field("translate", "Translate to english", &P::translate),
      field("no_context", "Do not use past transcription as initial prompt",
            &P::no_context),
      field("no_timestamps", "Do not generate timestamps", &P::no_timestamps),
      field("single_segment", "Force single segment output", &P::single_segment),
      field("print_special", "Print special tokens", &P::print_special),
      field("print_progress", "Print progress information", &P::print_progress),
      field("print_realtime", "Print results from within whisper.cpp",
            &P::print_realtime),
      field("print_timestamps", "Print timestamps for each text segment",
            &P::print_timestamps),
      field("token_timestamps", "Enable token-level timestamps",
            &P::token_timestamps),
      field("thold_pt", "Timestamp token probability threshold", &P::thold_pt),
      field("thold_ptsum", "Timestamp token sum probability threshold",
            &P::thold_ptsum),
      field("max_len", "Max segment length in characters", &P::max_len),
      field("split_on_word", "Split on word rather than on token",
            &P::split_on_word),
      field("max_tokens", "Max tokens per segment (0 = no limit)",
            &P::max_tokens),
      field("debug_mode", "Enable debug mode", &P::debug_mode),
      field("audio_ctx", "Overwrite the audio context size (0 = use default)",
            &P::audio_ctx),
      field("tdrz_enable", "Enable tinydiarize speaker turn detection",
            &P::tdrz_enable),
      Field{ParamInfo{"initial_prompt", ParamInfo::Type::text,
                      "Initial prompt prepended to the decoder context"},
            [](Params &p, const std::string &value) {
              p.initial_prompt_ = value;
            },
            [](const Params &p) { return p.initial_prompt_; }},
      Field{ParamInfo{"language", ParamInfo::Type::text,
                      "Language code, empty or \"auto\" for auto-detection"},
            [](Params &p, const std::string &value) {
              p.set_language(boost::algorithm::trim_copy(value));
            },
            [](const Params &p) { return p.language_; }},
      field("detect_language", "Exit after automatically detecting language",
            &P::detect_language),
      field("suppress_blank", "Suppress blank outputs", &P::suppress_blank),
      field("suppress_nst", "Suppress non-speech tokens", &P::suppress_nst),
      field("temperature", "Initial decoding temperature", &P::temperature),
      field("max_initial_ts", "Max initial timestamp", &P::max_initial_ts),
      field("length_penalty", "Length penalty", &P::length_penalty),
      field("temperature_inc", "Temperature increase on fallback",
            &P::temperature_inc),
      field("entropy_thold",
            "Compression ratio threshold, similar to OpenAI's "
            "\"compression_ratio_threshold\"",
            &P::entropy_thold),
      field("logprob_thold", "Average log probability fallback threshold",
            &P::logprob_thold),
      field("no_speech_thold", "No speech probability threshold",
            &P::no_speech_thold),
      Field{ParamInfo{"greedy.best_of", ParamInfo::Type::integer,
                      "Number of candidates kept by greedy sampling"},
            [](Params &p, const std::string &value) {
              p.params_.greedy.best_of = parse_value<int>("greedy.best_of", value);
            },
            [](const Params &p) { return format_value(p.params_.greedy.best_of); }},
      Field{ParamInfo{"beam_search.beam_size", ParamInfo::Type::integer,
                      "Beam size for beam search"},
            [](Params &p, const std::string &value) {
              p.params_.beam_search.beam_size =
                  parse_value<int>("beam_search.beam_size", value);
            },
            [](const Params &p) {
              return format_value(p.params_.beam_search.beam_size);
            }},
      Field{ParamInfo{"beam_search.patience", ParamInfo::Type::real,
                      "Beam search patience (not implemented in whisper.cpp)"},
            [](Params &p, const std::string &value) {
              p.params_.beam_search.patience =
                  parse_value<float>("beam_search.patience", value);
            },
            [](const Params &p) {
              return format_value(p.params_.beam_search.patience);
            }},
  };
  return fields;
}

const std::vector<ParamInfo> &Params::schema() {
  static const std::vector<ParamInfo> schema = [] {
    std::vector<ParamInfo> infos;
    for (const auto &f : fields()) {
      infos.push_back(f.info);
    }
    return infos;
  }();
  return schema;
}

bool Params::has(const std::string &name) {
  for (const auto &f : fields()) {
    if (f.info.name == name) {
      return true;
    }
  }
  return false;
}

Params::Params(SamplingStrategy strategy) : strategy_(strategy) {
  params_ = whisper_full_default_params(strategy == SamplingStrategy::greedy
                                            ? WHISPER_SAMPLING_GREEDY
                                            : WHISPER_SAMPLING_BEAM_SEARCH);
  /* keep string fields in owned storage */
  language_ = params_.language ? params_.language : "";
  initial_prompt_ = params_.initial_prompt ? params_.initial_prompt : "";
  params_.language = nullptr;
  params_.initial_prompt = nullptr;
}

Params Params::create(SamplingStrategy strategy) { return Params(strategy); }

void Params::set_n_threads(int n_threads) {
  if (n_threads < 1) {
    throw UsageError("n_threads must be at least 1, got " +
                     std::to_string(n_threads));
  }
  params_.n_threads = n_threads;
}

void Params::set_language(const std::string &language) {
  if (!language.empty() && language != "auto" &&
      whisper_lang_id(language.c_str()) < 0) {
    throw UsageError("unknown language " + language);
  }
  language_ = language;
}

void Params::set(const std::string &name, const std::string &value) {
  for (const auto &f : fields()) {
    if (f.info.name == name) {
      f.set(*this, value);
      return;
    }
  }
  throw UsageError("unknown parameter " + name);
}

void Params::apply(const std::map<std::string, std::string> &overrides) {
  if (overrides.empty()) {
    return;
  }
  Params next(*this);
  for (const auto &[name, value] : overrides) {
    next.set(name, value);
    BOOST_LOG_TRIVIAL(debug) << "params:: " << name << " = " << value;
  }
  *this = next;
}

std::map<std::string, std::string> Params::snapshot() const {
  std::map<std::string, std::string> values;
  for (const auto &f : fields()) {
    values[f.info.name] = f.get(*this);
  }
  values["strategy"] = to_string(strategy_);
  return values;
}

whisper_full_params Params::full_params() const {
  whisper_full_params params = params_;
  params.language = language_.c_str();
  params.initial_prompt =
      initial_prompt_.empty() ? nullptr : initial_prompt_.c_str();
  return params;
}
