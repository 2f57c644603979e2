//
//  params_test.cpp
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

#include <gtest/gtest.h>
#include <cstring>

#include "error.hpp"
#include "params.hpp"

TEST(ParamsTest, GreedyDefaults) {
  auto params = Params::create(SamplingStrategy::greedy);
  auto defaults = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);

  EXPECT_EQ(params.strategy(), SamplingStrategy::greedy);
  EXPECT_EQ(params.n_threads(), defaults.n_threads);
  EXPECT_EQ(params.translate(), defaults.translate);
  EXPECT_EQ(params.language(), defaults.language);

  auto values = params.snapshot();
  EXPECT_EQ(values["strategy"], "greedy");
  EXPECT_EQ(values["greedy.best_of"], std::to_string(defaults.greedy.best_of));
}

TEST(ParamsTest, BeamSearchDefaults) {
  auto params = Params::create(SamplingStrategy::beam_search);
  auto defaults = whisper_full_default_params(WHISPER_SAMPLING_BEAM_SEARCH);

  auto values = params.snapshot();
  EXPECT_EQ(values["strategy"], "beam_search");
  EXPECT_EQ(values["beam_search.beam_size"],
            std::to_string(defaults.beam_search.beam_size));
}

TEST(ParamsTest, ApplyTypedValues) {
  auto params = Params::create(SamplingStrategy::greedy);
  params.apply({{"n_threads", "2"},
                {"translate", "true"},
                {"language", "de"},
                {"temperature", "0.5"},
                {"initial_prompt", "Glossary: whisper"},
                {"beam_search.beam_size", "7"}});

  EXPECT_EQ(params.n_threads(), 2);
  EXPECT_TRUE(params.translate());
  EXPECT_EQ(params.language(), "de");

  auto values = params.snapshot();
  EXPECT_EQ(values["temperature"], "0.5");
  EXPECT_EQ(values["beam_search.beam_size"], "7");
  EXPECT_EQ(values["initial_prompt"], "Glossary: whisper");

  auto full = params.full_params();
  EXPECT_EQ(full.n_threads, 2);
  EXPECT_TRUE(full.translate);
  EXPECT_FLOAT_EQ(full.temperature, 0.5f);
  EXPECT_EQ(full.beam_search.beam_size, 7);
  EXPECT_STREQ(full.language, "de");
  EXPECT_STREQ(full.initial_prompt, "Glossary: whisper");
}

TEST(ParamsTest, BooleanSpellings) {
  auto params = Params::create(SamplingStrategy::greedy);
  params.apply({{"translate", "yes"}});
  EXPECT_TRUE(params.translate());
  params.apply({{"translate", "0"}});
  EXPECT_FALSE(params.translate());
  params.apply({{"translate", "ON"}});
  EXPECT_TRUE(params.translate());
}

TEST(ParamsTest, UnknownFieldLeavesParamsUnchanged) {
  auto params = Params::create(SamplingStrategy::greedy);
  auto before = params.snapshot();

  /* n_threads sorts before the unknown name and must not stick */
  EXPECT_THROW(params.apply({{"n_threads", "3"}, {"unknown_field", "1"}}),
               UsageError);
  EXPECT_EQ(params.snapshot(), before);
}

TEST(ParamsTest, BadValues) {
  auto params = Params::create(SamplingStrategy::greedy);
  auto before = params.snapshot();

  EXPECT_THROW(params.apply({{"n_threads", "four"}}), UsageError);
  EXPECT_THROW(params.apply({{"temperature", "warm"}}), UsageError);
  EXPECT_THROW(params.apply({{"translate", "maybe"}}), UsageError);
  EXPECT_THROW(params.apply({{"language", "klingon"}}), UsageError);
  EXPECT_EQ(params.snapshot(), before);
}

TEST(ParamsTest, ThreadCountMustBePositive) {
  auto params = Params::create(SamplingStrategy::greedy);
  auto before = params.snapshot();

  EXPECT_THROW(params.apply({{"n_threads", "0"}}), UsageError);
  EXPECT_THROW(params.apply({{"n_threads", "-2"}}), UsageError);
  EXPECT_THROW(params.set_n_threads(0), UsageError);
  EXPECT_EQ(params.snapshot(), before);

  params.apply({{"n_threads", "1"}});
  EXPECT_EQ(params.n_threads(), 1);
}

TEST(ParamsTest, AutoLanguage) {
  auto params = Params::create(SamplingStrategy::greedy);
  params.apply({{"language", "auto"}});
  EXPECT_EQ(params.language(), "auto");
  params.apply({{"language", ""}});
  EXPECT_EQ(params.language(), "");
}

TEST(ParamsTest, SnapshotCoversSchemaWithoutCallbacks) {
  auto values = Params::create(SamplingStrategy::greedy).snapshot();
  for (const auto &info : Params::schema()) {
    EXPECT_EQ(values.count(info.name), 1u) << info.name;
    EXPECT_TRUE(Params::has(info.name));
  }
  EXPECT_EQ(values.size(), Params::schema().size() + 1);
  EXPECT_EQ(values.count("new_segment_callback"), 0u);
  EXPECT_FALSE(Params::has("new_segment_callback"));
  EXPECT_FALSE(Params::has("strategy"));
}

TEST(ParamsTest, CopiesOwnTheirStrings) {
  auto params = Params::create(SamplingStrategy::greedy);
  params.apply({{"language", "fr"}});
  Params copy(params);
  params.apply({{"language", "it"}});

  EXPECT_STREQ(copy.full_params().language, "fr");
  EXPECT_STREQ(params.full_params().language, "it");
  EXPECT_EQ(copy.full_params().initial_prompt, nullptr);
}

TEST(ParamsTest, SamplingStrategyNames) {
  EXPECT_EQ(parse_sampling_strategy("greedy"), SamplingStrategy::greedy);
  EXPECT_EQ(parse_sampling_strategy("0"), SamplingStrategy::greedy);
  EXPECT_EQ(parse_sampling_strategy("BEAM_SEARCH"),
            SamplingStrategy::beam_search);
  EXPECT_EQ(parse_sampling_strategy("1"), SamplingStrategy::beam_search);
  EXPECT_THROW(parse_sampling_strategy("random"), UsageError);
  EXPECT_EQ(to_string(SamplingStrategy::beam_search), "beam_search");
}
