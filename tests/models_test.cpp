//
//  models_test.cpp
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

#include "error.hpp"
#include "models.hpp"
#include "test_utils.hpp"

namespace fs = boost::filesystem;

TEST(ModelsTest, DefaultDirFollowsXdgDataHome) {
  ScopedEnv xdg("XDG_DATA_HOME", "/data");
  EXPECT_EQ(default_models_dir(), "/data/whisper-transcribe/models");
}

TEST(ModelsTest, DefaultDirFallsBackToHome) {
  ScopedEnv xdg("XDG_DATA_HOME", "");
  ScopedEnv home("HOME", "/home/user");
  EXPECT_EQ(default_models_dir(),
            "/home/user/.local/share/whisper-transcribe/models");
}

TEST(ModelsTest, Url) {
  EXPECT_EQ(model_url("base.en"),
            "https://huggingface.co/ggerganov/whisper.cpp/resolve/main/"
            "ggml-base.en.bin");
}

TEST(ModelsTest, ExistingPathIsUsedAsIs) {
  ScopedDir dir;
  auto path = dir.file("custom-model.bin");
  write_script(path, "");
  EXPECT_EQ(resolve_model(path), path);
}

TEST(ModelsTest, UnknownNameIsNotFound) {
  ScopedDir dir;
  EXPECT_THROW(resolve_model("enormous", dir.path().string()), NotFoundError);
  EXPECT_TRUE(dir.empty());
}

TEST(ModelsTest, NamedModelInModelsDir) {
  ScopedDir dir;
  auto path = dir.file("ggml-tiny.en.bin");
  write_script(path, "");
  EXPECT_EQ(resolve_model("tiny.en", dir.path().string()), path);
}

class DownloadTest : public ::testing::Test {
protected:
  DownloadTest() : path_env_("PATH", bin_.path().string()) {}

  ScopedDir bin_;
  ScopedDir models_;
  ScopedEnv path_env_;
};

TEST_F(DownloadTest, MissingCurl) {
  EXPECT_THROW(resolve_model("tiny", models_.path().string()),
               ConversionUnavailableError);
}

TEST_F(DownloadTest, FailedTransferLeavesNothing) {
  write_script(bin_.file("curl"), "exit 22");
  EXPECT_THROW(resolve_model("tiny", models_.path().string()), DownloadError);
  EXPECT_TRUE(models_.empty());
}

TEST_F(DownloadTest, DownloadsMissingModel) {
  write_script(bin_.file("curl"),
               "while [ $# -gt 0 ]; do\n"
               "  if [ \"$1\" = \"-o\" ]; then out=\"$2\"; fi\n"
               "  shift\n"
               "done\n"
               "echo model > \"$out\"");
  auto path = resolve_model("base", models_.path().string());
  EXPECT_EQ(path, models_.file("ggml-base.bin"));
  EXPECT_EQ(read_file(path), "model\n");
  EXPECT_FALSE(fs::exists(path + ".part"));
}
