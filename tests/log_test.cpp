//
//  log_test.cpp
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
#include <fcntl.h>
#include <unistd.h>

#include "error.hpp"
#include "log.hpp"
#include "test_utils.hpp"

static void write_stderr(const char *text) {
  ASSERT_EQ(::write(STDERR_FILENO, text, std::strlen(text)),
            static_cast<ssize_t>(std::strlen(text)));
}

TEST(LogTargetTest, Parse) {
  EXPECT_EQ(LogTarget::parse("").kind, LogTarget::Kind::keep);
  EXPECT_EQ(LogTarget::parse("keep").kind, LogTarget::Kind::keep);
  EXPECT_EQ(LogTarget::parse("null").kind, LogTarget::Kind::null);
  EXPECT_EQ(LogTarget::parse("none").kind, LogTarget::Kind::null);
  EXPECT_EQ(LogTarget::parse("stdout").kind, LogTarget::Kind::stdout_stream);
  EXPECT_EQ(LogTarget::parse("stderr").kind, LogTarget::Kind::stderr_stream);
  EXPECT_EQ(LogTarget::parse("log").kind, LogTarget::Kind::log);

  auto file = LogTarget::parse("/tmp/whisper.log");
  EXPECT_EQ(file.kind, LogTarget::Kind::file);
  EXPECT_EQ(file.path, "/tmp/whisper.log");
  EXPECT_EQ(file.to_string(), "/tmp/whisper.log");
}

TEST(StderrRedirectTest, FileTargetIsRestored) {
  ScopedDir dir;
  auto path = dir.file("init.log");
  {
    StderrRedirect redirect(LogTarget::parse(path));
    EXPECT_TRUE(redirect.active());
    write_stderr("inside\n");
  }
  write_stderr("outside\n");
  EXPECT_NE(::fcntl(STDERR_FILENO, F_GETFD), -1);
  EXPECT_EQ(read_file(path), "inside\n");
}

TEST(StderrRedirectTest, KeepDoesNothing) {
  StderrRedirect redirect(LogTarget::parse("keep"));
  EXPECT_FALSE(redirect.active());
}

TEST(StderrRedirectTest, NullTarget) {
  {
    StderrRedirect redirect(LogTarget::parse("null"));
    EXPECT_TRUE(redirect.active());
    write_stderr("discarded\n");
  }
  EXPECT_NE(::fcntl(STDERR_FILENO, F_GETFD), -1);
}

TEST(StderrRedirectTest, UnopenableTargetThrows) {
  EXPECT_THROW(
      {
        StderrRedirect redirect(LogTarget::parse("/nonexistent/dir/init.log"));
      },
      Error);
  EXPECT_NE(::fcntl(STDERR_FILENO, F_GETFD), -1);
}
