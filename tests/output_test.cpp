//
//  output_test.cpp
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
#include <sstream>

#include "error.hpp"
#include "output.hpp"
#include "test_utils.hpp"

static const std::vector<Segment> segments{
    Segment(0, 150, "Hello there."), Segment(150, 6012, "She said \"hi\".")};

TEST(OutputTest, Txt) {
  std::ostringstream os;
  write_txt(os, segments);
  EXPECT_EQ(os.str(), "Hello there.\nShe said \"hi\".\n");
}

TEST(OutputTest, Srt) {
  std::ostringstream os;
  write_srt(os, segments);
  EXPECT_EQ(os.str(), "1\n00:00:00,000 --> 00:00:01,500\nHello there.\n\n"
                      "2\n00:00:01,500 --> 00:01:00,120\nShe said \"hi\".\n\n");
}

TEST(OutputTest, Vtt) {
  std::ostringstream os;
  write_vtt(os, segments);
  EXPECT_EQ(os.str(), "WEBVTT\n\n"
                      "00:00:00.000 --> 00:00:01.500\nHello there.\n\n"
                      "00:00:01.500 --> 00:01:00.120\nShe said \"hi\".\n\n");
}

TEST(OutputTest, Csv) {
  std::ostringstream os;
  write_csv(os, segments);
  EXPECT_EQ(os.str(), "start,end,text\n"
                      "0,1500,\"Hello there.\"\n"
                      "1500,60120,\"She said \"\"hi\"\".\"\n");
}

TEST(OutputTest, WriteOutputFile) {
  ScopedDir dir;
  auto path = write_output("srt", dir.file("talk"), segments);
  EXPECT_EQ(path, dir.file("talk.srt"));
  EXPECT_EQ(read_file(path).substr(0, 2), "1\n");
}

TEST(OutputTest, UnknownFormat) {
  ScopedDir dir;
  EXPECT_THROW(write_output("docx", dir.file("talk"), segments), UsageError);
  EXPECT_TRUE(dir.empty());
}
