//
//  output.hpp
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

#ifndef _OUTPUT_HPP_
#define _OUTPUT_HPP_

#include <ostream>
#include <string>
#include <vector>

#include "segment.hpp"

void write_txt(std::ostream &os, const std::vector<Segment> &segments);
void write_srt(std::ostream &os, const std::vector<Segment> &segments);
void write_vtt(std::ostream &os, const std::vector<Segment> &segments);
void write_csv(std::ostream &os, const std::vector<Segment> &segments);

const std::vector<std::string> &output_formats();

/* writes <base>.<format> and returns its path */
std::string write_output(const std::string &format, const std::string &base,
                         const std::vector<Segment> &segments);

#endif
