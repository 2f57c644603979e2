//
//  models.hpp
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

#ifndef _MODELS_HPP_
#define _MODELS_HPP_

#include <string>
#include <vector>

/* $XDG_DATA_HOME/whisper-transcribe/models or the ~/.local/share fallback */
std::string default_models_dir();

/* ggml model names published for whisper.cpp */
const std::vector<std::string> &available_models();

std::string model_url(const std::string &name);

/*
 * Path of an existing model file, or of the named model inside models_dir
 * (default_models_dir() when empty), downloading it when missing.
 */
std::string resolve_model(const std::string &name_or_path,
                          const std::string &models_dir = "");

std::string download_model(const std::string &name,
                           const std::string &models_dir);

#endif
