/*
 * Copyright 2022 Jussi Pakkanen
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <metadata.hpp>

#include <filesystem>
#include <string>
#include <vector>

struct RenderOutcome {
    std::string format;
    std::filesystem::path path;
    bool success;
    std::string message; // Error description when not successful.
};

// Renders every configured output format, each in its own thread. A
// failing format does not stop the others.
std::vector<RenderOutcome> render_all(const Book &book);

// Renders one format to the given path. Throws on failure.
void render_format(const Book &book, const std::string &format, const std::filesystem::path &dest);
