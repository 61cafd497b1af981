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

#include <string>
#include <string_view>

enum class EscapeFormat : int {
    None,
    Html,
    Tex,
};

std::string escape_html(std::string_view s);
std::string escape_tex(std::string_view s);
// For the URL argument of \href.
std::string escape_tex_url(std::string_view s);

std::string escape_for(EscapeFormat f, std::string_view s);
