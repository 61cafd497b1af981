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
#include <unordered_map>

typedef std::unordered_map<std::string, std::string> TemplateVars;

// Replaces {{name}} and {{{name}}} with the value of name. Values are
// inserted as is, callers escape them for the target format.
// Throws RenderError on unknown names or if the result is not UTF-8.
std::string expand_template(const std::string &templ, const TemplateVars &vars);
