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

#include <glib.h>

#include <string>
#include <variant>

struct NoOpCleaner {
    std::string clean(const std::string &text, bool) const { return text; }
};

// French typographic rules: thin spaces before high punctuation,
// spaces inside guillemets and after dialogue dashes.
class FrenchCleaner {
public:
    explicit FrenchCleaner(gunichar nb_char_ = ' ') : nb_char(nb_char_) {}

    std::string clean(const std::string &text, bool is_first_run_in_line) const;

    gunichar nonbreaking_char() const { return nb_char; }

private:
    bool is_space(gunichar c) const;
    bool is_gap(gunichar c) const { return is_space(c) || c == nb_char; }

    gunichar nb_char;
};

class Cleaner {
public:
    Cleaner() : impl(NoOpCleaner{}) {}
    explicit Cleaner(FrenchCleaner f) : impl(f) {}

    std::string clean(const std::string &text, bool is_first_run_in_line) const;

    bool is_noop() const { return std::holds_alternative<NoOpCleaner>(impl); }

private:
    std::variant<NoOpCleaner, FrenchCleaner> impl;
};

Cleaner make_cleaner(const std::string &lang, bool autoclean, gunichar nb_char);
