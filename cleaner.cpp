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

#include <cleaner.hpp>

#include <vector>

namespace {

const gunichar left_guillemet = 0xab;
const gunichar right_guillemet = 0xbb;
const gunichar em_dash = 0x2014;

bool is_high_punctuation(gunichar c) { return c == '?' || c == '!' || c == ';' || c == ':'; }

std::vector<gunichar> to_codepoints(const std::string &text) {
    std::vector<gunichar> result;
    const char *cur = text.c_str();
    const char *end = cur + text.length();
    while(cur < end) {
        result.push_back(g_utf8_get_char(cur));
        cur = g_utf8_next_char(cur);
    }
    return result;
}

void append_codepoint(std::string &buf, gunichar c) {
    char tmp[8];
    const int len = g_unichar_to_utf8(c, tmp);
    buf.append(tmp, len);
}

} // namespace

bool FrenchCleaner::is_space(gunichar c) const {
    if(c == 0xa0 || c == 0x202f) {
        return true;
    }
    return g_unichar_isspace(c);
}

std::string FrenchCleaner::clean(const std::string &text, bool is_first_run_in_line) const {
    if(!g_utf8_validate(text.c_str(), text.length(), nullptr)) {
        return text;
    }
    // Collapse all whitespace runs into one plain space first so the rules
    // below only need to look at single characters.
    std::vector<gunichar> chars;
    for(const auto c : to_codepoints(text)) {
        if(is_space(c)) {
            if(chars.empty() || chars.back() != ' ') {
                chars.push_back(' ');
            }
        } else {
            chars.push_back(c);
        }
    }

    std::vector<gunichar> out;
    out.reserve(chars.size() + 8);
    for(size_t i = 0; i < chars.size(); ++i) {
        const gunichar c = chars[i];
        const bool has_next = i + 1 < chars.size();
        const gunichar next = has_next ? chars[i + 1] : 0;
        if(c == ' ') {
            if(has_next && (is_high_punctuation(next) || next == right_guillemet)) {
                out.push_back(nb_char);
            } else if(i > 0 && chars[i - 1] == left_guillemet) {
                out.push_back(nb_char);
            } else if(is_first_run_in_line && i == 1 && chars[0] == em_dash) {
                out.push_back(nb_char);
            } else {
                out.push_back(c);
            }
        } else if(is_high_punctuation(c)) {
            if(!out.empty() && g_unichar_isalpha(out.back()) &&
               (!has_next || is_gap(next) || is_high_punctuation(next))) {
                out.push_back(nb_char);
            }
            out.push_back(c);
        } else if(c == right_guillemet) {
            if(!out.empty() && !is_gap(out.back())) {
                out.push_back(nb_char);
            }
            out.push_back(c);
        } else if(c == left_guillemet) {
            out.push_back(c);
            if(has_next && !is_gap(next)) {
                out.push_back(nb_char);
            }
        } else {
            out.push_back(c);
        }
    }

    std::string result;
    result.reserve(text.length() + 8);
    for(const auto c : out) {
        append_codepoint(result, c);
    }
    return result;
}

std::string Cleaner::clean(const std::string &text, bool is_first_run_in_line) const {
    return std::visit([&](const auto &c) { return c.clean(text, is_first_run_in_line); }, impl);
}

Cleaner make_cleaner(const std::string &lang, bool autoclean, gunichar nb_char) {
    if(!autoclean) {
        return Cleaner{};
    }
    gchar *lower = g_ascii_strdown(lang.c_str(), -1);
    const bool french = g_str_has_prefix(lower, "fr");
    g_free(lower);
    if(french) {
        return Cleaner{FrenchCleaner{nb_char}};
    }
    return Cleaner{};
}
