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

#include <escape.hpp>

namespace {

// UTF-8 encodings of U+00A0 and U+202F.
const std::string_view nbsp{"\xc2\xa0"};
const std::string_view narrow_nbsp{"\xe2\x80\xaf"};

} // namespace

std::string escape_html(std::string_view s) {
    std::string result;
    result.reserve(s.length());
    for(const char c : s) {
        switch(c) {
        case '&':
            result += "&amp;";
            break;
        case '<':
            result += "&lt;";
            break;
        case '>':
            result += "&gt;";
            break;
        case '"':
            result += "&quot;";
            break;
        case '\'':
            result += "&#39;";
            break;
        default:
            result += c;
        }
    }
    return result;
}

std::string escape_tex(std::string_view s) {
    std::string result;
    result.reserve(s.length());
    for(size_t i = 0; i < s.length(); ++i) {
        const char c = s[i];
        if(s.substr(i, nbsp.length()) == nbsp) {
            result += '~';
            i += nbsp.length() - 1;
            continue;
        }
        if(s.substr(i, narrow_nbsp.length()) == narrow_nbsp) {
            result += "\\,";
            i += narrow_nbsp.length() - 1;
            continue;
        }
        switch(c) {
        case '\\':
            result += "\\textbackslash{}";
            break;
        case '{':
            result += "\\{";
            break;
        case '}':
            result += "\\}";
            break;
        case '$':
            result += "\\$";
            break;
        case '&':
            result += "\\&";
            break;
        case '#':
            result += "\\#";
            break;
        case '^':
            result += "\\textasciicircum{}";
            break;
        case '_':
            result += "\\_";
            break;
        case '%':
            result += "\\%";
            break;
        case '~':
            result += "\\textasciitilde{}";
            break;
        default:
            result += c;
        }
    }
    return result;
}

std::string escape_tex_url(std::string_view s) {
    std::string result;
    result.reserve(s.length());
    for(const char c : s) {
        if(c == '%' || c == '#' || c == '\\' || c == '{' || c == '}') {
            result += '\\';
        }
        result += c;
    }
    return result;
}

std::string escape_for(EscapeFormat f, std::string_view s) {
    switch(f) {
    case EscapeFormat::Html:
        return escape_html(s);
    case EscapeFormat::Tex:
        return escape_tex(s);
    case EscapeFormat::None:
        break;
    }
    return std::string{s};
}
