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

#include <bookparser.hpp>
#include <errors.hpp>
#include <utils.hpp>

namespace {

const size_t npos = std::string_view::npos;

GRegex *compile_regex(const char *pattern) {
    GError *err = nullptr;
    GRegex *r = g_regex_new(pattern, GRegexCompileFlags(0), G_REGEX_MATCH_ANCHORED, &err);
    if(err) {
        std::string msg{err->message};
        g_error_free(err);
        throw ParseError(std::string{"internal regex failure: "} + msg);
    }
    return r;
}

bool is_blank(const std::string &line) {
    for(const char c : line) {
        if(c != ' ' && c != '\t') {
            return false;
        }
    }
    return true;
}

int indentation(const std::string &line) {
    int i = 0;
    while(i < (int)line.length() && line[i] == ' ') {
        ++i;
    }
    return i;
}

std::string strip_leading(const std::string &line) {
    size_t i = 0;
    while(i < line.length() && (line[i] == ' ' || line[i] == '\t')) {
        ++i;
    }
    return line.substr(i);
}

void strip_trailing(std::string &s) {
    while(!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
        s.pop_back();
    }
}

// Tabs in the indentation advance to the next multiple of four.
std::string expand_leading_tabs(const std::string &line) {
    std::string result;
    size_t i = 0;
    for(; i < line.length(); ++i) {
        if(line[i] == '\t') {
            result.append(4 - result.length() % 4, ' ');
        } else if(line[i] == ' ') {
            result += ' ';
        } else {
            break;
        }
    }
    result.append(line, i, std::string::npos);
    return result;
}

std::vector<std::string> split_input_lines(std::string_view text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while(start <= text.length()) {
        size_t end = text.find('\n', start);
        if(end == npos) {
            end = text.length();
        }
        std::string line{text.substr(start, end - start)};
        if(!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.emplace_back(expand_leading_tabs(line));
        start = end + 1;
    }
    if(!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::string join_lines(const std::vector<std::string> &lines) {
    std::string result;
    for(const auto &l : lines) {
        if(!result.empty()) {
            result += '\n';
        }
        result += l;
    }
    return result;
}

std::string strip_closing_hashes(std::string s) {
    strip_trailing(s);
    if(s.find_first_not_of('#') == std::string::npos) {
        return std::string{};
    }
    if(s.back() != '#') {
        return s;
    }
    size_t k = s.length();
    while(k > 0 && s[k - 1] == '#') {
        --k;
    }
    if(s[k - 1] == ' ' || s[k - 1] == '\t') {
        s.resize(k);
        strip_trailing(s);
    }
    return s;
}

void collect_definition_labels(const std::vector<Token> &tokens, std::set<std::string> &result) {
    for(const auto &t : tokens) {
        if(t.type == TokenType::FootnoteDefinition) {
            result.insert(t.text);
        }
        if(t.is_block()) {
            collect_definition_labels(t.children, result);
        }
    }
}

bool is_closing_fence(const std::string &line, const std::string &opening) {
    const int ind = indentation(line);
    if(ind > 3) {
        return false;
    }
    size_t i = ind;
    size_t run = 0;
    while(i < line.length() && line[i] == opening.front()) {
        ++i;
        ++run;
    }
    if(run < opening.length()) {
        return false;
    }
    return is_blank(line.substr(i));
}

size_t run_length(std::string_view s, size_t i, char c) {
    size_t k = i;
    while(k < s.length() && s[k] == c) {
        ++k;
    }
    return k - i;
}

bool is_word_char(char c) { return g_ascii_isalnum(c) || (unsigned char)c >= 0x80; }

size_t skip_spaces(std::string_view s, size_t i) {
    while(i < s.length() && (s[i] == ' ' || s[i] == '\t')) {
        ++i;
    }
    return i;
}

size_t skip_whitespace(std::string_view s, size_t i) {
    while(i < s.length() && g_ascii_isspace(s[i])) {
        ++i;
    }
    return i;
}

// Start of a backtick run of exactly the given length.
size_t find_code_close(std::string_view s, size_t from, size_t run) {
    size_t k = from;
    while(k < s.length()) {
        if(s[k] == '`') {
            const size_t r = run_length(s, k, '`');
            if(r == run) {
                return k;
            }
            k += r;
        } else {
            ++k;
        }
    }
    return npos;
}

// Position of the delimiter run that closes an emphasis opened just
// before `from`. Openers met on the way are matched recursively so that
// their closers are not mistaken for ours. Every search is done once per
// text, otherwise unmatched openers make the scan exponential.
size_t find_closing(std::string_view s, size_t from, char c, size_t count, ClosingCache &cache) {
    const auto key = std::make_tuple(s.data(), s.length(), from, c, count);
    auto cached = cache.find(key);
    if(cached != cache.end()) {
        return cached->second;
    }
    size_t result = npos;
    size_t k = from;
    while(k < s.length()) {
        const char ch = s[k];
        if(ch == '\\') {
            k += 2;
            continue;
        }
        if(ch == '`') {
            const size_t run = run_length(s, k, '`');
            const size_t close = find_code_close(s, k + run, run);
            k = close == npos ? k + run : close + run;
            continue;
        }
        if(ch != c) {
            ++k;
            continue;
        }
        const size_t run = run_length(s, k, c);
        const bool prev_space = g_ascii_isspace(s[k - 1]);
        const bool next_space = k + run >= s.length() || g_ascii_isspace(s[k + run]);
        bool right = k > from && !prev_space;
        bool left = !next_space;
        if(c == '_') {
            right = right && (k + run >= s.length() || !is_word_char(s[k + run]));
            left = left && !is_word_char(s[k - 1]);
        }
        if(right && run >= count) {
            result = k;
            break;
        }
        if(left && !right) {
            const size_t inner_count = run >= 2 ? 2 : 1;
            const size_t nested = find_closing(s, k + run, c, inner_count, cache);
            if(nested != npos) {
                k = nested + inner_count;
                continue;
            }
        }
        k += run;
    }
    cache[key] = result;
    return result;
}

} // namespace

std::string LineMatch::group(int n) const {
    gchar *text = g_match_info_fetch(minfo.get(), n);
    if(!text) {
        return std::string{};
    }
    std::string result{text};
    g_free(text);
    return result;
}

int LineMatch::group_length(int n) const {
    gint start_pos, end_pos;
    if(!g_match_info_fetch_pos(minfo.get(), n, &start_pos, &end_pos) || start_pos < 0) {
        return 0;
    }
    return end_pos - start_pos;
}

std::vector<Token> InlineParser::parse(std::string_view text) {
    std::vector<Token> out;
    buf.clear();
    closers.clear();
    at_line_start = true;
    parse_into(text, out);
    flush(out);
    return out;
}

void InlineParser::flush(std::vector<Token> &out) {
    if(buf.empty()) {
        return;
    }
    out.push_back(make_text(cleaner.clean(buf, at_line_start)));
    buf.clear();
    at_line_start = false;
}

void InlineParser::add_linebreak(std::vector<Token> &out) {
    flush(out);
    out.push_back(make_linebreak());
    at_line_start = true;
}

void InlineParser::emit_span(std::string_view s, const Span &span, std::vector<Token> &out) {
    flush(out);
    std::vector<Token> children;
    const auto inner = s.substr(span.inner_begin, span.inner_end - span.inner_begin);
    if(span.raw_label) {
        buf = inner;
    } else {
        parse_into(inner, children);
    }
    flush(children);
    switch(span.type) {
    case TokenType::Emphasis:
        out.push_back(make_emphasis(std::move(children)));
        break;
    case TokenType::Strong:
        out.push_back(make_strong(std::move(children)));
        break;
    case TokenType::Link:
        out.push_back(make_link(span.target, span.title, std::move(children)));
        break;
    case TokenType::Image:
        out.push_back(make_image(span.target, span.title, std::move(children)));
        break;
    default:
        throw ParseError(std::string{"unexpected inline span "} + token_type_name(span.type));
    }
}

void InlineParser::parse_into(std::string_view s, std::vector<Token> &out) {
    size_t i = 0;
    while(i < s.length()) {
        const char c = s[i];
        if(c == '\\') {
            if(i + 1 < s.length() && s[i + 1] == '\n') {
                add_linebreak(out);
                i = skip_spaces(s, i + 2);
                continue;
            }
            if(i + 1 < s.length() && g_ascii_ispunct(s[i + 1])) {
                buf += s[i + 1];
                i += 2;
                continue;
            }
            buf += c;
            ++i;
        } else if(c == '\n') {
            size_t spaces = 0;
            while(!buf.empty() && buf.back() == ' ') {
                buf.pop_back();
                ++spaces;
            }
            if(spaces >= 2) {
                add_linebreak(out);
            } else {
                buf += ' ';
            }
            i = skip_spaces(s, i + 1);
        } else if(c == '`') {
            const size_t run = run_length(s, i, '`');
            const size_t close = find_code_close(s, i + run, run);
            if(close == npos) {
                buf.append(run, '`');
                i += run;
                continue;
            }
            flush(out);
            std::string code{s.substr(i + run, close - i - run)};
            for(auto &ch : code) {
                if(ch == '\n') {
                    ch = ' ';
                }
            }
            if(code.length() >= 2 && code.front() == ' ' && code.back() == ' ' &&
               code.find_first_not_of(' ') != std::string::npos) {
                code = code.substr(1, code.length() - 2);
            }
            out.push_back(make_code(std::move(code)));
            i = close + run;
        } else if(c == '*' || c == '_') {
            auto span = find_emphasis(s, i);
            if(span) {
                buf.append(s.substr(i, span->literal_prefix));
                emit_span(s, *span, out);
                i = span->end;
            } else {
                const size_t run = run_length(s, i, c);
                buf.append(run, c);
                i += run;
            }
        } else if(c == '!' && i + 1 < s.length() && s[i + 1] == '[') {
            auto span = find_link(s, i + 1, true);
            if(span) {
                emit_span(s, *span, out);
                i = span->end;
            } else {
                buf += c;
                ++i;
            }
        } else if(c == '[') {
            if(i + 1 < s.length() && s[i + 1] == '^') {
                const size_t close = s.find(']', i + 2);
                if(close != npos) {
                    const std::string label{s.substr(i + 2, close - i - 2)};
                    if(labels.find(label) != labels.end()) {
                        flush(out);
                        out.push_back(make_footnote_reference(label));
                        i = close + 1;
                        continue;
                    }
                }
            }
            auto span = find_link(s, i, false);
            if(span) {
                emit_span(s, *span, out);
                i = span->end;
            } else {
                buf += c;
                ++i;
            }
        } else if(c == '<') {
            auto span = find_autolink(s, i);
            if(span) {
                emit_span(s, *span, out);
                i = span->end;
            } else {
                buf += c;
                ++i;
            }
        } else {
            buf += c;
            ++i;
        }
    }
}

std::optional<InlineParser::Span> InlineParser::find_emphasis(std::string_view s, size_t i) {
    const char c = s[i];
    const size_t run = run_length(s, i, c);
    const size_t after = i + run;
    if(after >= s.length() || g_ascii_isspace(s[after])) {
        return {};
    }
    if(c == '_' && i > 0 && is_word_char(s[i - 1])) {
        return {};
    }
    if(run >= 2) {
        // Strong takes the first two delimiters, the rest may open an
        // emphasis inside it.
        const size_t close = find_closing(s, i + 2, c, 2, closers);
        if(close != npos) {
            return Span{TokenType::Strong, 0, i + 2, close, close + 2};
        }
    }
    const size_t close = find_closing(s, after, c, 1, closers);
    if(close != npos) {
        return Span{TokenType::Emphasis, run - 1, after, close, close + 1};
    }
    return {};
}

std::optional<InlineParser::Span>
InlineParser::find_link(std::string_view s, size_t open_bracket, bool image) const {
    int depth = 0;
    size_t close = npos;
    for(size_t k = open_bracket; k < s.length(); ++k) {
        const char ch = s[k];
        if(ch == '\\') {
            ++k;
        } else if(ch == '`') {
            const size_t run = run_length(s, k, '`');
            const size_t code_close = find_code_close(s, k + run, run);
            k = code_close == npos ? k + run - 1 : code_close + run - 1;
        } else if(ch == '[') {
            ++depth;
        } else if(ch == ']') {
            --depth;
            if(depth == 0) {
                close = k;
                break;
            }
        }
    }
    if(close == npos || close + 1 >= s.length() || s[close + 1] != '(') {
        return {};
    }
    size_t p = skip_whitespace(s, close + 2);
    std::string target;
    if(p < s.length() && s[p] == '<') {
        const size_t e = s.find('>', p + 1);
        if(e == npos) {
            return {};
        }
        target = s.substr(p + 1, e - p - 1);
        p = e + 1;
    } else {
        int parens = 0;
        while(p < s.length()) {
            const char ch = s[p];
            if(g_ascii_isspace(ch)) {
                break;
            }
            if(ch == '\\' && p + 1 < s.length() && g_ascii_ispunct(s[p + 1])) {
                target += s[p + 1];
                p += 2;
                continue;
            }
            if(ch == '(') {
                ++parens;
            } else if(ch == ')') {
                if(parens == 0) {
                    break;
                }
                --parens;
            }
            target += ch;
            ++p;
        }
    }
    p = skip_whitespace(s, p);
    std::string title;
    if(p < s.length() && (s[p] == '"' || s[p] == '\'' || s[p] == '(')) {
        const char closing = s[p] == '(' ? ')' : s[p];
        const size_t e = s.find(closing, p + 1);
        if(e == npos) {
            return {};
        }
        title = s.substr(p + 1, e - p - 1);
        p = skip_whitespace(s, e + 1);
    }
    if(p >= s.length() || s[p] != ')') {
        return {};
    }
    Span span{image ? TokenType::Image : TokenType::Link, 0, open_bracket + 1, close, p + 1};
    span.target = std::move(target);
    span.title = std::move(title);
    return span;
}

std::optional<InlineParser::Span> InlineParser::find_autolink(std::string_view s,
                                                              size_t i) const {
    const size_t e = s.find('>', i + 1);
    if(e == npos) {
        return {};
    }
    const auto url = s.substr(i + 1, e - i - 1);
    for(const char ch : url) {
        if(g_ascii_isspace(ch) || ch == '<') {
            return {};
        }
    }
    if(url.find("://") == npos && url.substr(0, 7) != "mailto:") {
        return {};
    }
    Span span{TokenType::Link, 0, i + 1, e, e + 1};
    span.target = url;
    span.raw_label = true;
    return span;
}

BlockParser::BlockParser(const Cleaner &c) : cleaner(c) {
    atx_heading = compile_regex(R"(^ {0,3}(#{1,6})(?:[ \t]+(.*?))?[ \t]*$)");
    setext_underline = compile_regex(R"(^ {0,3}(=+|-+)[ \t]*$)");
    thematic_break = compile_regex(R"(^ {0,3}([-*_])(?:[ \t]*\1){2,}[ \t]*$)");
    fence_open = compile_regex(R"(^( {0,3})(`{3,}|~{3,})[ \t]*([^ \t`]*)[^`]*$)");
    bullet_item = compile_regex(R"(^( {0,3})([-+*])(?:([ \t]+)(.*))?$)");
    ordered_item = compile_regex(R"(^( {0,3})([0-9]{1,9})([.)])(?:([ \t]+)(.*))?$)");
    quote_line = compile_regex(R"(^ {0,3}> ?(.*)$)");
    footnote_def = compile_regex(R"(^ {0,3}\[\^([^\]\s]+)\]:[ \t]*(.*)$)");
}

BlockParser::~BlockParser() {
    g_regex_unref(atx_heading);
    g_regex_unref(setext_underline);
    g_regex_unref(thematic_break);
    g_regex_unref(fence_open);
    g_regex_unref(bullet_item);
    g_regex_unref(ordered_item);
    g_regex_unref(quote_line);
    g_regex_unref(footnote_def);
}

std::optional<LineMatch> BlockParser::try_match(GRegex *regex, const std::string &line) const {
    GMatchInfo *minfo = nullptr;
    if(g_regex_match(regex, line.c_str(), GRegexMatchFlags(0), &minfo)) {
        return LineMatch{re_match{minfo}};
    }
    g_match_info_free(minfo);
    return {};
}

std::optional<BlockParser::ListMarker> BlockParser::match_list_marker(const std::string &line) const {
    ListMarker lm;
    int marker_end;
    int spacing;
    if(auto bm = try_match(bullet_item, line)) {
        lm.ordered = false;
        lm.symbol = bm->group(2).front();
        lm.start = 0;
        lm.marker_indent = bm->group_length(1);
        marker_end = lm.marker_indent + 1;
        spacing = bm->group_length(3);
        lm.content = bm->group(4);
    } else if(auto om = try_match(ordered_item, line)) {
        lm.ordered = true;
        lm.symbol = om->group(3).front();
        lm.start = std::stoi(om->group(2));
        lm.marker_indent = om->group_length(1);
        marker_end = lm.marker_indent + om->group_length(2) + 1;
        spacing = om->group_length(4);
        lm.content = om->group(5);
    } else {
        return {};
    }
    if(lm.content.empty() || is_blank(lm.content)) {
        lm.content.clear();
        lm.content_column = marker_end + 1;
    } else if(spacing > 4) {
        // Content starts with an indented code block.
        lm.content_column = marker_end + 1;
        lm.content = std::string(spacing - 1, ' ') + lm.content;
    } else {
        lm.content_column = marker_end + spacing;
    }
    return lm;
}

bool BlockParser::starts_block(const std::string &line) const {
    if(indentation(line) >= 4) {
        return false;
    }
    if(try_match(fence_open, line) || try_match(atx_heading, line) ||
       try_match(thematic_break, line) || try_match(quote_line, line) ||
       try_match(footnote_def, line)) {
        return true;
    }
    auto marker = match_list_marker(line);
    return marker && !marker->content.empty();
}

std::vector<Token> BlockParser::parse_inline(const std::string &text) {
    InlineParser p(cleaner, footnote_labels);
    return p.parse(text);
}

void BlockParser::flush_paragraph(std::vector<std::string> &para, std::vector<Token> &out) {
    if(para.empty()) {
        return;
    }
    auto text = join_lines(para);
    strip_trailing(text);
    para.clear();
    out.push_back(make_paragraph(parse_inline(text)));
}

size_t BlockParser::parse_indented_code(const std::vector<std::string> &lines,
                                        size_t i,
                                        std::vector<Token> &out) {
    std::vector<std::string> code;
    while(i < lines.size()) {
        const auto &l = lines[i];
        if(is_blank(l)) {
            code.emplace_back(l.length() > 4 ? l.substr(4) : std::string{});
        } else if(indentation(l) >= 4) {
            code.emplace_back(l.substr(4));
        } else {
            break;
        }
        ++i;
    }
    while(!code.empty() && is_blank(code.back())) {
        code.pop_back();
    }
    std::string text;
    for(const auto &l : code) {
        text += l;
        text += '\n';
    }
    out.push_back(make_codeblock(std::string{}, std::move(text)));
    return i;
}

size_t BlockParser::parse_fenced_code(const std::vector<std::string> &lines,
                                      size_t i,
                                      const LineMatch &fence,
                                      std::vector<Token> &out) {
    const int fence_indent = fence.group_length(1);
    const std::string marker = fence.group(2);
    std::string info = fence.group(3);
    std::string text;
    ++i;
    while(i < lines.size()) {
        const auto &l = lines[i];
        ++i;
        if(is_closing_fence(l, marker)) {
            break;
        }
        int strip = 0;
        while(strip < fence_indent && strip < (int)l.length() && l[strip] == ' ') {
            ++strip;
        }
        text += l.substr(strip);
        text += '\n';
    }
    out.push_back(make_codeblock(std::move(info), std::move(text)));
    return i;
}

size_t BlockParser::parse_blockquote(const std::vector<std::string> &lines,
                                     size_t i,
                                     std::vector<Token> &out) {
    std::vector<std::string> inner;
    while(i < lines.size()) {
        const auto &l = lines[i];
        if(auto m = try_match(quote_line, l)) {
            inner.push_back(expand_leading_tabs(m->group(1)));
            ++i;
            continue;
        }
        // Lazy continuation of a quoted paragraph.
        if(is_blank(l) || inner.empty() || is_blank(inner.back()) || starts_block(l)) {
            break;
        }
        inner.push_back(l);
        ++i;
    }
    out.push_back(make_blockquote(parse_lines(inner)));
    return i;
}

size_t BlockParser::parse_footnote_definition(const std::vector<std::string> &lines,
                                              size_t i,
                                              const LineMatch &def,
                                              std::vector<Token> &out) {
    const std::string label = def.group(1);
    std::vector<std::string> inner{def.group(2)};
    ++i;
    while(i < lines.size()) {
        const auto &l = lines[i];
        if(is_blank(l)) {
            size_t j = i;
            while(j < lines.size() && is_blank(lines[j])) {
                ++j;
            }
            if(j < lines.size() && indentation(lines[j]) >= 4) {
                for(; i < j; ++i) {
                    inner.emplace_back();
                }
                continue;
            }
            break;
        }
        if(indentation(l) >= 4) {
            inner.push_back(l.substr(4));
        } else if(!is_blank(inner.back()) && !starts_block(l)) {
            inner.push_back(l);
        } else {
            break;
        }
        ++i;
    }
    out.push_back(make_footnote_definition(label, parse_lines(inner)));
    return i;
}

size_t BlockParser::parse_list(const std::vector<std::string> &lines,
                               size_t i,
                               const ListMarker &first,
                               std::vector<Token> &out) {
    std::vector<Token> items;
    ListMarker marker = first;
    while(true) {
        std::vector<std::string> item_lines{marker.content};
        ++i;
        while(i < lines.size()) {
            const auto &l = lines[i];
            if(is_blank(l)) {
                size_t j = i;
                while(j < lines.size() && is_blank(lines[j])) {
                    ++j;
                }
                if(j < lines.size() && indentation(lines[j]) >= marker.content_column) {
                    for(; i < j; ++i) {
                        item_lines.emplace_back();
                    }
                    continue;
                }
                break;
            }
            if(indentation(l) >= marker.content_column) {
                item_lines.push_back(l.substr(marker.content_column));
                ++i;
                continue;
            }
            if(starts_block(l) || match_list_marker(l) || is_blank(item_lines.back())) {
                break;
            }
            item_lines.push_back(strip_leading(l));
            ++i;
        }
        items.push_back(make_item(parse_lines(item_lines)));

        size_t j = i;
        while(j < lines.size() && is_blank(lines[j])) {
            ++j;
        }
        if(j >= lines.size() || try_match(thematic_break, lines[j])) {
            break;
        }
        auto next = match_list_marker(lines[j]);
        if(!next || next->ordered != first.ordered || next->symbol != first.symbol) {
            break;
        }
        marker = *next;
        i = j;
    }
    if(first.ordered) {
        out.push_back(make_ordered_list(first.start, std::move(items)));
    } else {
        out.push_back(make_list(std::move(items)));
    }
    return i;
}

std::vector<Token> BlockParser::parse_lines(const std::vector<std::string> &lines) {
    std::vector<Token> out;
    std::vector<std::string> para;
    size_t i = 0;
    while(i < lines.size()) {
        const auto &line = lines[i];
        if(is_blank(line)) {
            flush_paragraph(para, out);
            ++i;
            continue;
        }
        if(indentation(line) >= 4) {
            if(para.empty()) {
                i = parse_indented_code(lines, i, out);
            } else {
                para.push_back(strip_leading(line));
                ++i;
            }
            continue;
        }
        if(!para.empty()) {
            if(auto m = try_match(setext_underline, line)) {
                const int level = m->group(1).front() == '=' ? 1 : 2;
                auto text = join_lines(para);
                strip_trailing(text);
                para.clear();
                out.push_back(make_heading(level, parse_inline(text)));
                ++i;
                continue;
            }
        }
        if(auto m = try_match(fence_open, line)) {
            flush_paragraph(para, out);
            i = parse_fenced_code(lines, i, *m, out);
            continue;
        }
        if(auto m = try_match(atx_heading, line)) {
            flush_paragraph(para, out);
            out.push_back(
                make_heading(m->group_length(1), parse_inline(strip_closing_hashes(m->group(2)))));
            ++i;
            continue;
        }
        if(try_match(thematic_break, line)) {
            flush_paragraph(para, out);
            out.push_back(make_rule());
            ++i;
            continue;
        }
        if(try_match(quote_line, line)) {
            flush_paragraph(para, out);
            i = parse_blockquote(lines, i, out);
            continue;
        }
        if(auto m = try_match(footnote_def, line)) {
            flush_paragraph(para, out);
            i = parse_footnote_definition(lines, i, *m, out);
            continue;
        }
        if(auto marker = match_list_marker(line)) {
            const bool interrupts =
                !marker->content.empty() && (!marker->ordered || marker->start == 1);
            if(para.empty() || interrupts) {
                flush_paragraph(para, out);
                i = parse_list(lines, i, *marker, out);
                continue;
            }
        }
        para.push_back(strip_leading(line));
        ++i;
    }
    flush_paragraph(para, out);
    return out;
}

std::vector<Token> BlockParser::parse(std::string_view text) {
    const auto lines = split_input_lines(text);
    // References may come before their definitions, so collect the labels
    // first.
    GRegex *label_regex = compile_regex(R"(^[ \t>]*\[\^([^\]\s]+)\]:)");
    footnote_labels.clear();
    for(const auto &l : lines) {
        if(auto m = try_match(label_regex, l)) {
            footnote_labels.insert(m->group(1));
        }
    }
    g_regex_unref(label_regex);
    auto tokens = parse_lines(lines);
    // The scan also sees lines inside code blocks. Parse again if it
    // found labels that are not real definitions.
    std::set<std::string> defined;
    collect_definition_labels(tokens, defined);
    if(defined == footnote_labels) {
        return tokens;
    }
    footnote_labels = std::move(defined);
    return parse_lines(lines);
}

std::vector<Token> parse_markdown(std::string_view text, const Cleaner &cleaner) {
    if(!g_utf8_validate(text.data(), text.length(), nullptr)) {
        throw ParseError("input is not valid UTF-8");
    }
    BlockParser p(cleaner);
    return p.parse(text);
}

std::vector<Token> parse_file(const std::filesystem::path &path, const Cleaner &cleaner) {
    const auto contents = read_file(path);
    if(!g_utf8_validate(contents.c_str(), contents.length(), nullptr)) {
        throw ParseError(path.string() + " is not valid UTF-8");
    }
    BlockParser p(cleaner);
    return p.parse(contents);
}
