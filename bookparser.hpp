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

#include <token.hpp>
#include <cleaner.hpp>
#include <glib.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

struct MatchDeleter final {
    void operator()(GMatchInfo *mi) { g_match_info_unref(mi); }
};

typedef std::unique_ptr<GMatchInfo, MatchDeleter> re_match;

struct LineMatch {
    re_match minfo;

    std::string group(int n) const;
    // Byte length of a group, 0 if the group did not participate.
    int group_length(int n) const;
};

// Closer positions already searched for, keyed by the scanned text, the
// start position, the delimiter and the delimiter count.
typedef std::map<std::tuple<const char *, size_t, size_t, char, size_t>, size_t> ClosingCache;

// Inline markup of one block: emphasis, code spans, links, images,
// footnote references and line breaks.
class InlineParser {
public:
    InlineParser(const Cleaner &c, const std::set<std::string> &footnote_labels)
        : cleaner(c), labels(footnote_labels) {}

    std::vector<Token> parse(std::string_view text);

private:
    // A delimited inline construct found in the text. Positions are byte
    // offsets into the text given to parse_into.
    struct Span {
        TokenType type;
        size_t literal_prefix; // Delimiter characters that stay as text.
        size_t inner_begin;
        size_t inner_end;
        size_t end;
        std::string target;
        std::string title;
        bool raw_label = false;
    };

    void parse_into(std::string_view s, std::vector<Token> &out);
    void flush(std::vector<Token> &out);
    void add_linebreak(std::vector<Token> &out);
    void emit_span(std::string_view s, const Span &span, std::vector<Token> &out);

    std::optional<Span> find_emphasis(std::string_view s, size_t i);
    std::optional<Span> find_link(std::string_view s, size_t open_bracket, bool image) const;
    std::optional<Span> find_autolink(std::string_view s, size_t i) const;

    const Cleaner &cleaner;
    const std::set<std::string> &labels;
    ClosingCache closers;
    std::string buf;
    bool at_line_start = true;
};

// Splits a chapter into blocks, containers (quotes, list items, footnote
// definitions) are parsed recursively.
class BlockParser {
public:
    explicit BlockParser(const Cleaner &c);
    ~BlockParser();

    BlockParser(const BlockParser &) = delete;
    BlockParser &operator=(const BlockParser &) = delete;

    std::vector<Token> parse(std::string_view text);

private:
    struct ListMarker {
        bool ordered;
        char symbol; // Bullet character or ordered delimiter.
        int start;
        int marker_indent;
        int content_column;
        std::string content;
    };

    std::vector<Token> parse_lines(const std::vector<std::string> &lines);
    void flush_paragraph(std::vector<std::string> &para, std::vector<Token> &out);

    size_t parse_fenced_code(const std::vector<std::string> &lines,
                             size_t i,
                             const LineMatch &fence,
                             std::vector<Token> &out);
    size_t parse_indented_code(const std::vector<std::string> &lines,
                               size_t i,
                               std::vector<Token> &out);
    size_t parse_blockquote(const std::vector<std::string> &lines,
                            size_t i,
                            std::vector<Token> &out);
    size_t parse_footnote_definition(const std::vector<std::string> &lines,
                                     size_t i,
                                     const LineMatch &def,
                                     std::vector<Token> &out);
    size_t parse_list(const std::vector<std::string> &lines,
                      size_t i,
                      const ListMarker &first,
                      std::vector<Token> &out);

    std::optional<LineMatch> try_match(GRegex *regex, const std::string &line) const;
    std::optional<ListMarker> match_list_marker(const std::string &line) const;
    bool starts_block(const std::string &line) const;

    std::vector<Token> parse_inline(const std::string &text);

    const Cleaner &cleaner;
    std::set<std::string> footnote_labels;
    GRegex *atx_heading;
    GRegex *setext_underline;
    GRegex *thematic_break;
    GRegex *fence_open;
    GRegex *bullet_item;
    GRegex *ordered_item;
    GRegex *quote_line;
    GRegex *footnote_def;
};

// Throws ParseError if the text is not valid UTF-8.
std::vector<Token> parse_markdown(std::string_view text, const Cleaner &cleaner);

// Throws FileNotFound if the file can not be read.
std::vector<Token> parse_file(const std::filesystem::path &path, const Cleaner &cleaner);
