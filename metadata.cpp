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

#include <metadata.hpp>
#include <bookparser.hpp>
#include <errors.hpp>
#include <templates.hpp>
#include <utils.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>

#include <unordered_set>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::unordered_set<std::string> known_keys{
    "lang",         "author",       "title",        "description",   "subject",
    "cover",        "output_epub",  "output_html",  "output_tex",    "output_pdf",
    "output_odt",   "temp_dir",     "numbering",    "autoclean",     "nb_char",
    "verbose",      "tex_command",  "epub_css",     "epub_template", "html_css",
    "html_template", "epub_version", "numbering_template", "chapters"};

std::string get_string(const json &data, const char *key) {
    auto value = data[key];
    if(!value.is_string()) {
        throw ConfigError(std::string{key} + " must be a string", value.dump());
    }
    return value.get<std::string>();
}

bool get_bool(const json &data, const char *key) {
    auto value = data[key];
    if(!value.is_boolean()) {
        throw ConfigError(std::string{key} + " must be true or false", value.dump());
    }
    return value.get<bool>();
}

int get_int(const json &data, const char *key) {
    auto value = data[key];
    if(!value.is_number_integer()) {
        throw ConfigError(std::string{key} + " must be an integer", value.dump());
    }
    if(value.is_number_unsigned()) {
        if(value.get<std::uint64_t>() > std::uint64_t(G_MAXINT)) {
            throw ConfigError(std::string{key} + " is out of range", value.dump());
        }
    } else {
        const auto wide = value.get<std::int64_t>();
        if(wide < G_MININT || wide > G_MAXINT) {
            throw ConfigError(std::string{key} + " is out of range", value.dump());
        }
    }
    return value.get<int>();
}

gunichar get_char(const std::string &s) {
    if(!g_utf8_validate(s.c_str(), s.length(), nullptr) || g_utf8_strlen(s.c_str(), -1) != 1) {
        throw ConfigError("nb_char must be exactly one character", s);
    }
    return g_utf8_get_char(s.c_str());
}

void strip(std::string &s) {
    while(!s.empty() && g_ascii_isspace(s.back())) {
        s.pop_back();
    }
    size_t i = 0;
    while(i < s.length() && g_ascii_isspace(s[i])) {
        ++i;
    }
    s.erase(0, i);
}

std::string get_filename(std::string s, const std::string &line) {
    strip(s);
    if(s.empty()) {
        throw ConfigError("chapter entry has no file name", line);
    }
    for(const char c : s) {
        if(g_ascii_isspace(c)) {
            throw ConfigError("chapter file name contains whitespace", line);
        }
    }
    return s;
}

struct ChapterEntry {
    Number number;
    std::string file;
};

// + file   numbered chapter
// - file   unnumbered chapter
// ! file   chapter without a title
// 3. file  chapter with a given number, also 3: and 3+
ChapterEntry parse_chapter_entry(const std::string &line) {
    std::string s{line};
    strip(s);
    if(s.empty()) {
        throw ConfigError("empty chapter entry", line);
    }
    switch(s.front()) {
    case '+':
        return ChapterEntry{Number::automatic(), get_filename(s.substr(1), line)};
    case '-':
        return ChapterEntry{Number::unnumbered(), get_filename(s.substr(1), line)};
    case '!':
        return ChapterEntry{Number::hidden(), get_filename(s.substr(1), line)};
    default:
        break;
    }
    const size_t sep = s.find_first_of(".:+");
    if(sep == std::string::npos || sep == 0) {
        throw ConfigError("ill-formatted chapter entry", line);
    }
    const std::string numstr = s.substr(0, sep);
    gint64 value = 0;
    GError *err = nullptr;
    if(!g_ascii_string_to_signed(numstr.c_str(), 10, 0, G_MAXINT, &value, &err)) {
        g_error_free(err);
        throw ConfigError("could not parse chapter number", line);
    }
    return ChapterEntry{Number::specified(int(value)), get_filename(s.substr(sep + 1), line)};
}

} // namespace

Cleaner Book::get_cleaner() const { return make_cleaner(lang, autoclean, nb_char); }

std::string Book::get_header(int number, const std::string &chapter_title) const {
    TemplateVars vars{{"number", std::to_string(number)}, {"title", chapter_title}};
    return expand_template(numbering_template, vars);
}

std::string Book::get_template(TemplateKind kind) const {
    const std::optional<fs::path> *override_file = nullptr;
    const char *builtin = nullptr;
    switch(kind) {
    case TemplateKind::EpubCss:
        override_file = &epub_css;
        builtin = epub_stylesheet;
        break;
    case TemplateKind::EpubChapter:
        override_file = &epub_template;
        builtin = epub_version == 3 ? epub3_chapter_template : epub2_chapter_template;
        break;
    case TemplateKind::HtmlPage:
        override_file = &html_template;
        builtin = html_page_template;
        break;
    case TemplateKind::HtmlCss:
        override_file = &html_css;
        builtin = html_stylesheet;
        break;
    }
    if(*override_file) {
        return read_file(**override_file);
    }
    return std::string{builtin};
}

TemplateVars Book::get_metadata_vars(EscapeFormat f) const {
    TemplateVars vars;
    vars["author"] = escape_for(f, author);
    vars["title"] = escape_for(f, title);
    vars["lang"] = escape_for(f, lang);
    vars["description"] = escape_for(f, description.value_or(std::string{}));
    vars["subject"] = escape_for(f, subject.value_or(std::string{}));
    return vars;
}

void Book::add_chapter(Number n, const fs::path &file) {
    const fs::path full = file.is_absolute() ? file : top_dir / file;
    if(verbose) {
        printf("Parsing %s\n", full.c_str());
    }
    chapters.push_back(Chapter{n, parse_file(full, get_cleaner()), full});
}

std::vector<ResolvedNumber> Book::resolved_numbers() const {
    std::vector<Number> numbers;
    numbers.reserve(chapters.size());
    for(const auto &c : chapters) {
        numbers.push_back(c.number);
    }
    return resolve_numbering(numbers, numbering);
}

fs::path Book::resolve_path(const std::string &p) const {
    fs::path path{p};
    if(path.is_absolute()) {
        return path;
    }
    return (top_dir / path).lexically_normal();
}

Book parse_book_json(const std::string &text, const fs::path &top_dir) {
    json data;
    try {
        data = json::parse(text);
    } catch(const json::parse_error &e) {
        throw ConfigError("invalid JSON", e.what());
    }
    if(!data.is_object()) {
        throw ConfigError("book definition must be a JSON object", data.dump());
    }
    for(const auto &[key, value] : data.items()) {
        if(known_keys.find(key) == known_keys.end()) {
            throw ConfigError("unknown key", key);
        }
    }

    Book b;
    b.top_dir = top_dir;
    b.temp_dir = default_temp_dir();
    if(data.contains("lang")) {
        b.lang = get_string(data, "lang");
    }
    if(data.contains("author")) {
        b.author = get_string(data, "author");
    }
    if(data.contains("title")) {
        b.title = get_string(data, "title");
    }
    if(data.contains("description")) {
        b.description = get_string(data, "description");
    }
    if(data.contains("subject")) {
        b.subject = get_string(data, "subject");
    }
    if(data.contains("cover")) {
        b.cover = b.resolve_path(get_string(data, "cover"));
    }

    const std::pair<const char *, std::optional<fs::path> *> paths[] = {
        {"output_epub", &b.output_epub},
        {"output_html", &b.output_html},
        {"output_tex", &b.output_tex},
        {"output_pdf", &b.output_pdf},
        {"output_odt", &b.output_odt},
        {"epub_css", &b.epub_css},
        {"epub_template", &b.epub_template},
        {"html_css", &b.html_css},
        {"html_template", &b.html_template},
    };
    for(const auto &[key, target] : paths) {
        if(data.contains(key)) {
            *target = b.resolve_path(get_string(data, key));
        }
    }
    if(data.contains("temp_dir")) {
        b.temp_dir = b.resolve_path(get_string(data, "temp_dir"));
    }

    if(data.contains("numbering")) {
        b.numbering = get_bool(data, "numbering");
    }
    if(data.contains("autoclean")) {
        b.autoclean = get_bool(data, "autoclean");
    }
    if(data.contains("verbose")) {
        b.verbose = get_bool(data, "verbose");
    }
    if(data.contains("nb_char")) {
        b.nb_char = get_char(get_string(data, "nb_char"));
    }
    if(data.contains("numbering_template")) {
        b.numbering_template = get_string(data, "numbering_template");
    }
    if(data.contains("tex_command")) {
        b.tex_command = get_string(data, "tex_command");
        if(split_command_line(b.tex_command).empty()) {
            throw ConfigError("tex_command is empty", b.tex_command);
        }
    }
    if(data.contains("epub_version")) {
        b.epub_version = get_int(data, "epub_version");
        if(b.epub_version != 2 && b.epub_version != 3) {
            throw ConfigError("epub_version must be 2 or 3", std::to_string(b.epub_version));
        }
    }

    // Chapters last, their parsing depends on the language settings above.
    if(data.contains("chapters")) {
        auto arr = data["chapters"];
        if(!arr.is_array()) {
            throw ConfigError("chapters must be an array of strings", arr.dump());
        }
        for(const auto &e : arr) {
            if(!e.is_string()) {
                throw ConfigError("chapter entry is not a string", e.dump());
            }
            auto entry = parse_chapter_entry(e.get<std::string>());
            b.add_chapter(entry.number, b.resolve_path(entry.file));
        }
    }
    return b;
}

Book load_book_json(const char *path) {
    const fs::path json_file = fs::absolute(fs::path{path});
    const auto contents = read_file(json_file);
    return parse_book_json(contents, json_file.parent_path());
}
