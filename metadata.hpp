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

#include <cleaner.hpp>
#include <escape.hpp>
#include <numbering.hpp>
#include <templater.hpp>
#include <token.hpp>

#include <glib.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

enum class TemplateKind : int {
    EpubCss,
    EpubChapter, // Version 2 or 3 depending on the book.
    HtmlPage,
    HtmlCss,
};

struct Chapter {
    Number number;
    std::vector<Token> tokens;
    std::filesystem::path source;
};

struct Book {
    // All relative paths in the book definition are relative to this
    // (i.e. where the JSON file was).
    std::filesystem::path top_dir;

    std::string lang = "en";
    std::string author = "Anonymous";
    std::string title = "Untitled";
    std::optional<std::string> description;
    std::optional<std::string> subject;
    std::optional<std::filesystem::path> cover;

    std::optional<std::filesystem::path> output_epub;
    std::optional<std::filesystem::path> output_html;
    std::optional<std::filesystem::path> output_tex;
    std::optional<std::filesystem::path> output_pdf;
    std::optional<std::filesystem::path> output_odt;
    std::filesystem::path temp_dir;

    bool numbering = true;
    bool autoclean = true;
    bool verbose = false;
    gunichar nb_char = ' ';
    std::string numbering_template = "{{number}}. {{title}}";
    std::string tex_command = "pdflatex";

    std::optional<std::filesystem::path> epub_css;
    std::optional<std::filesystem::path> epub_template;
    std::optional<std::filesystem::path> html_css;
    std::optional<std::filesystem::path> html_template;
    int epub_version = 2;

    std::vector<Chapter> chapters;

    Cleaner get_cleaner() const;

    // The title must already be escaped for the output format.
    std::string get_header(int number, const std::string &title) const;

    // Override file contents if configured, the built-in otherwise.
    // Throws FileNotFound if a configured override can not be read.
    std::string get_template(TemplateKind kind) const;

    // author, title, lang, description and subject escaped for the target.
    TemplateVars get_metadata_vars(EscapeFormat f) const;

    // Parses the file right away with this book's cleaner.
    void add_chapter(Number n, const std::filesystem::path &file);

    std::vector<ResolvedNumber> resolved_numbers() const;

    std::filesystem::path resolve_path(const std::string &p) const;
};

// Throws FileNotFound, ConfigError and the errors of chapter parsing.
Book load_book_json(const char *path);
// Same for an in-memory definition, relative paths resolve against top_dir.
Book parse_book_json(const std::string &text, const std::filesystem::path &top_dir);
