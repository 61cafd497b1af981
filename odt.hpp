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

#include <chapterwalk.hpp>
#include <container.hpp>
#include <metadata.hpp>

#include <tinyxml2.h>

#include <filesystem>
#include <unordered_map>

// OpenDocument text. Styles are referenced by name and defined in
// styles.xml so that the document can be restyled in an office suite.
class OdtRenderer {
public:
    explicit OdtRenderer(const Book &b);

    Container render();

private:
    std::string write_content();
    void write_title_page(tinyxml2::XMLElement *text);
    void write_chapter(tinyxml2::XMLElement *text, size_t index);
    void write_blocks(tinyxml2::XMLElement *parent,
                      const std::vector<Token> &tokens,
                      ChapterWalk &walk,
                      const char *para_style);
    void write_block(tinyxml2::XMLElement *parent,
                     const Token &t,
                     ChapterWalk &walk,
                     const char *para_style);
    void write_inline(tinyxml2::XMLElement *parent,
                      const std::vector<Token> &tokens,
                      ChapterWalk &walk);
    void write_image(tinyxml2::XMLElement *parent, const Token &t);

    std::string write_styles() const;
    std::string write_meta() const;
    std::string write_manifest() const;

    std::string get_picture_path(const std::filesystem::path &source);

    const Book &book;
    std::vector<ResolvedNumber> numbers;
    int note_counter = 0;
    int frame_counter = 0;
    bool in_note = false;
    std::unordered_map<std::string, std::string> picturenames;
    std::vector<std::pair<std::string, std::filesystem::path>> pictures;
};

// Appends text to an ODF element, runs of spaces become text:s and tabs
// text:tab because ODF collapses whitespace.
void append_odf_text(tinyxml2::XMLElement *parent, const std::string &text, bool at_start);
