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

class EpubRenderer {
public:
    explicit EpubRenderer(const Book &b);

    Container render();

private:
    std::string write_chapter(size_t index);
    void write_blocks(tinyxml2::XMLElement *parent,
                      const std::vector<Token> &tokens,
                      ChapterWalk &walk);
    void write_block(tinyxml2::XMLElement *parent, const Token &t, ChapterWalk &walk);
    void write_inline(tinyxml2::XMLElement *parent,
                      const std::vector<Token> &tokens,
                      ChapterWalk &walk);
    void write_notes(tinyxml2::XMLElement *body, ChapterWalk &walk);

    std::string write_opf() const;
    std::string write_ncx() const;
    std::string write_nav() const;
    std::string write_cover_page() const;
    void write_navmap(tinyxml2::XMLElement *root) const;
    void generate_epub_manifest(tinyxml2::XMLElement *manifest) const;
    void generate_spine(tinyxml2::XMLElement *spine) const;

    std::string get_epub_image_path(const std::string &src);

    struct TocEntry {
        std::string file;
        std::string label;
    };

    const Book &book;
    std::vector<ResolvedNumber> numbers;
    std::string uuid;
    std::vector<TocEntry> toc;
    std::string cover_name;

    // Per chapter footnote numbering.
    std::vector<std::pair<std::string, int>> pending_notes;
    std::unordered_map<std::string, int> chapter_notes;

    std::unordered_map<std::string, std::string> imagenames;
    std::vector<std::pair<std::string, std::filesystem::path>> embedded_images;
};

// Media type of an image by its file extension, throws RenderError for
// formats that EPUB readers do not support.
const char *image_media_type(const std::filesystem::path &p, const char *format);
