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
#include <metadata.hpp>

#include <filesystem>
#include <string>
#include <vector>

// A LaTeX document of the book class, optionally compiled to PDF.
class LatexRenderer {
public:
    explicit LatexRenderer(const Book &b);

    std::string render();

    // Runs the book's tex command on the rendered source and moves the
    // resulting PDF to dest.
    void render_pdf(const std::filesystem::path &dest);

private:
    std::string render_preamble() const;
    std::string render_chapter(size_t index);
    std::string render_blocks(const std::vector<Token> &tokens, ChapterWalk &walk);
    std::string render_block(const Token &t, ChapterWalk &walk);
    std::string render_inline(const std::vector<Token> &tokens, ChapterWalk &walk);

    std::string image_path(const std::string &src) const;

    const Book &book;
    std::vector<ResolvedNumber> numbers;
};
