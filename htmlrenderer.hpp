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

#include <string>
#include <unordered_map>
#include <vector>

// The whole book as one standalone HTML page.
class HtmlRenderer {
public:
    explicit HtmlRenderer(const Book &b);

    std::string render();

private:
    std::string render_chapter(size_t index);
    std::string render_blocks(const std::vector<Token> &tokens, ChapterWalk &walk);
    std::string render_block(const Token &t, ChapterWalk &walk);
    std::string render_inline(const std::vector<Token> &tokens, ChapterWalk &walk);
    std::string render_notes(ChapterWalk &walk);

    const Book &book;
    std::vector<ResolvedNumber> numbers;
    std::string toc;
    // Footnotes are numbered through the whole book.
    int footnote_counter = 0;
    std::vector<std::pair<std::string, int>> pending_notes;
    std::unordered_map<std::string, int> chapter_notes;
};
