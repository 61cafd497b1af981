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

#include <metadata.hpp>

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

enum class ChapterState : int {
    NotStarted,
    RenderingHeader,
    RenderingBody,
    Done,
};

// Per chapter bookkeeping shared by all renderers: which heading is the
// chapter title, where the footnote definitions are and how far the
// rendering has progressed.
class ChapterWalk {
public:
    ChapterWalk(const Chapter &c, const ResolvedNumber &rn, const char *format, int index);

    // Moves to RenderingHeader if the title is shown, to RenderingBody
    // otherwise.
    void begin();
    void enter_body();
    void finish();
    ChapterState state() const { return current; }

    // Heading used as the chapter title, nullptr if there is none or it
    // is hidden.
    const Token *title() const;
    // True for top level tokens that belong to the body.
    bool in_body(size_t i) const;

    const std::optional<int> &display_number() const { return rn.display_number; }

    // Throws RenderError for labels without a definition and for notes
    // that lead back to themselves through their own references.
    const Token &footnote(const std::string &label) const;

    const Chapter &chapter() const { return ch; }
    // 1-based, for error messages.
    int chapter_number() const { return index + 1; }
    const char *format_name() const { return format; }

private:
    void transition(ChapterState from, ChapterState to);

    const Chapter &ch;
    ResolvedNumber rn;
    const char *format;
    int index;
    int title_index = -1;
    ChapterState current = ChapterState::NotStarted;
    std::unordered_map<std::string, const Token *> footnotes;
    std::set<std::string> cyclic_notes;
};

// First top level level-1 heading, -1 if the chapter has none.
int find_title_heading(const std::vector<Token> &tokens);
