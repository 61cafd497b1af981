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

#include <chapterwalk.hpp>
#include <errors.hpp>

namespace {

const char *state_name(ChapterState s) {
    switch(s) {
    case ChapterState::NotStarted:
        return "not started";
    case ChapterState::RenderingHeader:
        return "header";
    case ChapterState::RenderingBody:
        return "body";
    case ChapterState::Done:
        return "done";
    }
    return "unknown";
}

void collect_footnotes(const std::vector<Token> &tokens,
                       std::unordered_map<std::string, const Token *> &result) {
    for(const auto &t : tokens) {
        if(t.type == TokenType::FootnoteDefinition) {
            // The first definition of a label wins.
            result.emplace(t.text, &t);
        } else if(t.is_block()) {
            collect_footnotes(t.children, result);
        }
    }
}

void collect_references(const std::vector<Token> &tokens, std::vector<std::string> &result) {
    for(const auto &t : tokens) {
        if(t.type == TokenType::FootnoteReference) {
            result.push_back(t.text);
        } else {
            collect_references(t.children, result);
        }
    }
}

typedef std::unordered_map<std::string, std::vector<std::string>> NoteGraph;

bool leads_back(const std::string &label, const NoteGraph &graph) {
    std::vector<std::string> pending{label};
    std::set<std::string> seen;
    while(!pending.empty()) {
        const auto current = pending.back();
        pending.pop_back();
        auto it = graph.find(current);
        if(it == graph.end()) {
            continue;
        }
        for(const auto &next : it->second) {
            if(next == label) {
                return true;
            }
            if(seen.insert(next).second) {
                pending.push_back(next);
            }
        }
    }
    return false;
}

} // namespace

int find_title_heading(const std::vector<Token> &tokens) {
    for(size_t i = 0; i < tokens.size(); ++i) {
        if(tokens[i].type == TokenType::Heading && tokens[i].level == 1) {
            return int(i);
        }
    }
    return -1;
}

ChapterWalk::ChapterWalk(const Chapter &c,
                         const ResolvedNumber &rn_,
                         const char *format_,
                         int index_)
    : ch(c), rn(rn_), format(format_), index(index_) {
    title_index = find_title_heading(ch.tokens);
    collect_footnotes(ch.tokens, footnotes);
    NoteGraph graph;
    for(const auto &[label, def] : footnotes) {
        collect_references(def->children, graph[label]);
    }
    for(const auto &entry : footnotes) {
        if(leads_back(entry.first, graph)) {
            cyclic_notes.insert(entry.first);
        }
    }
}

void ChapterWalk::transition(ChapterState from, ChapterState to) {
    if(current != from) {
        throw RenderError(format,
                          "chapter " + std::to_string(chapter_number()) + " is in state " +
                              state_name(current) + ", expected " + state_name(from));
    }
    current = to;
}

void ChapterWalk::begin() {
    transition(ChapterState::NotStarted,
               title() ? ChapterState::RenderingHeader : ChapterState::RenderingBody);
}

void ChapterWalk::enter_body() {
    transition(ChapterState::RenderingHeader, ChapterState::RenderingBody);
}

void ChapterWalk::finish() { transition(ChapterState::RenderingBody, ChapterState::Done); }

const Token *ChapterWalk::title() const {
    if(title_index < 0 || !rn.show_title) {
        return nullptr;
    }
    return &ch.tokens[title_index];
}

bool ChapterWalk::in_body(size_t i) const {
    if(int(i) == title_index) {
        return false;
    }
    return ch.tokens[i].type != TokenType::FootnoteDefinition;
}

const Token &ChapterWalk::footnote(const std::string &label) const {
    auto it = footnotes.find(label);
    if(it == footnotes.end()) {
        throw RenderError(format,
                          "chapter " + std::to_string(chapter_number()) +
                              ": footnote reference [^" + label + "] has no definition");
    }
    if(cyclic_notes.find(label) != cyclic_notes.end()) {
        throw RenderError(format,
                          "chapter " + std::to_string(chapter_number()) + ": footnote [^" +
                              label + "] references itself");
    }
    return *it->second;
}
