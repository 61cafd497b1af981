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

#include <htmlrenderer.hpp>
#include <errors.hpp>
#include <escape.hpp>

namespace {

const char format_name[] = "html";

std::string attribute(const char *name, const std::string &value) {
    std::string result{" "};
    result += name;
    result += "=\"";
    result += escape_html(value);
    result += '"';
    return result;
}

} // namespace

HtmlRenderer::HtmlRenderer(const Book &b) : book(b), numbers(b.resolved_numbers()) {}

std::string HtmlRenderer::render() {
    std::string content;
    toc = "<ul>\n";
    footnote_counter = 0;
    for(size_t i = 0; i < book.chapters.size(); ++i) {
        content += render_chapter(i);
    }
    toc += "</ul>";

    auto vars = book.get_metadata_vars(EscapeFormat::Html);
    vars["style"] = book.get_template(TemplateKind::HtmlCss);
    vars["toc"] = toc;
    vars["content"] = content;
    try {
        return expand_template(book.get_template(TemplateKind::HtmlPage), vars);
    } catch(const RenderError &e) {
        throw RenderError(format_name, e.what());
    }
}

std::string HtmlRenderer::render_chapter(size_t index) {
    ChapterWalk walk(book.chapters[index], numbers[index], format_name, int(index));
    const std::string chapter_id = "chapter-" + std::to_string(index + 1);
    std::string out = "<div class=\"chapter\" id=\"" + chapter_id + "\">\n";
    pending_notes.clear();
    chapter_notes.clear();

    walk.begin();
    if(walk.state() == ChapterState::RenderingHeader) {
        std::string header = render_inline(walk.title()->children, walk);
        // The table of contents gets no markup, a footnote reference
        // there would duplicate its anchor.
        std::string label = escape_html(plain_text(walk.title()->children));
        if(walk.display_number()) {
            header = book.get_header(*walk.display_number(), header);
            label = book.get_header(*walk.display_number(), label);
        }
        out += "<h1>" + header + "</h1>\n";
        toc += "<li><a href=\"#" + chapter_id + "\">" + label + "</a></li>\n";
        walk.enter_body();
    }
    const auto &tokens = walk.chapter().tokens;
    for(size_t i = 0; i < tokens.size(); ++i) {
        if(walk.in_body(i)) {
            out += render_block(tokens[i], walk);
        }
    }
    out += render_notes(walk);
    walk.finish();
    out += "</div>\n";
    return out;
}

std::string HtmlRenderer::render_blocks(const std::vector<Token> &tokens, ChapterWalk &walk) {
    std::string out;
    for(const auto &t : tokens) {
        out += render_block(t, walk);
    }
    return out;
}

std::string HtmlRenderer::render_block(const Token &t, ChapterWalk &walk) {
    switch(t.type) {
    case TokenType::Paragraph:
        return "<p>" + render_inline(t.children, walk) + "</p>\n";
    case TokenType::Heading: {
        const std::string tag = "h" + std::to_string(t.level);
        return "<" + tag + ">" + render_inline(t.children, walk) + "</" + tag + ">\n";
    }
    case TokenType::List:
        return "<ul>\n" + render_blocks(t.children, walk) + "</ul>\n";
    case TokenType::OrderedList: {
        std::string open{"<ol"};
        if(t.level != 1) {
            open += " start=\"" + std::to_string(t.level) + "\"";
        }
        return open + ">\n" + render_blocks(t.children, walk) + "</ol>\n";
    }
    case TokenType::Item:
        // Single paragraph items are written tight.
        if(t.children.size() == 1 && t.children.front().type == TokenType::Paragraph) {
            return "<li>" + render_inline(t.children.front().children, walk) + "</li>\n";
        }
        return "<li>\n" + render_blocks(t.children, walk) + "</li>\n";
    case TokenType::BlockQuote:
        return "<blockquote>\n" + render_blocks(t.children, walk) + "</blockquote>\n";
    case TokenType::CodeBlock: {
        std::string out{"<pre><code"};
        if(!t.info.empty()) {
            out += attribute("class", "language-" + t.info);
        }
        return out + ">" + escape_html(t.text) + "</code></pre>\n";
    }
    case TokenType::Rule:
        return "<hr />\n";
    case TokenType::FootnoteDefinition:
        // Written at the end of the chapter.
        return std::string{};
    default:
        break;
    }
    throw RenderError(format_name,
                      std::string{"unexpected "} + token_type_name(t.type) + " at block level");
}

std::string HtmlRenderer::render_inline(const std::vector<Token> &tokens, ChapterWalk &walk) {
    std::string out;
    for(const auto &t : tokens) {
        switch(t.type) {
        case TokenType::Text:
            out += escape_html(t.text);
            break;
        case TokenType::Emphasis:
            out += "<em>" + render_inline(t.children, walk) + "</em>";
            break;
        case TokenType::Strong:
            out += "<strong>" + render_inline(t.children, walk) + "</strong>";
            break;
        case TokenType::Code:
            out += "<code>" + escape_html(t.text) + "</code>";
            break;
        case TokenType::Link:
            out += "<a" + attribute("href", t.target);
            if(!t.info.empty()) {
                out += attribute("title", t.info);
            }
            out += ">" + render_inline(t.children, walk) + "</a>";
            break;
        case TokenType::Image:
            out += "<img" + attribute("src", t.target) + attribute("alt", plain_text(t.children));
            if(!t.info.empty()) {
                out += attribute("title", t.info);
            }
            out += " />";
            break;
        case TokenType::LineBreak:
            out += "<br />\n";
            break;
        case TokenType::FootnoteReference: {
            walk.footnote(t.text);
            auto it = chapter_notes.find(t.text);
            int number;
            if(it == chapter_notes.end()) {
                number = ++footnote_counter;
                chapter_notes[t.text] = number;
                pending_notes.emplace_back(t.text, number);
            } else {
                number = it->second;
            }
            const auto n = std::to_string(number);
            out += "<a href=\"#note-" + n + "\" id=\"ref-" + n + "\" class=\"footnote-ref\"><sup>" +
                   n + "</sup></a>";
            break;
        }
        default:
            throw RenderError(format_name,
                              std::string{"unexpected "} + token_type_name(t.type) +
                                  " inside a paragraph");
        }
    }
    return out;
}

std::string HtmlRenderer::render_notes(ChapterWalk &walk) {
    if(pending_notes.empty()) {
        return std::string{};
    }
    std::string out{"<div class=\"notes\">\n"};
    // Notes may reference further notes, which are appended while we go.
    for(size_t i = 0; i < pending_notes.size(); ++i) {
        const auto label = pending_notes[i].first;
        const auto n = std::to_string(pending_notes[i].second);
        const Token &def = walk.footnote(label);
        out += "<div class=\"footnote\" id=\"note-" + n + "\">\n";
        out += "<a class=\"footnote-back\" href=\"#ref-" + n + "\">" + n + ".</a>\n";
        out += render_blocks(def.children, walk);
        out += "</div>\n";
    }
    out += "</div>\n";
    return out;
}
