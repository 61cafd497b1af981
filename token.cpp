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

#include <token.hpp>

namespace {

Token make_container(TokenType t, std::vector<Token> children) {
    Token tok{t};
    tok.children = std::move(children);
    return tok;
}

void append_plain_text(const Token &t, std::string &buf) {
    switch(t.type) {
    case TokenType::Text:
    case TokenType::Code:
    case TokenType::CodeBlock:
        buf += t.text;
        break;
    case TokenType::LineBreak:
        buf += ' ';
        break;
    case TokenType::FootnoteReference:
    case TokenType::FootnoteDefinition:
        // Notes are not part of the running text.
        break;
    default:
        for(const auto &c : t.children) {
            append_plain_text(c, buf);
        }
    }
}

} // namespace

bool Token::is_block() const {
    switch(type) {
    case TokenType::Paragraph:
    case TokenType::Heading:
    case TokenType::List:
    case TokenType::OrderedList:
    case TokenType::Item:
    case TokenType::BlockQuote:
    case TokenType::CodeBlock:
    case TokenType::Rule:
    case TokenType::FootnoteDefinition:
        return true;
    default:
        return false;
    }
}

bool Token::operator==(const Token &o) const {
    return type == o.type && text == o.text && target == o.target && info == o.info &&
           level == o.level && children == o.children;
}

Token make_text(std::string text) {
    Token t{TokenType::Text};
    t.text = std::move(text);
    return t;
}

Token make_code(std::string text) {
    Token t{TokenType::Code};
    t.text = std::move(text);
    return t;
}

Token make_codeblock(std::string info, std::string text) {
    Token t{TokenType::CodeBlock};
    t.info = std::move(info);
    t.text = std::move(text);
    return t;
}

Token make_paragraph(std::vector<Token> children) {
    return make_container(TokenType::Paragraph, std::move(children));
}

Token make_heading(int level, std::vector<Token> children) {
    Token t = make_container(TokenType::Heading, std::move(children));
    t.level = level;
    return t;
}

Token make_list(std::vector<Token> items) {
    return make_container(TokenType::List, std::move(items));
}

Token make_ordered_list(int start, std::vector<Token> items) {
    Token t = make_container(TokenType::OrderedList, std::move(items));
    t.level = start;
    return t;
}

Token make_item(std::vector<Token> children) {
    return make_container(TokenType::Item, std::move(children));
}

Token make_blockquote(std::vector<Token> children) {
    return make_container(TokenType::BlockQuote, std::move(children));
}

Token make_rule() { return Token{TokenType::Rule}; }

Token make_emphasis(std::vector<Token> children) {
    return make_container(TokenType::Emphasis, std::move(children));
}

Token make_strong(std::vector<Token> children) {
    return make_container(TokenType::Strong, std::move(children));
}

Token make_link(std::string target, std::string title, std::vector<Token> label) {
    Token t = make_container(TokenType::Link, std::move(label));
    t.target = std::move(target);
    t.info = std::move(title);
    return t;
}

Token make_image(std::string source, std::string title, std::vector<Token> alt) {
    Token t = make_container(TokenType::Image, std::move(alt));
    t.target = std::move(source);
    t.info = std::move(title);
    return t;
}

Token make_linebreak() { return Token{TokenType::LineBreak}; }

Token make_footnote_reference(std::string label) {
    Token t{TokenType::FootnoteReference};
    t.text = std::move(label);
    return t;
}

Token make_footnote_definition(std::string label, std::vector<Token> children) {
    Token t = make_container(TokenType::FootnoteDefinition, std::move(children));
    t.text = std::move(label);
    return t;
}

std::string plain_text(const std::vector<Token> &tokens) {
    std::string buf;
    for(const auto &t : tokens) {
        append_plain_text(t, buf);
    }
    return buf;
}

std::string plain_text(const Token &token) {
    std::string buf;
    append_plain_text(token, buf);
    return buf;
}

const char *token_type_name(TokenType t) {
    switch(t) {
    case TokenType::Paragraph:
        return "paragraph";
    case TokenType::Heading:
        return "heading";
    case TokenType::List:
        return "list";
    case TokenType::OrderedList:
        return "ordered list";
    case TokenType::Item:
        return "item";
    case TokenType::BlockQuote:
        return "block quote";
    case TokenType::CodeBlock:
        return "code block";
    case TokenType::Rule:
        return "rule";
    case TokenType::FootnoteDefinition:
        return "footnote definition";
    case TokenType::Text:
        return "text";
    case TokenType::Emphasis:
        return "emphasis";
    case TokenType::Strong:
        return "strong";
    case TokenType::Code:
        return "code";
    case TokenType::Link:
        return "link";
    case TokenType::Image:
        return "image";
    case TokenType::LineBreak:
        return "line break";
    case TokenType::FootnoteReference:
        return "footnote reference";
    }
    return "unknown";
}
