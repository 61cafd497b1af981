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

#include <string>
#include <vector>

enum class TokenType : int {
    // Block level.
    Paragraph,
    Heading,
    List,
    OrderedList,
    Item,
    BlockQuote,
    CodeBlock,
    Rule,
    FootnoteDefinition,
    // Inline.
    Text,
    Emphasis,
    Strong,
    Code,
    Link,
    Image,
    LineBreak,
    FootnoteReference,
};

/*
 * One node of a chapter's document tree. Which fields are meaningful
 * depends on the type:
 *
 * text      raw characters of Text, Code and CodeBlock, label of footnotes
 * target    destination of Link, source of Image
 * info      title of Link and Image, info string of CodeBlock
 * level     heading level, first number of OrderedList
 * children  everything else, owned by value
 */
struct Token {
    TokenType type;
    std::string text;
    std::string target;
    std::string info;
    int level = 0;
    std::vector<Token> children;

    bool is_block() const;

    bool operator==(const Token &o) const;
    bool operator!=(const Token &o) const { return !(*this == o); }
};

Token make_text(std::string text);
Token make_code(std::string text);
Token make_codeblock(std::string info, std::string text);
Token make_paragraph(std::vector<Token> children);
Token make_heading(int level, std::vector<Token> children);
Token make_list(std::vector<Token> items);
Token make_ordered_list(int start, std::vector<Token> items);
Token make_item(std::vector<Token> children);
Token make_blockquote(std::vector<Token> children);
Token make_rule();
Token make_emphasis(std::vector<Token> children);
Token make_strong(std::vector<Token> children);
Token make_link(std::string target, std::string title, std::vector<Token> label);
Token make_image(std::string source, std::string title, std::vector<Token> alt);
Token make_linebreak();
Token make_footnote_reference(std::string label);
Token make_footnote_definition(std::string label, std::vector<Token> children);

// Concatenation of all text leaves, line breaks become spaces.
std::string plain_text(const std::vector<Token> &tokens);
std::string plain_text(const Token &token);

const char *token_type_name(TokenType t);
