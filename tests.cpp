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

#include <bookparser.hpp>
#include <cleaner.hpp>
#include <errors.hpp>
#include <escape.hpp>
#include <metadata.hpp>
#include <numbering.hpp>
#include <templater.hpp>
#include <token.hpp>
#include <utils.hpp>

#include <glib.h>

#include <climits>
#include <cstdio>
#include <cstdlib>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace {

// U+202F NARROW NO-BREAK SPACE
const gunichar narrow_nbsp = 0x202f;
const char narrow[] = "\xe2\x80\xaf";

std::vector<Token> parse(const std::string &text) { return parse_markdown(text, Cleaner{}); }

Token para_text(const std::string &text) { return make_paragraph({make_text(text)}); }

} // namespace

void test_token_equality() {
    auto a = make_paragraph({make_text("x"), make_emphasis({make_text("y")})});
    auto b = make_paragraph({make_text("x"), make_emphasis({make_text("y")})});
    auto c = make_paragraph({make_text("x"), make_strong({make_text("y")})});
    CHECK(a == b);
    CHECK(a != c);
    CHECK(make_heading(1, {}) != make_heading(2, {}));
    CHECK(a.is_block());
    CHECK(!a.children.front().is_block());
}

void test_plain_text() {
    auto t = make_paragraph({make_text("a"),
                             make_linebreak(),
                             make_emphasis({make_text("b")}),
                             make_footnote_reference("1"),
                             make_code(" c")});
    CHECK(plain_text(t) == "a b c");
}

void test_noop_cleaner() {
    CHECK(make_cleaner("en", true, ' ').is_noop());
    CHECK(make_cleaner("fr", false, ' ').is_noop());
    CHECK(!make_cleaner("FR_ca", true, ' ').is_noop());
    Cleaner c;
    CHECK(c.clean("  Quoi ?  ", true) == "  Quoi ?  ");
}

void test_french_punctuation() {
    FrenchCleaner c(narrow_nbsp);
    CHECK(c.clean("Quoi ?", false) == std::string{"Quoi"} + narrow + "?");
    CHECK(c.clean("Quoi?", false) == std::string{"Quoi"} + narrow + "?");
    CHECK(c.clean("Bonjour   le   monde", false) == "Bonjour le monde");
    // Times and URLs are left alone.
    CHECK(c.clean("12:30", false) == "12:30");
}

void test_french_guillemets() {
    FrenchCleaner c(narrow_nbsp);
    const std::string expected = std::string{"«"} + narrow + "Salut" + narrow + "»";
    CHECK(c.clean("« Salut »", false) == expected);
    CHECK(c.clean("«Salut»", false) == expected);
}

void test_french_dialogue() {
    FrenchCleaner c(narrow_nbsp);
    CHECK(c.clean("— Oui", true) == std::string{"—"} + narrow + "Oui");
    CHECK(c.clean("— Oui", false) == "— Oui");
}

void test_cleaner_idempotent() {
    const std::vector<std::string> samples{"« Bonjour ! »",
                                           "Quoi?Vraiment ; oui:non",
                                           "— Il a dit « non »  !",
                                           "rien à signaler"};
    for(const gunichar nb : {gunichar(' '), gunichar(0xa0), narrow_nbsp}) {
        Cleaner c{FrenchCleaner{nb}};
        for(const auto &s : samples) {
            for(const bool first : {true, false}) {
                const auto once = c.clean(s, first);
                CHECK(c.clean(once, first) == once);
            }
        }
    }
}

void test_parse_heading_and_paragraph() {
    auto tokens = parse("# Title\n\nHello, world.\n");
    CHECK(tokens.size() == 2);
    CHECK(tokens[0] == make_heading(1, {make_text("Title")}));
    CHECK(tokens[1] == para_text("Hello, world."));
}

void test_parse_atx_closing() {
    auto tokens = parse("## Title ##\n###### Deep");
    CHECK(tokens.size() == 2);
    CHECK(tokens[0] == make_heading(2, {make_text("Title")}));
    CHECK(tokens[1] == make_heading(6, {make_text("Deep")}));
    // Not a heading without the space.
    CHECK(parse("#hashtag").front() == para_text("#hashtag"));
}

void test_parse_setext() {
    auto tokens = parse("Title\n=====\n\nSub\n---\n");
    CHECK(tokens.size() == 2);
    CHECK(tokens[0] == make_heading(1, {make_text("Title")}));
    CHECK(tokens[1] == make_heading(2, {make_text("Sub")}));
}

void test_parse_paragraph_lines() {
    auto tokens = parse("one\ntwo\n\nthree");
    CHECK(tokens.size() == 2);
    CHECK(tokens[0] == para_text("one two"));
    CHECK(tokens[1] == para_text("three"));
}

void test_parse_rules() {
    auto tokens = parse("***\n\n- - -\n\n___");
    CHECK(tokens.size() == 3);
    for(const auto &t : tokens) {
        CHECK(t == make_rule());
    }
}

void test_parse_emphasis() {
    auto tokens = parse("a *b* __c__ ***d***");
    CHECK(tokens.size() == 1);
    const auto expected = make_paragraph({make_text("a "),
                                          make_emphasis({make_text("b")}),
                                          make_text(" "),
                                          make_strong({make_text("c")}),
                                          make_text(" "),
                                          make_strong({make_emphasis({make_text("d")})})});
    CHECK(tokens[0] == expected);
}

void test_parse_intraword_underscore() {
    CHECK(parse("snake_case_name").front() == para_text("snake_case_name"));
    CHECK(parse("2 * 3 * 4").front() == para_text("2 * 3 * 4"));
    CHECK(parse("*unclosed").front() == para_text("*unclosed"));
}

void test_parse_unmatched_emphasis() {
    // Stray delimiters must not make the closer search blow up.
    std::string text;
    for(int i = 0; i < 250; ++i) {
        text += "*a _b ";
    }
    text += "end";
    const auto tokens = parse(text);
    CHECK(tokens.size() == 1);
    CHECK(tokens[0] == para_text(text));
}

void test_parse_code_span() {
    auto tokens = parse("use `a*b` or `` x`y ``");
    const auto expected =
        make_paragraph({make_text("use "), make_code("a*b"), make_text(" or "), make_code("x`y")});
    CHECK(tokens.front() == expected);
}

void test_parse_links() {
    auto tokens = parse("[label](http://x.org \"T\") and <https://example.com>");
    const auto expected = make_paragraph(
        {make_link("http://x.org", "T", {make_text("label")}),
         make_text(" and "),
         make_link("https://example.com", "", {make_text("https://example.com")})});
    CHECK(tokens.front() == expected);
    CHECK(parse("[not a link]").front() == para_text("[not a link]"));
}

void test_parse_image() {
    auto tokens = parse("![The *alt*](pics/a.png)");
    const auto expected = make_paragraph(
        {make_image("pics/a.png", "", {make_text("The "), make_emphasis({make_text("alt")})})});
    CHECK(tokens.front() == expected);
}

void test_parse_escapes_and_breaks() {
    CHECK(parse("\\*not\\*").front() == para_text("*not*"));
    const auto hard = make_paragraph({make_text("a"), make_linebreak(), make_text("b")});
    CHECK(parse("a  \nb").front() == hard);
    CHECK(parse("a\\\nb").front() == hard);
}

void test_parse_lists() {
    auto tokens = parse("- one\n- two\n");
    CHECK(tokens.size() == 1);
    CHECK(tokens[0] ==
          make_list({make_item({para_text("one")}), make_item({para_text("two")})}));

    tokens = parse("3. a\n4. b");
    CHECK(tokens.size() == 1);
    CHECK(tokens[0] == make_ordered_list(3, {make_item({para_text("a")}), make_item({para_text("b")})}));
}

void test_parse_nested_list() {
    auto tokens = parse("- a\n  - b\n- c\n");
    const auto expected =
        make_list({make_item({para_text("a"), make_list({make_item({para_text("b")})})}),
                   make_item({para_text("c")})});
    CHECK(tokens.size() == 1);
    CHECK(tokens[0] == expected);
}

void test_parse_list_with_blank_lines() {
    auto tokens = parse("1. first\n\n   more\n2. second\n");
    const auto expected = make_ordered_list(
        1, {make_item({para_text("first"), para_text("more")}), make_item({para_text("second")})});
    CHECK(tokens.size() == 1);
    CHECK(tokens[0] == expected);
}

void test_parse_blockquote() {
    auto tokens = parse("> quoted\ncontinued\n\nafter");
    CHECK(tokens.size() == 2);
    CHECK(tokens[0] == make_blockquote({para_text("quoted continued")}));
    CHECK(tokens[1] == para_text("after"));

    tokens = parse("> # Inner\n>\n> - x");
    CHECK(tokens.size() == 1);
    CHECK(tokens[0] == make_blockquote({make_heading(1, {make_text("Inner")}),
                                        make_list({make_item({para_text("x")})})}));
}

void test_parse_code_blocks() {
    auto tokens = parse("```cpp\nint x;\n\n  y();\n```\n    indented\n");
    CHECK(tokens.size() == 2);
    CHECK(tokens[0] == make_codeblock("cpp", "int x;\n\n  y();\n"));
    CHECK(tokens[1] == make_codeblock("", "indented\n"));
    // Unterminated fences run to the end.
    tokens = parse("~~~\n*raw*");
    CHECK(tokens.size() == 1);
    CHECK(tokens[0] == make_codeblock("", "*raw*\n"));
}

void test_parse_footnotes() {
    auto tokens = parse("Text[^1].\n\n[^1]: The note\n    continues.\n");
    CHECK(tokens.size() == 2);
    CHECK(tokens[0] ==
          make_paragraph({make_text("Text"), make_footnote_reference("1"), make_text(".")}));
    CHECK(tokens[1] == make_footnote_definition("1", {para_text("The note continues.")}));
    // Undefined labels stay text.
    CHECK(parse("Text[^x].").front() == para_text("Text[^x]."));
}

void test_parse_footnote_label_in_code() {
    // Definitions shown inside code do not make references elsewhere.
    auto tokens =
        parse("```\n[^x]: not a note\n```\n\nText[^x].\n\n    [^y]: indented code\n\nMore[^y].");
    CHECK(tokens.size() == 4);
    CHECK(tokens[0] == make_codeblock("", "[^x]: not a note\n"));
    CHECK(tokens[1] == para_text("Text[^x]."));
    CHECK(tokens[2] == make_codeblock("", "[^y]: indented code\n"));
    CHECK(tokens[3] == para_text("More[^y]."));
}

void test_parse_cleans_text() {
    const auto tokens = parse_markdown("Quoi ?  \n— Oui", Cleaner{FrenchCleaner{narrow_nbsp}});
    const auto expected = make_paragraph({make_text(std::string{"Quoi"} + narrow + "?"),
                                          make_linebreak(),
                                          make_text(std::string{"—"} + narrow + "Oui")});
    CHECK(tokens.front() == expected);
    // Code is never cleaned.
    const auto code = parse_markdown("`a ?`", Cleaner{FrenchCleaner{narrow_nbsp}});
    CHECK(code.front() == make_paragraph({make_code("a ?")}));
}

void test_parse_deterministic() {
    const std::string text{"# T\n\nSome *text* with [a](b) and `code`.\n\n- x\n- y\n\n> q\n"};
    CHECK(parse(text) == parse(text));
}

void test_parse_errors() {
    bool thrown = false;
    try {
        parse("bad \xff utf-8");
    } catch(const ParseError &) {
        thrown = true;
    }
    CHECK(thrown);

    thrown = false;
    try {
        parse_file("/nonexistent/folio/chapter.md", Cleaner{});
    } catch(const FileNotFound &e) {
        thrown = true;
        CHECK(e.filename() == "/nonexistent/folio/chapter.md");
    }
    CHECK(thrown);
}

void test_numbering() {
    const std::vector<Number> numbers{Number::automatic(),
                                      Number::automatic(),
                                      Number::specified(5),
                                      Number::automatic(),
                                      Number::unnumbered(),
                                      Number::hidden()};
    const std::vector<ResolvedNumber> expected{{1, true},
                                               {2, true},
                                               {5, true},
                                               {6, true},
                                               {std::nullopt, true},
                                               {std::nullopt, false}};
    CHECK(resolve_numbering(numbers, true) == expected);
}

void test_numbering_disabled() {
    const std::vector<Number> numbers{
        Number::automatic(), Number::specified(3), Number::unnumbered(), Number::hidden()};
    const std::vector<ResolvedNumber> expected{
        {std::nullopt, true}, {std::nullopt, true}, {std::nullopt, true}, {std::nullopt, false}};
    CHECK(resolve_numbering(numbers, false) == expected);
}

void test_numbering_unnumbered_keeps_counter() {
    const std::vector<Number> numbers{
        Number::automatic(), Number::unnumbered(), Number::hidden(), Number::automatic()};
    const auto r = resolve_numbering(numbers, true);
    CHECK(r[3].display_number == 2);
}

void test_numbering_overflow() {
    CHECK(resolve_numbering({Number::specified(INT_MAX)}, true)[0].display_number == INT_MAX);
    bool thrown = false;
    try {
        resolve_numbering({Number::specified(INT_MAX), Number::automatic()}, true);
    } catch(const RenderError &) {
        thrown = true;
    }
    CHECK(thrown);
    CHECK(resolve_numbering({Number::specified(INT_MAX), Number::automatic()}, false).size() == 2);
}

void test_template_expansion() {
    TemplateVars vars{{"a", "1"}, {"b", "<two>"}};
    CHECK(expand_template("{{a}}-{{{ b }}}-{{ a }}", vars) == "1-<two>-1");
    CHECK(expand_template("no placeholders", vars) == "no placeholders");
    // Unpaired braces stay in the output.
    CHECK(expand_template("{{{a}}", vars) == "{1");
    CHECK(expand_template("{{a}}}", vars) == "1}");
    bool thrown = false;
    try {
        expand_template("{{missing}}", vars);
    } catch(const RenderError &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_escaping() {
    CHECK(escape_html("<a href='x'>&\"") == "&lt;a href=&#39;x&#39;&gt;&amp;&quot;");
    CHECK(escape_tex("50% of $x_1 & {y}") == "50\\% of \\$x\\_1 \\& \\{y\\}");
    CHECK(escape_tex("a\\b~^#") == "a\\textbackslash{}b\\textasciitilde{}\\textasciicircum{}\\#");
    CHECK(escape_tex("a\xc2\xa0"
                     "b") == "a~b");
    CHECK(escape_tex(std::string{"a"} + narrow + "b") == "a\\,b");
    CHECK(escape_tex_url("http://x.org/a%20b#c") == "http://x.org/a\\%20b\\#c");
}

void test_config_defaults() {
    Book b = parse_book_json("{}", "/tmp");
    CHECK(b.author == "Anonymous");
    CHECK(b.title == "Untitled");
    CHECK(b.lang == "en");
    CHECK(b.numbering);
    CHECK(b.autoclean);
    CHECK(!b.verbose);
    CHECK(b.epub_version == 2);
    CHECK(b.tex_command == "pdflatex");
    CHECK(!b.output_epub);
    CHECK(b.chapters.empty());
    CHECK(b.get_header(3, "Title") == "3. Title");
    CHECK(b.get_cleaner().is_noop());
}

void test_config_chapters() {
    TempDir dir(default_temp_dir(), "test");
    write_file_atomic(dir.path() / "a.md", "# A\n\nText of a.\n", "test");
    write_file_atomic(dir.path() / "b.md", "# B\n", "test");
    Book b = parse_book_json(R"({"lang": "fr", "title": "Livre",
                                 "output_html": "out/book.html",
                                 "chapters": ["+ a.md", "-b.md", "!a.md", "5. b.md", "7:a.md"]})",
                             dir.path());
    CHECK(b.chapters.size() == 5);
    CHECK(b.chapters[0].number == Number::automatic());
    CHECK(b.chapters[1].number == Number::unnumbered());
    CHECK(b.chapters[2].number == Number::hidden());
    CHECK(b.chapters[3].number == Number::specified(5));
    CHECK(b.chapters[4].number == Number::specified(7));
    CHECK(b.chapters[0].source == dir.path() / "a.md");
    CHECK(b.chapters[0].tokens.front() == make_heading(1, {make_text("A")}));
    CHECK(*b.output_html == dir.path() / "out" / "book.html");
    CHECK(!b.get_cleaner().is_noop());
}

void test_config_errors() {
    const std::vector<std::string> bad{R"({"unknown": 1})",
                                       R"({"epub_version": 4})",
                                       R"({"epub_version": 4294967298})",
                                       R"({"epub_version": -4294967294})",
                                       R"({"nb_char": "ab"})",
                                       R"({"numbering": "yes"})",
                                       R"({"chapters": "a.md"})",
                                       R"({"chapters": ["x a.md"]})",
                                       R"({"chapters": ["+ a b.md"]})",
                                       R"({"chapters": ["+"]})",
                                       R"([1, 2])",
                                       R"({"title": )"};
    for(const auto &text : bad) {
        bool thrown = false;
        try {
            parse_book_json(text, "/tmp");
        } catch(const ConfigError &) {
            thrown = true;
        }
        CHECK(thrown);
    }
}

void test_config_missing_chapter() {
    TempDir dir(default_temp_dir(), "test");
    bool thrown = false;
    try {
        parse_book_json(R"({"chapters": ["+ missing.md"]})", dir.path());
    } catch(const FileNotFound &e) {
        thrown = true;
        CHECK(e.filename() == (dir.path() / "missing.md").string());
    }
    CHECK(thrown);
}

void test_config_templates() {
    TempDir dir(default_temp_dir(), "test");
    write_file_atomic(dir.path() / "style.css", "p { color: red; }", "test");
    Book b = parse_book_json(R"({"html_css": "style.css", "epub_css": "nope.css"})", dir.path());
    CHECK(b.get_template(TemplateKind::HtmlCss) == "p { color: red; }");
    CHECK(b.get_template(TemplateKind::HtmlPage).find("{{{content}}}") != std::string::npos);
    bool thrown = false;
    try {
        b.get_template(TemplateKind::EpubCss);
    } catch(const FileNotFound &) {
        thrown = true;
    }
    CHECK(thrown);
    b.epub_version = 3;
    CHECK(b.get_template(TemplateKind::EpubChapter).find("<!DOCTYPE html>") != std::string::npos);
}

void test_metadata_vars() {
    Book b;
    b.title = "Tom & Jerry";
    b.author = "A_B";
    const auto html = b.get_metadata_vars(EscapeFormat::Html);
    CHECK(html.at("title") == "Tom &amp; Jerry");
    CHECK(html.at("description").empty());
    const auto tex = b.get_metadata_vars(EscapeFormat::Tex);
    CHECK(tex.at("title") == "Tom \\& Jerry");
    CHECK(tex.at("author") == "A\\_B");
}

int main(int, char **) {
    test_token_equality();
    test_plain_text();

    test_noop_cleaner();
    test_french_punctuation();
    test_french_guillemets();
    test_french_dialogue();
    test_cleaner_idempotent();

    test_parse_heading_and_paragraph();
    test_parse_atx_closing();
    test_parse_setext();
    test_parse_paragraph_lines();
    test_parse_rules();
    test_parse_emphasis();
    test_parse_intraword_underscore();
    test_parse_unmatched_emphasis();
    test_parse_code_span();
    test_parse_links();
    test_parse_image();
    test_parse_escapes_and_breaks();
    test_parse_lists();
    test_parse_nested_list();
    test_parse_list_with_blank_lines();
    test_parse_blockquote();
    test_parse_code_blocks();
    test_parse_footnotes();
    test_parse_footnote_label_in_code();
    test_parse_cleans_text();
    test_parse_deterministic();
    test_parse_errors();

    test_numbering();
    test_numbering_disabled();
    test_numbering_unnumbered_keeps_counter();
    test_numbering_overflow();

    test_template_expansion();
    test_escaping();

    test_config_defaults();
    test_config_chapters();
    test_config_errors();
    test_config_missing_chapter();
    test_config_templates();
    test_metadata_vars();
    return 0;
}
