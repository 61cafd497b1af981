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
#include <container.hpp>
#include <epub.hpp>
#include <errors.hpp>
#include <htmlrenderer.hpp>
#include <latexrenderer.hpp>
#include <odt.hpp>
#include <renderall.hpp>
#include <utils.hpp>

#include <glib.h>

#include <cstdio>
#include <cstdlib>

#define CHECK(cond)                                                                                \
    if(!(cond)) {                                                                                  \
        printf("Fail %s:%d\n", __PRETTY_FUNCTION__, __LINE__);                                     \
        std::abort();                                                                              \
    }

namespace fs = std::filesystem;

namespace {

bool has(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

void add(Book &b, Number n, const std::string &text) {
    b.chapters.push_back(Chapter{n, parse_markdown(text, b.get_cleaner()), fs::path{}});
}

Book hello_book() {
    Book b;
    add(b, Number::automatic(), "Hello, world.");
    return b;
}

Book headers_book() {
    Book b;
    add(b, Number::automatic(), "# First\n\nfirst text");
    add(b, Number::unnumbered(), "# Interlude\n\ninterlude text");
    add(b, Number::hidden(), "# Secret\n\nhidden text");
    add(b, Number::specified(5), "# Fifth\n\n# Second heading");
    return b;
}

size_t occurrences(const std::string &haystack, const std::string &needle) {
    size_t n = 0;
    for(size_t pos = haystack.find(needle); pos != std::string::npos;
        pos = haystack.find(needle, pos + needle.length())) {
        ++n;
    }
    return n;
}

const ContainerEntry *find_entry(const Container &c, const std::string &path) {
    for(const auto &e : c.entries()) {
        if(e.path == path) {
            return &e;
        }
    }
    return nullptr;
}

template<typename Renderer> bool render_fails(const Book &b) {
    try {
        Renderer r(b);
        r.render();
    } catch(const RenderError &) {
        return true;
    }
    return false;
}

} // namespace

void test_html_hello() {
    const Book b = hello_book();
    HtmlRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "<p>Hello, world.</p>"));
    CHECK(has(out, "<div class=\"chapter\" id=\"chapter-1\">"));
}

void test_latex_hello() {
    const Book b = hello_book();
    LatexRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "\nHello, world.\n\n"));
    CHECK(has(out, "\\documentclass[a4paper,11pt]{book}"));
    CHECK(has(out, "\\end{document}"));
}

void test_html_title_escaping() {
    Book b = hello_book();
    b.title = "Tom & <Jerry>";
    HtmlRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "<title>Tom &amp; &lt;Jerry&gt;</title>"));
    CHECK(!has(out, "<Jerry>"));
}

void test_latex_title_escaping() {
    Book b = hello_book();
    b.title = "100% & $5_a";
    b.author = "{Me}";
    LatexRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "\\title{100\\% \\& \\$5\\_a}"));
    CHECK(has(out, "\\author{\\{Me\\}}"));
}

void test_html_chapter_headers() {
    const Book b = headers_book();
    HtmlRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "<h1>1. First</h1>"));
    CHECK(has(out, "<h1>Interlude</h1>"));
    CHECK(!has(out, "Secret"));
    CHECK(has(out, "hidden text"));
    CHECK(has(out, "<h1>5. Fifth</h1>"));
    // Only the first level 1 heading is the chapter title.
    CHECK(has(out, "<h1>Second heading</h1>"));
    CHECK(has(out, "<li><a href=\"#chapter-1\">1. First</a></li>"));
    CHECK(!has(out, "href=\"#chapter-3\""));
}

void test_numbering_disabled_headers() {
    Book b = headers_book();
    b.numbering = false;
    HtmlRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "<h1>First</h1>"));
    CHECK(has(out, "<h1>Fifth</h1>"));
    CHECK(!has(out, "Secret"));
}

void test_custom_numbering_template() {
    Book b;
    b.numbering_template = "Chapter {{number}}: {{title}}";
    add(b, Number::automatic(), "# A & B");
    HtmlRenderer hr(b);
    CHECK(has(hr.render(), "<h1>Chapter 1: A &amp; B</h1>"));
    LatexRenderer lr(b);
    const auto tex = lr.render();
    CHECK(has(tex, "\\chapter*{Chapter 1: A \\& B}"));
    CHECK(has(tex, "\\addcontentsline{toc}{chapter}{Chapter 1: A \\& B}"));

    b.numbering_template = "{{number}} {{bogus}}";
    CHECK(render_fails<HtmlRenderer>(b));
}

void test_html_structures() {
    Book b;
    add(b,
        Number::unnumbered(),
        "- a\n- b\n\n3. x\n\n> q\n\n```sh\n<raw>\n```\n\n![alt](p.png \"T\") "
        "[l](http://x.org/?a=1&b=2)\\\nnext\n\n---");
    HtmlRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "<ul>\n<li>a</li>\n<li>b</li>\n</ul>"));
    CHECK(has(out, "<ol start=\"3\">\n<li>x</li>\n</ol>"));
    CHECK(has(out, "<blockquote>\n<p>q</p>\n</blockquote>"));
    CHECK(has(out, "<pre><code class=\"language-sh\">&lt;raw&gt;\n</code></pre>"));
    CHECK(has(out, "<img src=\"p.png\" alt=\"alt\" title=\"T\" />"));
    CHECK(has(out, "<a href=\"http://x.org/?a=1&amp;b=2\">l</a><br />"));
    CHECK(has(out, "<hr />"));
}

void test_html_footnotes() {
    Book b;
    add(b, Number::automatic(), "# One\n\nText[^n].\n\n[^n]: The *note*.");
    add(b, Number::automatic(), "# Two\n\nMore[^n].\n\n[^n]: Other note.");
    HtmlRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "<a href=\"#note-1\" id=\"ref-1\" class=\"footnote-ref\"><sup>1</sup></a>"));
    CHECK(has(out, "<div class=\"notes\">"));
    CHECK(has(out, "<p>The <em>note</em>.</p>"));
    // Numbering continues through the book.
    CHECK(has(out, "id=\"note-2\""));
    CHECK(has(out, "<p>Other note.</p>"));
}

void test_unresolved_footnote() {
    Book b;
    b.chapters.push_back(
        Chapter{Number::automatic(),
                {make_paragraph({make_text("x"), make_footnote_reference("zz")})},
                fs::path{}});
    CHECK(render_fails<HtmlRenderer>(b));
    CHECK(render_fails<LatexRenderer>(b));
    CHECK(render_fails<EpubRenderer>(b));
    CHECK(render_fails<OdtRenderer>(b));
}

void test_footnote_cycles() {
    Book self;
    add(self, Number::automatic(), "Text[^a].\n\n[^a]: See[^a].");
    CHECK(render_fails<HtmlRenderer>(self));
    CHECK(render_fails<LatexRenderer>(self));
    CHECK(render_fails<EpubRenderer>(self));
    CHECK(render_fails<OdtRenderer>(self));

    Book cycle;
    add(cycle, Number::automatic(), "Text[^a].\n\n[^a]: A[^b].\n\n[^b]: B[^a].");
    CHECK(render_fails<HtmlRenderer>(cycle));
    CHECK(render_fails<LatexRenderer>(cycle));
    CHECK(render_fails<EpubRenderer>(cycle));
    CHECK(render_fails<OdtRenderer>(cycle));

    // A note referring to another note is fine as long as it ends.
    Book nested;
    add(nested, Number::automatic(), "Text[^a].\n\n[^a]: A[^b].\n\n[^b]: Bee.");
    HtmlRenderer html(nested);
    CHECK(has(html.render(), "id=\"note-2\""));
    LatexRenderer latex(nested);
    CHECK(has(latex.render(), "\\footnote{A\\footnote{Bee.}}"));
    OdtRenderer odt(nested);
    const Container c = odt.render();
    const auto content = find_entry(c, "content.xml")->data;
    CHECK(occurrences(content, "<text:note ") == 1);
    CHECK(has(content, "A (Bee.)"));
}

void test_html_toc_plain_title() {
    Book b;
    add(b, Number::automatic(), "# Title *x*[^n]\n\nBody.\n\n[^n]: Note.");
    HtmlRenderer r(b);
    const auto out = r.render();
    CHECK(occurrences(out, "id=\"ref-1\"") == 1);
    CHECK(has(out, "<li><a href=\"#chapter-1\">1. Title x</a></li>"));
    CHECK(has(out, "<h1>1. Title <em>x</em><a href=\"#note-1\" id=\"ref-1\""));
}

void test_latex_structures() {
    Book b;
    b.top_dir = "/book";
    add(b,
        Number::automatic(),
        "# T\n\n- a\n- b\n\n3. x\n\n> q\n\n```\nraw $\n```\n\n[l](http://x.org/a%b) "
        "![i](img/p.png) note[^1]\n\n[^1]: Foot 50%.\n\n***\n\n## Sub");
    LatexRenderer r(b);
    const auto out = r.render();
    CHECK(has(out, "\\begin{itemize}\n\\item a\n\n\\item b\n\n\\end{itemize}"));
    CHECK(has(out, "\\begin{enumerate}\n\\setcounter{enumi}{2}\n\\item x"));
    CHECK(has(out, "\\begin{quotation}\nq\n\n\\end{quotation}"));
    CHECK(has(out, "\\begin{verbatim}\nraw $\n\\end{verbatim}"));
    CHECK(has(out, "\\href{http://x.org/a\\%b}{l}"));
    CHECK(has(out, "\\includegraphics[width=\\linewidth]{/book/img/p.png}"));
    CHECK(has(out, "note\\footnote{Foot 50\\%.}"));
    CHECK(has(out, "\\rule{0.5\\linewidth}{0.5pt}"));
    CHECK(has(out, "\\section*{Sub}"));
}

void test_latex_language() {
    Book b = hello_book();
    b.lang = "fr";
    LatexRenderer fr(b);
    CHECK(has(fr.render(), "\\usepackage[french]{babel}"));
    b.lang = "xx";
    LatexRenderer other(b);
    CHECK(has(other.render(), "\\usepackage[english]{babel}"));
}

void test_epub_entries() {
    Book b = headers_book();
    EpubRenderer r(b);
    const Container c = r.render();
    const auto &entries = c.entries();
    CHECK(!entries.empty());
    CHECK(entries.front().path == "mimetype");
    CHECK(entries.front().stored);
    CHECK(entries.front().data == "application/epub+zip");
    CHECK(c.contains("META-INF/container.xml"));
    CHECK(c.contains("OEBPS/content.opf"));
    CHECK(c.contains("OEBPS/toc.ncx"));
    CHECK(c.contains("OEBPS/stylesheet.css"));
    CHECK(!c.contains("OEBPS/nav.xhtml"));
    int chapters = 0;
    for(const auto &e : entries) {
        if(g_str_has_prefix(e.path.c_str(), "OEBPS/chapter_")) {
            ++chapters;
        }
    }
    CHECK(chapters == int(b.chapters.size()));
    CHECK(c.contains("OEBPS/chapter_004.xhtml"));
}

void test_epub_documents() {
    Book b = headers_book();
    b.title = "Tom & Jerry";
    EpubRenderer r(b);
    const Container c = r.render();
    const auto opf = find_entry(c, "OEBPS/content.opf")->data;
    CHECK(has(opf, "version=\"2.0\""));
    CHECK(has(opf, "<dc:title>Tom &amp; Jerry</dc:title>"));
    CHECK(has(opf, "urn:uuid:"));
    CHECK(has(opf, "<itemref idref=\"chapter_1\"/>"));
    const auto ncx = find_entry(c, "OEBPS/toc.ncx")->data;
    CHECK(has(ncx, "<text>1. First</text>"));
    CHECK(has(ncx, "<text>5. Fifth</text>"));
    CHECK(!has(ncx, "Secret"));
    const auto first = find_entry(c, "OEBPS/chapter_001.xhtml")->data;
    CHECK(has(first, "<h1>1. First</h1>"));
    CHECK(has(first, "<p>first text</p>"));
    CHECK(has(first, "<title>Tom &amp; Jerry</title>"));
    CHECK(has(first, "xhtml11.dtd"));
    const auto hidden = find_entry(c, "OEBPS/chapter_003.xhtml")->data;
    CHECK(!has(hidden, "Secret"));
    CHECK(has(hidden, "<p>hidden text</p>"));
}

void test_epub3() {
    Book b = hello_book();
    b.epub_version = 3;
    EpubRenderer r(b);
    const Container c = r.render();
    CHECK(c.contains("OEBPS/nav.xhtml"));
    const auto opf = find_entry(c, "OEBPS/content.opf")->data;
    CHECK(has(opf, "version=\"3.0\""));
    CHECK(has(opf, "dcterms:modified"));
    CHECK(has(opf, "properties=\"nav\""));
    const auto chapter = find_entry(c, "OEBPS/chapter_001.xhtml")->data;
    CHECK(has(chapter, "<!DOCTYPE html>"));
    CHECK(has(chapter, "<p>Hello, world.</p>"));
}

void test_epub_missing_cover() {
    Book b = hello_book();
    b.cover = fs::path{"/nonexistent/folio/cover.png"};
    CHECK(render_fails<EpubRenderer>(b));
    CHECK(render_fails<OdtRenderer>(b));
}

void test_epub_cover_and_images() {
    TempDir dir(default_temp_dir(), "test");
    write_file_atomic(dir.path() / "cover.jpg", "not really a jpeg", "test");
    write_file_atomic(dir.path() / "pic.png", "not really a png", "test");
    Book b;
    b.top_dir = dir.path();
    b.cover = dir.path() / "cover.jpg";
    add(b, Number::automatic(), "![one](pic.png) ![again](pic.png) ![far](http://x.org/a.png)");
    EpubRenderer r(b);
    const Container c = r.render();
    CHECK(c.contains("OEBPS/images/cover.jpg"));
    CHECK(c.contains("OEBPS/cover.xhtml"));
    CHECK(c.contains("OEBPS/images/image-0.png"));
    CHECK(!c.contains("OEBPS/images/image-1.png"));
    CHECK(find_entry(c, "OEBPS/images/image-0.png")->data == "not really a png");
    const auto opf = find_entry(c, "OEBPS/content.opf")->data;
    CHECK(has(opf, "<meta name=\"cover\" content=\"cover-image\"/>"));
    CHECK(has(opf, "media-type=\"image/jpeg\""));
    const auto chapter = find_entry(c, "OEBPS/chapter_001.xhtml")->data;
    CHECK(has(chapter, "src=\"images/image-0.png\""));
    CHECK(has(chapter, "src=\"http://x.org/a.png\""));

    add(b, Number::automatic(), "![gone](missing.png)");
    CHECK(render_fails<EpubRenderer>(b));
}

void test_epub_footnotes() {
    Book b;
    b.epub_version = 3;
    add(b, Number::automatic(), "Text[^a].\n\n[^a]: Note.");
    EpubRenderer r(b);
    const Container c = r.render();
    const auto chapter = find_entry(c, "OEBPS/chapter_001.xhtml")->data;
    CHECK(has(chapter, "epub:type=\"noteref\""));
    CHECK(has(chapter, "<aside id=\"note-1\" class=\"footnote\" epub:type=\"footnote\">"));
    CHECK(has(chapter, "<p>Note.</p>"));
}

void test_epub_inline_markup() {
    Book b;
    add(b, Number::unnumbered(), "*a*[b](c) **d**\n\n```\ncode\n```");
    EpubRenderer r(b);
    const Container c = r.render();
    const auto chapter = find_entry(c, "OEBPS/chapter_001.xhtml")->data;
    // Serialized as is, without indentation between elements.
    CHECK(has(chapter, "<p><em>a</em><a href=\"c\">b</a> <strong>d</strong></p>"));
    CHECK(has(chapter, "<pre><code>code\n</code></pre>"));
}

void test_odt_entries() {
    const Book b = headers_book();
    OdtRenderer r(b);
    const Container c = r.render();
    const auto &entries = c.entries();
    CHECK(entries.front().path == "mimetype");
    CHECK(entries.front().stored);
    CHECK(entries.front().data == "application/vnd.oasis.opendocument.text");
    CHECK(c.contains("content.xml"));
    CHECK(c.contains("styles.xml"));
    CHECK(c.contains("meta.xml"));
    CHECK(c.contains("META-INF/manifest.xml"));
    const auto content = find_entry(c, "content.xml")->data;
    CHECK(has(content,
              "<text:h text:style-name=\"Heading_20_1\" text:outline-level=\"1\">1. First</text:h>"));
    CHECK(has(content, "<text:p text:style-name=\"Text_20_body\">first text</text:p>"));
    CHECK(!has(content, "Secret"));
    const auto styles = find_entry(c, "styles.xml")->data;
    CHECK(has(styles, "style:name=\"Quotations\""));
    CHECK(has(styles, "style:name=\"List_20_1\""));
}

void test_odt_markup() {
    TempDir dir(default_temp_dir(), "test");
    write_file_atomic(dir.path() / "pic.png", "png", "test");
    Book b;
    b.top_dir = dir.path();
    add(b,
        Number::unnumbered(),
        "*em* **strong** [l](http://x.org) ![a](pic.png) n[^1]\n\n> quoted\n\n1. item\n\n"
        "```\n  two  spaces\n```\n\n[^1]: Note.");
    OdtRenderer r(b);
    const Container c = r.render();
    const auto content = find_entry(c, "content.xml")->data;
    CHECK(has(content, "<text:span text:style-name=\"Emphasis\">em</text:span>"));
    CHECK(has(content, "<text:span text:style-name=\"Strong_20_Emphasis\">strong</text:span>"));
    CHECK(has(content, "<text:a xlink:type=\"simple\" xlink:href=\"http://x.org\">l</text:a>"));
    CHECK(has(content, "xlink:href=\"Pictures/image-0.png\""));
    CHECK(has(content, "<text:note text:id=\"ftn1\" text:note-class=\"footnote\">"));
    CHECK(has(content, "<text:p text:style-name=\"Quotations\">quoted</text:p>"));
    CHECK(has(content, "<text:list text:style-name=\"Numbering_20_1\">"));
    CHECK(has(content, "<text:s text:c=\"2\"/>two <text:s/>spaces"));
    CHECK(c.contains("Pictures/image-0.png"));
    CHECK(has(find_entry(c, "META-INF/manifest.xml")->data, "Pictures/image-0.png"));
}

void test_odt_spaces() {
    tinyxml2::XMLDocument doc;
    auto p = doc.NewElement("text:p");
    doc.InsertEndChild(p);
    append_odf_text(p, "a   b\tc", false);
    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    const std::string out{printer.CStr()};
    CHECK(has(out, "a <text:s text:c=\"2\"/>b<text:tab/>c"));
}

void test_container() {
    Container c("test");
    c.add("mimetype", "x", true);
    c.add("a/b.txt", "y");
    CHECK(c.contains("a/b.txt"));
    CHECK(!c.contains("b.txt"));
    CHECK(c.entries().size() == 2);
    bool thrown = false;
    try {
        c.add("mimetype", "z");
    } catch(const RenderError &) {
        thrown = true;
    }
    CHECK(thrown);
    thrown = false;
    try {
        c.add_file("missing", "/nonexistent/folio/file");
    } catch(const RenderError &) {
        thrown = true;
    }
    CHECK(thrown);
}

void test_container_write() {
    gchar *zip = g_find_program_in_path("zip");
    if(!zip) {
        printf("zip not found, skipping %s\n", __PRETTY_FUNCTION__);
        return;
    }
    g_free(zip);
    TempDir dir(default_temp_dir(), "test");
    Container c("test");
    c.add("mimetype", "application/epub+zip", true);
    c.add("OEBPS/a.txt", "some text");
    const auto dest = dir.path() / "out.zip";
    c.write(dest, dir.path());
    CHECK(fs::exists(dest));
    CHECK(!fs::exists(dir.path() / "out.zip.partial"));
    const auto data = read_file(dest);
    // The first local file header is 30 bytes, followed by the name and
    // the stored data.
    CHECK(data.substr(0, 2) == "PK");
    CHECK(data.substr(30, 8) == "mimetype");
    CHECK(data.substr(38, 20) == "application/epub+zip");
}

void test_render_all_nothing() {
    const Book b = hello_book();
    CHECK(render_all(b).empty());
}

void test_render_all_independent() {
    TempDir dir(default_temp_dir(), "test");
    Book b = hello_book();
    b.temp_dir = dir.path();
    b.output_html = dir.path() / "book.html";
    b.output_tex = dir.path() / "book.tex";
    b.output_epub = dir.path() / "book.epub";
    b.cover = dir.path() / "missing.png";
    const auto outcomes = render_all(b);
    CHECK(outcomes.size() == 3);
    for(const auto &o : outcomes) {
        if(o.format == "epub") {
            CHECK(!o.success);
            CHECK(has(o.message, "missing.png"));
        } else {
            CHECK(o.success);
            CHECK(fs::exists(o.path));
        }
    }
    CHECK(!fs::exists(dir.path() / "book.epub"));
    CHECK(has(read_file(dir.path() / "book.html"), "<p>Hello, world.</p>"));
}

void test_pdf_command_failure() {
    TempDir dir(default_temp_dir(), "test");
    Book b = hello_book();
    b.temp_dir = dir.path();
    b.tex_command = "false";
    const auto dest = dir.path() / "book.pdf";
    bool thrown = false;
    try {
        render_format(b, "pdf", dest);
    } catch(const RenderError &e) {
        thrown = true;
        CHECK(e.format() == "pdf");
    }
    CHECK(thrown);
    CHECK(!fs::exists(dest));
}

int main(int, char **) {
    test_html_hello();
    test_latex_hello();
    test_html_title_escaping();
    test_latex_title_escaping();
    test_html_chapter_headers();
    test_numbering_disabled_headers();
    test_custom_numbering_template();
    test_html_structures();
    test_html_footnotes();
    test_unresolved_footnote();
    test_footnote_cycles();
    test_html_toc_plain_title();

    test_latex_structures();
    test_latex_language();

    test_epub_entries();
    test_epub_documents();
    test_epub3();
    test_epub_missing_cover();
    test_epub_cover_and_images();
    test_epub_footnotes();
    test_epub_inline_markup();

    test_odt_entries();
    test_odt_markup();
    test_odt_spaces();

    test_container();
    test_container_write();

    test_render_all_nothing();
    test_render_all_independent();
    test_pdf_command_failure();
    return 0;
}
