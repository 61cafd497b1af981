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

#include <odt.hpp>
#include <epub.hpp>
#include <errors.hpp>
#include <utils.hpp>

#include <glib.h>

namespace fs = std::filesystem;

namespace {

const char format_name[] = "odt";

const char mimetext[] = "application/vnd.oasis.opendocument.text";

const char ns_office[] = "urn:oasis:names:tc:opendocument:xmlns:office:1.0";
const char ns_style[] = "urn:oasis:names:tc:opendocument:xmlns:style:1.0";
const char ns_text[] = "urn:oasis:names:tc:opendocument:xmlns:text:1.0";
const char ns_draw[] = "urn:oasis:names:tc:opendocument:xmlns:drawing:1.0";
const char ns_fo[] = "urn:oasis:names:tc:opendocument:xmlns:xsl-fo-compatible:1.0";
const char ns_xlink[] = "http://www.w3.org/1999/xlink";
const char ns_svg[] = "urn:oasis:names:tc:opendocument:xmlns:svg-compatible:1.0";
const char ns_dc[] = "http://purl.org/dc/elements/1.1/";
const char ns_meta[] = "urn:oasis:names:tc:opendocument:xmlns:meta:1.0";
const char ns_manifest[] = "urn:oasis:names:tc:opendocument:xmlns:manifest:1.0";

const char body_style[] = "Text_20_body";

struct ParagraphStyle {
    const char *name;
    const char *display_name;
    const char *parent;
    const char *font_size;
    const char *font_weight;
    const char *font_style;
    const char *margin_left;
    const char *align;
};

// Paragraph styles, written to styles.xml and referenced by name.
const ParagraphStyle paragraph_styles[] = {
    {"Standard", "Standard", nullptr, nullptr, nullptr, nullptr, nullptr, nullptr},
    {"Text_20_body", "Text body", "Standard", nullptr, nullptr, nullptr, nullptr, "justify"},
    {"Title", "Title", "Standard", "24pt", "bold", nullptr, nullptr, "center"},
    {"Subtitle", "Subtitle", "Standard", "16pt", nullptr, "italic", nullptr, "center"},
    {"Heading_20_1", "Heading 1", "Standard", "20pt", "bold", nullptr, nullptr, "center"},
    {"Heading_20_2", "Heading 2", "Standard", "16pt", "bold", nullptr, nullptr, nullptr},
    {"Heading_20_3", "Heading 3", "Standard", "14pt", "bold", nullptr, nullptr, nullptr},
    {"Heading_20_4", "Heading 4", "Standard", "12pt", "bold", nullptr, nullptr, nullptr},
    {"Heading_20_5", "Heading 5", "Standard", "12pt", "bold", "italic", nullptr, nullptr},
    {"Heading_20_6", "Heading 6", "Standard", "12pt", nullptr, "italic", nullptr, nullptr},
    {"Quotations", "Quotations", "Text_20_body", nullptr, nullptr, "italic", "1cm", nullptr},
    {"Preformatted_20_Text", "Preformatted Text", "Standard", "10pt", nullptr, nullptr, "0.5cm", nullptr},
    {"Horizontal_20_Line", "Horizontal Line", "Standard", nullptr, nullptr, nullptr, nullptr, "center"},
    {"Footnote", "Footnote", "Standard", "10pt", nullptr, nullptr, nullptr, nullptr},
    {"Cover", "Cover", "Standard", nullptr, nullptr, nullptr, nullptr, "center"},
};

tinyxml2::XMLElement *add_element(tinyxml2::XMLNode *parent, const char *name) {
    auto e = parent->GetDocument()->NewElement(name);
    parent->InsertEndChild(e);
    return e;
}

// Compact, indentation would become part of mixed content.
std::string to_string(const tinyxml2::XMLDocument &doc) {
    tinyxml2::XMLPrinter printer(nullptr, true);
    doc.Print(&printer);
    return std::string{printer.CStr()};
}

std::string heading_style(int level) { return "Heading_20_" + std::to_string(level); }

bool is_remote(const std::string &target) { return target.find("://") != std::string::npos; }

} // namespace

void append_odf_text(tinyxml2::XMLElement *parent, const std::string &text, bool at_start) {
    auto doc = parent->GetDocument();
    std::string buf;
    auto flush = [&]() {
        if(!buf.empty()) {
            parent->InsertEndChild(doc->NewText(buf.c_str()));
            buf.clear();
        }
    };
    size_t i = 0;
    while(i < text.length()) {
        const char c = text[i];
        if(c == ' ') {
            size_t run = 0;
            while(i + run < text.length() && text[i + run] == ' ') {
                ++run;
            }
            size_t literal = 0;
            if(!(at_start && i == 0)) {
                buf += ' ';
                literal = 1;
            }
            if(run > literal) {
                flush();
                auto s = add_element(parent, "text:s");
                if(run - literal > 1) {
                    s->SetAttribute("text:c", int(run - literal));
                }
            }
            i += run;
        } else if(c == '\t') {
            flush();
            add_element(parent, "text:tab");
            ++i;
        } else if(c == '\n') {
            flush();
            add_element(parent, "text:line-break");
            ++i;
        } else {
            buf += c;
            ++i;
        }
    }
    flush();
}

OdtRenderer::OdtRenderer(const Book &b) : book(b), numbers(b.resolved_numbers()) {}

Container OdtRenderer::render() {
    Container c(format_name);
    note_counter = 0;
    frame_counter = 0;
    in_note = false;
    picturenames.clear();
    pictures.clear();

    c.add("mimetype", mimetext, true);
    const auto content = write_content();
    for(const auto &[name, source] : pictures) {
        c.add_file(name, source);
    }
    c.add("content.xml", content);
    c.add("styles.xml", write_styles());
    c.add("meta.xml", write_meta());
    c.add("META-INF/manifest.xml", write_manifest());
    return c;
}

std::string OdtRenderer::write_content() {
    tinyxml2::XMLDocument doc;
    doc.InsertFirstChild(doc.NewDeclaration(nullptr));
    auto root = add_element(&doc, "office:document-content");
    root->SetAttribute("xmlns:office", ns_office);
    root->SetAttribute("xmlns:style", ns_style);
    root->SetAttribute("xmlns:text", ns_text);
    root->SetAttribute("xmlns:draw", ns_draw);
    root->SetAttribute("xmlns:fo", ns_fo);
    root->SetAttribute("xmlns:xlink", ns_xlink);
    root->SetAttribute("xmlns:svg", ns_svg);
    root->SetAttribute("office:version", "1.2");
    add_element(root, "office:automatic-styles");
    auto body = add_element(root, "office:body");
    auto text = add_element(body, "office:text");

    write_title_page(text);
    for(size_t i = 0; i < book.chapters.size(); ++i) {
        if(book.verbose) {
            printf("ODT: chapter %d\n", int(i + 1));
        }
        write_chapter(text, i);
    }
    return to_string(doc);
}

void OdtRenderer::write_title_page(tinyxml2::XMLElement *text) {
    if(book.cover) {
        auto p = add_element(text, "text:p");
        p->SetAttribute("text:style-name", "Cover");
        Token cover = make_image(book.cover->string(), std::string{}, {make_text(book.title)});
        write_image(p, cover);
    }
    auto title = add_element(text, "text:p");
    title->SetAttribute("text:style-name", "Title");
    append_odf_text(title, book.title, true);
    auto author = add_element(text, "text:p");
    author->SetAttribute("text:style-name", "Subtitle");
    append_odf_text(author, book.author, true);
}

void OdtRenderer::write_chapter(tinyxml2::XMLElement *text, size_t index) {
    ChapterWalk walk(book.chapters[index], numbers[index], format_name, int(index));
    walk.begin();
    if(walk.state() == ChapterState::RenderingHeader) {
        std::string header = plain_text(walk.title()->children);
        if(walk.display_number()) {
            header = book.get_header(*walk.display_number(), header);
        }
        auto h = add_element(text, "text:h");
        h->SetAttribute("text:style-name", "Heading_20_1");
        h->SetAttribute("text:outline-level", 1);
        append_odf_text(h, header, true);
        walk.enter_body();
    }
    const auto &tokens = walk.chapter().tokens;
    for(size_t i = 0; i < tokens.size(); ++i) {
        if(walk.in_body(i)) {
            write_block(text, tokens[i], walk, body_style);
        }
    }
    walk.finish();
}

void OdtRenderer::write_blocks(tinyxml2::XMLElement *parent,
                               const std::vector<Token> &tokens,
                               ChapterWalk &walk,
                               const char *para_style) {
    for(const auto &t : tokens) {
        write_block(parent, t, walk, para_style);
    }
}

void OdtRenderer::write_block(tinyxml2::XMLElement *parent,
                              const Token &t,
                              ChapterWalk &walk,
                              const char *para_style) {
    switch(t.type) {
    case TokenType::Paragraph: {
        auto p = add_element(parent, "text:p");
        p->SetAttribute("text:style-name", para_style);
        write_inline(p, t.children, walk);
        break;
    }
    case TokenType::Heading: {
        auto h = add_element(parent, "text:h");
        h->SetAttribute("text:style-name", heading_style(t.level).c_str());
        h->SetAttribute("text:outline-level", t.level);
        write_inline(h, t.children, walk);
        break;
    }
    case TokenType::List:
    case TokenType::OrderedList: {
        const bool ordered = t.type == TokenType::OrderedList;
        auto list = add_element(parent, "text:list");
        list->SetAttribute("text:style-name", ordered ? "Numbering_20_1" : "List_20_1");
        for(size_t i = 0; i < t.children.size(); ++i) {
            auto item = add_element(list, "text:list-item");
            if(ordered && i == 0 && t.level != 1) {
                item->SetAttribute("text:start-value", t.level);
            }
            write_blocks(item, t.children[i].children, walk, para_style);
        }
        break;
    }
    case TokenType::Item:
        write_blocks(parent, t.children, walk, para_style);
        break;
    case TokenType::BlockQuote:
        write_blocks(parent, t.children, walk, "Quotations");
        break;
    case TokenType::CodeBlock: {
        auto p = add_element(parent, "text:p");
        p->SetAttribute("text:style-name", "Preformatted_20_Text");
        std::string code = t.text;
        if(!code.empty() && code.back() == '\n') {
            code.pop_back();
        }
        auto span = add_element(p, "text:span");
        span->SetAttribute("text:style-name", "Source_20_Text");
        // Every line keeps its indentation.
        size_t start = 0;
        while(true) {
            const size_t end = code.find('\n', start);
            append_odf_text(span, code.substr(start, end - start), true);
            if(end == std::string::npos) {
                break;
            }
            add_element(span, "text:line-break");
            start = end + 1;
        }
        break;
    }
    case TokenType::Rule: {
        auto p = add_element(parent, "text:p");
        p->SetAttribute("text:style-name", "Horizontal_20_Line");
        break;
    }
    case TokenType::FootnoteDefinition:
        break;
    default:
        throw RenderError(format_name,
                          std::string{"unexpected "} + token_type_name(t.type) + " at block level");
    }
}

void OdtRenderer::write_inline(tinyxml2::XMLElement *parent,
                               const std::vector<Token> &tokens,
                               ChapterWalk &walk) {
    bool at_start = parent->FirstChild() == nullptr;
    for(const auto &t : tokens) {
        switch(t.type) {
        case TokenType::Text:
            append_odf_text(parent, t.text, at_start);
            break;
        case TokenType::Emphasis:
        case TokenType::Strong: {
            auto span = add_element(parent, "text:span");
            span->SetAttribute("text:style-name",
                               t.type == TokenType::Emphasis ? "Emphasis" : "Strong_20_Emphasis");
            write_inline(span, t.children, walk);
            break;
        }
        case TokenType::Code: {
            auto span = add_element(parent, "text:span");
            span->SetAttribute("text:style-name", "Source_20_Text");
            append_odf_text(span, t.text, false);
            break;
        }
        case TokenType::Link: {
            auto a = add_element(parent, "text:a");
            a->SetAttribute("xlink:type", "simple");
            a->SetAttribute("xlink:href", t.target.c_str());
            if(!t.info.empty()) {
                a->SetAttribute("office:title", t.info.c_str());
            }
            write_inline(a, t.children, walk);
            break;
        }
        case TokenType::Image:
            write_image(parent, t);
            break;
        case TokenType::LineBreak:
            add_element(parent, "text:line-break");
            break;
        case TokenType::FootnoteReference: {
            const Token &def = walk.footnote(t.text);
            if(in_note) {
                // Notes can not contain notes, the inner one is put in
                // parentheses instead.
                append_odf_text(parent, " (" + plain_text(def.children) + ")", at_start);
                break;
            }
            const auto n = std::to_string(++note_counter);
            auto note = add_element(parent, "text:note");
            note->SetAttribute("text:id", ("ftn" + n).c_str());
            note->SetAttribute("text:note-class", "footnote");
            add_element(note, "text:note-citation")->SetText(n.c_str());
            auto note_body = add_element(note, "text:note-body");
            in_note = true;
            write_blocks(note_body, def.children, walk, "Footnote");
            in_note = false;
            break;
        }
        default:
            throw RenderError(format_name,
                              std::string{"unexpected "} + token_type_name(t.type) +
                                  " inside a paragraph");
        }
        at_start = false;
    }
}

void OdtRenderer::write_image(tinyxml2::XMLElement *parent, const Token &t) {
    if(is_remote(t.target)) {
        // Remote pictures are not embedded, link to them instead.
        auto a = add_element(parent, "text:a");
        a->SetAttribute("xlink:type", "simple");
        a->SetAttribute("xlink:href", t.target.c_str());
        append_odf_text(a, plain_text(t.children), false);
        return;
    }
    const auto picture = get_picture_path(book.resolve_path(t.target));
    const auto name = "Picture" + std::to_string(++frame_counter);
    auto frame = add_element(parent, "draw:frame");
    frame->SetAttribute("draw:name", name.c_str());
    frame->SetAttribute("text:anchor-type", "as-char");
    frame->SetAttribute("svg:width", "15cm");
    frame->SetAttribute("style:rel-width", "100%");
    frame->SetAttribute("style:rel-height", "scale");
    auto image = add_element(frame, "draw:image");
    image->SetAttribute("xlink:href", picture.c_str());
    image->SetAttribute("xlink:type", "simple");
    image->SetAttribute("xlink:show", "embed");
    image->SetAttribute("xlink:actuate", "onLoad");
    const auto alt = plain_text(t.children);
    if(!alt.empty()) {
        add_element(frame, "svg:desc")->SetText(alt.c_str());
    }
}

std::string OdtRenderer::get_picture_path(const fs::path &source) {
    auto it = picturenames.find(source.string());
    if(it != picturenames.end()) {
        return it->second;
    }
    if(!fs::exists(source)) {
        throw RenderError(format_name, "missing image " + source.string());
    }
    image_media_type(source, format_name);
    std::string name =
        "Pictures/image-" + std::to_string(picturenames.size()) + source.extension().string();
    pictures.emplace_back(name, source);
    picturenames[source.string()] = name;
    return name;
}

std::string OdtRenderer::write_styles() const {
    tinyxml2::XMLDocument doc;
    doc.InsertFirstChild(doc.NewDeclaration(nullptr));
    auto root = add_element(&doc, "office:document-styles");
    root->SetAttribute("xmlns:office", ns_office);
    root->SetAttribute("xmlns:style", ns_style);
    root->SetAttribute("xmlns:text", ns_text);
    root->SetAttribute("xmlns:fo", ns_fo);
    root->SetAttribute("xmlns:svg", ns_svg);
    root->SetAttribute("office:version", "1.2");
    auto styles = add_element(root, "office:styles");

    for(const auto &ps : paragraph_styles) {
        auto s = add_element(styles, "style:style");
        s->SetAttribute("style:name", ps.name);
        s->SetAttribute("style:display-name", ps.display_name);
        s->SetAttribute("style:family", "paragraph");
        if(ps.parent) {
            s->SetAttribute("style:parent-style-name", ps.parent);
        }
        if(g_str_has_prefix(ps.name, "Heading")) {
            s->SetAttribute("style:next-style-name", body_style);
        }
        auto pprops = add_element(s, "style:paragraph-properties");
        pprops->SetAttribute("fo:margin-bottom", "0.2cm");
        if(ps.margin_left) {
            pprops->SetAttribute("fo:margin-left", ps.margin_left);
        }
        if(ps.align) {
            pprops->SetAttribute("fo:text-align", ps.align);
        }
        if(std::string{ps.name} == "Horizontal_20_Line") {
            pprops->SetAttribute("fo:border-bottom", "0.06pt solid #808080");
        }
        auto tprops = add_element(s, "style:text-properties");
        if(ps.font_size) {
            tprops->SetAttribute("fo:font-size", ps.font_size);
        }
        if(ps.font_weight) {
            tprops->SetAttribute("fo:font-weight", ps.font_weight);
        }
        if(ps.font_style) {
            tprops->SetAttribute("fo:font-style", ps.font_style);
        }
        if(std::string{ps.name} == "Preformatted_20_Text") {
            tprops->SetAttribute("style:font-name", "Monospace");
            tprops->SetAttribute("fo:font-family", "monospace");
        }
    }

    struct TextStyle {
        const char *name;
        const char *property;
        const char *value;
    };
    const TextStyle text_styles[] = {{"Emphasis", "fo:font-style", "italic"},
                                     {"Strong_20_Emphasis", "fo:font-weight", "bold"},
                                     {"Source_20_Text", "fo:font-family", "monospace"}};
    for(const auto &ts : text_styles) {
        auto s = add_element(styles, "style:style");
        s->SetAttribute("style:name", ts.name);
        s->SetAttribute("style:family", "text");
        add_element(s, "style:text-properties")->SetAttribute(ts.property, ts.value);
    }

    auto bullets = add_element(styles, "text:list-style");
    bullets->SetAttribute("style:name", "List_20_1");
    auto numbering = add_element(styles, "text:list-style");
    numbering->SetAttribute("style:name", "Numbering_20_1");
    for(int level = 1; level <= 10; ++level) {
        char indent[32];
        snprintf(indent, 32, "%.1fcm", 0.6 * level);
        auto b = add_element(bullets, "text:list-level-style-bullet");
        b->SetAttribute("text:level", level);
        b->SetAttribute("text:bullet-char", "•");
        add_element(b, "style:list-level-properties")->SetAttribute("text:space-before", indent);
        auto n = add_element(numbering, "text:list-level-style-number");
        n->SetAttribute("text:level", level);
        n->SetAttribute("style:num-suffix", ".");
        n->SetAttribute("style:num-format", "1");
        add_element(n, "style:list-level-properties")->SetAttribute("text:space-before", indent);
    }

    auto notes = add_element(styles, "text:notes-configuration");
    notes->SetAttribute("text:note-class", "footnote");
    notes->SetAttribute("text:default-style-name", "Footnote");
    notes->SetAttribute("style:num-format", "1");
    notes->SetAttribute("text:start-value", 0);
    notes->SetAttribute("text:footnotes-position", "page");
    notes->SetAttribute("text:start-numbering-at", "document");
    return to_string(doc);
}

std::string OdtRenderer::write_meta() const {
    tinyxml2::XMLDocument doc;
    doc.InsertFirstChild(doc.NewDeclaration(nullptr));
    auto root = add_element(&doc, "office:document-meta");
    root->SetAttribute("xmlns:office", ns_office);
    root->SetAttribute("xmlns:dc", ns_dc);
    root->SetAttribute("xmlns:meta", ns_meta);
    root->SetAttribute("office:version", "1.2");
    auto meta = add_element(root, "office:meta");
    add_element(meta, "meta:generator")->SetText("folio");
    add_element(meta, "dc:title")->SetText(book.title.c_str());
    add_element(meta, "meta:initial-creator")->SetText(book.author.c_str());
    add_element(meta, "dc:creator")->SetText(book.author.c_str());
    add_element(meta, "dc:language")->SetText(book.lang.c_str());
    if(book.description) {
        add_element(meta, "dc:description")->SetText(book.description->c_str());
    }
    if(book.subject) {
        add_element(meta, "dc:subject")->SetText(book.subject->c_str());
    }
    add_element(meta, "meta:creation-date")->SetText(current_timestamp().c_str());
    return to_string(doc);
}

std::string OdtRenderer::write_manifest() const {
    tinyxml2::XMLDocument doc;
    doc.InsertFirstChild(doc.NewDeclaration(nullptr));
    auto root = add_element(&doc, "manifest:manifest");
    root->SetAttribute("xmlns:manifest", ns_manifest);
    root->SetAttribute("manifest:version", "1.2");
    auto add_entry = [root](const std::string &path, const char *type) {
        auto e = add_element(root, "manifest:file-entry");
        e->SetAttribute("manifest:full-path", path.c_str());
        e->SetAttribute("manifest:media-type", type);
        return e;
    };
    add_entry("/", mimetext)->SetAttribute("manifest:version", "1.2");
    add_entry("content.xml", "text/xml");
    add_entry("styles.xml", "text/xml");
    add_entry("meta.xml", "text/xml");
    for(const auto &[name, source] : pictures) {
        add_entry(name, image_media_type(source, format_name));
    }
    return to_string(doc);
}
