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

#include <epub.hpp>
#include <errors.hpp>
#include <escape.hpp>
#include <utils.hpp>

#include <glib.h>

namespace fs = std::filesystem;

namespace {

const char format_name[] = "epub";

// The contents of these files is always the same.

const char mimetext[] = "application/epub+zip";

const char containertext[] = R"(<?xml version='1.0' encoding='utf-8'?>
<container xmlns="urn:oasis:names:tc:opendocument:xmlns:container" version="1.0">
  <rootfiles>
    <rootfile full-path="OEBPS/content.opf" media-type="application/oebps-package+xml"/>
  </rootfiles>
</container>
)";

const std::unordered_map<std::string, const char *> image_types{{".png", "image/png"},
                                                                {".jpg", "image/jpeg"},
                                                                {".jpeg", "image/jpeg"},
                                                                {".gif", "image/gif"},
                                                                {".svg", "image/svg+xml"}};

tinyxml2::XMLElement *add_element(tinyxml2::XMLNode *parent, const char *name) {
    auto e = parent->GetDocument()->NewElement(name);
    parent->InsertEndChild(e);
    return e;
}

void add_text(tinyxml2::XMLNode *parent, const std::string &text) {
    parent->InsertEndChild(parent->GetDocument()->NewText(text.c_str()));
}

std::string to_string(const tinyxml2::XMLDocument &doc) {
    tinyxml2::XMLPrinter printer;
    doc.Print(&printer);
    return std::string{printer.CStr()};
}

// Serializes the children of an element without the element itself.
// Compact, as indentation would end up inside pre and inline markup.
std::string inner_xml(const tinyxml2::XMLElement *e) {
    tinyxml2::XMLPrinter printer(nullptr, true);
    for(auto child = e->FirstChild(); child; child = child->NextSibling()) {
        child->Accept(&printer);
    }
    return std::string{printer.CStr()};
}

std::string chapter_filename(size_t index) {
    char buf[64];
    snprintf(buf, 64, "chapter_%03d.xhtml", int(index + 1));
    return std::string{buf};
}

bool is_remote(const std::string &target) { return target.find("://") != std::string::npos; }

} // namespace

const char *image_media_type(const fs::path &p, const char *format) {
    gchar *ext = g_ascii_strdown(p.extension().c_str(), -1);
    auto it = image_types.find(ext);
    g_free(ext);
    if(it == image_types.end()) {
        throw RenderError(format, "unsupported image type " + p.string());
    }
    return it->second;
}

EpubRenderer::EpubRenderer(const Book &b) : book(b), numbers(b.resolved_numbers()) {
    gchar *id = g_uuid_string_random();
    uuid = "urn:uuid:";
    uuid += id;
    g_free(id);
}

Container EpubRenderer::render() {
    Container c(format_name);
    toc.clear();
    imagenames.clear();
    embedded_images.clear();
    cover_name.clear();

    c.add("mimetype", mimetext, true);
    c.add("META-INF/container.xml", containertext);

    std::string stylesheet;
    try {
        stylesheet = book.get_template(TemplateKind::EpubCss);
    } catch(const FileNotFound &e) {
        throw RenderError(format_name, std::string{"stylesheet: "} + e.what());
    }

    if(book.cover) {
        cover_name = "images/cover" + book.cover->extension().string();
        image_media_type(*book.cover, format_name);
        c.add_file("OEBPS/" + cover_name, *book.cover);
        c.add("OEBPS/cover.xhtml", write_cover_page());
    }

    for(size_t i = 0; i < book.chapters.size(); ++i) {
        if(book.verbose) {
            printf("EPUB: chapter %d\n", int(i + 1));
        }
        c.add("OEBPS/" + chapter_filename(i), write_chapter(i));
    }
    for(const auto &[name, source] : embedded_images) {
        c.add_file("OEBPS/" + name, source);
    }

    c.add("OEBPS/stylesheet.css", stylesheet);
    c.add("OEBPS/content.opf", write_opf());
    c.add("OEBPS/toc.ncx", write_ncx());
    if(book.epub_version == 3) {
        c.add("OEBPS/nav.xhtml", write_nav());
    }
    return c;
}

std::string EpubRenderer::write_chapter(size_t index) {
    ChapterWalk walk(book.chapters[index], numbers[index], format_name, int(index));
    tinyxml2::XMLDocument epubdoc;
    auto body = epubdoc.NewElement("body");
    epubdoc.InsertEndChild(body);
    pending_notes.clear();
    chapter_notes.clear();

    walk.begin();
    if(walk.state() == ChapterState::RenderingHeader) {
        std::string header = plain_text(walk.title()->children);
        if(walk.display_number()) {
            header = book.get_header(*walk.display_number(), header);
        }
        auto heading = add_element(body, "h1");
        heading->SetText(header.c_str());
        toc.push_back(TocEntry{chapter_filename(index), header});
        walk.enter_body();
    }
    const auto &tokens = walk.chapter().tokens;
    for(size_t i = 0; i < tokens.size(); ++i) {
        if(walk.in_body(i)) {
            write_block(body, tokens[i], walk);
        }
    }
    write_notes(body, walk);
    walk.finish();

    auto vars = book.get_metadata_vars(EscapeFormat::Html);
    vars["content"] = inner_xml(body);
    try {
        return expand_template(book.get_template(TemplateKind::EpubChapter), vars);
    } catch(const FileNotFound &e) {
        throw RenderError(format_name, std::string{"chapter template: "} + e.what());
    }
}

void EpubRenderer::write_blocks(tinyxml2::XMLElement *parent,
                                const std::vector<Token> &tokens,
                                ChapterWalk &walk) {
    for(const auto &t : tokens) {
        write_block(parent, t, walk);
    }
}

void EpubRenderer::write_block(tinyxml2::XMLElement *parent, const Token &t, ChapterWalk &walk) {
    switch(t.type) {
    case TokenType::Paragraph:
        write_inline(add_element(parent, "p"), t.children, walk);
        break;
    case TokenType::Heading: {
        const std::string tag = "h" + std::to_string(t.level);
        write_inline(add_element(parent, tag.c_str()), t.children, walk);
        break;
    }
    case TokenType::List:
        write_blocks(add_element(parent, "ul"), t.children, walk);
        break;
    case TokenType::OrderedList: {
        auto ol = add_element(parent, "ol");
        // XHTML 1.1 has no start attribute.
        if(t.level != 1 && book.epub_version == 3) {
            ol->SetAttribute("start", t.level);
        }
        write_blocks(ol, t.children, walk);
        break;
    }
    case TokenType::Item: {
        auto li = add_element(parent, "li");
        if(t.children.size() == 1 && t.children.front().type == TokenType::Paragraph) {
            write_inline(li, t.children.front().children, walk);
        } else {
            write_blocks(li, t.children, walk);
        }
        break;
    }
    case TokenType::BlockQuote:
        write_blocks(add_element(parent, "blockquote"), t.children, walk);
        break;
    case TokenType::CodeBlock: {
        auto pre = add_element(parent, "pre");
        auto code = add_element(pre, "code");
        code->SetText(t.text.c_str());
        break;
    }
    case TokenType::Rule:
        add_element(parent, "hr");
        break;
    case TokenType::FootnoteDefinition:
        break;
    default:
        throw RenderError(format_name,
                          std::string{"unexpected "} + token_type_name(t.type) + " at block level");
    }
}

void EpubRenderer::write_inline(tinyxml2::XMLElement *parent,
                                const std::vector<Token> &tokens,
                                ChapterWalk &walk) {
    for(const auto &t : tokens) {
        switch(t.type) {
        case TokenType::Text:
            add_text(parent, t.text);
            break;
        case TokenType::Emphasis:
            write_inline(add_element(parent, "em"), t.children, walk);
            break;
        case TokenType::Strong:
            write_inline(add_element(parent, "strong"), t.children, walk);
            break;
        case TokenType::Code:
            add_element(parent, "code")->SetText(t.text.c_str());
            break;
        case TokenType::Link: {
            auto a = add_element(parent, "a");
            a->SetAttribute("href", t.target.c_str());
            if(!t.info.empty()) {
                a->SetAttribute("title", t.info.c_str());
            }
            write_inline(a, t.children, walk);
            break;
        }
        case TokenType::Image: {
            auto img = add_element(parent, "img");
            img->SetAttribute("src", get_epub_image_path(t.target).c_str());
            img->SetAttribute("alt", plain_text(t.children).c_str());
            if(!t.info.empty()) {
                img->SetAttribute("title", t.info.c_str());
            }
            break;
        }
        case TokenType::LineBreak:
            add_element(parent, "br");
            break;
        case TokenType::FootnoteReference: {
            walk.footnote(t.text);
            int number;
            auto it = chapter_notes.find(t.text);
            if(it == chapter_notes.end()) {
                number = int(pending_notes.size()) + 1;
                chapter_notes[t.text] = number;
                pending_notes.emplace_back(t.text, number);
            } else {
                number = it->second;
            }
            const auto n = std::to_string(number);
            auto a = add_element(parent, "a");
            a->SetAttribute("href", ("#note-" + n).c_str());
            a->SetAttribute("id", ("ref-" + n).c_str());
            a->SetAttribute("class", "footnote-ref");
            if(book.epub_version == 3) {
                a->SetAttribute("epub:type", "noteref");
            }
            add_element(a, "sup")->SetText(n.c_str());
            break;
        }
        default:
            throw RenderError(format_name,
                              std::string{"unexpected "} + token_type_name(t.type) +
                                  " inside a paragraph");
        }
    }
}

void EpubRenderer::write_notes(tinyxml2::XMLElement *body, ChapterWalk &walk) {
    if(pending_notes.empty()) {
        return;
    }
    auto notes = add_element(body, "div");
    notes->SetAttribute("class", "notes");
    for(size_t i = 0; i < pending_notes.size(); ++i) {
        const auto label = pending_notes[i].first;
        const auto n = std::to_string(pending_notes[i].second);
        auto note = add_element(notes, book.epub_version == 3 ? "aside" : "div");
        note->SetAttribute("id", ("note-" + n).c_str());
        note->SetAttribute("class", "footnote");
        if(book.epub_version == 3) {
            note->SetAttribute("epub:type", "footnote");
        }
        auto p = add_element(note, "p");
        auto backlink = add_element(p, "a");
        backlink->SetAttribute("href", ("#ref-" + n).c_str());
        backlink->SetText((n + ".").c_str());
        write_blocks(note, walk.footnote(label).children, walk);
    }
}

std::string EpubRenderer::write_cover_page() const {
    tinyxml2::XMLDocument cover;
    cover.InsertFirstChild(cover.NewDeclaration(nullptr));
    if(book.epub_version == 3) {
        cover.InsertEndChild(cover.NewUnknown("DOCTYPE html"));
    } else {
        cover.InsertEndChild(cover.NewUnknown(
            R"(DOCTYPE html PUBLIC "-//W3C//DTD XHTML 1.1//EN" "http://www.w3.org/TR/xhtml11/DTD/xhtml11.dtd")"));
    }
    auto html = add_element(&cover, "html");
    html->SetAttribute("xmlns", "http://www.w3.org/1999/xhtml");
    html->SetAttribute("xml:lang", book.lang.c_str());
    auto head = add_element(html, "head");
    add_element(head, "title")->SetText(book.title.c_str());
    auto style = add_element(head, "link");
    style->SetAttribute("rel", "stylesheet");
    style->SetAttribute("href", "stylesheet.css");
    style->SetAttribute("type", "text/css");
    auto body = add_element(html, "body");
    auto div = add_element(body, "div");
    div->SetAttribute("class", "cover");
    auto img = add_element(div, "img");
    img->SetAttribute("src", cover_name.c_str());
    img->SetAttribute("alt", book.title.c_str());
    return to_string(cover);
}

std::string EpubRenderer::write_opf() const {
    tinyxml2::XMLDocument opf;

    auto decl = opf.NewDeclaration(nullptr);
    opf.InsertFirstChild(decl);
    auto package = opf.NewElement("package");
    package->SetAttribute("version", book.epub_version == 3 ? "3.0" : "2.0");
    package->SetAttribute("xmlns", "http://www.idpf.org/2007/opf");
    package->SetAttribute("unique-identifier", "BookId");

    opf.InsertEndChild(package);

    auto metadata = opf.NewElement("metadata");
    package->InsertFirstChild(metadata);
    metadata->SetAttribute("xmlns:dc", "http://purl.org/dc/elements/1.1/");
    metadata->SetAttribute("xmlns:opf", "http://www.idpf.org/2007/opf");

    add_element(metadata, "dc:title")->SetText(book.title.c_str());
    add_element(metadata, "dc:language")->SetText(book.lang.c_str());
    auto identifier = add_element(metadata, "dc:identifier");
    identifier->SetAttribute("id", "BookId");
    identifier->SetText(uuid.c_str());
    auto creator = add_element(metadata, "dc:creator");
    if(book.epub_version == 2) {
        creator->SetAttribute("opf:role", "aut");
    }
    creator->SetText(book.author.c_str());
    if(book.description) {
        add_element(metadata, "dc:description")->SetText(book.description->c_str());
    }
    if(book.subject) {
        add_element(metadata, "dc:subject")->SetText(book.subject->c_str());
    }
    add_element(metadata, "dc:date")->SetText(current_date().c_str());
    if(book.epub_version == 3) {
        auto modified = add_element(metadata, "meta");
        modified->SetAttribute("property", "dcterms:modified");
        modified->SetText(current_timestamp().c_str());
    }
    if(book.cover) {
        auto meta = add_element(metadata, "meta");
        meta->SetAttribute("name", "cover");
        meta->SetAttribute("content", "cover-image");
    }

    generate_epub_manifest(add_element(package, "manifest"));

    auto spine = add_element(package, "spine");
    spine->SetAttribute("toc", "ncx");
    generate_spine(spine);

    return to_string(opf);
}

std::string EpubRenderer::write_ncx() const {
    tinyxml2::XMLDocument ncx;

    auto decl = ncx.NewDeclaration(nullptr);
    ncx.InsertFirstChild(decl);
    auto doctype = ncx.NewUnknown(
        R"(DOCTYPE ncx PUBLIC "-//NISO//DTD ncx 2005-1//EN" "http://www.daisy.org/z3986/2005/ncx-2005-1.dtd")");
    ncx.InsertEndChild(doctype);

    auto root = ncx.NewElement("ncx");
    ncx.InsertEndChild(root);
    root->SetAttribute("version", "2005-1");
    root->SetAttribute("xml:lang", book.lang.c_str());
    root->SetAttribute("xmlns", "http://www.daisy.org/z3986/2005/ncx/");

    auto head = add_element(root, "head");
    const std::pair<const char *, std::string> metas[] = {
        {"dtb:uid", uuid},
        {"dtb:depth", "1"},
        {"dtb:totalPageCount", "0"},
        {"dtb:maxPageNumber", "0"},
    };
    for(const auto &[name, content] : metas) {
        auto meta = add_element(head, "meta");
        meta->SetAttribute("name", name);
        meta->SetAttribute("content", content.c_str());
    }

    auto doctitle = add_element(root, "docTitle");
    add_element(doctitle, "text")->SetText(book.title.c_str());
    auto docauthor = add_element(root, "docAuthor");
    add_element(docauthor, "text")->SetText(book.author.c_str());

    write_navmap(root);
    return to_string(ncx);
}

void EpubRenderer::write_navmap(tinyxml2::XMLElement *root) const {
    auto navmap = add_element(root, "navMap");
    std::vector<TocEntry> entries = toc;
    // A navigation map must not be empty.
    if(entries.empty() && !book.chapters.empty()) {
        entries.push_back(TocEntry{chapter_filename(0), book.title});
    }
    int play_order = 1;
    for(const auto &e : entries) {
        auto navpoint = add_element(navmap, "navPoint");
        navpoint->SetAttribute("class", "chapter");
        navpoint->SetAttribute("id", ("navpoint-" + std::to_string(play_order)).c_str());
        navpoint->SetAttribute("playOrder", play_order);
        auto navlabel = add_element(navpoint, "navLabel");
        add_element(navlabel, "text")->SetText(e.label.c_str());
        add_element(navpoint, "content")->SetAttribute("src", e.file.c_str());
        ++play_order;
    }
}

std::string EpubRenderer::write_nav() const {
    tinyxml2::XMLDocument nav;
    nav.InsertFirstChild(nav.NewDeclaration(nullptr));
    nav.InsertEndChild(nav.NewUnknown("DOCTYPE html"));
    auto html = add_element(&nav, "html");
    html->SetAttribute("xmlns", "http://www.w3.org/1999/xhtml");
    html->SetAttribute("xmlns:epub", "http://www.idpf.org/2007/ops");
    html->SetAttribute("xml:lang", book.lang.c_str());
    auto head = add_element(html, "head");
    add_element(head, "meta")->SetAttribute("charset", "utf-8");
    add_element(head, "title")->SetText(book.title.c_str());
    auto body = add_element(html, "body");
    auto navelem = add_element(body, "nav");
    navelem->SetAttribute("epub:type", "toc");
    navelem->SetAttribute("id", "toc");
    add_element(navelem, "h1")->SetText(book.title.c_str());
    auto ol = add_element(navelem, "ol");
    std::vector<TocEntry> entries = toc;
    if(entries.empty() && !book.chapters.empty()) {
        entries.push_back(TocEntry{chapter_filename(0), book.title});
    }
    for(const auto &e : entries) {
        auto li = add_element(ol, "li");
        auto a = add_element(li, "a");
        a->SetAttribute("href", e.file.c_str());
        a->SetText(e.label.c_str());
    }
    return to_string(nav);
}

void EpubRenderer::generate_epub_manifest(tinyxml2::XMLElement *manifest) const {
    auto add_item = [manifest](const std::string &id, const std::string &href, const char *type) {
        auto item = add_element(manifest, "item");
        item->SetAttribute("id", id.c_str());
        item->SetAttribute("href", href.c_str());
        item->SetAttribute("media-type", type);
        return item;
    };
    add_item("ncx", "toc.ncx", "application/x-dtbncx+xml");
    add_item("stylesheet", "stylesheet.css", "text/css");
    if(book.epub_version == 3) {
        add_item("nav", "nav.xhtml", "application/xhtml+xml")->SetAttribute("properties", "nav");
    }
    if(book.cover) {
        add_item("cover", "cover.xhtml", "application/xhtml+xml");
        auto item =
            add_item("cover-image", cover_name, image_media_type(*book.cover, format_name));
        if(book.epub_version == 3) {
            item->SetAttribute("properties", "cover-image");
        }
    }
    for(size_t i = 0; i < book.chapters.size(); ++i) {
        add_item("chapter_" + std::to_string(i + 1), chapter_filename(i), "application/xhtml+xml");
    }
    int imagenum = 0;
    for(const auto &[name, source] : embedded_images) {
        add_item("image" + std::to_string(imagenum), name, image_media_type(source, format_name));
        ++imagenum;
    }
}

void EpubRenderer::generate_spine(tinyxml2::XMLElement *spine) const {
    if(book.cover) {
        auto node = add_element(spine, "itemref");
        node->SetAttribute("idref", "cover");
        node->SetAttribute("linear", "no");
    }
    for(size_t i = 0; i < book.chapters.size(); ++i) {
        auto node = add_element(spine, "itemref");
        node->SetAttribute("idref", ("chapter_" + std::to_string(i + 1)).c_str());
    }
}

std::string EpubRenderer::get_epub_image_path(const std::string &src) {
    if(is_remote(src)) {
        return src;
    }
    auto it = imagenames.find(src);
    if(it != imagenames.end()) {
        return it->second;
    }
    const fs::path fullpath = book.resolve_path(src);
    if(!fs::exists(fullpath)) {
        throw RenderError(format_name, "missing image " + fullpath.string());
    }
    std::string epub_name = "images/image-" + std::to_string(imagenames.size()) +
                            fullpath.extension().string();
    image_media_type(fullpath, format_name);
    embedded_images.emplace_back(epub_name, fullpath);
    imagenames[src] = epub_name;
    return epub_name;
}
