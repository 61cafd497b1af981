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

#include <latexrenderer.hpp>
#include <errors.hpp>
#include <escape.hpp>
#include <utils.hpp>

#include <unordered_map>

namespace fs = std::filesystem;

namespace {

const char format_name[] = "tex";

const std::unordered_map<std::string, const char *> babel_languages{
    {"fr", "french"}, {"en", "english"}, {"de", "ngerman"}, {"es", "spanish"}, {"it", "italian"}};

const char *babel_language(const std::string &lang) {
    auto it = babel_languages.find(lang.substr(0, 2));
    if(it == babel_languages.end()) {
        return "english";
    }
    return it->second;
}

const char *section_command(int level) {
    switch(level) {
    case 1:
        return "\\chapter*";
    case 2:
        return "\\section*";
    case 3:
        return "\\subsection*";
    default:
        return "\\subsubsection*";
    }
}

bool is_remote(const std::string &target) { return target.find("://") != std::string::npos; }

} // namespace

LatexRenderer::LatexRenderer(const Book &b) : book(b), numbers(b.resolved_numbers()) {}

std::string LatexRenderer::render_preamble() const {
    const auto vars = book.get_metadata_vars(EscapeFormat::Tex);
    std::string out;
    out += "\\documentclass[a4paper,11pt]{book}\n";
    out += "\\usepackage[T1]{fontenc}\n";
    out += "\\usepackage[utf8]{inputenc}\n";
    out += "\\usepackage[";
    out += babel_language(book.lang);
    out += "]{babel}\n";
    out += "\\usepackage{graphicx}\n";
    out += "\\usepackage{hyperref}\n";
    out += "\\hypersetup{pdftitle={" + vars.at("title") + "}, pdfauthor={" + vars.at("author") +
           "}}\n\n";
    out += "\\title{" + vars.at("title") + "}\n";
    out += "\\author{" + vars.at("author") + "}\n";
    out += "\\date{}\n\n";
    return out;
}

std::string LatexRenderer::render() {
    std::string out = render_preamble();
    out += "\\begin{document}\n";
    out += "\\maketitle\n";
    out += "\\tableofcontents\n\n";
    for(size_t i = 0; i < book.chapters.size(); ++i) {
        out += render_chapter(i);
    }
    out += "\\end{document}\n";
    return out;
}

std::string LatexRenderer::render_chapter(size_t index) {
    ChapterWalk walk(book.chapters[index], numbers[index], format_name, int(index));
    std::string out;
    walk.begin();
    if(walk.state() == ChapterState::RenderingHeader) {
        std::string header = render_inline(walk.title()->children, walk);
        if(walk.display_number()) {
            header = book.get_header(*walk.display_number(), header);
        }
        out += "\\chapter*{" + header + "}\n";
        out += "\\addcontentsline{toc}{chapter}{" + header + "}\n\n";
        walk.enter_body();
    } else {
        out += "\\clearpage\n\n";
    }
    const auto &tokens = walk.chapter().tokens;
    for(size_t i = 0; i < tokens.size(); ++i) {
        if(walk.in_body(i)) {
            out += render_block(tokens[i], walk);
        }
    }
    walk.finish();
    return out;
}

std::string LatexRenderer::render_blocks(const std::vector<Token> &tokens, ChapterWalk &walk) {
    std::string out;
    for(const auto &t : tokens) {
        out += render_block(t, walk);
    }
    return out;
}

std::string LatexRenderer::render_block(const Token &t, ChapterWalk &walk) {
    switch(t.type) {
    case TokenType::Paragraph:
        return render_inline(t.children, walk) + "\n\n";
    case TokenType::Heading:
        return std::string{section_command(t.level)} + "{" + render_inline(t.children, walk) +
               "}\n\n";
    case TokenType::List:
        return "\\begin{itemize}\n" + render_blocks(t.children, walk) + "\\end{itemize}\n\n";
    case TokenType::OrderedList: {
        std::string out{"\\begin{enumerate}\n"};
        if(t.level != 1) {
            out += "\\setcounter{enumi}{" + std::to_string(t.level - 1) + "}\n";
        }
        return out + render_blocks(t.children, walk) + "\\end{enumerate}\n\n";
    }
    case TokenType::Item:
        return "\\item " + render_blocks(t.children, walk);
    case TokenType::BlockQuote:
        return "\\begin{quotation}\n" + render_blocks(t.children, walk) + "\\end{quotation}\n\n";
    case TokenType::CodeBlock:
        // Verbatim content is not escaped, but it can not end the
        // environment early.
        if(t.text.find("\\end{verbatim}") != std::string::npos) {
            throw RenderError(format_name,
                              "chapter " + std::to_string(walk.chapter_number()) +
                                  ": code block contains \\end{verbatim}");
        }
        return "\\begin{verbatim}\n" + t.text + "\\end{verbatim}\n\n";
    case TokenType::Rule:
        return "\\begin{center}\\rule{0.5\\linewidth}{0.5pt}\\end{center}\n\n";
    case TokenType::FootnoteDefinition:
        // Inlined at the reference with \footnote.
        return std::string{};
    default:
        break;
    }
    throw RenderError(format_name,
                      std::string{"unexpected "} + token_type_name(t.type) + " at block level");
}

std::string LatexRenderer::render_inline(const std::vector<Token> &tokens, ChapterWalk &walk) {
    std::string out;
    for(const auto &t : tokens) {
        switch(t.type) {
        case TokenType::Text:
            out += escape_tex(t.text);
            break;
        case TokenType::Emphasis:
            out += "\\emph{" + render_inline(t.children, walk) + "}";
            break;
        case TokenType::Strong:
            out += "\\textbf{" + render_inline(t.children, walk) + "}";
            break;
        case TokenType::Code:
            out += "\\texttt{" + escape_tex(t.text) + "}";
            break;
        case TokenType::Link:
            out += "\\href{" + escape_tex_url(t.target) + "}{" + render_inline(t.children, walk) +
                   "}";
            break;
        case TokenType::Image:
            if(is_remote(t.target)) {
                // Remote images can not be included, keep a link instead.
                out += "\\href{" + escape_tex_url(t.target) + "}{" +
                       escape_tex(plain_text(t.children)) + "}";
            } else {
                out += "\\includegraphics[width=\\linewidth]{" + image_path(t.target) + "}";
            }
            break;
        case TokenType::LineBreak:
            out += "\\\\\n";
            break;
        case TokenType::FootnoteReference: {
            const Token &def = walk.footnote(t.text);
            std::string note = render_blocks(def.children, walk);
            while(!note.empty() && note.back() == '\n') {
                note.pop_back();
            }
            out += "\\footnote{" + note + "}";
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

std::string LatexRenderer::image_path(const std::string &src) const {
    const fs::path p = book.resolve_path(src);
    return escape_tex_url(p.string());
}

void LatexRenderer::render_pdf(const fs::path &dest) {
    const std::string source = render();
    TempDir staging(book.temp_dir, "pdf");
    write_file_atomic(staging.path() / "book.tex", source, "pdf");

    std::vector<std::string> args;
    try {
        args = split_command_line(book.tex_command);
    } catch(const ConfigError &e) {
        throw RenderError("pdf", e.what());
    }
    args.push_back("-interaction=nonstopmode");
    args.push_back("book.tex");
    // The second run picks up the table of contents.
    for(int pass = 0; pass < 2; ++pass) {
        if(book.verbose) {
            printf("Running %s (pass %d)\n", args.front().c_str(), pass + 1);
        }
        const auto result = run_command(args, staging.path(), "pdf");
        if(result.exit_status != 0) {
            throw RenderError("pdf",
                              book.tex_command + " failed with status " +
                                  std::to_string(result.exit_status) + ":\n" + result.output);
        }
    }
    const fs::path pdf = staging.path() / "book.pdf";
    if(!fs::exists(pdf)) {
        throw RenderError("pdf", book.tex_command + " did not produce book.pdf");
    }
    write_file_atomic(dest, read_file(pdf), "pdf");
}
