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

#include <renderall.hpp>
#include <epub.hpp>
#include <errors.hpp>
#include <htmlrenderer.hpp>
#include <latexrenderer.hpp>
#include <odt.hpp>
#include <utils.hpp>

#include <thread>

namespace fs = std::filesystem;

void render_format(const Book &book, const std::string &format, const fs::path &dest) {
    if(format == "epub") {
        EpubRenderer r(book);
        r.render().write(dest, book.temp_dir);
    } else if(format == "odt") {
        OdtRenderer r(book);
        r.render().write(dest, book.temp_dir);
    } else if(format == "html") {
        HtmlRenderer r(book);
        write_file_atomic(dest, r.render(), format);
    } else if(format == "tex") {
        LatexRenderer r(book);
        write_file_atomic(dest, r.render(), format);
    } else if(format == "pdf") {
        LatexRenderer r(book);
        r.render_pdf(dest);
    } else {
        throw RenderError(format, "unknown output format");
    }
}

std::vector<RenderOutcome> render_all(const Book &book) {
    const std::pair<const char *, const std::optional<fs::path> *> formats[] = {
        {"epub", &book.output_epub},
        {"html", &book.output_html},
        {"tex", &book.output_tex},
        {"pdf", &book.output_pdf},
        {"odt", &book.output_odt},
    };
    std::vector<RenderOutcome> outcomes;
    for(const auto &[name, path] : formats) {
        if(*path) {
            outcomes.push_back(RenderOutcome{name, **path, false, std::string{}});
        }
    }
    if(outcomes.empty()) {
        fprintf(stderr, "Warning: no output format is configured, nothing to do.\n");
        return outcomes;
    }

    // Each thread only touches its own outcome, the book is read only.
    std::vector<std::thread> jobs;
    for(auto &o : outcomes) {
        jobs.emplace_back([&book, &o]() {
            if(book.verbose) {
                printf("Rendering %s\n", o.format.c_str());
            }
            try {
                render_format(book, o.format, o.path);
                o.success = true;
            } catch(const BookError &e) {
                o.message = e.what();
            } catch(const std::exception &e) {
                o.message = std::string{"unexpected error: "} + e.what();
            }
        });
    }
    for(auto &j : jobs) {
        j.join();
    }
    return outcomes;
}
