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

#include <errors.hpp>
#include <metadata.hpp>
#include <renderall.hpp>

#include <cstdio>

int main(int argc, char **argv) {
    if(argc != 2) {
        printf("%s <book.json>\n", argv[0]);
        return 1;
    }
    Book book;
    try {
        book = load_book_json(argv[1]);
    } catch(const BookError &e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }
    if(book.verbose) {
        printf("Loaded %d chapters.\n", int(book.chapters.size()));
    }
    bool failed = false;
    for(const auto &o : render_all(book)) {
        if(o.success) {
            printf("Generated %s\n", o.path.c_str());
        } else {
            fprintf(stderr, "Error generating %s: %s\n", o.path.c_str(), o.message.c_str());
            failed = true;
        }
    }
    return failed ? 1 : 0;
}
