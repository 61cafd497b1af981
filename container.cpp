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

#include <container.hpp>
#include <errors.hpp>
#include <utils.hpp>

#include <fstream>

namespace fs = std::filesystem;

void Container::add(std::string path, std::string data, bool stored) {
    if(contains(path)) {
        throw RenderError(format, "duplicate archive entry " + path);
    }
    files.push_back(ContainerEntry{std::move(path), std::move(data), stored});
}

void Container::add_file(std::string path, const fs::path &source) {
    std::string data;
    try {
        data = read_file(source);
    } catch(const FileNotFound &) {
        throw RenderError(format, "missing resource " + source.string());
    }
    add(std::move(path), std::move(data));
}

bool Container::contains(const std::string &path) const {
    for(const auto &e : files) {
        if(e.path == path) {
            return true;
        }
    }
    return false;
}

void Container::write(const fs::path &dest, const fs::path &temp_dir) const {
    TempDir staging(temp_dir, format);
    for(const auto &e : files) {
        const fs::path ofile = staging.path() / e.path;
        fs::create_directories(ofile.parent_path());
        std::ofstream out(ofile, std::ios::out | std::ios::binary);
        out.write(e.data.data(), e.data.size());
        out.close();
        if(out.fail()) {
            throw RenderError(format, "could not stage " + e.path);
        }
    }

    fs::path partial = fs::absolute(dest);
    partial += ".partial";
    std::error_code ec;
    fs::remove(partial, ec);

    // One zip invocation per run of entries with the same compression so
    // that the archive order matches the entry order.
    size_t i = 0;
    while(i < files.size()) {
        const bool stored = files[i].stored;
        std::vector<std::string> args{"zip", "-X", "-q", stored ? "-0" : "-9", partial.string()};
        while(i < files.size() && files[i].stored == stored) {
            args.push_back(files[i].path);
            ++i;
        }
        const auto result = run_command(args, staging.path(), format);
        if(result.exit_status != 0) {
            fs::remove(partial, ec);
            throw RenderError(format,
                              "zip failed with status " + std::to_string(result.exit_status) +
                                  ": " + result.output);
        }
    }

    fs::rename(partial, dest, ec);
    if(ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        throw RenderError(format, "could not move archive to " + dest.string() + ": " + ec.message());
    }
}
