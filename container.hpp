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

#include <filesystem>
#include <string>
#include <vector>

struct ContainerEntry {
    std::string path; // Inside the archive, '/' separated.
    std::string data;
    bool stored;      // Not compressed.
};

// A ZIP archive in memory. Entries keep their insertion order, which
// matters for formats that want an uncompressed mimetype first.
class Container {
public:
    explicit Container(std::string format_name) : format(std::move(format_name)) {}

    void add(std::string path, std::string data, bool stored = false);
    // Throws RenderError if the source can not be read.
    void add_file(std::string path, const std::filesystem::path &source);

    bool contains(const std::string &path) const;
    const std::vector<ContainerEntry> &entries() const { return files; }

    // Packs the entries with the zip command in a staging directory under
    // temp_dir. The destination is only replaced when packing succeeded.
    void write(const std::filesystem::path &dest, const std::filesystem::path &temp_dir) const;

private:
    std::string format;
    std::vector<ContainerEntry> files;
};
