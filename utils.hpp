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
#include <string_view>
#include <vector>

// Whole file as bytes. Throws FileNotFound.
std::string read_file(const std::filesystem::path &p);

// Writes to a sibling file and renames it onto the destination so that a
// failed write never leaves a truncated output behind. Throws RenderError.
void write_file_atomic(const std::filesystem::path &dest,
                       std::string_view contents,
                       const std::string &format);

std::string current_date();
// UTC, second precision, e.g. 2022-09-01T12:00:00Z.
std::string current_timestamp();

std::filesystem::path default_temp_dir();

// A freshly created directory that is removed with its contents when the
// object goes out of scope.
class TempDir {
public:
    TempDir(const std::filesystem::path &parent, const std::string &format);
    ~TempDir();

    TempDir(const TempDir &) = delete;
    TempDir &operator=(const TempDir &) = delete;

    const std::filesystem::path &path() const { return dir; }

private:
    std::filesystem::path dir;
};

struct CommandResult {
    int exit_status;
    std::string output; // stdout followed by stderr
};

// Runs a program without a shell. Throws RenderError if it can not be
// started, a non-zero exit status is returned to the caller.
CommandResult run_command(const std::vector<std::string> &args,
                          const std::filesystem::path &workdir,
                          const std::string &format);

// Splits a command line the way a POSIX shell would. Throws ConfigError.
std::vector<std::string> split_command_line(const std::string &command);
