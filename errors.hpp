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

#include <stdexcept>
#include <string>

class BookError : public std::runtime_error {
public:
    explicit BookError(const std::string &msg) : std::runtime_error(msg) {}
};

class FileNotFound : public BookError {
public:
    explicit FileNotFound(const std::string &fname)
        : BookError("file not found: " + fname), file(fname) {}

    const std::string &filename() const { return file; }

private:
    std::string file;
};

class ParseError : public BookError {
public:
    explicit ParseError(const std::string &msg) : BookError("parse error: " + msg) {}
};

// Format is the short output name ("epub", "html", ...) or empty when the
// error happens outside of a specific renderer, e.g. in template expansion.
class RenderError : public BookError {
public:
    explicit RenderError(const std::string &msg) : BookError("render error: " + msg) {}
    RenderError(const std::string &format_, const std::string &msg)
        : BookError("render error (" + format_ + "): " + msg), fmt(format_) {}

    const std::string &format() const { return fmt; }

private:
    std::string fmt;
};

class ConfigError : public BookError {
public:
    ConfigError(const std::string &msg, const std::string &context)
        : BookError("config error: " + msg + ": " + context) {}
};
