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

#include <utils.hpp>
#include <errors.hpp>
#include <glib.h>

#include <fstream>
#include <sstream>

#include <sys/wait.h>
#include <time.h>

namespace fs = std::filesystem;

namespace {

std::string format_time(const char *format, bool utc) {
    char buf[200];
    time_t t = time(NULL);
    struct tm tmbuf;
    struct tm *tmp = utc ? gmtime_r(&t, &tmbuf) : localtime_r(&t, &tmbuf);
    if(tmp == NULL) {
        throw BookError("could not determine the current time");
    }
    if(strftime(buf, 200, format, tmp) == 0) {
        throw BookError("could not format the current time");
    }
    return std::string{buf};
}

} // namespace

std::string read_file(const fs::path &p) {
    std::error_code ec;
    std::ifstream input(p, std::ios::in | std::ios::binary);
    if(input.fail() || fs::is_directory(p, ec)) {
        throw FileNotFound(p.string());
    }
    std::stringstream buf;
    buf << input.rdbuf();
    if(input.bad()) {
        throw FileNotFound(p.string());
    }
    return buf.str();
}

void write_file_atomic(const fs::path &dest, std::string_view contents, const std::string &format) {
    fs::path partial = dest;
    partial += ".partial";
    {
        std::ofstream ofile(partial, std::ios::out | std::ios::binary | std::ios::trunc);
        if(ofile.fail()) {
            throw RenderError(format, "could not open " + partial.string() + " for writing");
        }
        ofile.write(contents.data(), contents.size());
        ofile.close();
        if(ofile.fail()) {
            std::error_code ec;
            fs::remove(partial, ec);
            throw RenderError(format, "could not write " + partial.string());
        }
    }
    std::error_code ec;
    fs::rename(partial, dest, ec);
    if(ec) {
        std::error_code ignored;
        fs::remove(partial, ignored);
        throw RenderError(format, "could not move output to " + dest.string() + ": " + ec.message());
    }
}

std::string current_date() { return format_time("%Y-%m-%d", false); }

std::string current_timestamp() { return format_time("%Y-%m-%dT%H:%M:%SZ", true); }

fs::path default_temp_dir() { return fs::path{g_get_tmp_dir()}; }

TempDir::TempDir(const fs::path &parent, const std::string &format) {
    std::string templ = (parent / "folio-XXXXXX").string();
    if(!g_mkdtemp(templ.data())) {
        throw RenderError(format, "could not create a staging directory in " + parent.string());
    }
    dir = templ;
}

TempDir::~TempDir() {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if(ec) {
        fprintf(stderr, "Could not remove %s: %s\n", dir.c_str(), ec.message().c_str());
    }
}

CommandResult run_command(const std::vector<std::string> &args,
                          const fs::path &workdir,
                          const std::string &format) {
    if(args.empty()) {
        throw RenderError(format, "empty command");
    }
    std::vector<gchar *> argv;
    for(const auto &a : args) {
        argv.push_back(const_cast<gchar *>(a.c_str()));
    }
    argv.push_back(nullptr);
    gchar *out = nullptr;
    gchar *err_out = nullptr;
    gint wait_status = 0;
    GError *err = nullptr;
    const gboolean spawned = g_spawn_sync(workdir.c_str(),
                                          argv.data(),
                                          nullptr,
                                          G_SPAWN_SEARCH_PATH,
                                          nullptr,
                                          nullptr,
                                          &out,
                                          &err_out,
                                          &wait_status,
                                          &err);
    if(!spawned) {
        std::string msg{"could not run " + args.front() + ": " + err->message};
        g_error_free(err);
        throw RenderError(format, msg);
    }
    CommandResult result;
    result.output = out ? out : "";
    result.output += err_out ? err_out : "";
    g_free(out);
    g_free(err_out);
    if(WIFEXITED(wait_status)) {
        result.exit_status = WEXITSTATUS(wait_status);
    } else {
        result.exit_status = -1;
    }
    return result;
}

std::vector<std::string> split_command_line(const std::string &command) {
    gint argc = 0;
    gchar **argv = nullptr;
    GError *err = nullptr;
    if(!g_shell_parse_argv(command.c_str(), &argc, &argv, &err)) {
        std::string msg{err->message};
        g_error_free(err);
        throw ConfigError(msg, command);
    }
    std::vector<std::string> result;
    for(gint i = 0; i < argc; ++i) {
        result.emplace_back(argv[i]);
    }
    g_strfreev(argv);
    return result;
}
