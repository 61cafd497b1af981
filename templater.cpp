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

#include <templater.hpp>
#include <errors.hpp>
#include <glib.h>

namespace {

// {{{name}}} or {{name}}, braces must pair up.
const char placeholder_pattern[] =
    R"(\{\{\{\s*([A-Za-z_][A-Za-z0-9_-]*)\s*\}\}\}|\{\{\s*([A-Za-z_][A-Za-z0-9_-]*)\s*\}\})";

struct ExpansionState {
    const TemplateVars *vars;
    std::string missing;
};

gboolean eval_placeholder_cb(const GMatchInfo *info, GString *res, gpointer data) {
    auto *state = static_cast<ExpansionState *>(data);
    // Group 1 is the triple brace form, group 2 the double one.
    gchar *name = g_match_info_fetch(info, 1);
    if(!name || !*name) {
        g_free(name);
        name = g_match_info_fetch(info, 2);
    }
    auto it = state->vars->find(name);
    if(it == state->vars->end()) {
        state->missing = name;
        g_free(name);
        // Stops the replacement.
        return TRUE;
    }
    g_string_append_len(res, it->second.c_str(), it->second.length());
    g_free(name);
    return FALSE;
}

} // namespace

std::string expand_template(const std::string &templ, const TemplateVars &vars) {
    if(!g_utf8_validate(templ.c_str(), templ.length(), nullptr)) {
        throw RenderError("template is not valid UTF-8");
    }
    GError *err = nullptr;
    GRegex *placeholder = g_regex_new(placeholder_pattern,
                                      GRegexCompileFlags(0),
                                      GRegexMatchFlags(0),
                                      &err);
    if(err) {
        std::string msg{err->message};
        g_error_free(err);
        throw RenderError("could not compile template regex: " + msg);
    }
    ExpansionState state{&vars, {}};
    gchar *replaced = g_regex_replace_eval(placeholder,
                                           templ.c_str(),
                                           templ.length(),
                                           0,
                                           GRegexMatchFlags(0),
                                           eval_placeholder_cb,
                                           &state,
                                           &err);
    g_regex_unref(placeholder);
    if(err) {
        std::string msg{err->message};
        g_error_free(err);
        throw RenderError("template expansion failed: " + msg);
    }
    std::string result{replaced};
    g_free(replaced);
    if(!state.missing.empty()) {
        throw RenderError("unknown template variable '" + state.missing + "'");
    }
    if(!g_utf8_validate(result.c_str(), result.length(), nullptr)) {
        throw RenderError("template expansion produced invalid UTF-8");
    }
    return result;
}
