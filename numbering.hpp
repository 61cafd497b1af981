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

#include <optional>
#include <vector>

enum class NumberKind : int {
    Hidden,     // Title is not shown at all.
    Unnumbered, // Title without a number.
    Default,    // Next number in sequence.
    Specified,  // Explicit number, following chapters continue from it.
};

struct Number {
    NumberKind kind = NumberKind::Default;
    int value = 0; // Only used by Specified.

    static Number hidden() { return Number{NumberKind::Hidden}; }
    static Number unnumbered() { return Number{NumberKind::Unnumbered}; }
    static Number automatic() { return Number{NumberKind::Default}; }
    static Number specified(int n) { return Number{NumberKind::Specified, n}; }

    bool operator==(const Number &o) const {
        return kind == o.kind && (kind != NumberKind::Specified || value == o.value);
    }
};

struct ResolvedNumber {
    std::optional<int> display_number;
    bool show_title;

    bool operator==(const ResolvedNumber &o) const {
        return display_number == o.display_number && show_title == o.show_title;
    }
};

// Throws RenderError if a number goes past INT_MAX.
std::vector<ResolvedNumber> resolve_numbering(const std::vector<Number> &numbers,
                                              bool numbering_enabled);
