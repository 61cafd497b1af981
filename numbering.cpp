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

#include <numbering.hpp>
#include <errors.hpp>

#include <climits>
#include <string>

std::vector<ResolvedNumber> resolve_numbering(const std::vector<Number> &numbers,
                                              bool numbering_enabled) {
    std::vector<ResolvedNumber> result;
    result.reserve(numbers.size());
    int counter = 0;
    for(size_t i = 0; i < numbers.size(); ++i) {
        const auto &n = numbers[i];
        if(n.kind == NumberKind::Hidden) {
            result.push_back(ResolvedNumber{std::nullopt, false});
            continue;
        }
        if(!numbering_enabled) {
            result.push_back(ResolvedNumber{std::nullopt, true});
            continue;
        }
        switch(n.kind) {
        case NumberKind::Unnumbered:
            result.push_back(ResolvedNumber{std::nullopt, true});
            break;
        case NumberKind::Default:
            if(counter == INT_MAX) {
                throw RenderError("chapter " + std::to_string(i + 1) + ": chapter number overflows");
            }
            ++counter;
            result.push_back(ResolvedNumber{counter, true});
            break;
        case NumberKind::Specified:
            counter = n.value;
            result.push_back(ResolvedNumber{counter, true});
            break;
        case NumberKind::Hidden:
            break;
        }
    }
    return result;
}
