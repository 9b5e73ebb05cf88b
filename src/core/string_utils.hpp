/*
 * Copyright 2025 Veritas Contributors
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

// String Utilities - Edit distance and suggestions for misspelled names

#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace veritas::core {

/// Levenshtein distance: minimum number of single-character insertions, deletions
/// or substitutions turning s1 into s2
[[nodiscard]] inline size_t levenshtein_distance(std::string_view s1, std::string_view s2) {
    if (s1.empty())
        return s2.size();
    if (s2.empty())
        return s1.size();

    // Two rolling rows instead of the full matrix
    std::vector<size_t> prev_row(s2.size() + 1);
    std::vector<size_t> curr_row(s2.size() + 1);
    for (size_t j = 0; j <= s2.size(); ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= s1.size(); ++i) {
        curr_row[0] = i;
        for (size_t j = 1; j <= s2.size(); ++j) {
            if (s1[i - 1] == s2[j - 1]) {
                curr_row[j] = prev_row[j - 1];
            } else {
                curr_row[j] = 1 + std::min({prev_row[j], curr_row[j - 1], prev_row[j - 1]});
            }
        }
        std::swap(prev_row, curr_row);
    }

    return prev_row[s2.size()];
}

/// Candidates within max_distance edits of target (exact matches excluded),
/// closest first
[[nodiscard]] inline std::vector<std::string> find_similar_strings(
    std::string_view target, const std::vector<std::string>& candidates, size_t max_distance = 3) {
    std::vector<std::pair<std::string, size_t>> matches;
    for (const auto& candidate : candidates) {
        size_t distance = levenshtein_distance(target, candidate);
        if (distance <= max_distance && distance > 0) {
            matches.emplace_back(candidate, distance);
        }
    }

    std::stable_sort(matches.begin(), matches.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> result;
    result.reserve(matches.size());
    for (auto& [str, _] : matches) {
        result.push_back(std::move(str));
    }
    return result;
}

/// Join strings with a delimiter
[[nodiscard]] inline std::string join(const std::vector<std::string>& strings,
                                      std::string_view delimiter) {
    std::string result;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

}  // namespace veritas::core
