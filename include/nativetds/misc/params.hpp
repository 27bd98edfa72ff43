//
// Copyright (c) 2025 Ruben Perez Hidalgo (rubenperez038 at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef NATIVETDS_MISC_PARAMS_HPP
#define NATIVETDS_MISC_PARAMS_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <optional>
#include <ranges>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nativetds {
namespace misc {

/**
 * Expands environment variables written as ${VAR}, $VAR or %VAR%.
 * Variables that are not set are left untouched.
 */
inline std::string expand_environment_variables(const std::string& input)
{
    static const std::regex env_regex("\\$\\{(\\w+)\\}|\\$(\\w+)|%(\\w+)%");

    std::string result;
    auto first = input.cbegin();
    std::smatch match;
    while (std::regex_search(first, input.cend(), match, env_regex))
    {
        std::string var_name;
        if (match[1].matched)
            var_name = match[1].str();
        else if (match[2].matched)
            var_name = match[2].str();
        else
            var_name = match[3].str();

        result.append(first, match[0].first);
        const char* var_value = std::getenv(var_name.c_str());
        result.append(var_value ? std::string(var_value) : match.str());
        first = match[0].second;
    }
    result.append(first, input.cend());
    return result;
}

using name_value_pair = std::pair<std::string, std::string>;

// Splits "Name1=Value1;Name2=Value2" into pairs. Empty entries are skipped
inline std::vector<name_value_pair> parse_string_to_pairs(
    std::string_view input,
    bool expand_env_vars = true,
    char delimiter = ';'
)
{
    std::vector<name_value_pair> result;
    for (auto token : input | std::views::split(delimiter))
    {
        std::string s(std::ranges::begin(token), std::ranges::end(token));
        if (s.empty())
            continue;
        auto pos = s.find('=');
        if (pos == std::string::npos)
            result.emplace_back(std::move(s), std::string());
        else
            result.emplace_back(s.substr(0, pos), s.substr(pos + 1));
    }
    if (expand_env_vars)
    {
        for (auto& p : result)
            p.second = expand_environment_variables(p.second);
    }
    return result;
}

inline bool is_equal_case_insensitive(std::string_view lhs, std::string_view rhs)
{
    return std::ranges::equal(lhs, rhs, [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1)) == std::tolower(static_cast<unsigned char>(c2));
    });
}

// Looks up a value by name, ignoring case. The last occurrence wins
inline std::optional<std::string> find_value_case_insensitive(
    const std::vector<name_value_pair>& pairs,
    std::string_view name
)
{
    std::optional<std::string> res;
    for (const auto& p : pairs)
    {
        if (is_equal_case_insensitive(p.first, name))
            res = p.second;
    }
    return res;
}

}  // namespace misc
}  // namespace nativetds

#endif
