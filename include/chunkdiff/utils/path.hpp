#pragma once

#include <string>
#include <string_view>

namespace chunkdiff::utils
{

/**
 * @brief Lexically normalizes a slash separated path.
 *
 * Collapses repeated separators, removes "." elements and resolves ".."
 * against the preceding element. ".." elements of a rooted path never
 * ascend above the root. An empty result becomes ".".
 */
auto clean_path(std::string_view path) -> std::string;

/**
 * @brief Cleans @p path as if it were rooted, i.e. the result always starts
 * with a slash and contains no ".." element.
 */
inline auto clean_absolute_path(std::string_view path) -> std::string
{
    std::string rooted{"/"};
    rooted.append(path);
    return clean_path(rooted);
}

} // namespace chunkdiff::utils
