/**
 * @file step_id.hpp
 * @brief Case-insensitive comparison of step ids and setting keys.
 */
#pragma once
#include "stagedpipe/common/common.hpp"
#include <cctype>

namespace stagedpipe
{

/**
 * @brief Compare two ids for equality, ignoring ASCII case.
 */
inline bool iequals(const std::string& lhs, const std::string& rhs) noexcept
{
    if (lhs.size() != rhs.size())
    {
        return false;
    }
    for (size_t i = 0; i < lhs.size(); ++i)
    {
        auto a = static_cast<unsigned char>(lhs[i]);
        auto b = static_cast<unsigned char>(rhs[i]);
        if (std::tolower(a) != std::tolower(b))
        {
            return false;
        }
    }
    return true;
}

/**
 * @brief Hash functor consistent with `iequals`.
 */
struct CaseInsensitiveHash
{
    size_t operator()(const std::string& key) const noexcept
    {
        // FNV-1a over the lowercased bytes.
        size_t h = static_cast<size_t>(14695981039346656037ULL);
        for (char c : key)
        {
            h ^= static_cast<size_t>(std::tolower(static_cast<unsigned char>(c)));
            h *= static_cast<size_t>(1099511628211ULL);
        }
        return h;
    }
};

/**
 * @brief Equality functor wrapping `iequals`.
 */
struct CaseInsensitiveEqual
{
    bool operator()(const std::string& lhs, const std::string& rhs) const noexcept
    {
        return iequals(lhs, rhs);
    }
};

/**
 * @brief Map keyed by id, compared case-insensitively.
 */
template <typename V>
using IdMap = std::unordered_map<std::string, V, CaseInsensitiveHash, CaseInsensitiveEqual>;

/**
 * @brief Set of ids, compared case-insensitively.
 */
using IdSet = std::unordered_set<std::string, CaseInsensitiveHash, CaseInsensitiveEqual>;

/**
 * @brief Format ids as `'a', 'b', 'c'` for error messages.
 */
inline std::string quote_ids(const std::vector<std::string>& ids)
{
    std::string result;
    for (size_t i = 0; i < ids.size(); ++i)
    {
        if (i > 0)
        {
            result += ", ";
        }
        result += "'" + ids[i] + "'";
    }
    return result;
}

} // namespace stagedpipe
