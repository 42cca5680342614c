#include "brewsource/resources/uri_pattern.hpp"

namespace brewsource::resources
{

bool is_wildcard_pattern(std::string_view pattern)
{
    return !pattern.empty() && pattern.back() == '*';
}

bool matches_pattern(std::string_view pattern, std::string_view uri)
{
    if (pattern == "*")
        return true;

    if (is_wildcard_pattern(pattern))
    {
        auto prefix = pattern.substr(0, pattern.size() - 1);
        return uri.size() >= prefix.size() && uri.compare(0, prefix.size(), prefix) == 0;
    }

    return pattern == uri;
}

std::size_t pattern_specificity(std::string_view pattern)
{
    return is_wildcard_pattern(pattern) ? pattern.size() - 1 : pattern.size();
}

bool is_valid_uri(std::string_view uri)
{
    if (uri.size() < 3)
        return false;
    char first = uri.front();
    bool letter = (first >= 'a' && first <= 'z') || (first >= 'A' && first <= 'Z');
    return letter && uri.find("://") != std::string_view::npos;
}

} // namespace brewsource::resources
