#pragma once
#include <string>
#include <string_view>

namespace brewsource::resources
{

/// Match a registered resource pattern against a concrete URI.
///
/// - "*" matches every URI.
/// - A pattern ending in '*' matches any URI starting with the text before it.
/// - Any other pattern matches only the identical URI.
///
/// Comparison is byte-wise and case-sensitive.
bool matches_pattern(std::string_view pattern, std::string_view uri);

/// True when the pattern ends in the wildcard character.
bool is_wildcard_pattern(std::string_view pattern);

/// Number of literal bytes a pattern pins down; used to rank overlapping
/// patterns so the most specific one wins.
std::size_t pattern_specificity(std::string_view pattern);

/// Minimal syntactic check: at least three bytes, starts with an ASCII letter
/// and contains a "://" scheme separator.
bool is_valid_uri(std::string_view uri);

} // namespace brewsource::resources
