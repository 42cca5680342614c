#include "brewsource/resources/uri_pattern.hpp"

#include <cassert>

using namespace brewsource::resources;

int main()
{
    // Single wildcard matches everything
    assert(matches_pattern("*", "bjcp://styles"));
    assert(matches_pattern("*", ""));
    assert(matches_pattern("*", "anything at all"));

    // Trailing wildcard is a byte-wise prefix match
    assert(matches_pattern("bjcp://*", "bjcp://styles/21A"));
    assert(matches_pattern("bjcp://*", "bjcp://"));
    assert(!matches_pattern("bjcp://*", "beers://catalog"));
    assert(!matches_pattern("bjcp://*", "BJCP://styles"));
    assert(!matches_pattern("bjcp://*", "bjcp:/"));
    assert(matches_pattern("bjcp://styles/*", "bjcp://styles/21A"));
    assert(!matches_pattern("bjcp://styles/*", "bjcp://categories"));

    // Anything else is exact equality
    assert(matches_pattern("beers://catalog", "beers://catalog"));
    assert(!matches_pattern("beers://catalog", "beers://catalog/1"));
    assert(!matches_pattern("beers://catalog", "Beers://catalog"));
    assert(!matches_pattern("bjcp://*/x", "bjcp://a/x"));

    assert(is_wildcard_pattern("*"));
    assert(is_wildcard_pattern("bjcp://*"));
    assert(!is_wildcard_pattern("bjcp://styles"));
    assert(!is_wildcard_pattern(""));

    assert(pattern_specificity("*") == 0);
    assert(pattern_specificity("bjcp://*") == 7);
    assert(pattern_specificity("beers://catalog") == 15);

    // URI syntax check
    assert(is_valid_uri("bjcp://styles"));
    assert(is_valid_uri("B://x"));
    assert(!is_valid_uri(""));
    assert(!is_valid_uri("ab"));
    assert(!is_valid_uri("/version"));
    assert(!is_valid_uri("1bjcp://styles"));
    assert(!is_valid_uri("bjcp:styles"));
    assert(!is_valid_uri("not-a-uri"));
    assert(!is_valid_uri("://styles"));

    return 0;
}
