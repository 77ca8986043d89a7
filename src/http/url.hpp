#pragma once

#include <optional>
#include <string>
#include <string_view>

// RFC 3986 reference resolution, e.g. ("http://h/a/b/", "..") -> "http://h/a/".
// A reference with characters that are not allowed in a URI (spaces, raw
// UTF-8) is percent-encoded first. nullopt when either side does not parse.
std::optional<std::string> resolve_url(std::string_view base, std::string_view ref);
