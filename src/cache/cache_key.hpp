#pragma once

#include <string>
#include <string_view>

// Hex encoded SHA-256 of the raw url bytes (64 chars). No normalization:
// "http://h/a" and "http://h/a/" are different keys.
std::string derive_key(std::string_view url);
