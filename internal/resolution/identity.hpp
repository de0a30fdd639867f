#pragma once

#include <string>
#include <string_view>

namespace research::resolution {

/*
  Identity keys used to match raw entities to canonical ones. Every function
  returns an empty string when the input carries no usable key.
*/

// Host of a URL or bare domain: lower-case, trailing dot and "www." removed.
std::string NormalizeDomain(std::string_view url);

// Company name key: ICU NFKC_Casefold, whitespace collapsed.
std::string NormalizeEntityName(std::string_view name);

std::string NormalizeEmail(std::string_view email);

// scheme://host/path lower-cased; scheme defaults to https, no query or fragment.
std::string NormalizeLinkedinUrl(std::string_view url);

// Folded like NormalizeEntityName; every run of characters that are not
// letters, digits or combining marks becomes one space. Letters outside
// ASCII are kept, so "José" and "Josà" stay distinct keys.
std::string NormalizePersonName(std::string_view name);

} // namespace research::resolution
