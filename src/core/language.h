#pragma once

#include <string>
#include <string_view>

namespace lingua
{

// Language code of a locale identifier, lowercased: "sv-SE" -> "sv", "en_US" -> "en",
// "se" -> "se". Empty input yields ICU's default locale language.
std::string LanguageCodeOf(std::string_view locale_id);

// True when both identifiers name the same language ("en-US" matches "en_GB").
bool SameLanguage(std::string_view a, std::string_view b);

} // namespace lingua
