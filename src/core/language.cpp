#include "core/language.h"

#include <unicode/locid.h>

#include <algorithm>
#include <cctype>

namespace lingua
{

std::string LanguageCodeOf(std::string_view locale_id)
{
    if (locale_id.empty())
        return icu::Locale::getDefault().getLanguage();

    // ICU expects '_' separators in its canonical form; accept BCP-47 style input too.
    std::string id(locale_id);
    std::replace(id.begin(), id.end(), '-', '_');

    const icu::Locale loc = icu::Locale::createCanonical(id.c_str());
    std::string lang = loc.getLanguage();
    if (lang.empty())
    {
        // Not something ICU could parse; fall back to the leading token.
        lang = id.substr(0, id.find('_'));
    }
    for (char& c : lang)
        c = (char)std::tolower((unsigned char)c);
    return lang;
}

bool SameLanguage(std::string_view a, std::string_view b)
{
    return LanguageCodeOf(a) == LanguageCodeOf(b);
}

} // namespace lingua
