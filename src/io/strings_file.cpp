#include "io/strings_file.h"

#include "io/file_util.h"

#include <unicode/utf8.h>

#include <algorithm>
#include <cstdint>
#include <vector>

namespace lingua::strings_file
{
namespace
{
static bool IsSpace(unsigned char c)
{
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

static void SkipSpaces(const char*& p, const char* end)
{
    while (p < end && IsSpace((unsigned char)*p))
        ++p;
}

static bool IsValidUtf8(std::string_view s)
{
    const uint8_t* p = reinterpret_cast<const uint8_t*>(s.data());
    const int32_t len = (int32_t)s.size();
    int32_t i = 0;
    while (i < len)
    {
        UChar32 c = 0;
        U8_NEXT(p, i, len, c);
        if (c < 0)
            return false;
    }
    return true;
}

// Reads a quoted string starting at `p` (which must point at the opening quote).
static bool ParseQuoted(const char*& p, const char* end, std::string& out)
{
    out.clear();
    if (p >= end || *p != '"')
        return false;
    ++p;
    while (p < end)
    {
        const char c = *p++;
        if (c == '"')
            return true;
        if (c != '\\')
        {
            out.push_back(c);
            continue;
        }
        if (p >= end)
            return false;
        const char e = *p++;
        switch (e)
        {
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            default: out.push_back(e); break; // \" \\ and unknown escapes
        }
    }
    return false; // unterminated
}

static bool ParseEntryLine(std::string_view line, std::string& key, std::string& value)
{
    const char* p = line.data();
    const char* end = p + line.size();

    SkipSpaces(p, end);
    if (!ParseQuoted(p, end, key))
        return false;
    SkipSpaces(p, end);
    if (p >= end || *p != '=')
        return false;
    ++p;
    SkipSpaces(p, end);
    if (!ParseQuoted(p, end, value))
        return false;
    SkipSpaces(p, end);
    if (p >= end || *p != ';')
        return false;
    ++p;
    SkipSpaces(p, end);
    return p == end;
}
} // namespace

std::string Escape(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default: out.push_back(c); break;
        }
    }
    return out;
}

size_t Parse(std::string_view text, TranslationTable::Entries& out)
{
    out.clear();

    if (text.size() >= 3 &&
        (unsigned char)text[0] == 0xEF &&
        (unsigned char)text[1] == 0xBB &&
        (unsigned char)text[2] == 0xBF)
    {
        text.remove_prefix(3);
    }

    size_t skipped = 0;
    size_t i = 0;
    const size_t len = text.size();
    std::string key;
    std::string value;
    while (i < len)
    {
        const size_t start = i;
        while (i < len && text[i] != '\n' && text[i] != '\r')
            ++i;
        std::string_view line = text.substr(start, i - start);
        if (i < len && text[i] == '\r')
        {
            ++i;
            if (i < len && text[i] == '\n')
                ++i;
        }
        else if (i < len && text[i] == '\n')
        {
            ++i;
        }

        // Blank lines are not counted as malformed.
        if (std::all_of(line.begin(), line.end(), [](char c) { return IsSpace((unsigned char)c); }))
            continue;

        if (!ParseEntryLine(line, key, value) || !IsValidUtf8(key) || !IsValidUtf8(value))
        {
            ++skipped;
            continue;
        }
        out[key] = value;
    }
    return skipped;
}

bool Serialize(const TranslationTable::Entries& entries, std::string& out, std::string& err)
{
    out.clear();
    err.clear();

    std::vector<const TranslationTable::Entries::value_type*> sorted;
    sorted.reserve(entries.size());
    for (const auto& kv : entries)
        sorted.push_back(&kv);
    std::sort(sorted.begin(), sorted.end(), [](const auto* a, const auto* b) { return a->first < b->first; });

    for (const auto* kv : sorted)
    {
        if (!IsValidUtf8(kv->first))
        {
            err = "key is not valid UTF-8";
            return false;
        }
        if (!IsValidUtf8(kv->second))
        {
            err = "value for key \"" + kv->first + "\" is not valid UTF-8";
            return false;
        }
        out.push_back('"');
        out += Escape(kv->first);
        out += "\" = \"";
        out += Escape(kv->second);
        out += "\";\n";
    }
    return true;
}

bool ReadFile(const std::string& path, TranslationTable::Entries& out, std::string& err)
{
    out.clear();
    std::string text;
    if (!file_util::ReadFileText(path, text, err))
        return false;
    (void)Parse(text, out);
    return true;
}

} // namespace lingua::strings_file
