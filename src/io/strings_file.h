#pragma once

#include "core/translation_table.h"

#include <string>
#include <string_view>

// Strings table file format (one file per language per table).
//
// Sketch:
//   "key" = "value";
//   "say \"hi\"" = "säg \"hej\"";
//
// - UTF-8, one entry per line; an optional BOM and CRLF line endings are accepted
// - `"` `\` and control characters (\n \r \t) are backslash-escaped
// - blank lines and lines that do not match the pattern are ignored
namespace lingua::strings_file
{

// Lowercase extension (no leading dot).
constexpr std::string_view kExtension = "table";

// Parses file contents. Never fails: malformed lines contribute no entries.
// Returns the number of lines that were skipped as malformed.
size_t Parse(std::string_view text, TranslationTable::Entries& out);

// Serializes entries (sorted by key). Fails if a key or value is not valid UTF-8.
bool Serialize(const TranslationTable::Entries& entries, std::string& out, std::string& err);

// Escapes a single key or value for use between the quotes.
std::string Escape(std::string_view s);

// Reads and parses a file. Returns false (with `err`) only when the file can't be read.
bool ReadFile(const std::string& path, TranslationTable::Entries& out, std::string& err);

} // namespace lingua::strings_file
