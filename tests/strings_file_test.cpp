#include <catch2/catch.hpp>

#include "io/strings_file.h"

namespace sf = lingua::strings_file;

TEST_CASE("Parse reads well-formed entries", "[strings_file]")
{
    lingua::TranslationTable::Entries e;
    const size_t skipped = sf::Parse("\"hello\" = \"hej\";\n\"bye\"=\"hej d\xC3\xA5\";", e);
    REQUIRE(skipped == 0);
    REQUIRE(e.size() == 2);
    REQUIRE(e["hello"] == "hej");
    REQUIRE(e["bye"] == "hej d\xC3\xA5");
}

TEST_CASE("Parse tolerates BOM, CRLF, blank and junk lines", "[strings_file]")
{
    const std::string text =
        "\xEF\xBB\xBF"
        "// a comment\r\n"
        "\r\n"
        "   \"a\" = \"1\";   \r\n"
        "not an entry\n"
        "\"b\" = \"2\"\n"          // missing semicolon
        "\"c\" = \"3\"; trailing\n" // junk after the entry
        "\"d\" = \"4\";";
    lingua::TranslationTable::Entries e;
    const size_t skipped = sf::Parse(text, e);
    REQUIRE(e.size() == 2);
    REQUIRE(e["a"] == "1");
    REQUIRE(e["d"] == "4");
    REQUIRE(skipped == 4);
}

TEST_CASE("Escaped quotes, backslashes and newlines survive serialization", "[strings_file]")
{
    lingua::TranslationTable::Entries in;
    in["say \"hi\""] = "s\xC3\xA4g \"hej\"";
    in["path\\to"] = "line1\nline2\ttab";

    std::string text;
    std::string err;
    REQUIRE(sf::Serialize(in, text, err));
    REQUIRE(err.empty());
    REQUIRE(text.find("\"say \\\"hi\\\"\" = ") != std::string::npos);

    lingua::TranslationTable::Entries out;
    REQUIRE(sf::Parse(text, out) == 0);
    REQUIRE(out == in);
}

TEST_CASE("Serialize sorts keys and emits one line per entry", "[strings_file]")
{
    lingua::TranslationTable::Entries in{{"b", "2"}, {"a", "1"}};
    std::string text;
    std::string err;
    REQUIRE(sf::Serialize(in, text, err));
    REQUIRE(text == "\"a\" = \"1\";\n\"b\" = \"2\";\n");
}

TEST_CASE("Serialize rejects invalid UTF-8", "[strings_file]")
{
    lingua::TranslationTable::Entries in{{"k", std::string("bad \xFF byte")}};
    std::string text;
    std::string err;
    REQUIRE_FALSE(sf::Serialize(in, text, err));
    REQUIRE_FALSE(err.empty());
}

TEST_CASE("Parse skips entries with invalid UTF-8", "[strings_file]")
{
    lingua::TranslationTable::Entries e;
    const size_t skipped = sf::Parse("\"ok\" = \"fine\";\n\"bad\" = \"\xC3\";\n", e);
    REQUIRE(skipped == 1);
    REQUIRE(e.size() == 1);
    REQUIRE(e.count("ok") == 1);
}
