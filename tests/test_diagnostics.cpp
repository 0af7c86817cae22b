#include <catch2/catch_test_macros.hpp>

#include "processing/Diagnostics.hpp"

#include <string>

using processing::Diagnostics;

namespace
{

// Restores the process-wide switches after each test
struct DiagnosticsGuard
{
    ~DiagnosticsGuard()
    {
        Diagnostics::SetVerbose(false);
        Diagnostics::SetRedactText(false);
        Diagnostics::SetMaxPreview(160);
    }
};

} // namespace

TEST_CASE("Diagnostics - preview quotes and escapes transcript text", "[diagnostics]")
{
    DiagnosticsGuard guard;

    REQUIRE(Diagnostics::Preview("hello") == "\"hello\"");
    REQUIRE(Diagnostics::Preview("a\nb\t\"c\"") == "\"a\\nb\\t\\\"c\\\"\"");
    REQUIRE(Diagnostics::Preview("") == "\"\"");
}

TEST_CASE("Diagnostics - preview truncates on a code point boundary", "[diagnostics]")
{
    DiagnosticsGuard guard;
    Diagnostics::SetMaxPreview(4);

    SECTION("ASCII text is cut at the limit")
    {
        REQUIRE(Diagnostics::Preview("abcdefgh") == "\"abcd\"... (8 bytes)");
    }

    SECTION("A multi-byte sequence is never split")
    {
        // "abc" followed by U+00E9 (2 bytes); the limit falls inside it
        std::string text = "abc\xC3\xA9xyz";
        REQUIRE(Diagnostics::Preview(text) == "\"abc\"... (8 bytes)");
    }

    SECTION("Zero is clamped to one byte")
    {
        Diagnostics::SetMaxPreview(0);
        REQUIRE(Diagnostics::MaxPreview() == 1);
    }
}

TEST_CASE("Diagnostics - redaction hides transcript content", "[diagnostics][privacy]")
{
    DiagnosticsGuard guard;

    REQUIRE_FALSE(Diagnostics::IsRedactingText());
    Diagnostics::SetRedactText(true);
    REQUIRE(Diagnostics::IsRedactingText());

    std::string preview = Diagnostics::Preview("you are an ass today");
    REQUIRE(preview == "<redacted 20 bytes>");
    REQUIRE(preview.find("ass") == std::string::npos);

    Diagnostics::SetRedactText(false);
    REQUIRE(Diagnostics::Preview("ok") == "\"ok\"");
}

TEST_CASE("Diagnostics - verbose switch", "[diagnostics]")
{
    DiagnosticsGuard guard;

    REQUIRE_FALSE(Diagnostics::IsVerbose());
    Diagnostics::SetVerbose(true);
    REQUIRE(Diagnostics::IsVerbose());
}
