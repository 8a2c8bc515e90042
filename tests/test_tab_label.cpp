#include <catch2/catch.hpp>

#include "tab_label.h"

TEST_CASE("codepoints are counted, not bytes", "[label]")
{
    REQUIRE(utf8_codepoints("") == 0);
    REQUIRE(utf8_codepoints("xterm") == 5);
    REQUIRE(utf8_codepoints("Gr\xc3\xbc\xc3\x9f" "e") == 5);
    REQUIRE(utf8_prefix_bytes("Gr\xc3\xbc\xc3\x9f" "e", 3) == 4);
    REQUIRE(utf8_prefix_bytes("abc", 10) == 3);
    REQUIRE(utf8_prefix_bytes("abc", 0) == 0);
}

TEST_CASE("short titles are left alone", "[label]")
{
    REQUIRE(ellipsize_title("Editor", 32) == "Editor");
    REQUIRE(ellipsize_title("exactly", 7) == "exactly");
}

TEST_CASE("long titles end in an ellipsis", "[label]")
{
    REQUIRE(ellipsize_title("Terminal - user@host", 11) == "Terminal...");
    REQUIRE(utf8_codepoints(ellipsize_title(std::string(100, 'a'), 32)) == 32);
}

TEST_CASE("ellipsizing never splits a multibyte character", "[label]")
{
    std::string title = "\xc3\xa4\xc3\xb6\xc3\xbc\xc3\xa4\xc3\xb6\xc3\xbc";
    REQUIRE(ellipsize_title(title, 5) == "\xc3\xa4\xc3\xb6...");
}

TEST_CASE("tiny limits truncate the ellipsis itself", "[label]")
{
    REQUIRE(ellipsize_title("Calculator", 3) == "...");
    REQUIRE(ellipsize_title("Calculator", 2) == "..");
    REQUIRE(ellipsize_title("Calculator", 0).empty());
}
