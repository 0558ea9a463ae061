#include <xw/xml_escape.hpp>

#include <catch2/catch.hpp>

#include <sstream>
#include <string>

using namespace xw;

static std::string
attribute(std::string_view text, const escape_options& opts = {}) {
  std::ostringstream os;
  escape_attribute(os, text, opts);
  return os.str();
}

TEST_CASE("escape: plain text is unchanged", "[xml_escape]") {
  CHECK(escape_text("Hello World") == "Hello World");
  CHECK(escape_text("") == "");
  CHECK(escape_text("tab\tcr\rlf\n") == "tab\tcr\rlf\n");
}

TEST_CASE("escape: markup characters become entities", "[xml_escape]") {
  CHECK(escape_text("a < b && c > d") == "a &lt; b &amp;&amp; c &gt; d");
}

TEST_CASE("escape: quotes pass through in text", "[xml_escape]") {
  CHECK(escape_text(R"(say "hi" 'there')") == R"(say "hi" 'there')");
}

TEST_CASE("escape: quotes are escaped in attributes", "[xml_escape]") {
  CHECK(attribute(R"(say "hi" 'there' & <go>)") ==
        "say &quot;hi&quot; &apos;there&apos; &amp; &lt;go&gt;");
}

TEST_CASE("escape: control characters become references", "[xml_escape]") {
  CHECK(escape_text(std::string("a\x01z")) == "a&#x1;z");
  CHECK(escape_text(std::string("\x1F")) == "&#x1F;");
  CHECK(escape_text(std::string("\x1B"), {false, true}) == "&#27;");
}

TEST_CASE("escape: non-ASCII passes through by default", "[xml_escape]") {
  CHECK(escape_text("caf\xC3\xA9") == "caf\xC3\xA9");
}

TEST_CASE("escape: non-ASCII escaping in hex and decimal", "[xml_escape]") {
  escape_options hex{true, false};
  escape_options dec{true, true};

  CHECK(escape_text("caf\xC3\xA9", hex) == "caf&#xE9;");
  CHECK(escape_text("caf\xC3\xA9", dec) == "caf&#233;");
  CHECK(escape_text("\xE2\x82\xAC", hex) == "&#x20AC;");
  CHECK(escape_text("\xF0\x9F\x98\x80", hex) == "&#x1F600;");
  CHECK(escape_text("\x7F", hex) == "&#x7F;");
}

TEST_CASE("escape: malformed UTF-8 becomes the replacement character",
          "[xml_escape]") {
  escape_options hex{true, false};
  CHECK(escape_text("a\xFFz", hex) == "a&#xFFFD;z");
  CHECK(escape_text("\xC3", hex) == "&#xFFFD;");
  CHECK(escape_text("\xE2\x82", hex) == "&#xFFFD;&#xFFFD;");
}

TEST_CASE("escape: character references", "[xml_escape]") {
  std::ostringstream hex;
  write_char_ref(hex, U'a', false);
  CHECK(hex.str() == "&#x61;");

  std::ostringstream dec;
  write_char_ref(dec, U'a', true);
  CHECK(dec.str() == "&#97;");
}

TEST_CASE("escape: quoted attribute value", "[xml_escape]") {
  std::ostringstream os;
  write_quoted(os, "a\"b");
  CHECK(os.str() == "\"a&quot;b\"");
}
