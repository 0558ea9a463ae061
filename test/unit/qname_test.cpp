#include <xw/qname.hpp>

#include <catch2/catch.hpp>

#include <set>
#include <sstream>
#include <string>

TEST_CASE("qname default construction", "[qname]") {
  xw::qname q;
  CHECK(q.namespace_uri().empty());
  CHECK(q.local_name().empty());
  CHECK(q.qualified_name().empty());
  CHECK(q.prefix().empty());
}

TEST_CASE("qname construction with values", "[qname]") {
  xw::qname q{"urn:example", "item", "ex:item"};
  CHECK(q.namespace_uri() == "urn:example");
  CHECK(q.local_name() == "item");
  CHECK(q.qualified_name() == "ex:item");
}

TEST_CASE("qname prefix of the qualified name", "[qname]") {
  CHECK(xw::qname("urn:a", "x", "a:x").prefix() == "a");
  CHECK(xw::qname("urn:a", "x", "x").prefix().empty());
  CHECK(xw::qname("urn:a", "x").prefix().empty());
}

TEST_CASE("qname output local name falls back to the qualified name",
          "[qname]") {
  CHECK(xw::qname("", "local", "p:other").output_local_name() == "local");
  CHECK(xw::qname("", "", "p:other").output_local_name() == "other");
  CHECK(xw::qname("", "", "plain").output_local_name() == "plain");
}

TEST_CASE("qname equality", "[qname]") {
  xw::qname a{"urn:a", "x"};
  xw::qname b{"urn:a", "x"};
  xw::qname c{"urn:a", "x", "p:x"};

  CHECK(a == b);
  CHECK(a != c);
}

TEST_CASE("qname ordering is usable in ordered containers", "[qname]") {
  std::set<xw::qname> names;
  names.insert({"urn:b", "x"});
  names.insert({"urn:a", "y"});
  names.insert({"urn:a", "x"});
  names.insert({"urn:a", "x"});

  REQUIRE(names.size() == 3);
  CHECK(names.begin()->namespace_uri() == "urn:a");
  CHECK(names.begin()->local_name() == "x");
}

TEST_CASE("qname stream output", "[qname]") {
  std::ostringstream os;
  os << xw::qname{"urn:example", "item"} << ' ' << xw::qname{"", "plain"};
  CHECK(os.str() == "{urn:example}item plain");
}
