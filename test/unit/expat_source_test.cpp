#include <xw/expat_source.hpp>

#include <catch2/catch.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace xw;

namespace {

  // Records each event as one line of text.
  class recorder : public event_handler {
  public:
    std::vector<std::string> events;
    std::vector<attributes> element_attributes;

    void
    start_document() override {
      events.push_back("start_document");
    }

    void
    end_document() override {
      events.push_back("end_document");
    }

    void
    start_element(const qname& name, const attributes& attrs) override {
      std::ostringstream os;
      os << "start " << name;
      if (!name.qualified_name().empty()) {
        os << " (" << name.qualified_name() << ")";
      }
      events.push_back(os.str());
      element_attributes.push_back(attrs);
    }

    void
    end_element(const qname& name) override {
      std::ostringstream os;
      os << "end " << name;
      events.push_back(os.str());
    }

    void
    characters(std::string_view text) override {
      events.push_back("text " + std::string(text));
    }

    void
    ignorable_whitespace(std::string_view text) override {
      events.push_back("ws " + std::string(text));
    }

    void
    processing_instruction(std::string_view target,
                           std::string_view data) override {
      events.push_back("pi " + std::string(target) + " " + std::string(data));
    }

    void
    start_prefix_mapping(std::string_view prefix,
                         std::string_view uri) override {
      events.push_back("map " + std::string(prefix) + "=" + std::string(uri));
    }

    void
    end_prefix_mapping(std::string_view prefix) override {
      events.push_back("unmap " + std::string(prefix));
    }

    void
    comment(std::string_view text) override {
      events.push_back("comment " + std::string(text));
    }

    void
    start_cdata() override {
      events.push_back("start_cdata");
    }

    void
    end_cdata() override {
      events.push_back("end_cdata");
    }

    void
    start_dtd(std::string_view name, std::optional<std::string_view> public_id,
              std::string_view system_id) override {
      events.push_back("dtd " + std::string(name) + " " +
                       std::string(public_id.value_or("-")) + " " +
                       std::string(system_id));
    }

    void
    end_dtd() override {
      events.push_back("end_dtd");
    }
  };

  using lines = std::vector<std::string>;

} // namespace

TEST_CASE("expat source: elements and text", "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.parse("<a x=\"1\">hello <b/>world</a>");

  CHECK(rec.events == lines{"start_document", "start a", "text hello ",
                            "start b", "end b", "text world", "end a",
                            "end_document"});
  REQUIRE(rec.element_attributes.size() == 2);
  REQUIRE(rec.element_attributes[0].size() == 1);
  CHECK(rec.element_attributes[0][0].name.output_local_name() == "x");
  CHECK(rec.element_attributes[0][0].value == "1");
  CHECK(rec.element_attributes[0][0].specified);
}

TEST_CASE("expat source: character data is coalesced", "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.parse("<a>one &amp; two&#x41;\nthree</a>");

  CHECK(rec.events == lines{"start_document", "start a",
                            "text one & twoA\nthree", "end a",
                            "end_document"});
}

TEST_CASE("expat source: blank text can be dropped", "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.set_strip_blank_text(true);
  CHECK(source.strip_blank_text());

  source.parse("<a>\n  <b> x </b>\n  <![CDATA[  ]]>\n</a>");

  CHECK(rec.events == lines{"start_document", "start a", "start b",
                            "text  x ", "end b", "start_cdata", "text   ",
                            "end_cdata", "end a", "end_document"});
}

TEST_CASE("expat source: namespaces keep their prefixes", "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.parse("<r xmlns=\"urn:d\" xmlns:p=\"urn:p\">"
               "<p:c p:at=\"v\" plain=\"w\"/></r>");

  CHECK(rec.events == lines{"start_document", "map =urn:d", "map p=urn:p",
                            "start {urn:d}r (r)", "start {urn:p}c (p:c)",
                            "end {urn:p}c", "end {urn:d}r", "unmap p",
                            "unmap ", "end_document"});

  REQUIRE(rec.element_attributes.size() == 2);
  const auto& attrs = rec.element_attributes[1];
  REQUIRE(attrs.size() == 2);
  CHECK(attrs[0].name == qname("urn:p", "at", "p:at"));
  CHECK(attrs[1].name == qname("", "plain"));
}

TEST_CASE("expat source: comments, PIs and CDATA", "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.parse("<?xml version=\"1.0\"?><?go now?><a><!-- c -->"
               "<![CDATA[x<y]]></a>");

  CHECK(rec.events == lines{"start_document", "pi go now", "start a",
                            "comment  c ", "start_cdata", "text x<y",
                            "end_cdata", "end a", "end_document"});
}

TEST_CASE("expat source: doctype and defaulted attributes",
          "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.parse("<!DOCTYPE a [<!-- in subset --><?pi in subset?>"
               "<!ATTLIST a d CDATA \"dv\">]>"
               "<a s=\"sv\"/>");

  // An internal subset alone is not reported, nor is anything inside it.
  CHECK(rec.events == lines{"start_document", "start a", "end a",
                            "end_document"});

  REQUIRE(rec.element_attributes.size() == 1);
  const auto& attrs = rec.element_attributes[0];
  REQUIRE(attrs.size() == 2);
  CHECK(attrs[0].value == "sv");
  CHECK(attrs[0].specified);
  CHECK(attrs[1].value == "dv");
  CHECK_FALSE(attrs[1].specified);
}

TEST_CASE("expat source: external doctype ids", "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.parse("<!DOCTYPE a PUBLIC \"-//X//Y\" \"a.dtd\"><a/>");

  CHECK(rec.events[1] == "dtd a -//X//Y a.dtd");
}

TEST_CASE("expat source: external doctype with an internal subset",
          "[expat_source]") {
  recorder rec;
  expat_source source(rec);
  source.parse("<!DOCTYPE a SYSTEM \"a.dtd\" [<!-- c --><!ENTITY e \"v\">]>"
               "<!-- after --><a/>");

  CHECK(rec.events == lines{"start_document", "dtd a - a.dtd", "end_dtd",
                            "comment  after ", "start a", "end a",
                            "end_document"});
}

TEST_CASE("expat source: stream input", "[expat_source]") {
  std::string xml = "<list>";
  for (int i = 0; i < 5000; ++i) {
    xml += "<item n=\"" + std::to_string(i) + "\">text</item>";
  }
  xml += "</list>";

  recorder rec;
  expat_source source(rec);
  std::istringstream in(xml);
  source.parse(in);

  CHECK(rec.events.size() == 2 + 2 + 5000 * 3);
  CHECK(rec.events.front() == "start_document");
  CHECK(rec.events.back() == "end_document");
}

TEST_CASE("expat source: malformed input reports the line", "[expat_source]") {
  recorder rec;
  expat_source source(rec);

  try {
    source.parse("<a>\n<b>\n</a>");
    FAIL("expected a parse error");
  } catch (const std::runtime_error& e) {
    CHECK(std::string(e.what()).find("XML parse error at line 3") == 0);
  }
}

TEST_CASE("expat source: handler exceptions propagate", "[expat_source]") {
  struct refusing : recorder {
    void
    start_element(const qname&, const attributes&) override {
      throw std::invalid_argument("refused");
    }
  };

  refusing rec;
  expat_source source(rec);
  CHECK_THROWS_AS(source.parse("<a><b/></a>"), std::invalid_argument);

  // The source is usable again afterwards.
  recorder ok;
  source.set_handler(&ok);
  source.parse("<a/>");
  CHECK(ok.events.size() == 4);
}

TEST_CASE("expat source: a handler is required", "[expat_source]") {
  expat_source source;
  CHECK(source.handler() == nullptr);
  CHECK_THROWS_AS(source.parse("<a/>"), std::logic_error);
}
