#pragma once

#include <xw/xml_escape.hpp>

#include <string>

namespace xw {

  inline constexpr const char* default_indent = "    ";
  inline constexpr const char* default_xml_version = "1.0";

  struct format_options {
    bool pretty_print = false;
    std::string indent = default_indent;
    // Written at the start of every indented line, before the indent.
    std::string offset;
    bool attr_per_line = false;
    bool minimize_empty = true;
    // Skip attributes a parser defaulted from a DTD.
    bool specified_only = true;
    bool escape_non_ascii = false;
    bool use_decimal = false;
    std::string xml_version = default_xml_version;
    bool standalone = true;

    escape_options
    escaping() const {
      return {escape_non_ascii, use_decimal};
    }
  };

} // namespace xw
