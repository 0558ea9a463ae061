#pragma once

#include <ostream>
#include <string>
#include <string_view>

namespace xw {

  struct escape_options {
    // Write every character above U+007E as a numeric character reference.
    bool escape_non_ascii = false;
    // Numeric character references in decimal (&#169;) instead of
    // hexadecimal (&#xA9;).
    bool use_decimal = false;
  };

  // Write a numeric character reference for a code point.
  void
  write_char_ref(std::ostream& os, char32_t code_point, bool use_decimal);

  // Escape character data. '&', '<' and '>' become named entities; tab, CR
  // and LF pass through; other C0 controls become numeric references, as do
  // characters above U+007E when escape_non_ascii is set. Input is UTF-8.
  void
  escape_text(std::ostream& os, std::string_view text,
              const escape_options& opts = {});

  // As escape_text, additionally escaping '"' and '\''.
  void
  escape_attribute(std::ostream& os, std::string_view text,
                   const escape_options& opts = {});

  // Double quote, escape_attribute, double quote.
  void
  write_quoted(std::ostream& os, std::string_view text,
               const escape_options& opts = {});

  std::string
  escape_text(std::string_view text, const escape_options& opts = {});

} // namespace xw
