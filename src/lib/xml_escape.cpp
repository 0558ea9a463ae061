#include <xw/xml_escape.hpp>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <sstream>

namespace xw {

  namespace {

    constexpr char32_t replacement_character = 0xFFFD;

    // Decode one UTF-8 sequence starting at text[pos]. On success returns the
    // code point and sets len; a malformed sequence yields U+FFFD with len 1.
    char32_t
    decode_utf8(std::string_view text, std::size_t pos, std::size_t& len) {
      auto byte = [&](std::size_t i) {
        return static_cast<std::uint8_t>(text[pos + i]);
      };

      const std::uint8_t lead = byte(0);
      std::size_t need = 0;
      char32_t cp = 0;
      char32_t min = 0;

      if (lead < 0x80) {
        len = 1;
        return lead;
      } else if ((lead & 0xE0) == 0xC0) {
        need = 1;
        cp = lead & 0x1F;
        min = 0x80;
      } else if ((lead & 0xF0) == 0xE0) {
        need = 2;
        cp = lead & 0x0F;
        min = 0x800;
      } else if ((lead & 0xF8) == 0xF0) {
        need = 3;
        cp = lead & 0x07;
        min = 0x10000;
      } else {
        len = 1;
        return replacement_character;
      }

      if (pos + need >= text.size()) {
        len = 1;
        return replacement_character;
      }

      for (std::size_t i = 1; i <= need; ++i) {
        const std::uint8_t b = byte(i);
        if ((b & 0xC0) != 0x80) {
          len = 1;
          return replacement_character;
        }
        cp = (cp << 6) | (b & 0x3F);
      }

      if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        len = 1;
        return replacement_character;
      }

      len = need + 1;
      return cp;
    }

    void
    escape(std::ostream& os, std::string_view text, const escape_options& opts,
           bool quotes) {
      std::size_t run = 0;
      std::size_t i = 0;

      auto flush_run = [&]() {
        if (i > run) {
          os.write(text.data() + run, static_cast<std::streamsize>(i - run));
        }
      };

      while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);
        const char* entity = nullptr;

        switch (c) {
          case '&':
            entity = "&amp;";
            break;
          case '<':
            entity = "&lt;";
            break;
          case '>':
            entity = "&gt;";
            break;
          case '"':
            if (quotes) { entity = "&quot;"; }
            break;
          case '\'':
            if (quotes) { entity = "&apos;"; }
            break;
          default:
            break;
        }

        if (entity != nullptr) {
          flush_run();
          os << entity;
          run = ++i;
          continue;
        }

        if (c < 0x20 && c != '\t' && c != '\n' && c != '\r') {
          flush_run();
          write_char_ref(os, c, opts.use_decimal);
          run = ++i;
          continue;
        }

        if (opts.escape_non_ascii && c > 0x7E) {
          flush_run();
          std::size_t len = 1;
          write_char_ref(os, decode_utf8(text, i, len), opts.use_decimal);
          i += len;
          run = i;
          continue;
        }

        ++i;
      }

      flush_run();
    }

  } // namespace

  void
  write_char_ref(std::ostream& os, char32_t code_point, bool use_decimal) {
    char buf[16];
    auto value = static_cast<std::uint32_t>(code_point);
    auto end =
        std::to_chars(buf, buf + sizeof(buf), value, use_decimal ? 10 : 16)
            .ptr;

    os << (use_decimal ? "&#" : "&#x");
    for (char* p = buf; p != end; ++p) {
      char ch = *p;
      if (ch >= 'a' && ch <= 'f') { ch = static_cast<char>(ch - 'a' + 'A'); }
      os << ch;
    }
    os << ';';
  }

  void
  escape_text(std::ostream& os, std::string_view text,
              const escape_options& opts) {
    escape(os, text, opts, false);
  }

  void
  escape_attribute(std::ostream& os, std::string_view text,
                   const escape_options& opts) {
    escape(os, text, opts, true);
  }

  void
  write_quoted(std::ostream& os, std::string_view text,
               const escape_options& opts) {
    os << '"';
    escape_attribute(os, text, opts);
    os << '"';
  }

  std::string
  escape_text(std::string_view text, const escape_options& opts) {
    std::ostringstream os;
    escape_text(os, text, opts);
    return os.str();
  }

} // namespace xw
