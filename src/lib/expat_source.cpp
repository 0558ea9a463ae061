#include <xw/expat_source.hpp>

#include <expat.h>

#include <array>
#include <cstring>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace xw {

  namespace {

    constexpr std::size_t chunk_size = 16 * 1024;

    // Triplet names: "uri\nlocal\nprefix". Unqualified names have no
    // separator; names in the default namespace have no prefix part.
    qname
    parse_expat_name(const char* expat_name) {
      const char* sep = std::strchr(expat_name, '\n');
      if (sep == nullptr) { return qname{"", std::string(expat_name)}; }

      std::string uri(expat_name, sep);
      const char* local = sep + 1;
      const char* sep2 = std::strchr(local, '\n');
      if (sep2 == nullptr) {
        // Unprefixed: keep the local name as the qualified name so the
        // writer puts it back in the default namespace.
        return qname{std::move(uri), std::string(local), std::string(local)};
      }

      std::string local_name(local, sep2);
      std::string qualified = std::string(sep2 + 1) + ':' + local_name;
      return qname{std::move(uri), std::move(local_name), std::move(qualified)};
    }

    bool
    is_blank(std::string_view text) {
      return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
    }

    struct parser_deleter {
      void
      operator()(XML_Parser parser) const {
        XML_ParserFree(parser);
      }
    };

    using parser_ptr =
        std::unique_ptr<std::remove_pointer_t<XML_Parser>, parser_deleter>;

  } // namespace

  struct expat_source::impl {
    event_handler* handler = nullptr;
    bool strip_blank_text = false;

    // Per-parse state
    XML_Parser parser = nullptr;
    std::string pending_text;
    bool in_cdata = false;
    bool in_dtd = false;
    // The DOCTYPE had an external id and was reported.
    bool dtd_reported = false;
    std::exception_ptr error;

    void
    flush_text() {
      if (pending_text.empty()) { return; }
      if (!in_cdata && strip_blank_text && is_blank(pending_text)) {
        pending_text.clear();
        return;
      }
      std::string text = std::move(pending_text);
      pending_text.clear();
      handler->characters(text);
    }

    // Run a handler callback; a throw stops the parser and is rethrown from
    // parse().
    template <typename F>
    static void
    dispatch(void* user_data, F&& body) {
      auto* self = static_cast<impl*>(user_data);
      if (self->error) { return; }
      try {
        body(*self);
      } catch (...) {
        self->error = std::current_exception();
        XML_StopParser(self->parser, XML_FALSE);
      }
    }

    static void XMLCALL
    on_start_element(void* user_data, const char* name, const char** atts) {
      dispatch(user_data, [&](impl& self) {
        self.flush_text();

        auto specified = static_cast<std::size_t>(
            XML_GetSpecifiedAttributeCount(self.parser));
        attributes attrs;
        std::size_t i = 0;
        for (const char** p = atts; *p != nullptr; p += 2, i += 2) {
          qname attr_name = parse_expat_name(p[0]);
          attrs.add(attr_name.namespace_uri(), attr_name.local_name(),
                    attr_name.qualified_name(), std::string(cdata_type),
                    std::string(p[1]), i < specified);
        }
        self.handler->start_element(parse_expat_name(name), attrs);
      });
    }

    static void XMLCALL
    on_end_element(void* user_data, const char* name) {
      dispatch(user_data, [&](impl& self) {
        self.flush_text();
        self.handler->end_element(parse_expat_name(name));
      });
    }

    static void XMLCALL
    on_character_data(void* user_data, const char* s, int len) {
      dispatch(user_data, [&](impl& self) {
        self.pending_text.append(s, static_cast<std::size_t>(len));
      });
    }

    static void XMLCALL
    on_comment(void* user_data, const char* text) {
      dispatch(user_data, [&](impl& self) {
        if (self.in_dtd) { return; }
        self.flush_text();
        self.handler->comment(text);
      });
    }

    static void XMLCALL
    on_processing_instruction(void* user_data, const char* target,
                              const char* data) {
      dispatch(user_data, [&](impl& self) {
        if (self.in_dtd) { return; }
        self.flush_text();
        self.handler->processing_instruction(target,
                                             data != nullptr ? data : "");
      });
    }

    static void XMLCALL
    on_start_cdata(void* user_data) {
      dispatch(user_data, [&](impl& self) {
        self.flush_text();
        self.in_cdata = true;
        self.handler->start_cdata();
      });
    }

    static void XMLCALL
    on_end_cdata(void* user_data) {
      dispatch(user_data, [&](impl& self) {
        self.flush_text();
        self.in_cdata = false;
        self.handler->end_cdata();
      });
    }

    static void XMLCALL
    on_start_doctype(void* user_data, const char* name, const char* system_id,
                     const char* public_id, int) {
      dispatch(user_data, [&](impl& self) {
        self.flush_text();
        self.in_dtd = true;
        // A DOCTYPE with only an internal subset has nothing to report.
        if (system_id == nullptr) { return; }
        std::optional<std::string_view> pub;
        if (public_id != nullptr) { pub = public_id; }
        self.dtd_reported = true;
        self.handler->start_dtd(name, pub, system_id);
      });
    }

    static void XMLCALL
    on_end_doctype(void* user_data) {
      dispatch(user_data, [&](impl& self) {
        self.in_dtd = false;
        if (!std::exchange(self.dtd_reported, false)) { return; }
        self.handler->end_dtd();
      });
    }

    static void XMLCALL
    on_start_namespace(void* user_data, const char* prefix, const char* uri) {
      dispatch(user_data, [&](impl& self) {
        self.flush_text();
        self.handler->start_prefix_mapping(prefix != nullptr ? prefix : "",
                                           uri != nullptr ? uri : "");
      });
    }

    static void XMLCALL
    on_end_namespace(void* user_data, const char* prefix) {
      dispatch(user_data, [&](impl& self) {
        self.handler->end_prefix_mapping(prefix != nullptr ? prefix : "");
      });
    }

    parser_ptr
    create_parser() {
      if (handler == nullptr) {
        throw std::logic_error("expat_source: no handler set");
      }

      // '\n' as the namespace separator
      parser_ptr p(XML_ParserCreateNS(nullptr, '\n'));
      if (!p) { throw std::runtime_error("failed to create expat parser"); }

      XML_SetReturnNSTriplet(p.get(), XML_TRUE);
      XML_SetUserData(p.get(), this);
      XML_SetElementHandler(p.get(), on_start_element, on_end_element);
      XML_SetCharacterDataHandler(p.get(), on_character_data);
      XML_SetCommentHandler(p.get(), on_comment);
      XML_SetProcessingInstructionHandler(p.get(), on_processing_instruction);
      XML_SetCdataSectionHandler(p.get(), on_start_cdata, on_end_cdata);
      XML_SetDoctypeDeclHandler(p.get(), on_start_doctype, on_end_doctype);
      XML_SetNamespaceDeclHandler(p.get(), on_start_namespace,
                                  on_end_namespace);

      parser = p.get();
      pending_text.clear();
      in_cdata = false;
      in_dtd = false;
      dtd_reported = false;
      error = nullptr;
      return p;
    }

    // Feed one buffer; rethrow a handler failure or report a parse error.
    void
    feed(const char* data, std::size_t size, bool is_final) {
      XML_Status status =
          XML_Parse(parser, data, static_cast<int>(size),
                    is_final ? XML_TRUE : XML_FALSE);

      if (error) { std::rethrow_exception(std::exchange(error, nullptr)); }
      if (status == XML_STATUS_ERROR) {
        std::string msg = "XML parse error at line ";
        msg += std::to_string(XML_GetCurrentLineNumber(parser));
        msg += ": ";
        msg += XML_ErrorString(XML_GetErrorCode(parser));
        throw std::runtime_error(msg);
      }
    }
  };

  expat_source::expat_source() : impl_(std::make_unique<impl>()) {}

  expat_source::expat_source(event_handler& handler)
      : impl_(std::make_unique<impl>()) {
    impl_->handler = &handler;
  }

  expat_source::~expat_source() = default;
  expat_source::expat_source(expat_source&&) noexcept = default;
  expat_source&
  expat_source::operator=(expat_source&&) noexcept = default;

  void
  expat_source::set_handler(event_handler* handler) {
    impl_->handler = handler;
  }

  event_handler*
  expat_source::handler() const {
    return impl_->handler;
  }

  void
  expat_source::set_strip_blank_text(bool strip) {
    impl_->strip_blank_text = strip;
  }

  bool
  expat_source::strip_blank_text() const {
    return impl_->strip_blank_text;
  }

  void
  expat_source::parse(std::string_view xml) {
    auto parser = impl_->create_parser();
    impl_->handler->start_document();
    impl_->feed(xml.data(), xml.size(), true);
    impl_->flush_text();
    impl_->handler->end_document();
  }

  void
  expat_source::parse(std::istream& in) {
    auto parser = impl_->create_parser();
    impl_->handler->start_document();

    std::array<char, chunk_size> buffer;
    for (;;) {
      in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
      auto count = static_cast<std::size_t>(in.gcount());
      if (in.bad()) {
        throw std::runtime_error("expat_source: failed to read input");
      }
      bool done = in.eof();
      impl_->feed(buffer.data(), count, done);
      if (done) { break; }
    }

    impl_->flush_text();
    impl_->handler->end_document();
  }

} // namespace xw
