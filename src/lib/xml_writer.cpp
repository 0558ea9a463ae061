#include <xw/element_stack.hpp>
#include <xw/errors.hpp>
#include <xw/layout.hpp>
#include <xw/namespace_resolver.hpp>
#include <xw/xml_escape.hpp>
#include <xw/xml_writer.hpp>

#include <exception>
#include <ios>
#include <stdexcept>
#include <string>
#include <utility>

namespace xw {

  struct xml_writer::impl {
    std::ostream* os;
    event_source* source = nullptr;
    event_handler* downstream = nullptr;

    format_options opts;
    writer_state state = writer_state::before_document;
    element_stack stack;
    namespace_resolver resolver;

    explicit impl(std::ostream& os) : os(&os) {}

    // Run one operation's writes. A stream that throws has its exception
    // nested in a write_error; a stream left in a failed state is reported
    // the same way.
    template <typename F>
    void
    guarded(F&& body) {
      try {
        body();
      } catch (const std::ios_base::failure&) {
        std::throw_with_nested(write_error("xml_writer: write to output failed"));
      }
      if (!*os) { throw write_error("xml_writer: output stream is not good"); }
    }

    // -- State machine --------------------------------------------------------

    writer_state
    handle(writer_event event) {
      const writer_state previous = state;
      const transition& t = transition_for(state, event);
      if (!t.allowed) { throw illegal_event_error(state, event); }

      switch (t.action) {
        case transition_action::none:
          break;
        case transition_action::flush_start_tag:
          // A pending empty root closes here; nothing may open after it.
          if (stack.top().is_empty && stack.depth() == 1 &&
              (t.next == writer_state::in_start_tag ||
               t.next == writer_state::in_cdata)) {
            throw illegal_event_error(state, event);
          }
          write_start_tag(false);
          break;
        case transition_action::close_start_tag: {
          // An empty element closes itself, so this end_element belongs to
          // its parent.
          const bool is_empty = stack.top().is_empty;
          if (is_empty && stack.depth() == 1) {
            throw illegal_event_error(state, event);
          }
          write_start_tag(opts.minimize_empty);
          if (is_empty || !opts.minimize_empty) { write_end_tag(); }
          break;
        }
        case transition_action::finish_start_tag: {
          // Only the innermost element is closed here; open ancestors would
          // be left unterminated.
          if (stack.depth() > 1) { throw illegal_event_error(state, event); }
          const bool self_closing = stack.top().is_empty || opts.minimize_empty;
          write_start_tag(opts.minimize_empty);
          if (!self_closing) { write_end_tag(); }
          break;
        }
        case transition_action::write_end_tag:
          write_end_tag();
          break;
      }

      if (t.next_by_depth ||
          (t.action == transition_action::flush_start_tag && stack.empty())) {
        state = stack.empty() ? writer_state::after_root
                              : writer_state::after_tag;
      } else {
        state = t.next;
      }
      return previous;
    }

    // -- Output primitives ----------------------------------------------------

    void
    write_newline() {
      *os << newline_char;
    }

    void
    write_indent(int level_adjust = 0) {
      xw::write_indent(*os, opts, stack.depth(), level_adjust);
    }

    void
    write_quoted(std::string_view text) {
      xw::write_quoted(*os, text, opts.escaping());
    }

    void
    write_name(const qname& name, bool is_element) {
      // A bare qualified name such as "xml:lang" is written as given.
      if (name.local_name().empty() && name.namespace_uri().empty()) {
        *os << name.qualified_name();
        return;
      }
      auto prefix = resolver.resolve(name.namespace_uri(),
                                     name.qualified_name(), is_element);
      if (!prefix.empty()) { *os << prefix << ':'; }
      *os << name.output_local_name();
    }

    // -- Tags -----------------------------------------------------------------

    void
    open_element(const qname& name, const attributes& attrs, bool is_empty,
                 writer_state containing_state) {
      resolver.push_context();
      stack.push(name, attrs, is_empty, containing_state);
      if (stack.depth() == 1) { resolver.declare_root_namespaces(); }
    }

    std::size_t
    write_attributes(const attributes& attrs) {
      std::size_t written = 0;
      for (const auto& attr : attrs) {
        if (opts.specified_only && !attr.specified) { continue; }
        if (breaks_before_attribute(opts)) {
          write_newline();
          write_indent(1);
        } else {
          *os << ' ';
        }
        write_name(attr.name, false);
        *os << '=';
        write_quoted(attr.value);
        ++written;
      }
      return written;
    }

    std::size_t
    write_namespace_declarations() {
      const auto& context = resolver.context();
      std::size_t written = 0;
      for (const auto& prefix : context.declared_prefixes()) {
        if (breaks_before_attribute(opts)) {
          write_newline();
          write_indent(1);
        } else {
          *os << ' ';
        }
        *os << "xmlns";
        if (!prefix.empty()) { *os << ':' << prefix; }
        *os << '=';
        write_quoted(context.uri_for(prefix).value_or(std::string_view{}));
        ++written;
      }
      return written;
    }

    void
    write_start_tag(bool minimize) {
      const element_frame& element = stack.top();

      if (breaks_before_start_tag(opts, element.containing_state,
                                  stack.depth())) {
        write_newline();
        write_indent();
      }

      *os << '<';
      write_name(element.name, true);
      std::size_t count = write_attributes(element.attrs);
      count += write_namespace_declarations();
      if (breaks_before_attribute(opts) && count > 0) {
        write_newline();
        write_indent();
      }

      const bool self_closing = element.is_empty || minimize;
      *os << (self_closing ? "/>" : ">");
      if (self_closing) { close_element(); }
    }

    void
    write_end_tag() {
      if (breaks_before_end_tag(opts, state)) {
        write_newline();
        write_indent();
      }

      *os << "</";
      write_name(stack.top().name, true);
      *os << '>';
      close_element();
    }

    void
    close_element() {
      qname name = stack.top().name;
      stack.pop();
      resolver.pop_context();
      if (downstream != nullptr) { downstream->end_element(name); }
    }

    // -- Document type --------------------------------------------------------

    void
    write_entity_decl(const entity& decl) {
      *os << "<!ENTITY " << decl.name;
      if (decl.value) {
        *os << " \"" << *decl.value << '"';
      } else {
        if (decl.public_id) {
          *os << " PUBLIC \"" << *decl.public_id << "\" \""
              << decl.system_id.value_or("") << '"';
        } else {
          *os << " SYSTEM \"" << decl.system_id.value_or("") << '"';
        }
        if (decl.notation_name) { *os << " NDATA " << *decl.notation_name; }
      }
      *os << '>';
    }

    void
    write_notation_decl(const notation& decl) {
      *os << "<!NOTATION " << decl.name;
      if (decl.public_id) {
        *os << " PUBLIC \"" << *decl.public_id << '"';
        if (decl.system_id) { *os << " \"" << *decl.system_id << '"'; }
      } else if (decl.system_id) {
        *os << " SYSTEM \"" << *decl.system_id << '"';
      }
      *os << '>';
    }

    void
    write_internal_subset_line() {
      write_newline();
      *os << opts.offset << opts.indent;
    }

    element_frame&
    pending_element() {
      return stack.top();
    }
  };

  xml_writer::xml_writer(std::ostream& os)
      : impl_(std::make_unique<impl>(os)) {}

  xml_writer::xml_writer(event_source& source, std::ostream& os)
      : impl_(std::make_unique<impl>(os)) {
    impl_->source = &source;
  }

  xml_writer::~xml_writer() = default;
  xml_writer::xml_writer(xml_writer&&) noexcept = default;
  xml_writer&
  xml_writer::operator=(xml_writer&&) noexcept = default;

  // -- Output and filtering ---------------------------------------------------

  void
  xml_writer::set_output(std::ostream& os) {
    impl_->os = &os;
  }

  std::ostream&
  xml_writer::output() const {
    return *impl_->os;
  }

  void
  xml_writer::set_downstream(event_handler* handler) {
    impl_->downstream = handler;
  }

  event_handler*
  xml_writer::downstream() const {
    return impl_->downstream;
  }

  void
  xml_writer::set_source(event_source* source) {
    impl_->source = source;
  }

  event_source*
  xml_writer::source() const {
    return impl_->source;
  }

  void
  xml_writer::parse(std::string_view xml) {
    if (impl_->source == nullptr) {
      throw std::logic_error("xml_writer: no event source to parse with");
    }
    impl_->source->set_handler(this);
    impl_->source->parse(xml);
  }

  void
  xml_writer::parse(std::istream& in) {
    if (impl_->source == nullptr) {
      throw std::logic_error("xml_writer: no event source to parse with");
    }
    impl_->source->set_handler(this);
    impl_->source->parse(in);
  }

  // -- Namespaces -------------------------------------------------------------

  xml_writer&
  xml_writer::add_ns_prefix(std::string_view prefix, std::string_view uri) {
    impl_->resolver.add_preferred_prefix(prefix, uri);
    return *this;
  }

  xml_writer&
  xml_writer::add_ns_root_decl(std::string_view uri) {
    impl_->resolver.add_root_declaration(uri);
    return *this;
  }

  xml_writer&
  xml_writer::add_ns_root_decl(std::string_view prefix, std::string_view uri) {
    add_ns_prefix(prefix, uri);
    return add_ns_root_decl(uri);
  }

  // -- Configuration ----------------------------------------------------------

  const format_options&
  xml_writer::options() const {
    return impl_->opts;
  }

  void
  xml_writer::set_options(const format_options& opts) {
    impl_->opts = opts;
  }

  void
  xml_writer::set_pretty_print(bool enable) {
    impl_->opts.pretty_print = enable;
  }

  bool
  xml_writer::pretty_print() const {
    return impl_->opts.pretty_print;
  }

  void
  xml_writer::set_indent_string(std::string_view indent) {
    impl_->opts.indent = std::string(indent);
  }

  void
  xml_writer::set_indent_string(std::string_view offset,
                                std::string_view indent) {
    impl_->opts.offset = std::string(offset);
    impl_->opts.indent = std::string(indent);
  }

  const std::string&
  xml_writer::indent_string() const {
    return impl_->opts.indent;
  }

  const std::string&
  xml_writer::offset_string() const {
    return impl_->opts.offset;
  }

  void
  xml_writer::set_minimize_empty(bool minimize) {
    impl_->opts.minimize_empty = minimize;
  }

  bool
  xml_writer::minimize_empty() const {
    return impl_->opts.minimize_empty;
  }

  void
  xml_writer::set_attr_per_line(bool separate_lines) {
    impl_->opts.attr_per_line = separate_lines;
  }

  bool
  xml_writer::attr_per_line() const {
    return impl_->opts.attr_per_line;
  }

  void
  xml_writer::set_specified_attributes(bool specified_only) {
    impl_->opts.specified_only = specified_only;
  }

  bool
  xml_writer::specified_attributes() const {
    return impl_->opts.specified_only;
  }

  void
  xml_writer::set_escape_non_ascii(bool enable) {
    impl_->opts.escape_non_ascii = enable;
  }

  bool
  xml_writer::escape_non_ascii() const {
    return impl_->opts.escape_non_ascii;
  }

  void
  xml_writer::set_use_decimal(bool enable) {
    impl_->opts.use_decimal = enable;
  }

  bool
  xml_writer::use_decimal() const {
    return impl_->opts.use_decimal;
  }

  void
  xml_writer::set_standalone(bool standalone) {
    impl_->opts.standalone = standalone;
  }

  bool
  xml_writer::standalone() const {
    return impl_->opts.standalone;
  }

  void
  xml_writer::set_xml_version(std::string_view version) {
    impl_->opts.xml_version = std::string(version);
  }

  const std::string&
  xml_writer::xml_version() const {
    return impl_->opts.xml_version;
  }

  // -- State ------------------------------------------------------------------

  writer_state
  xml_writer::state() const {
    return impl_->state;
  }

  std::size_t
  xml_writer::element_level() const {
    return impl_->stack.depth();
  }

  void
  xml_writer::reset() {
    impl_->stack.clear();
    impl_->resolver.reset();
    impl_->state = writer_state::before_document;
  }

  void
  xml_writer::flush() {
    impl_->guarded([&] { impl_->os->flush(); });
  }

  // -- Document ---------------------------------------------------------------

  void
  xml_writer::start_document() {
    start_document(std::nullopt, impl_->opts.standalone, false);
    if (impl_->downstream != nullptr) { impl_->downstream->start_document(); }
  }

  xml_writer&
  xml_writer::start_document(std::optional<std::string_view> encoding,
                             bool standalone, bool is_fragment) {
    impl_->guarded([&] {
      impl_->handle(writer_event::start_document);
      if (is_fragment) { return; }

      auto& os = *impl_->os;
      os << "<?xml version=";
      impl_->write_quoted(impl_->opts.xml_version);
      if (encoding) {
        os << " encoding=";
        impl_->write_quoted(*encoding);
      }
      os << " standalone=";
      impl_->write_quoted(standalone ? "yes" : "no");
      os << "?>";
      impl_->write_newline();
    });
    return *this;
  }

  void
  xml_writer::end_document() {
    impl_->guarded([&] {
      impl_->handle(writer_event::end_document);
      impl_->write_newline();
      impl_->os->flush();
    });
    if (impl_->downstream != nullptr) { impl_->downstream->end_document(); }
  }

  // -- Document type ----------------------------------------------------------

  void
  xml_writer::start_dtd(std::string_view name,
                        std::optional<std::string_view> public_id,
                        std::string_view system_id) {
    impl_->guarded([&] {
      impl_->handle(writer_event::start_dtd);

      auto& os = *impl_->os;
      os << "<!DOCTYPE " << name;
      if (public_id) {
        os << " PUBLIC \"" << *public_id << '"';
      } else {
        os << " SYSTEM";
      }
      os << " \"" << system_id << '"';
    });
    if (impl_->downstream != nullptr) {
      impl_->downstream->start_dtd(name, public_id, system_id);
    }
  }

  void
  xml_writer::end_dtd() {
    impl_->guarded([&] {
      impl_->handle(writer_event::end_dtd);
      *impl_->os << '>';
      impl_->write_newline();
      impl_->write_newline();
    });
    if (impl_->downstream != nullptr) { impl_->downstream->end_dtd(); }
  }

  xml_writer&
  xml_writer::doctype(std::string_view name,
                      std::optional<std::string_view> public_id,
                      std::string_view system_id) {
    start_dtd(name, public_id, system_id);
    end_dtd();
    return *this;
  }

  xml_writer&
  xml_writer::doctype(std::string_view name,
                      std::optional<std::string_view> public_id,
                      std::string_view system_id,
                      const std::vector<entity>& entities,
                      const std::vector<notation>& notations) {
    start_dtd(name, public_id, system_id);
    if (!entities.empty() || !notations.empty()) {
      impl_->guarded([&] {
        *impl_->os << " [";
        for (const auto& decl : entities) {
          impl_->write_internal_subset_line();
          impl_->write_entity_decl(decl);
        }
        for (const auto& decl : notations) {
          impl_->write_internal_subset_line();
          impl_->write_notation_decl(decl);
        }
        impl_->write_newline();
        *impl_->os << ']';
      });
    }
    end_dtd();
    return *this;
  }

  // -- Elements ---------------------------------------------------------------

  void
  xml_writer::start_element(const qname& name, const attributes& attrs) {
    impl_->guarded([&] {
      const writer_state previous = impl_->handle(writer_event::start_element);
      impl_->open_element(name, attrs, false, previous);
    });
    if (impl_->downstream != nullptr) {
      impl_->downstream->start_element(name, attrs);
    }
  }

  xml_writer&
  xml_writer::start_element(std::string_view local_name) {
    start_element(qname{"", std::string(local_name)}, attributes{});
    return *this;
  }

  xml_writer&
  xml_writer::start_element(std::string_view local_name,
                            const attributes& attrs) {
    start_element(qname{"", std::string(local_name)}, attrs);
    return *this;
  }

  xml_writer&
  xml_writer::start_element(std::string_view namespace_uri,
                            std::string_view local_name,
                            std::string_view qualified_name) {
    start_element(qname{std::string(namespace_uri), std::string(local_name),
                        std::string(qualified_name)},
                  attributes{});
    return *this;
  }

  xml_writer&
  xml_writer::start_element(std::string_view namespace_uri,
                            std::string_view local_name,
                            std::string_view qualified_name,
                            const attributes& attrs) {
    start_element(qname{std::string(namespace_uri), std::string(local_name),
                        std::string(qualified_name)},
                  attrs);
    return *this;
  }

  void
  xml_writer::end_element(const qname&) {
    end_element();
  }

  xml_writer&
  xml_writer::end_element() {
    impl_->guarded([&] { impl_->handle(writer_event::end_element); });
    return *this;
  }

  xml_writer&
  xml_writer::empty_element(const qname& name, const attributes& attrs) {
    impl_->guarded([&] {
      const writer_state previous = impl_->handle(writer_event::start_element);
      impl_->open_element(name, attrs, true, previous);
    });
    if (impl_->downstream != nullptr) {
      impl_->downstream->start_element(name, attrs);
    }
    return *this;
  }

  xml_writer&
  xml_writer::empty_element(std::string_view local_name) {
    return empty_element(qname{"", std::string(local_name)}, attributes{});
  }

  xml_writer&
  xml_writer::empty_element(std::string_view local_name,
                            const attributes& attrs) {
    return empty_element(qname{"", std::string(local_name)}, attrs);
  }

  xml_writer&
  xml_writer::empty_element(std::string_view namespace_uri,
                            std::string_view local_name,
                            std::string_view qualified_name) {
    return empty_element(qname{std::string(namespace_uri),
                               std::string(local_name),
                               std::string(qualified_name)},
                         attributes{});
  }

  xml_writer&
  xml_writer::empty_element(std::string_view namespace_uri,
                            std::string_view local_name,
                            std::string_view qualified_name,
                            const attributes& attrs) {
    return empty_element(qname{std::string(namespace_uri),
                               std::string(local_name),
                               std::string(qualified_name)},
                         attrs);
  }

  // -- Attributes of the pending start tag ------------------------------------

  xml_writer&
  xml_writer::set_attributes(const attributes& attrs) {
    impl_->handle(writer_event::attribute);
    impl_->pending_element().attrs.set(attrs);
    return *this;
  }

  xml_writer&
  xml_writer::add_attributes(const attributes& attrs) {
    impl_->handle(writer_event::attribute);
    impl_->pending_element().attrs.append(attrs);
    return *this;
  }

  xml_writer&
  xml_writer::add_attribute(std::string_view namespace_uri,
                            std::string_view local_name,
                            std::string_view qualified_name,
                            std::string_view type, std::string_view value) {
    impl_->handle(writer_event::attribute);
    impl_->pending_element().attrs.add(
        std::string(namespace_uri), std::string(local_name),
        std::string(qualified_name), std::string(type), std::string(value));
    return *this;
  }

  xml_writer&
  xml_writer::add_attribute(std::string_view namespace_uri,
                            std::string_view local_name,
                            std::string_view qualified_name,
                            std::string_view value) {
    return add_attribute(namespace_uri, local_name, qualified_name, cdata_type,
                         value);
  }

  xml_writer&
  xml_writer::add_attribute(std::string_view namespace_uri,
                            std::string_view local_name,
                            std::string_view value) {
    return add_attribute(namespace_uri, local_name, {}, cdata_type, value);
  }

  xml_writer&
  xml_writer::add_attribute(std::string_view name, std::string_view value) {
    return add_attribute({}, name, {}, cdata_type, value);
  }

  xml_writer&
  xml_writer::add_attribute(std::string_view name, long long value) {
    return add_attribute(name, std::string_view(std::to_string(value)));
  }

  // -- Content ----------------------------------------------------------------

  void
  xml_writer::characters(std::string_view text) {
    impl_->guarded([&] {
      impl_->handle(writer_event::characters);
      if (impl_->state == writer_state::in_cdata) {
        *impl_->os << text;
      } else {
        escape_text(*impl_->os, text, impl_->opts.escaping());
      }
    });
    if (impl_->downstream != nullptr) { impl_->downstream->characters(text); }
  }

  void
  xml_writer::ignorable_whitespace(std::string_view text) {
    impl_->guarded([&] {
      impl_->handle(writer_event::characters);
      escape_text(*impl_->os, text, impl_->opts.escaping());
    });
    if (impl_->downstream != nullptr) {
      impl_->downstream->ignorable_whitespace(text);
    }
  }

  xml_writer&
  xml_writer::data(std::string_view text) {
    impl_->guarded([&] {
      impl_->handle(writer_event::characters);
      *impl_->os << text;
    });
    return *this;
  }

  void
  xml_writer::start_cdata() {
    impl_->guarded([&] {
      impl_->handle(writer_event::start_cdata);
      *impl_->os << "<![CDATA[";
    });
    if (impl_->downstream != nullptr) { impl_->downstream->start_cdata(); }
  }

  void
  xml_writer::end_cdata() {
    impl_->guarded([&] {
      impl_->handle(writer_event::end_cdata);
      *impl_->os << "]]>";
    });
    if (impl_->downstream != nullptr) { impl_->downstream->end_cdata(); }
  }

  xml_writer&
  xml_writer::cdata_section(std::string_view text) {
    start_cdata();
    characters(text);
    end_cdata();
    return *this;
  }

  void
  xml_writer::comment(std::string_view text) {
    impl_->guarded([&] {
      impl_->handle(writer_event::comment);
      // Comments inside the internal subset are dropped.
      if (impl_->state != writer_state::in_dtd) {
        *impl_->os << "<!--" << text << "-->";
      }
    });
    if (impl_->downstream != nullptr) { impl_->downstream->comment(text); }
  }

  void
  xml_writer::processing_instruction(std::string_view target,
                                     std::string_view data) {
    impl_->guarded([&] {
      impl_->handle(writer_event::processing_instruction);
      auto& os = *impl_->os;
      os << "<?" << target;
      if (!data.empty()) { os << ' ' << data; }
      os << "?>";
    });
    if (impl_->downstream != nullptr) {
      impl_->downstream->processing_instruction(target, data);
    }
  }

  xml_writer&
  xml_writer::entity_ref(std::string_view name, formatting_hint hint) {
    impl_->guarded([&] {
      const bool block = hint == formatting_hint::block;
      impl_->handle(block ? writer_event::block_ref : writer_event::inline_ref);

      const bool own_line = block && impl_->opts.pretty_print;
      if (own_line) {
        impl_->write_newline();
        impl_->write_indent(1);
      }
      *impl_->os << '&' << name << ';';
      if (own_line) {
        impl_->write_newline();
        impl_->write_indent(1);
      }
    });
    return *this;
  }

  xml_writer&
  xml_writer::character_ref(char32_t code_point) {
    if (code_point == 0 || code_point > 0x10FFFF ||
        (code_point >= 0xD800 && code_point <= 0xDFFF)) {
      throw std::invalid_argument("xml_writer: not a character code point");
    }
    impl_->guarded([&] {
      impl_->handle(writer_event::inline_ref);
      write_char_ref(*impl_->os, code_point, impl_->opts.use_decimal);
    });
    return *this;
  }

  xml_writer&
  xml_writer::newline() {
    impl_->guarded([&] {
      impl_->handle(writer_event::newline);
      impl_->write_newline();
      if (impl_->opts.pretty_print &&
          impl_->state != writer_state::in_cdata) {
        impl_->write_indent(1);
      }
    });
    return *this;
  }

  void
  xml_writer::start_prefix_mapping(std::string_view prefix,
                                   std::string_view uri) {
    if (impl_->downstream != nullptr) {
      impl_->downstream->start_prefix_mapping(prefix, uri);
    }
  }

  void
  xml_writer::end_prefix_mapping(std::string_view prefix) {
    if (impl_->downstream != nullptr) {
      impl_->downstream->end_prefix_mapping(prefix);
    }
  }

} // namespace xw
