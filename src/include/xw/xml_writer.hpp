#pragma once

#include <xw/attributes.hpp>
#include <xw/dtd.hpp>
#include <xw/event_handler.hpp>
#include <xw/event_source.hpp>
#include <xw/format_options.hpp>
#include <xw/qname.hpp>
#include <xw/state_machine.hpp>

#include <cstddef>
#include <istream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace xw {

  // Placement of an entity reference when pretty printing: inline references
  // run on with the surrounding text, block references get a line of their
  // own.
  enum class formatting_hint { inline_ref, block };

  // Incremental XML serializer. Each call is checked against the document
  // state machine (see state_machine.hpp) and written to the output stream
  // immediately; an out-of-order call throws illegal_event_error and a failed
  // stream throws write_error.
  //
  // As an event_handler the writer can sit behind an event_source (a parser)
  // and re-emit its document; every event it accepts is also relayed to an
  // optional downstream handler.
  class xml_writer : public event_handler {
  public:
    explicit xml_writer(std::ostream& os);
    xml_writer(event_source& source, std::ostream& os);
    ~xml_writer() override;

    xml_writer(const xml_writer&) = delete;
    xml_writer&
    operator=(const xml_writer&) = delete;
    xml_writer(xml_writer&&) noexcept;
    xml_writer&
    operator=(xml_writer&&) noexcept;

    // -- Output and filtering ---------------------------------------------------

    // Redirect output. The writer never closes its stream.
    void
    set_output(std::ostream& os);

    std::ostream&
    output() const;

    void
    set_downstream(event_handler* handler);

    event_handler*
    downstream() const;

    void
    set_source(event_source* source);

    event_source*
    source() const;

    // Run the source with this writer as its handler.
    void
    parse(std::string_view xml);

    void
    parse(std::istream& in);

    // -- Namespaces -------------------------------------------------------------

    // Prefer prefix for uri whenever it is free in scope.
    xml_writer&
    add_ns_prefix(std::string_view prefix, std::string_view uri);

    // Declare uri on the root element.
    xml_writer&
    add_ns_root_decl(std::string_view uri);

    xml_writer&
    add_ns_root_decl(std::string_view prefix, std::string_view uri);

    // -- Configuration ----------------------------------------------------------

    const format_options&
    options() const;

    void
    set_options(const format_options& opts);

    void
    set_pretty_print(bool enable);

    bool
    pretty_print() const;

    void
    set_indent_string(std::string_view indent);

    void
    set_indent_string(std::string_view offset, std::string_view indent);

    const std::string&
    indent_string() const;

    const std::string&
    offset_string() const;

    void
    set_minimize_empty(bool minimize);

    bool
    minimize_empty() const;

    void
    set_attr_per_line(bool separate_lines);

    bool
    attr_per_line() const;

    // Write only attributes the source marked as specified.
    void
    set_specified_attributes(bool specified_only);

    bool
    specified_attributes() const;

    void
    set_escape_non_ascii(bool enable);

    bool
    escape_non_ascii() const;

    void
    set_use_decimal(bool enable);

    bool
    use_decimal() const;

    void
    set_standalone(bool standalone);

    bool
    standalone() const;

    void
    set_xml_version(std::string_view version);

    const std::string&
    xml_version() const;

    // -- State ------------------------------------------------------------------

    writer_state
    state() const;

    // Number of open elements; 0 outside the root element.
    std::size_t
    element_level() const;

    // Start over with a new document. Configuration, preferred prefixes and
    // root declarations are kept.
    void
    reset();

    void
    flush();

    // -- Document ---------------------------------------------------------------

    // Prolog with the configured standalone flag and no encoding.
    void
    start_document() override;

    // A fragment has no prolog.
    xml_writer&
    start_document(std::optional<std::string_view> encoding, bool standalone,
                   bool is_fragment);

    // Final newline, then flush. A pending start tag is completed first; any
    // other open element makes this an illegal event.
    void
    end_document() override;

    // -- Document type ----------------------------------------------------------

    // Always writes an external id: SYSTEM "sys" or PUBLIC "pub" "sys".
    // end_dtd() leaves a blank line after the declaration.
    void
    start_dtd(std::string_view name, std::optional<std::string_view> public_id,
              std::string_view system_id) override;

    void
    end_dtd() override;

    xml_writer&
    doctype(std::string_view name, std::optional<std::string_view> public_id,
            std::string_view system_id);

    xml_writer&
    doctype(std::string_view name, std::optional<std::string_view> public_id,
            std::string_view system_id, const std::vector<entity>& entities,
            const std::vector<notation>& notations);

    // -- Elements ---------------------------------------------------------------

    void
    start_element(const qname& name, const attributes& attrs) override;

    xml_writer&
    start_element(std::string_view local_name);

    xml_writer&
    start_element(std::string_view local_name, const attributes& attrs);

    xml_writer&
    start_element(std::string_view namespace_uri, std::string_view local_name,
                  std::string_view qualified_name = {});

    xml_writer&
    start_element(std::string_view namespace_uri, std::string_view local_name,
                  std::string_view qualified_name, const attributes& attrs);

    // The name is ignored; the innermost open element is closed.
    void
    end_element(const qname& name) override;

    xml_writer&
    end_element();

    // An element that is written self-closing as soon as its start tag is
    // complete. Attributes may still be added until then.
    xml_writer&
    empty_element(const qname& name, const attributes& attrs);

    xml_writer&
    empty_element(std::string_view local_name);

    xml_writer&
    empty_element(std::string_view local_name, const attributes& attrs);

    xml_writer&
    empty_element(std::string_view namespace_uri, std::string_view local_name,
                  std::string_view qualified_name = {});

    xml_writer&
    empty_element(std::string_view namespace_uri, std::string_view local_name,
                  std::string_view qualified_name, const attributes& attrs);

    // -- Attributes of the pending start tag ------------------------------------

    xml_writer&
    set_attributes(const attributes& attrs);

    xml_writer&
    add_attributes(const attributes& attrs);

    xml_writer&
    add_attribute(std::string_view namespace_uri, std::string_view local_name,
                  std::string_view qualified_name, std::string_view type,
                  std::string_view value);

    xml_writer&
    add_attribute(std::string_view namespace_uri, std::string_view local_name,
                  std::string_view qualified_name, std::string_view value);

    xml_writer&
    add_attribute(std::string_view namespace_uri, std::string_view local_name,
                  std::string_view value);

    xml_writer&
    add_attribute(std::string_view name, std::string_view value);

    xml_writer&
    add_attribute(std::string_view name, long long value);

    // -- Content ----------------------------------------------------------------

    // Escaped, or verbatim inside a CDATA section.
    void
    characters(std::string_view text) override;

    void
    ignorable_whitespace(std::string_view text) override;

    // Verbatim markup; no escaping.
    xml_writer&
    data(std::string_view text);

    void
    start_cdata() override;

    void
    end_cdata() override;

    xml_writer&
    cdata_section(std::string_view text);

    void
    comment(std::string_view text) override;

    void
    processing_instruction(std::string_view target,
                           std::string_view data) override;

    xml_writer&
    entity_ref(std::string_view name,
               formatting_hint hint = formatting_hint::inline_ref);

    // Throws std::invalid_argument for NUL, surrogates and values above
    // U+10FFFF.
    xml_writer&
    character_ref(char32_t code_point);

    // Line break, indented one level inside the current element when pretty
    // printing.
    xml_writer&
    newline();

    void
    start_prefix_mapping(std::string_view prefix,
                         std::string_view uri) override;

    void
    end_prefix_mapping(std::string_view prefix) override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xw
