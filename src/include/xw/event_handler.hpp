#pragma once

#include <xw/attributes.hpp>
#include <xw/qname.hpp>

#include <optional>
#include <string_view>

namespace xw {

  // Receiver of structural XML events, in document order.
  class event_handler {
  public:
    virtual ~event_handler() = default;

    virtual void
    start_document() = 0;

    virtual void
    end_document() = 0;

    virtual void
    start_element(const qname& name, const attributes& attrs) = 0;

    virtual void
    end_element(const qname& name) = 0;

    virtual void
    characters(std::string_view text) = 0;

    virtual void
    ignorable_whitespace(std::string_view text) = 0;

    virtual void
    processing_instruction(std::string_view target, std::string_view data) = 0;

    // Reported before the start_element that declares the binding.
    virtual void
    start_prefix_mapping(std::string_view prefix, std::string_view uri) = 0;

    // Reported after the end_element of the declaring element.
    virtual void
    end_prefix_mapping(std::string_view prefix) = 0;

    virtual void
    comment(std::string_view text) = 0;

    virtual void
    start_cdata() = 0;

    virtual void
    end_cdata() = 0;

    virtual void
    start_dtd(std::string_view name, std::optional<std::string_view> public_id,
              std::string_view system_id) = 0;

    virtual void
    end_dtd() = 0;
  };

} // namespace xw
