#pragma once

#include <xw/event_handler.hpp>

#include <istream>
#include <string_view>

namespace xw {

  // Producer of structural XML events, typically a parser.
  class event_source {
  public:
    virtual ~event_source() = default;

    virtual void
    set_handler(event_handler* handler) = 0;

    virtual event_handler*
    handler() const = 0;

    // Deliver every event of the document to the handler.
    virtual void
    parse(std::string_view xml) = 0;

    virtual void
    parse(std::istream& in) = 0;
  };

} // namespace xw
