#pragma once

#include <xw/event_source.hpp>

#include <istream>
#include <memory>
#include <string_view>

namespace xw {

  // Namespace-aware event_source backed by expat. Element and attribute names
  // keep the prefix they had in the input as their qualified name. Adjacent
  // character data is delivered as one characters() event.
  //
  // A DOCTYPE is reported only when it has an external id; the internal
  // subset, including its comments and processing instructions, is not.
  //
  // Parse errors throw std::runtime_error naming the line. An exception
  // thrown by the handler stops the parser and propagates out of parse().
  class expat_source : public event_source {
  public:
    expat_source();
    explicit expat_source(event_handler& handler);
    ~expat_source() override;

    expat_source(const expat_source&) = delete;
    expat_source&
    operator=(const expat_source&) = delete;
    expat_source(expat_source&&) noexcept;
    expat_source&
    operator=(expat_source&&) noexcept;

    void
    set_handler(event_handler* handler) override;

    event_handler*
    handler() const override;

    // Drop text runs that are entirely whitespace (outside CDATA sections).
    void
    set_strip_blank_text(bool strip);

    bool
    strip_blank_text() const;

    void
    parse(std::string_view xml) override;

    void
    parse(std::istream& in) override;

  private:
    struct impl;
    std::unique_ptr<impl> impl_;
  };

} // namespace xw
