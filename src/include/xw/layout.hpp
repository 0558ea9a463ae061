#pragma once

#include <xw/format_options.hpp>
#include <xw/state_machine.hpp>

#include <cstddef>
#include <ostream>
#include <string>

namespace xw {

  inline constexpr char newline_char = '\n';

  // Whitespace that starts a line at element depth d (root = 1):
  // offset + indent * (d - 1 + level_adjust). Never negative.
  std::string
  indentation(const format_options& opts, std::size_t depth,
              int level_adjust = 0);

  void
  write_indent(std::ostream& os, const format_options& opts,
               std::size_t depth, int level_adjust = 0);

  // A start tag goes on its own line unless it directly follows character
  // data or is the root element.
  bool
  breaks_before_start_tag(const format_options& opts,
                          writer_state containing_state, std::size_t depth);

  // An end tag goes on its own line unless it directly follows character
  // data.
  bool
  breaks_before_end_tag(const format_options& opts, writer_state current);

  // Each attribute and namespace declaration on its own line, one level
  // deeper than the element.
  bool
  breaks_before_attribute(const format_options& opts);

} // namespace xw
