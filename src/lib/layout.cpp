#include <xw/layout.hpp>

namespace xw {

  std::string
  indentation(const format_options& opts, std::size_t depth,
              int level_adjust) {
    long level = static_cast<long>(depth) - 1 + level_adjust;
    if (level < 0) { level = 0; }

    std::string result = opts.offset;
    result.reserve(opts.offset.size() +
                   opts.indent.size() * static_cast<std::size_t>(level));
    for (long i = 0; i < level; ++i) {
      result += opts.indent;
    }
    return result;
  }

  void
  write_indent(std::ostream& os, const format_options& opts,
               std::size_t depth, int level_adjust) {
    os << indentation(opts, depth, level_adjust);
  }

  bool
  breaks_before_start_tag(const format_options& opts,
                          writer_state containing_state, std::size_t depth) {
    return opts.pretty_print && containing_state != writer_state::after_data &&
           depth > 1;
  }

  bool
  breaks_before_end_tag(const format_options& opts, writer_state current) {
    return opts.pretty_print && current != writer_state::after_data;
  }

  bool
  breaks_before_attribute(const format_options& opts) {
    return opts.attr_per_line;
  }

} // namespace xw
