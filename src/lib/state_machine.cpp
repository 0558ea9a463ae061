#include <xw/state_machine.hpp>

namespace xw {

  const char*
  to_string(writer_state state) {
    switch (state) {
      case writer_state::before_document:
        return "before_document";
      case writer_state::before_root:
        return "before_root";
      case writer_state::in_start_tag:
        return "in_start_tag";
      case writer_state::in_cdata:
        return "in_cdata";
      case writer_state::in_dtd:
        return "in_dtd";
      case writer_state::after_tag:
        return "after_tag";
      case writer_state::after_data:
        return "after_data";
      case writer_state::after_root:
        return "after_root";
      case writer_state::after_document:
        return "after_document";
    }
    return "unknown";
  }

  const char*
  to_string(writer_event event) {
    switch (event) {
      case writer_event::attribute:
        return "attribute";
      case writer_event::inline_ref:
        return "inline_ref";
      case writer_event::block_ref:
        return "block_ref";
      case writer_event::characters:
        return "characters";
      case writer_event::comment:
        return "comment";
      case writer_event::end_cdata:
        return "end_cdata";
      case writer_event::end_document:
        return "end_document";
      case writer_event::end_dtd:
        return "end_dtd";
      case writer_event::end_element:
        return "end_element";
      case writer_event::newline:
        return "newline";
      case writer_event::processing_instruction:
        return "processing_instruction";
      case writer_event::start_cdata:
        return "start_cdata";
      case writer_event::start_document:
        return "start_document";
      case writer_event::start_dtd:
        return "start_dtd";
      case writer_event::start_element:
        return "start_element";
    }
    return "unknown";
  }

} // namespace xw
