#pragma once

#include <xw/attributes.hpp>
#include <xw/qname.hpp>
#include <xw/state_machine.hpp>

#include <cstddef>
#include <vector>

namespace xw {

  struct element_frame {
    qname name;
    attributes attrs;
    // Opened with empty_element(): always written self-closing.
    bool is_empty = false;
    // Writer state when the element was opened.
    writer_state containing_state = writer_state::before_root;
  };

  // Open elements, innermost last. Popped frames stay allocated and are
  // reused by later pushes.
  class element_stack {
    std::vector<element_frame> frames_;
    std::size_t depth_ = 0;

  public:
    element_frame&
    push(qname name, const attributes& attrs, bool is_empty,
         writer_state containing_state);

    void
    pop();

    element_frame&
    top() {
      return frames_[depth_ - 1];
    }

    const element_frame&
    top() const {
      return frames_[depth_ - 1];
    }

    std::size_t
    depth() const {
      return depth_;
    }

    bool
    empty() const {
      return depth_ == 0;
    }

    void
    clear() {
      depth_ = 0;
    }
  };

} // namespace xw
