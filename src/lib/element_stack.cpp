#include <xw/element_stack.hpp>

#include <stdexcept>
#include <utility>

namespace xw {

  element_frame&
  element_stack::push(qname name, const attributes& attrs, bool is_empty,
                      writer_state containing_state) {
    if (depth_ == frames_.size()) { frames_.emplace_back(); }

    auto& frame = frames_[depth_++];
    frame.name = std::move(name);
    frame.attrs.set(attrs);
    frame.is_empty = is_empty;
    frame.containing_state = containing_state;
    return frame;
  }

  void
  element_stack::pop() {
    if (depth_ == 0) {
      throw std::logic_error("element_stack: pop of an empty stack");
    }
    --depth_;
  }

} // namespace xw
