#pragma once

#include <xw/state_machine.hpp>

#include <stdexcept>
#include <string>

namespace xw {

  // An event was issued that is not legal in the writer's current state. The
  // document being written cannot be completed.
  class illegal_event_error : public std::runtime_error {
    writer_state state_;
    writer_event event_;

  public:
    illegal_event_error(writer_state state, writer_event event)
        : std::runtime_error(std::string("event ") + to_string(event) +
                             " not allowed in state " + to_string(state)),
          state_(state), event_(event) {}

    writer_state
    state() const {
      return state_;
    }

    writer_event
    event() const {
      return event_;
    }
  };

  // The output sink rejected a write. When the sink threw, the original
  // exception is nested inside this one.
  class write_error : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

} // namespace xw
