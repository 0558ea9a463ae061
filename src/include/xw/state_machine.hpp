#pragma once

#include <array>
#include <cstddef>
#include <initializer_list>

namespace xw {

  enum class writer_state {
    before_document,
    before_root,
    in_start_tag,
    in_cdata,
    in_dtd,
    after_tag,
    after_data,
    after_root,
    after_document,
  };

  enum class writer_event {
    attribute,
    inline_ref,
    block_ref,
    characters,
    comment,
    end_cdata,
    end_document,
    end_dtd,
    end_element,
    newline,
    processing_instruction,
    start_cdata,
    start_document,
    start_dtd,
    start_element,
  };

  inline constexpr std::size_t writer_state_count = 9;
  inline constexpr std::size_t writer_event_count = 15;

  // Output the writer performs while taking a transition, before the event's
  // own text is written.
  enum class transition_action {
    none,
    // Write the pending start tag and close it with '>'.
    flush_start_tag,
    // Write the pending start tag; minimize it or follow it with an end tag.
    close_start_tag,
    // As close_start_tag, at end of document.
    finish_start_tag,
    // Write the end tag of the innermost open element.
    write_end_tag,
  };

  struct transition {
    bool allowed = false;
    transition_action action = transition_action::none;
    writer_state next = writer_state::before_document;
    // Next state is after_tag while elements remain open, else after_root.
    bool next_by_depth = false;
  };

  namespace detail {

    using transition_table =
        std::array<std::array<transition, writer_event_count>,
                   writer_state_count>;

    constexpr std::size_t
    index(writer_state s) {
      return static_cast<std::size_t>(s);
    }

    constexpr std::size_t
    index(writer_event e) {
      return static_cast<std::size_t>(e);
    }

    constexpr transition_table
    make_transition_table() {
      using st = writer_state;
      using ev = writer_event;
      using act = transition_action;

      transition_table t{};

      auto stay = [&](st s, ev e) {
        t[index(s)][index(e)] = {true, act::none, s, false};
      };
      auto go = [&](st s, ev e, st next, act a = act::none) {
        t[index(s)][index(e)] = {true, a, next, false};
      };
      auto close = [&](st s, ev e, act a) {
        t[index(s)][index(e)] = {true, a, st::after_tag, true};
      };

      go(st::before_document, ev::start_document, st::before_root);

      for (auto e : {ev::characters, ev::comment, ev::inline_ref,
                     ev::block_ref, ev::newline, ev::processing_instruction}) {
        stay(st::before_root, e);
      }
      go(st::before_root, ev::start_dtd, st::in_dtd);
      go(st::before_root, ev::start_element, st::in_start_tag);
      go(st::before_root, ev::end_document, st::after_document);

      stay(st::in_start_tag, ev::attribute);
      for (auto e : {ev::characters, ev::inline_ref}) {
        go(st::in_start_tag, e, st::after_data, act::flush_start_tag);
      }
      for (auto e : {ev::newline, ev::processing_instruction, ev::block_ref,
                     ev::comment}) {
        go(st::in_start_tag, e, st::after_tag, act::flush_start_tag);
      }
      go(st::in_start_tag, ev::start_element, st::in_start_tag,
         act::flush_start_tag);
      go(st::in_start_tag, ev::start_cdata, st::in_cdata,
         act::flush_start_tag);
      close(st::in_start_tag, ev::end_element, act::close_start_tag);
      go(st::in_start_tag, ev::end_document, st::after_document,
         act::finish_start_tag);

      for (auto e : {ev::characters, ev::comment, ev::inline_ref,
                     ev::block_ref, ev::newline}) {
        stay(st::in_cdata, e);
      }
      go(st::in_cdata, ev::end_cdata, st::after_data);

      for (auto e : {ev::characters, ev::comment, ev::newline}) {
        stay(st::in_dtd, e);
      }
      go(st::in_dtd, ev::end_dtd, st::before_root);

      for (auto e : {ev::characters, ev::inline_ref}) {
        go(st::after_tag, e, st::after_data);
      }
      for (auto e : {ev::block_ref, ev::comment, ev::newline,
                     ev::processing_instruction}) {
        stay(st::after_tag, e);
      }
      go(st::after_tag, ev::start_cdata, st::in_cdata);
      go(st::after_tag, ev::start_element, st::in_start_tag);
      close(st::after_tag, ev::end_element, act::write_end_tag);

      for (auto e : {ev::characters, ev::inline_ref, ev::block_ref,
                     ev::comment, ev::newline, ev::processing_instruction}) {
        stay(st::after_data, e);
      }
      go(st::after_data, ev::start_cdata, st::in_cdata);
      go(st::after_data, ev::start_element, st::in_start_tag);
      close(st::after_data, ev::end_element, act::write_end_tag);

      for (auto e : {ev::characters, ev::comment, ev::inline_ref,
                     ev::block_ref, ev::newline, ev::processing_instruction}) {
        stay(st::after_root, e);
      }
      go(st::after_root, ev::end_document, st::after_document);

      return t;
    }

    inline constexpr transition_table transitions = make_transition_table();

  } // namespace detail

  constexpr const transition&
  transition_for(writer_state state, writer_event event) {
    return detail::transitions[detail::index(state)][detail::index(event)];
  }

  const char*
  to_string(writer_state state);

  const char*
  to_string(writer_event event);

} // namespace xw
