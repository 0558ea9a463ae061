#include <xw/element_stack.hpp>

#include <catch2/catch.hpp>

#include <stdexcept>

using namespace xw;

TEST_CASE("element stack: push and pop", "[element_stack]") {
  element_stack stack;
  CHECK(stack.empty());

  stack.push({"", "root"}, attributes{"a", "1"}, false,
             writer_state::before_root);
  stack.push({"urn:x", "child"}, attributes{}, true,
             writer_state::in_start_tag);

  CHECK(stack.depth() == 2);
  CHECK(stack.top().name == qname("urn:x", "child"));
  CHECK(stack.top().is_empty);
  CHECK(stack.top().containing_state == writer_state::in_start_tag);

  stack.pop();
  CHECK(stack.depth() == 1);
  CHECK(stack.top().name.local_name() == "root");
  CHECK(stack.top().attrs.size() == 1);
  CHECK_FALSE(stack.top().is_empty);
}

TEST_CASE("element stack: reused frames are overwritten", "[element_stack]") {
  element_stack stack;
  stack.push({"", "first"}, attributes{"a", "1", "b", "2"}, true,
             writer_state::after_tag);
  stack.pop();

  auto& frame = stack.push({"", "second"}, attributes{}, false,
                           writer_state::after_data);
  CHECK(frame.name.local_name() == "second");
  CHECK(frame.attrs.empty());
  CHECK_FALSE(frame.is_empty);
  CHECK(frame.containing_state == writer_state::after_data);
}

TEST_CASE("element stack: frames can be edited in place", "[element_stack]") {
  element_stack stack;
  stack.push({"", "e"}, attributes{}, false, writer_state::before_root);
  stack.top().attrs.add("late", "yes");
  CHECK(stack.top().attrs.size() == 1);
}

TEST_CASE("element stack: pop of an empty stack throws", "[element_stack]") {
  element_stack stack;
  CHECK_THROWS_AS(stack.pop(), std::logic_error);
}

TEST_CASE("element stack: clear", "[element_stack]") {
  element_stack stack;
  stack.push({"", "a"}, attributes{}, false, writer_state::before_root);
  stack.push({"", "b"}, attributes{}, false, writer_state::in_start_tag);
  stack.clear();
  CHECK(stack.empty());
  CHECK(stack.depth() == 0);
}
