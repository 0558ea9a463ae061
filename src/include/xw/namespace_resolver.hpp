#pragma once

#include <xw/namespace_context.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace xw {

  // Chooses the prefix used to write a namespaced name and declares it in the
  // current element's scope.
  //
  // Resolution order for a URI:
  //   1. empty URI: no prefix, undeclaring an inherited default namespace
  //      for elements
  //   2. element in the active default namespace: no prefix
  //   3. a prefix already bound to the URI in scope
  //   4. the prefix last resolved for the URI
  //   5. the caller's preferred prefix for the URI
  //   6. the prefix of the candidate qualified name (or the default
  //      namespace for an unprefixed element when none is active)
  //   7. a synthesized "__NS<n>" prefix
  // Candidates from 4 and 5 are rejected when already bound in scope, or
  // when they are the empty prefix and the name is an attribute or a default
  // namespace is active.
  class namespace_resolver {
    namespace_context context_;
    // uri -> prefix resolved earlier in the document
    std::unordered_map<std::string, std::string> resolved_;
    // uri -> prefix requested by the caller
    std::unordered_map<std::string, std::string> preferred_;
    // URIs declared on the root element, in insertion order
    std::vector<std::string> root_decls_;
    unsigned prefix_counter_ = 0;

    bool
    usable(const std::string* candidate, bool is_element,
           bool have_default) const;

    std::string
    synthesize_prefix();

  public:
    std::string
    resolve(std::string_view uri, std::string_view qualified_name,
            bool is_element);

    // Resolve every root declaration URI in the current scope. Called once,
    // when the root element opens.
    void
    declare_root_namespaces();

    void
    add_preferred_prefix(std::string_view prefix, std::string_view uri);

    void
    add_root_declaration(std::string_view uri);

    void
    push_context() {
      context_.push();
    }

    void
    pop_context() {
      context_.pop();
    }

    const namespace_context&
    context() const {
      return context_;
    }

    // Forget the document's scopes, resolved prefixes and the synthesized
    // prefix counter. Preferred prefixes and root declarations are kept.
    void
    reset();
  };

} // namespace xw
