#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xw {

  inline constexpr std::string_view xml_namespace_uri =
      "http://www.w3.org/XML/1998/namespace";

  // Prefix <-> URI bindings scoped to nested elements. The bottom frame
  // permanently binds the "xml" prefix.
  class namespace_context {
    // prefix -> uri, one map per open element
    std::vector<std::map<std::string, std::string, std::less<>>> frames_;

  public:
    namespace_context();

    void
    push();

    void
    pop();

    // Drop every frame except the base one.
    void
    reset();

    // Bind prefix to uri in the innermost frame. An empty prefix declares the
    // default namespace.
    void
    declare(std::string_view prefix, std::string_view uri);

    // URI bound to prefix in scope, if any.
    std::optional<std::string_view>
    uri_for(std::string_view prefix) const;

    // URI bound to prefix by the innermost frame itself, if any.
    std::optional<std::string_view>
    declared_uri(std::string_view prefix) const;

    // A non-empty prefix currently bound to uri, searching innermost frames
    // first. A prefix shadowed by an inner binding to another URI is skipped.
    std::optional<std::string_view>
    prefix_for(std::string_view uri) const;

    // Prefixes declared on the innermost frame, sorted.
    std::vector<std::string>
    declared_prefixes() const;

    bool
    is_bound(std::string_view prefix) const {
      return uri_for(prefix).has_value();
    }

    std::size_t
    depth() const {
      return frames_.size() - 1;
    }
  };

} // namespace xw
