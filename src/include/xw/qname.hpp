#pragma once

#include <compare>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace xw {

  // A namespace URI and local name, together with the qualified name the
  // caller would like to see written (e.g. "ns1:foo"). The qualified name is
  // only a hint for prefix selection and may be empty.
  class qname {
    std::string namespace_uri_;
    std::string local_name_;
    std::string qualified_name_;

  public:
    qname() = default;

    qname(std::string namespace_uri, std::string local_name,
          std::string qualified_name = {})
        : namespace_uri_(std::move(namespace_uri)),
          local_name_(std::move(local_name)),
          qualified_name_(std::move(qualified_name)) {}

    const std::string&
    namespace_uri() const {
      return namespace_uri_;
    }

    const std::string&
    local_name() const {
      return local_name_;
    }

    const std::string&
    qualified_name() const {
      return qualified_name_;
    }

    // Prefix portion of the qualified name, empty when it has none.
    std::string_view
    prefix() const {
      auto colon = qualified_name_.find(':');
      if (colon == std::string::npos) { return {}; }
      return std::string_view(qualified_name_).substr(0, colon);
    }

    // The name to write after the prefix: the local name, or the local part
    // of the qualified name when no local name was given.
    std::string_view
    output_local_name() const {
      if (!local_name_.empty()) { return local_name_; }
      auto colon = qualified_name_.find(':');
      if (colon == std::string::npos) { return qualified_name_; }
      return std::string_view(qualified_name_).substr(colon + 1);
    }

    auto
    operator<=>(const qname&) const = default;

    bool
    operator==(const qname&) const = default;

    friend std::ostream&
    operator<<(std::ostream& os, const qname& q) {
      if (q.namespace_uri_.empty()) { return os << q.output_local_name(); }
      return os << '{' << q.namespace_uri_ << '}' << q.output_local_name();
    }
  };

} // namespace xw
