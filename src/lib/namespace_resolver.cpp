#include <xw/namespace_resolver.hpp>

#include <algorithm>

namespace xw {

  namespace {

    constexpr std::string_view synthesized_prefix = "__NS";

  } // namespace

  bool
  namespace_resolver::usable(const std::string* candidate, bool is_element,
                             bool have_default) const {
    if (candidate == nullptr) { return false; }
    if (candidate->empty()) { return is_element && !have_default; }
    return !context_.is_bound(*candidate);
  }

  std::string
  namespace_resolver::synthesize_prefix() {
    std::string prefix;
    do {
      prefix = std::string(synthesized_prefix) +
               std::to_string(++prefix_counter_);
    } while (context_.is_bound(prefix));
    return prefix;
  }

  std::string
  namespace_resolver::resolve(std::string_view uri,
                              std::string_view qualified_name,
                              bool is_element) {
    auto default_uri = context_.uri_for("");
    // xmlns="" undeclares the default namespace.
    const bool have_default = default_uri.has_value() && !default_uri->empty();

    if (uri.empty()) {
      // An unqualified element below a default namespace declared by an
      // ancestor needs the default undeclared. One declared on this element
      // (a root declaration) is left alone.
      if (is_element && have_default && !context_.declared_uri("")) {
        context_.declare("", "");
      }
      return {};
    }

    if (is_element && have_default && *default_uri == uri) { return {}; }

    if (auto bound = context_.prefix_for(uri)) { return std::string(*bound); }

    const std::string uri_str(uri);
    const std::string* candidate = nullptr;

    if (auto it = resolved_.find(uri_str); it != resolved_.end()) {
      candidate = &it->second;
    }
    if (!usable(candidate, is_element, have_default)) {
      candidate = nullptr;
      if (auto it = preferred_.find(uri_str); it != preferred_.end()) {
        candidate = &it->second;
      }
      if (!usable(candidate, is_element, have_default)) { candidate = nullptr; }
    }

    std::string prefix;
    if (candidate != nullptr) {
      prefix = *candidate;
    } else {
      bool found = false;
      if (!qualified_name.empty()) {
        auto colon = qualified_name.find(':');
        if (colon == std::string_view::npos) {
          if (is_element && !have_default) { found = true; }
        } else {
          auto qname_prefix = qualified_name.substr(0, colon);
          auto here = context_.declared_uri(qname_prefix);
          if (!here || *here == uri) {
            prefix = std::string(qname_prefix);
            found = true;
          }
        }
      }
      if (!found) { prefix = synthesize_prefix(); }
    }

    context_.declare(prefix, uri);
    resolved_[uri_str] = prefix;
    return prefix;
  }

  void
  namespace_resolver::declare_root_namespaces() {
    for (const auto& uri : root_decls_) {
      resolve(uri, {}, true);
    }
  }

  void
  namespace_resolver::add_preferred_prefix(std::string_view prefix,
                                           std::string_view uri) {
    preferred_[std::string(uri)] = std::string(prefix);
  }

  void
  namespace_resolver::add_root_declaration(std::string_view uri) {
    if (std::find(root_decls_.begin(), root_decls_.end(), uri) ==
        root_decls_.end()) {
      root_decls_.emplace_back(uri);
    }
  }

  void
  namespace_resolver::reset() {
    context_.reset();
    resolved_.clear();
    prefix_counter_ = 0;
  }

} // namespace xw
