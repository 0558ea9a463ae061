#include <xw/namespace_context.hpp>

namespace xw {

  namespace_context::namespace_context() {
    reset();
  }

  void
  namespace_context::push() {
    frames_.emplace_back();
  }

  void
  namespace_context::pop() {
    if (frames_.size() > 1) { frames_.pop_back(); }
  }

  void
  namespace_context::reset() {
    frames_.clear();
    frames_.emplace_back();
    frames_.back().emplace("xml", std::string(xml_namespace_uri));
  }

  void
  namespace_context::declare(std::string_view prefix, std::string_view uri) {
    auto& frame = frames_.back();
    auto it = frame.find(prefix);
    if (it != frame.end()) {
      it->second = std::string(uri);
    } else {
      frame.emplace(std::string(prefix), std::string(uri));
    }
  }

  std::optional<std::string_view>
  namespace_context::uri_for(std::string_view prefix) const {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
      auto it = frame->find(prefix);
      if (it != frame->end()) { return std::string_view(it->second); }
    }
    return std::nullopt;
  }

  std::optional<std::string_view>
  namespace_context::declared_uri(std::string_view prefix) const {
    const auto& frame = frames_.back();
    auto it = frame.find(prefix);
    if (it == frame.end()) { return std::nullopt; }
    return std::string_view(it->second);
  }

  std::optional<std::string_view>
  namespace_context::prefix_for(std::string_view uri) const {
    for (auto frame = frames_.rbegin(); frame != frames_.rend(); ++frame) {
      for (const auto& [prefix, bound] : *frame) {
        if (prefix.empty() || bound != uri) { continue; }
        if (uri_for(prefix) == uri) { return std::string_view(prefix); }
      }
    }
    return std::nullopt;
  }

  std::vector<std::string>
  namespace_context::declared_prefixes() const {
    std::vector<std::string> result;
    if (frames_.size() < 2) { return result; }
    result.reserve(frames_.back().size());
    for (const auto& [prefix, uri] : frames_.back()) {
      result.push_back(prefix);
    }
    return result;
  }

} // namespace xw
