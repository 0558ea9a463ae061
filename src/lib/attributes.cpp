#include <xw/attributes.hpp>

#include <stdexcept>
#include <string>

namespace xw {

  attributes::attributes(
      std::initializer_list<std::string_view> names_and_values) {
    if (names_and_values.size() % 2 != 0) {
      throw std::invalid_argument(
          "attributes: an even number of arguments must be specified "
          "(name, value)");
    }

    items_.reserve(names_and_values.size() / 2);
    for (auto it = names_and_values.begin(); it != names_and_values.end();
         it += 2) {
      add(*it, *(it + 1));
    }
  }

  attributes&
  attributes::add(std::string namespace_uri, std::string local_name,
                  std::string qualified_name, std::string type,
                  std::string value, bool specified) {
    items_.push_back({qname{std::move(namespace_uri), std::move(local_name),
                            std::move(qualified_name)},
                      std::move(type), std::move(value), specified});
    return *this;
  }

  attributes&
  attributes::add(std::string_view name, std::string_view value) {
    return add("", "", std::string(name), std::string(cdata_type),
               std::string(value));
  }

  attributes&
  attributes::add(std::string_view name, int value) {
    return add(name, std::to_string(value));
  }

  void
  attributes::set(const attributes& other) {
    if (this != &other) { items_ = other.items_; }
  }

  void
  attributes::append(const attributes& other) {
    if (this == &other) {
      auto copy = other.items_;
      items_.insert(items_.end(), copy.begin(), copy.end());
      return;
    }
    items_.insert(items_.end(), other.items_.begin(), other.items_.end());
  }

  std::optional<std::size_t>
  attributes::index_of(std::string_view namespace_uri,
                       std::string_view local_name) const {
    for (std::size_t i = 0; i < items_.size(); ++i) {
      const auto& name = items_[i].name;
      if (name.namespace_uri() == namespace_uri &&
          name.output_local_name() == local_name) {
        return i;
      }
    }
    return std::nullopt;
  }

  std::optional<std::size_t>
  attributes::index_of(std::string_view qualified_name) const {
    for (std::size_t i = 0; i < items_.size(); ++i) {
      const auto& name = items_[i].name;
      if (name.qualified_name() == qualified_name) { return i; }
      if (name.qualified_name().empty() &&
          name.local_name() == qualified_name) {
        return i;
      }
    }
    return std::nullopt;
  }

  std::optional<std::string_view>
  attributes::value(std::string_view namespace_uri,
                    std::string_view local_name) const {
    auto index = index_of(namespace_uri, local_name);
    if (!index) { return std::nullopt; }
    return items_[*index].value;
  }

} // namespace xw
