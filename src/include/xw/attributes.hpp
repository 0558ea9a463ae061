#pragma once

#include <xw/qname.hpp>

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xw {

  inline constexpr std::string_view cdata_type = "CDATA";

  struct attribute {
    qname name;
    std::string type = std::string(cdata_type);
    std::string value;
    // False for attributes a parser defaulted from a DTD.
    bool specified = true;

    bool
    operator==(const attribute&) const = default;
  };

  class attributes {
    std::vector<attribute> items_;

  public:
    attributes() = default;

    // Name/value pairs: {"a1", "v1", "a2", "v2"}. An odd number of strings
    // throws std::invalid_argument.
    attributes(std::initializer_list<std::string_view> names_and_values);

    attributes&
    add(std::string namespace_uri, std::string local_name,
        std::string qualified_name, std::string type, std::string value,
        bool specified = true);

    attributes&
    add(std::string_view name, std::string_view value);

    attributes&
    add(std::string_view name, int value);

    // Replace the contents with a copy of other.
    void
    set(const attributes& other);

    // Append every attribute of other.
    void
    append(const attributes& other);

    void
    clear() {
      items_.clear();
    }

    std::size_t
    size() const {
      return items_.size();
    }

    bool
    empty() const {
      return items_.empty();
    }

    const attribute&
    operator[](std::size_t index) const {
      return items_[index];
    }

    std::optional<std::size_t>
    index_of(std::string_view namespace_uri, std::string_view local_name) const;

    std::optional<std::size_t>
    index_of(std::string_view qualified_name) const;

    std::optional<std::string_view>
    value(std::string_view namespace_uri, std::string_view local_name) const;

    auto
    begin() const {
      return items_.begin();
    }

    auto
    end() const {
      return items_.end();
    }

    bool
    operator==(const attributes&) const = default;
  };

} // namespace xw
