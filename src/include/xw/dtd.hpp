#pragma once

#include <optional>
#include <string>
#include <utility>

namespace xw {

  // -- Declarations written into a DOCTYPE internal subset --------------------

  // An internal entity carries a literal value; an external entity carries an
  // optional public id, a system id and, for unparsed entities, the name of
  // its notation.
  struct entity {
    std::string name;
    std::optional<std::string> value;
    std::optional<std::string> public_id;
    std::optional<std::string> system_id;
    std::optional<std::string> notation_name;

    static entity
    internal(std::string name, std::string value) {
      entity e;
      e.name = std::move(name);
      e.value = std::move(value);
      return e;
    }

    static entity
    external(std::string name, std::optional<std::string> public_id,
             std::string system_id,
             std::optional<std::string> notation_name = std::nullopt) {
      entity e;
      e.name = std::move(name);
      e.public_id = std::move(public_id);
      e.system_id = std::move(system_id);
      e.notation_name = std::move(notation_name);
      return e;
    }

    bool
    is_internal() const {
      return value.has_value();
    }

    bool
    operator==(const entity&) const = default;
  };

  struct notation {
    std::string name;
    std::optional<std::string> public_id;
    std::optional<std::string> system_id;

    bool
    operator==(const notation&) const = default;
  };

} // namespace xw
