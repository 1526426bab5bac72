#ifndef CORE_CAPABILITY_GATE_HPP
#define CORE_CAPABILITY_GATE_HPP

#include <set>
#include <string>

namespace core {

// The set of operations that submitted code is allowed to use: general purpose
// builtins (iteration, containers, arithmetic, sorting helpers, exception
// types) and a few pure standard modules reachable through a guarded import.
// Everything else (files, network, processes, dynamic code, reflection on the
// interpreter) is absent from the namespace the code runs in.
struct Capabilities {
  std::set<std::string> builtins;
  std::set<std::string> modules;
  // Public attributes of allowed modules, as "module.name", that are left out
  // of the copy of the module given to the code.
  std::set<std::string> hidden_attributes;
  // Attribute names the code may not mention. Names starting with an
  // underscore are always refused, except public_dunders and names made only
  // of underscores.
  std::set<std::string> denied_attributes;
  std::set<std::string> public_dunders;

  bool IsBuiltinAllowed(const std::string& name) const {
    return builtins.count(name) != 0;
  }

  // name may be a dotted module path, only its top-level package is checked.
  bool IsModuleAllowed(const std::string& name) const;

  // Whether the code may use name as an identifier or an attribute.
  bool IsAttributeAllowed(const std::string& name) const;
};

// Returns the allow-list. It is built on the first call and shared afterwards.
const Capabilities& BuildRestrictedEnvironment();

// Builtins that must never be exposed, whatever the allow-list says.
const std::set<std::string>& DeniedBuiltins();

}  // namespace core

#endif
