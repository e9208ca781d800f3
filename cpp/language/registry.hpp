#ifndef LANGUAGE_REGISTRY_HPP
#define LANGUAGE_REGISTRY_HPP

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "language/adapter.hpp"

namespace language {

struct Capability {
  std::string name;
  std::vector<std::string> aliases;
  std::unique_ptr<Adapter> adapter;
};

// Maps language identifiers to their capability. Lookups are case-insensitive
// and accept both canonical names and aliases.
class Registry {
 public:
  Registry() = default;
  Registry(Registry&&) = default;
  Registry& operator=(Registry&&) = default;

  // Fails if the name or one of the aliases is already taken.
  void Register(std::string name, std::vector<std::string> aliases,
                std::unique_ptr<Adapter> adapter);

  // Raises UNSUPPORTED_LANGUAGE for unknown identifiers.
  const Capability& Resolve(const std::string& language) const;

  // Canonical names, in registration order.
  std::vector<std::string> Languages() const;

  // Registry with the built-in languages. When enabled is not empty, only the
  // languages it names (canonical names or aliases) are registered.
  static Registry Builtin(const std::vector<std::string>& enabled = {});

 private:
  std::vector<std::unique_ptr<Capability>> capabilities_;
  std::unordered_map<std::string, Capability*> by_name_;
};

}  // namespace language

#endif
