#include "language/registry.hpp"

#include <kj/debug.h>
#include <algorithm>

#include "language/adapters.hpp"
#include "util/error.hpp"
#include "util/misc.hpp"

namespace language {

void Registry::Register(std::string name, std::vector<std::string> aliases,
                        std::unique_ptr<Adapter> adapter) {
  auto capability = std::make_unique<Capability>();
  capability->name = util::lower(std::move(name));
  for (auto& alias : aliases) capability->aliases.push_back(util::lower(alias));
  capability->adapter = std::move(adapter);
  KJ_REQUIRE(!by_name_.count(capability->name), capability->name,
             "Language already registered");
  for (const auto& alias : capability->aliases) {
    KJ_REQUIRE(!by_name_.count(alias), alias, "Alias already registered");
  }
  by_name_[capability->name] = capability.get();
  for (const auto& alias : capability->aliases) {
    by_name_[alias] = capability.get();
  }
  capabilities_.push_back(std::move(capability));
}

const Capability& Registry::Resolve(const std::string& language) const {
  auto it = by_name_.find(util::lower(language));
  if (it == by_name_.end()) {
    BROKER_THROW(UNSUPPORTED_LANGUAGE, language);
  }
  return *it->second;
}

std::vector<std::string> Registry::Languages() const {
  std::vector<std::string> names;
  for (const auto& capability : capabilities_) {
    names.push_back(capability->name);
  }
  return names;
}

Registry Registry::Builtin(const std::vector<std::string>& enabled) {
  Registry all;
  all.Register("python", {"python3", "py"},
               std::make_unique<ScriptAdapter>("main.py", "python3"));
  all.Register("node", {"javascript", "js"},
               std::make_unique<ScriptAdapter>("script.js", "node"));
  all.Register("bash", {"shell", "sh"},
               std::make_unique<ScriptAdapter>("script.sh", "bash"));
  all.Register("c", {"gcc"}, std::make_unique<CAdapter>());
  if (enabled.empty()) return all;

  std::vector<std::string> wanted;
  for (const auto& language : enabled) {
    wanted.push_back(all.Resolve(language).name);
  }
  Registry restricted;
  for (auto& capability : all.capabilities_) {
    if (std::find(wanted.begin(), wanted.end(), capability->name) ==
        wanted.end()) {
      continue;
    }
    restricted.Register(capability->name, capability->aliases,
                        std::move(capability->adapter));
  }
  return restricted;
}

}  // namespace language
