#ifndef LANGUAGE_ADAPTERS_HPP
#define LANGUAGE_ADAPTERS_HPP

#include <string>

#include "language/adapter.hpp"

namespace language {

// Writes the source to file_name and runs `interpreter file_name`.
class ScriptAdapter : public Adapter {
 public:
  ScriptAdapter(std::string file_name, std::string interpreter)
      : file_name_(std::move(file_name)), interpreter_(std::move(interpreter)) {}

  kj::Promise<Outcome> Execute(sandbox::Instance& instance,
                               const std::string& source) override;

 private:
  std::string file_name_;
  std::string interpreter_;
};

// Compiles the source with gcc under a unique name and runs the binary. A
// failed compilation returns the compiler's exit code and its diagnostics.
class CAdapter : public Adapter {
 public:
  kj::Promise<Outcome> Execute(sandbox::Instance& instance,
                               const std::string& source) override;
};

}  // namespace language

#endif
