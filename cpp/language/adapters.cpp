#include "language/adapters.hpp"

#include "util/misc.hpp"

namespace language {
namespace {
Outcome FromResult(sandbox::CommandResult result) {
  Outcome outcome;
  outcome.output = std::move(result.stdout_text);
  outcome.error = std::move(result.stderr_text);
  outcome.exit_code = result.exit_code;
  return outcome;
}
}  // namespace

kj::Promise<Outcome> ScriptAdapter::Execute(sandbox::Instance& instance,
                                            const std::string& source) {
  return instance.WriteFile(file_name_, source)
      .then([this, &instance]() {
        return instance.Execute(interpreter_ + " " + file_name_);
      })
      .then([](sandbox::CommandResult result) {
        return FromResult(std::move(result));
      });
}

kj::Promise<Outcome> CAdapter::Execute(sandbox::Instance& instance,
                                       const std::string& source) {
  std::string executable = "program_" + util::RandomHex(4);
  std::string source_file = executable + ".c";
  return instance.WriteFile(source_file, source)
      .then([&instance, executable, source_file]() {
        return instance.Execute("gcc -o " + executable + " " + source_file);
      })
      .then([&instance,
             executable](sandbox::CommandResult compile) -> kj::Promise<Outcome> {
        if (compile.exit_code != 0) {
          Outcome outcome;
          outcome.error = "Compilation error:\n" + compile.stderr_text;
          outcome.exit_code = compile.exit_code;
          return outcome;
        }
        return instance.Execute("./" + executable)
            .then([](sandbox::CommandResult result) {
              return FromResult(std::move(result));
            });
      });
}

}  // namespace language
