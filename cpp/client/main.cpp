#include "client/main.hpp"

#include <capnp/ez-rpc.h>
#include <kj/debug.h>
#include <cstdlib>
#include <iostream>

#include "capnp/broker.capnp.h"
#include "client/exit_codes.hpp"
#include "client/source.hpp"
#include "util/error.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace client {
namespace {

// Runs call against the broker, exiting with the status of the error if the
// broker rejects it.
template <typename Func>
void WithBroker(Func&& call) {
  auto result = kj::runCatchingExceptions([&call]() {
    capnp::EzRpcClient client(Flags::server, Flags::port);
    call(client.getMain<capnproto::Broker>(), client.getWaitScope());
  });
  KJ_IF_MAYBE(exc, result) {
    util::ErrorKind kind = util::ClassifyError(*exc);
    std::cerr << util::ErrorKindName(kind) << ": " << util::ErrorMessage(*exc)
              << std::endl;
    std::exit(ExitCodeForError(kind));
  }
}

language::Failure FailureOf(capnproto::Outcome::Reader outcome) {
  switch (outcome.getFailure().which()) {
    case capnproto::Outcome::Failure::TIMEOUT:
      return language::Failure::TIMEOUT;
    case capnproto::Outcome::Failure::ADAPTER_ERROR:
      return language::Failure::ADAPTER_ERROR;
    default:
      return language::Failure::NONE;
  }
}

}  // namespace

kj::MainBuilder::Validity Main::Run() {
  if (language_.empty()) return "You need to specify a language!";
  if (!ReadsFromInput(source_path_) && !util::File::Exists(source_path_)) {
    return "The source file does not exist!";
  }
  std::string source = ReadSource(source_path_, std::cin);
  int exit_code = 0;
  WithBroker([&](capnproto::Broker::Client broker, kj::WaitScope& ws) {
    auto req = broker.runCodeRequest();
    auto request = req.initRequest();
    request.setLanguage(language_);
    request.setSource(source);
    request.setTimeoutSeconds(timeout_);
    request.setSessionId(session_id_);
    request.setPrincipal(principal_);
    auto files = request.initFiles(files_.size());
    for (size_t i = 0; i < files_.size(); i++) {
      std::string content = util::File::ReadAll(files_[i].first);
      files[i].setPath(files_[i].second);
      files[i].setContent(kj::arrayPtr(
          reinterpret_cast<const kj::byte*>(content.data()),  // NOLINT
          content.size()));
    }
    auto res = req.send().wait(ws);
    auto outcome = res.getOutcome();
    std::cout << outcome.getOutput().cStr() << std::flush;
    std::cerr << outcome.getError().cStr();
    if (outcome.getFailure().isTimeout()) {
      std::cerr << "Time limit exceeded" << std::endl;
    } else if (outcome.getFailure().isAdapterError()) {
      std::cerr << "Execution failed: "
                << outcome.getFailure().getAdapterError().cStr() << std::endl;
    }
    exit_code = ExitCodeForOutcome(FailureOf(outcome), outcome.getExitCode());
  });
  std::exit(exit_code);
}

kj::MainBuilder::Validity Main::OpenSession() {
  if (language_.empty()) return "You need to specify a language!";
  WithBroker([this](capnproto::Broker::Client broker, kj::WaitScope& ws) {
    auto req = broker.openSessionRequest();
    req.setLanguage(language_);
    req.setPrincipal(principal_);
    auto res = req.send().wait(ws);
    std::cout << res.getSessionId().cStr() << std::endl;
  });
  return true;
}

kj::MainBuilder::Validity Main::CloseSession() {
  if (session_id_.empty()) return "You need to specify a session!";
  WithBroker([this](capnproto::Broker::Client broker, kj::WaitScope& ws) {
    auto req = broker.closeSessionRequest();
    req.setSessionId(session_id_);
    req.send().wait(ws);
  });
  return true;
}

kj::MainBuilder::Validity Main::ListSessions() {
  WithBroker([this](capnproto::Broker::Client broker, kj::WaitScope& ws) {
    auto req = broker.listSessionsRequest();
    req.setPrincipal(principal_);
    auto res = req.send().wait(ws);
    for (auto session : res.getSessions()) {
      std::cout << session.getSessionId().cStr() << "\t"
                << session.getLanguage().cStr() << "\t"
                << session.getPrincipal().cStr() << "\t"
                << session.getCreatedAt() << std::endl;
    }
  });
  return true;
}

kj::MainBuilder::Validity Main::Stats() {
  WithBroker([](capnproto::Broker::Client broker, kj::WaitScope& ws) {
    auto res = broker.statsRequest().send().wait(ws);
    auto stats = res.getStats();
    std::cout << "capacity: " << stats.getCapacity() << std::endl;
    std::cout << "provisioning: " << stats.getProvisioning() << std::endl;
    std::cout << "discarding: " << stats.getDiscarding() << std::endl;
    std::cout << "draining: " << (stats.getDraining() ? "yes" : "no")
              << std::endl;
    for (auto language : stats.getLanguages()) {
      std::cout << language.getLanguage().cStr()
                << ": idle=" << language.getIdle()
                << " ephemeral=" << language.getEphemeral()
                << " session=" << language.getSession() << std::endl;
    }
  });
  return true;
}

kj::MainFunc Main::getRunMain() {
  return kj::MainBuilder(context, util::version, "Runs a program")
      .addOptionWithArg({'l', "language"}, util::setString(language_),
                        "<LANG>", "Language of the program")
      .addOptionWithArg({'t', "timeout"}, util::setUint(timeout_),
                        "<SECONDS>", "Time limit, 0 for the broker default")
      .addOptionWithArg({'s', "session"}, util::setString(session_id_),
                        "<ID>", "Run inside an existing session")
      .addOptionWithArg({'u', "principal"}, util::setString(principal_),
                        "<NAME>", "Owner of the session")
      .addOptionWithArg(
          {'f', "file"},
          [this](kj::StringPtr arg) -> kj::MainBuilder::Validity {
            std::string arg_str = arg;
            size_t eq = arg_str.find('=');
            if (eq == std::string::npos) {
              files_.emplace_back(arg_str, util::File::BaseName(arg_str));
            } else {
              files_.emplace_back(arg_str.substr(0, eq), arg_str.substr(eq + 1));
            }
            if (!util::File::Exists(files_.back().first)) {
              return "The input file does not exist!";
            }
            return true;
          },
          "<LOCAL[=PATH]>", "Copy a file in the sandbox before running")
      .expectOptionalArg("<SOURCE>", util::setString(source_path_))
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}

kj::MainFunc Main::getOpenSessionMain() {
  return kj::MainBuilder(context, util::version,
                         "Opens a session and prints its id")
      .addOptionWithArg({'l', "language"}, util::setString(language_),
                        "<LANG>", "Language of the session")
      .addOptionWithArg({'u', "principal"}, util::setString(principal_),
                        "<NAME>", "Owner of the session")
      .callAfterParsing(KJ_BIND_METHOD(*this, OpenSession))
      .build();
}

kj::MainFunc Main::getCloseSessionMain() {
  return kj::MainBuilder(context, util::version, "Closes a session")
      .expectArg("<ID>", util::setString(session_id_))
      .callAfterParsing(KJ_BIND_METHOD(*this, CloseSession))
      .build();
}

kj::MainFunc Main::getListSessionsMain() {
  return kj::MainBuilder(context, util::version, "Lists the open sessions")
      .addOptionWithArg({'u', "principal"}, util::setString(principal_),
                        "<NAME>", "Only list the sessions of this owner")
      .callAfterParsing(KJ_BIND_METHOD(*this, ListSessions))
      .build();
}

kj::MainFunc Main::getStatsMain() {
  return kj::MainBuilder(context, util::version, "Prints the pool usage")
      .callAfterParsing(KJ_BIND_METHOD(*this, Stats))
      .build();
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Sandbox Broker Client (" + util::version + ")",
                         "Sends requests to a broker")
      .addOptionWithArg({'s', "server"}, util::setString(Flags::server),
                        "<ADDRESS>", "Address of the broker")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port of the broker")
      .addSubCommand("run", KJ_BIND_METHOD(*this, getRunMain),
                     "run a program")
      .addSubCommand("open-session", KJ_BIND_METHOD(*this, getOpenSessionMain),
                     "open a session")
      .addSubCommand("close-session",
                     KJ_BIND_METHOD(*this, getCloseSessionMain),
                     "close a session")
      .addSubCommand("list-sessions",
                     KJ_BIND_METHOD(*this, getListSessionsMain),
                     "list the sessions")
      .addSubCommand("stats", KJ_BIND_METHOD(*this, getStatsMain),
                     "print the pool usage")
      .build();
}
}  // namespace client
