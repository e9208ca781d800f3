#include "host/main.hpp"

#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>
#include <signal.h>

#include "host/host.hpp"
#include "sandbox/local_provider.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"
#include "util/which.hpp"

namespace host {
kj::MainBuilder::Validity Main::Run() {
  util::LogManager log_manager(context);
  for (const char* tool : {"python3", "node", "bash", "gcc"}) {
    if (util::which(tool).empty()) {
      KJ_LOG(WARNING, "Not found in $PATH, its language will not work", tool);
    }
  }

  kj::UnixEventPort::captureSignal(SIGINT);
  kj::UnixEventPort::captureSignal(SIGTERM);
  auto io = kj::setupAsyncIo();

  sandbox::LocalProvider provider(*io.lowLevelProvider, Flags::temp_directory,
                                  Flags::keep_sandboxes);
  capnp::TwoPartyServer server(kj::heap<Host>(&provider));
  auto listener = io.provider->getNetwork()
                      .parseAddress(Flags::listen_address, Flags::host_port)
                      .wait(io.waitScope)
                      ->listen();
  KJ_LOG(INFO, "Listening", Flags::listen_address, listener->getPort());

  auto signal = io.unixEventPort.onSignal(SIGINT)
                    .exclusiveJoin(io.unixEventPort.onSignal(SIGTERM))
                    .then([](siginfo_t info) {
                      KJ_LOG(INFO, "Received signal", info.si_signo);
                    });
  server.listen(*listener).exclusiveJoin(kj::mv(signal)).wait(io.waitScope);
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context, "Sandbox Host (" + util::version + ")",
                         "Creates sandboxes on behalf of a remote broker")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log more, with stack traces")
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::host_port),
                        "<PORT>", "Port to listen on")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the sandboxes should be created")
      .addOption({'k', "keep-sandboxes"}, util::setBool(Flags::keep_sandboxes),
                 "Keep the sandbox directories after destruction")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace host
