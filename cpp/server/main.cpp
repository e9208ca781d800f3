#include "server/main.hpp"

#include <capnp/rpc-twoparty.h>
#include <kj/async-io.h>
#include <kj/async-unix.h>
#include <kj/debug.h>
#include <signal.h>

#include "language/registry.hpp"
#include "pool/orchestrator.hpp"
#include "pool/sandbox_pool.hpp"
#include "pool/session_registry.hpp"
#include "sandbox/local_provider.hpp"
#include "sandbox/remote_provider.hpp"
#include "server/server.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  if (Flags::max_pool_size <= 0) {
    return "The pool size must be positive!";
  }
  if (Flags::initial_pool_size < 0 ||
      Flags::initial_pool_size > Flags::max_pool_size) {
    return "The initial pool size must be between 0 and the pool size!";
  }
  if (Flags::default_timeout == 0 ||
      Flags::default_timeout > Flags::max_timeout) {
    return "The default timeout must be between 1 and the maximum timeout!";
  }
  util::LogManager log_manager(context);

  language::Registry registry;
  auto built = kj::runCatchingExceptions([&registry]() {
    registry = language::Registry::Builtin(util::split(Flags::languages, ','));
  });
  KJ_IF_MAYBE(exc, built) { return kj::str(exc->getDescription()); }
  if (registry.Languages().empty()) {
    return "You need to enable at least one language!";
  }

  // Signals must be captured before the event loop is created.
  kj::UnixEventPort::captureSignal(SIGINT);
  kj::UnixEventPort::captureSignal(SIGTERM);
  auto io = kj::setupAsyncIo();
  auto& network = io.provider->getNetwork();

  kj::Own<kj::AsyncIoStream> host_connection;
  kj::Own<capnp::TwoPartyClient> host_client;
  kj::Own<sandbox::Provider> provider;
  if (Flags::host.empty()) {
    KJ_LOG(INFO, "Creating local sandboxes in", Flags::temp_directory);
    provider = kj::heap<sandbox::LocalProvider>(
        *io.lowLevelProvider, Flags::temp_directory, Flags::keep_sandboxes);
  } else {
    KJ_LOG(INFO, "Connecting to sandbox host", Flags::host, Flags::host_port);
    host_connection = network.parseAddress(Flags::host, Flags::host_port)
                          .then([](kj::Own<kj::NetworkAddress> address) {
                            return address->connect();
                          })
                          .wait(io.waitScope);
    host_client = kj::heap<capnp::TwoPartyClient>(*host_connection);
    provider = kj::heap<sandbox::RemoteProvider>(
        host_client->bootstrap().castAs<capnproto::SandboxHost>());
  }

  pool::PoolOptions pool_options;
  pool_options.capacity = Flags::max_pool_size;
  pool_options.languages = registry.Languages();
  pool_options.reset_after_use = Flags::reset_after_use;
  pool::SandboxPool pool(*provider, pool_options);
  pool::SessionRegistry sessions(&pool);
  pool::OrchestratorOptions options;
  options.default_timeout = Flags::default_timeout;
  options.max_timeout = Flags::max_timeout;
  pool::Orchestrator orchestrator(registry, &pool, &sessions,
                                  io.provider->getTimer(), options);

  pool.Warm(Flags::initial_pool_size).wait(io.waitScope);
  KJ_LOG(INFO, "Pool warmed", pool.Stats().Total());

  capnp::TwoPartyServer server(kj::heap<Server>(&orchestrator));
  auto listener = network.parseAddress(Flags::listen_address, Flags::port)
                      .wait(io.waitScope)
                      ->listen();
  KJ_LOG(INFO, "Listening", Flags::listen_address, listener->getPort());

  auto signal = io.unixEventPort.onSignal(SIGINT)
                    .exclusiveJoin(io.unixEventPort.onSignal(SIGTERM))
                    .then([](siginfo_t info) {
                      KJ_LOG(INFO, "Received signal", info.si_signo);
                    });
  server.listen(*listener).exclusiveJoin(kj::mv(signal)).wait(io.waitScope);

  orchestrator.Shutdown().wait(io.waitScope);
  KJ_LOG(INFO, "Every sandbox destroyed");
  return true;
}

kj::MainFunc Main::getMain() {
  return kj::MainBuilder(context,
                         "Sandbox Broker Server (" + util::version + ")",
                         "Runs code in pooled sandboxes on behalf of clients")
      .addOptionWithArg({'L', "logfile"}, util::setString(Flags::log_file),
                        "<LOGFILE>", "Path where the log file should be stored")
      .addOption({'v', "verbose"}, util::setBool(Flags::verbose),
                 "Log more, with stack traces")
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({'H', "host"}, util::setString(Flags::host),
                        "<ADDRESS>",
                        "Sandbox host to use instead of local sandboxes")
      .addOptionWithArg({"host-port"}, util::setInt(Flags::host_port),
                        "<PORT>", "Port of the sandbox host")
      .addOptionWithArg({'T', "temp-dir"},
                        util::setString(Flags::temp_directory), "<DIR>",
                        "Path where the local sandboxes should be created")
      .addOption({'k', "keep-sandboxes"}, util::setBool(Flags::keep_sandboxes),
                 "Keep the local sandbox directories after destruction")
      .addOptionWithArg({"languages"}, util::setString(Flags::languages),
                        "<LIST>", "Comma separated list of enabled languages")
      .addOptionWithArg({'i', "initial-pool-size"},
                        util::setInt(Flags::initial_pool_size), "<N>",
                        "Number of sandboxes created at startup")
      .addOptionWithArg({'n', "max-pool-size"},
                        util::setInt(Flags::max_pool_size), "<N>",
                        "Maximum number of sandboxes")
      .addOptionWithArg({'t', "default-timeout"},
                        util::setUint(Flags::default_timeout), "<SECONDS>",
                        "Timeout of the runs that do not ask for one")
      .addOptionWithArg({"max-timeout"}, util::setUint(Flags::max_timeout),
                        "<SECONDS>", "Upper bound of the requested timeouts")
      .addOption({"reset-after-use"}, util::setBool(Flags::reset_after_use),
                 "Reset the one-shot sandboxes after every run")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run))
      .build();
}
}  // namespace server
