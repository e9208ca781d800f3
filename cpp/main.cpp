#include "client/main.hpp"
#include "host/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class SandboxBrokerMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit SandboxBrokerMain(kj::ProcessContext& context)
      : context(context), sm(context), hm(context), cm(context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Sandbox Broker (" + util::version + ")",
                           "Runs untrusted code in pooled sandboxes")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain), "run the broker")
        .addSubCommand("host", KJ_BIND_METHOD(hm, getMain),
                       "run a sandbox host")
        .addSubCommand("client", KJ_BIND_METHOD(cm, getMain),
                       "send requests to a broker")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  host::Main hm;
  client::Main cm;
};

KJ_MAIN(SandboxBrokerMain);
