#ifndef HOST_HOST_HPP
#define HOST_HOST_HPP

#include "capnp/sandbox_host.capnp.h"
#include "sandbox/provider.hpp"

namespace host {

// Exports one sandbox of the host. The sandbox is destroyed when the last
// client reference goes away, if destroy was never called.
class HostedSandbox : public capnproto::Sandbox::Server {
 public:
  explicit HostedSandbox(kj::Own<sandbox::Instance> instance)
      : instance_(kj::mv(instance)) {}

  kj::Promise<void> execute(ExecuteContext context) override;
  kj::Promise<void> writeFile(WriteFileContext context) override;
  kj::Promise<void> interrupt(InterruptContext context) override;
  kj::Promise<void> reset(ResetContext context) override;
  kj::Promise<void> destroy(DestroyContext context) override;

 private:
  kj::Own<sandbox::Instance> instance_;
  bool destroyed_ = false;
};

// Lends the sandboxes of a provider to a remote broker.
class Host : public capnproto::SandboxHost::Server {
 public:
  explicit Host(sandbox::Provider* provider) : provider_(*provider) {}

  kj::Promise<void> create(CreateContext context) override;

 private:
  sandbox::Provider& provider_;
};

}  // namespace host

#endif
