#ifndef SANDBOX_REMOTE_PROVIDER_HPP
#define SANDBOX_REMOTE_PROVIDER_HPP

#include <string>

#include "capnp/sandbox_host.capnp.h"
#include "sandbox/provider.hpp"

namespace sandbox {

// Client side of a sandbox living in a `host` process.
class RemoteInstance : public Instance {
 public:
  RemoteInstance(capnproto::Sandbox::Client sandbox, std::string id)
      : sandbox_(sandbox), id_(std::move(id)) {}

  const std::string& Id() const override { return id_; }
  kj::Promise<CommandResult> Execute(const std::string& command) override;
  kj::Promise<void> WriteFile(const std::string& path,
                              const std::string& content) override;
  kj::Promise<void> Interrupt() override;
  kj::Promise<void> Reset() override;
  kj::Promise<void> Destroy() override;

 private:
  capnproto::Sandbox::Client sandbox_;
  std::string id_;
};

class RemoteProvider : public Provider {
 public:
  explicit RemoteProvider(capnproto::SandboxHost::Client host) : host_(host) {}

  kj::Promise<kj::Own<Instance>> Create(const std::string& language) override;

 private:
  capnproto::SandboxHost::Client host_;
};

}  // namespace sandbox

#endif
