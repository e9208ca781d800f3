#include "sandbox/remote_provider.hpp"

#include <kj/debug.h>
#include <memory>

namespace sandbox {

kj::Promise<CommandResult> RemoteInstance::Execute(const std::string& command) {
  auto req = sandbox_.executeRequest();
  req.setCommand(command);
  auto finished = std::make_shared<bool>(false);
  // The host keeps running a command whose call was dropped, so an abandoned
  // execution is followed by an interrupt.
  auto interrupt = kj::defer([sandbox = sandbox_, finished]() mutable {
    if (*finished) return;
    sandbox.interruptRequest().send().ignoreResult().detach(
        [](kj::Exception exc) {
          KJ_LOG(WARNING, "Could not interrupt a remote sandbox",
                 exc.getDescription());
        });
  });
  return req.send()
      .then(
          [finished](
              capnp::Response<capnproto::Sandbox::ExecuteResults> res) {
            *finished = true;
            auto result = res.getResult();
            CommandResult ret;
            ret.stdout_text = std::string(result.getStdoutText());
            ret.stderr_text = std::string(result.getStderrText());
            ret.exit_code = result.getExitCode();
            return ret;
          },
          [finished](kj::Exception exc) -> CommandResult {
            *finished = true;
            kj::throwFatalException(AsInfrastructureError(kj::mv(exc)));
          })
      .attach(kj::mv(interrupt));
}

kj::Promise<void> RemoteInstance::Interrupt() {
  return sandbox_.interruptRequest().send().ignoreResult().catch_(
      [](kj::Exception exc) -> kj::Promise<void> {
        return AsInfrastructureError(kj::mv(exc));
      });
}

kj::Promise<void> RemoteInstance::WriteFile(const std::string& path,
                                            const std::string& content) {
  auto req = sandbox_.writeFileRequest();
  req.setPath(path);
  req.setContent(kj::arrayPtr(
      reinterpret_cast<const kj::byte*>(content.data()),  // NOLINT
      content.size()));
  return req.send().ignoreResult().catch_(
      [](kj::Exception exc) -> kj::Promise<void> {
        return AsInfrastructureError(kj::mv(exc));
      });
}

kj::Promise<void> RemoteInstance::Reset() {
  return sandbox_.resetRequest().send().ignoreResult().catch_(
      [](kj::Exception exc) -> kj::Promise<void> {
        return AsInfrastructureError(kj::mv(exc));
      });
}

kj::Promise<void> RemoteInstance::Destroy() {
  return sandbox_.destroyRequest().send().ignoreResult().catch_(
      [](kj::Exception exc) -> kj::Promise<void> {
        return AsInfrastructureError(kj::mv(exc));
      });
}

kj::Promise<kj::Own<Instance>> RemoteProvider::Create(
    const std::string& language) {
  auto req = host_.createRequest();
  req.setLanguage(language);
  return req.send().then(
      [](capnp::Response<capnproto::SandboxHost::CreateResults> res) {
        KJ_LOG(INFO, "Created remote sandbox", res.getId());
        return kj::Own<Instance>(
            kj::heap<RemoteInstance>(res.getSandbox(), std::string(res.getId())));
      },
      [](kj::Exception exc) -> kj::Own<Instance> {
        kj::throwFatalException(AsInfrastructureError(kj::mv(exc)));
      });
}

}  // namespace sandbox
