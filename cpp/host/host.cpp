#include "host/host.hpp"

#include <kj/debug.h>

#include "util/error.hpp"

namespace host {
namespace {
void CheckAlive(bool destroyed) {
  if (destroyed) {
    BROKER_THROW(INFRASTRUCTURE, "The sandbox was destroyed");
  }
}
}  // namespace

kj::Promise<void> HostedSandbox::execute(ExecuteContext context) {
  CheckAlive(destroyed_);
  std::string command = context.getParams().getCommand();
  return instance_->Execute(command).then(
      [context](sandbox::CommandResult result) mutable {
        auto builder = context.getResults().initResult();
        builder.setStdoutText(result.stdout_text);
        builder.setStderrText(result.stderr_text);
        builder.setExitCode(result.exit_code);
      });
}

kj::Promise<void> HostedSandbox::writeFile(WriteFileContext context) {
  CheckAlive(destroyed_);
  auto content = context.getParams().getContent().asChars();
  return instance_->WriteFile(context.getParams().getPath(),
                              std::string(content.begin(), content.size()));
}

kj::Promise<void> HostedSandbox::interrupt(InterruptContext context) {
  CheckAlive(destroyed_);
  KJ_LOG(INFO, "Interrupting sandbox", instance_->Id());
  return instance_->Interrupt();
}

kj::Promise<void> HostedSandbox::reset(ResetContext context) {
  CheckAlive(destroyed_);
  return instance_->Reset();
}

kj::Promise<void> HostedSandbox::destroy(DestroyContext context) {
  if (destroyed_) return kj::READY_NOW;
  destroyed_ = true;
  KJ_LOG(INFO, "Destroying sandbox", instance_->Id());
  return instance_->Destroy();
}

kj::Promise<void> Host::create(CreateContext context) {
  std::string language = context.getParams().getLanguage();
  return provider_.Create(language).then(
      [context, language](kj::Own<sandbox::Instance> instance) mutable {
        KJ_LOG(INFO, "Created sandbox", instance->Id(), language);
        context.getResults().setId(instance->Id());
        context.getResults().setSandbox(
            kj::heap<HostedSandbox>(kj::mv(instance)));
      });
}

}  // namespace host
