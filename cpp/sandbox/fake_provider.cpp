#include "sandbox/fake_provider.hpp"

#include <kj/debug.h>

#include "util/error.hpp"

namespace sandbox {
namespace {

// Keeps the running and cancelled counters of an Execute call.
class RunningGuard {
 public:
  explicit RunningGuard(std::shared_ptr<FakeProvider::State> state)
      : state_(std::move(state)) {
    state_->running++;
  }
  ~RunningGuard() {
    state_->running--;
    if (!done_) state_->cancelled++;
  }
  KJ_DISALLOW_COPY(RunningGuard);
  void Done() { done_ = true; }

 private:
  std::shared_ptr<FakeProvider::State> state_;
  bool done_ = false;
};

}  // namespace

FakeProvider::FakeProvider(kj::Timer& timer) : timer_(timer) {
  state_->handler = DefaultHandler;
}

kj::Promise<kj::Own<Instance>> FakeProvider::Create(
    const std::string& language) {
  auto state = state_;
  return timer_.afterDelay(state_->create_delay)
      .then([this, state, language]() -> kj::Own<Instance> {
        if (state->fail_create) {
          BROKER_THROW(INFRASTRUCTURE, "quota exceeded");
        }
        return kj::heap<FakeInstance>(timer_, state, language);
      });
}

CommandResult FakeProvider::DefaultHandler(FakeInstance& instance,
                                           const std::string& command) {
  CommandResult result;
  if (command == "ls") {
    for (const auto& file : instance.Files()) {
      result.stdout_text += file.first + "\n";
    }
  } else if (command.compare(0, 4, "cat ") == 0) {
    auto it = instance.Files().find(command.substr(4));
    if (it == instance.Files().end()) {
      result.stderr_text = "cat: " + command.substr(4) + ": No such file\n";
      result.exit_code = 1;
    } else {
      result.stdout_text = it->second;
    }
  }
  return result;
}

FakeInstance::FakeInstance(kj::Timer& timer,
                           std::shared_ptr<FakeProvider::State> state,
                           std::string language)
    : timer_(timer), state_(std::move(state)), language_(std::move(language)) {
  id_ = "fake-" + std::to_string(state_->next_id++);
  state_->created++;
}

FakeInstance::~FakeInstance() {
  if (!destroyed_) state_->destroyed++;
}

kj::Promise<CommandResult> FakeInstance::Execute(const std::string& command) {
  if (destroyed_) return BROKER_ERROR(INFRASTRUCTURE, "sandbox destroyed");
  auto guard = kj::heap<RunningGuard>(state_);
  auto guard_ptr = guard.get();
  return timer_.afterDelay(state_->execute_delay)
      .then([this, command, guard_ptr]() {
        guard_ptr->Done();
        if (state_->fail_execute) {
          BROKER_THROW(INFRASTRUCTURE, "command channel lost");
        }
        return state_->handler(*this, command);
      })
      .attach(kj::mv(guard));
}

kj::Promise<void> FakeInstance::WriteFile(const std::string& path,
                                          const std::string& content) {
  std::string error_msg;
  if (!IsValidPath(path, &error_msg)) {
    return BROKER_ERROR(INVALID_REQUEST, error_msg);
  }
  if (destroyed_) return BROKER_ERROR(INFRASTRUCTURE, "sandbox destroyed");
  files_[path] = content;
  return kj::READY_NOW;
}

kj::Promise<void> FakeInstance::Interrupt() {
  if (destroyed_) return BROKER_ERROR(INFRASTRUCTURE, "sandbox destroyed");
  state_->interrupts++;
  if (state_->fail_interrupt) {
    return BROKER_ERROR(INFRASTRUCTURE, "kill failed");
  }
  return kj::READY_NOW;
}

kj::Promise<void> FakeInstance::Reset() {
  return timer_.afterDelay(state_->reset_delay).then([this]() {
    state_->resets++;
    if (state_->fail_reset) BROKER_THROW(INFRASTRUCTURE, "reset failed");
    files_.clear();
  });
}

kj::Promise<void> FakeInstance::Destroy() {
  if (!destroyed_) {
    destroyed_ = true;
    state_->destroyed++;
  }
  return kj::READY_NOW;
}

}  // namespace sandbox
