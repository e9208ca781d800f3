#ifndef SANDBOX_FAKE_PROVIDER_HPP
#define SANDBOX_FAKE_PROVIDER_HPP

#include <kj/time.h>
#include <kj/timer.h>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "sandbox/provider.hpp"

namespace sandbox {

class FakeInstance;

// In-memory provider used by the tests of the layers above the provider. Every
// sandbox is a map of files; commands are answered by a handler that tests can
// replace, after a configurable delay.
class FakeProvider : public Provider {
 public:
  using Handler =
      std::function<CommandResult(FakeInstance&, const std::string&)>;

  // Shared with the instances, which may outlive the provider.
  struct State {
    Handler handler;
    kj::Duration create_delay = 0 * kj::MILLISECONDS;
    kj::Duration execute_delay = 0 * kj::MILLISECONDS;
    kj::Duration reset_delay = 0 * kj::MILLISECONDS;
    bool fail_create = false;
    bool fail_execute = false;
    bool fail_reset = false;
    bool fail_interrupt = false;
    size_t created = 0;
    size_t destroyed = 0;
    size_t resets = 0;
    size_t running = 0;
    size_t cancelled = 0;
    size_t interrupts = 0;
    size_t next_id = 0;
  };

  explicit FakeProvider(kj::Timer& timer);

  kj::Promise<kj::Own<Instance>> Create(const std::string& language) override;

  State& state() { return *state_; }

  // Sandboxes created and not destroyed yet.
  size_t Alive() const { return state_->created - state_->destroyed; }

  // Understands "ls" (sorted file names, one per line) and "cat <file>";
  // every other command succeeds without output.
  static CommandResult DefaultHandler(FakeInstance& instance,
                                      const std::string& command);

 private:
  kj::Timer& timer_;
  std::shared_ptr<State> state_ = std::make_shared<State>();
};

class FakeInstance : public Instance {
 public:
  FakeInstance(kj::Timer& timer, std::shared_ptr<FakeProvider::State> state,
               std::string language);
  ~FakeInstance();
  KJ_DISALLOW_COPY(FakeInstance);

  const std::string& Id() const override { return id_; }
  kj::Promise<CommandResult> Execute(const std::string& command) override;
  kj::Promise<void> WriteFile(const std::string& path,
                              const std::string& content) override;
  kj::Promise<void> Interrupt() override;
  kj::Promise<void> Reset() override;
  kj::Promise<void> Destroy() override;

  const std::string& Language() const { return language_; }
  std::map<std::string, std::string>& Files() { return files_; }

 private:
  kj::Timer& timer_;
  std::shared_ptr<FakeProvider::State> state_;
  std::string language_;
  std::string id_;
  std::map<std::string, std::string> files_;
  bool destroyed_ = false;
};

}  // namespace sandbox

#endif
