#ifndef SANDBOX_LOCAL_PROVIDER_HPP
#define SANDBOX_LOCAL_PROVIDER_HPP

#include <kj/async-io.h>
#include <sys/types.h>
#include <memory>
#include <string>
#include <unordered_set>

#include "sandbox/provider.hpp"
#include "util/file.hpp"

namespace sandbox {

// A sandbox backed by a private directory on this machine. Commands run with
// /bin/sh in their own process group, with the directory as working directory
// and $HOME.
class LocalInstance : public Instance {
 public:
  LocalInstance(kj::LowLevelAsyncIoProvider& io, util::TempDir dir,
                bool keep);
  ~LocalInstance();
  KJ_DISALLOW_COPY(LocalInstance);

  const std::string& Id() const override { return id_; }
  kj::Promise<CommandResult> Execute(const std::string& command) override;
  kj::Promise<void> WriteFile(const std::string& path,
                              const std::string& content) override;
  kj::Promise<void> Interrupt() override;
  kj::Promise<void> Reset() override;
  kj::Promise<void> Destroy() override;

  const std::string& Path() const { return dir_->Path(); }

 private:
  void KillAll();

  kj::LowLevelAsyncIoProvider& io_;
  std::unique_ptr<util::TempDir> dir_;
  std::string id_;
  // Process groups of the commands that are still running. Shared with the
  // Execute promises, which may outlive the instance.
  std::shared_ptr<std::unordered_set<pid_t>> running_ =
      std::make_shared<std::unordered_set<pid_t>>();
};

class LocalProvider : public Provider {
 public:
  // Sandboxes are created as subdirectories of base_dir, which is created if
  // needed. With keep set, their directories survive destruction.
  LocalProvider(kj::LowLevelAsyncIoProvider& io, std::string base_dir,
                bool keep = false);

  kj::Promise<kj::Own<Instance>> Create(const std::string& language) override;

 private:
  kj::LowLevelAsyncIoProvider& io_;
  std::string base_dir_;
  bool keep_;
};

}  // namespace sandbox

#endif
