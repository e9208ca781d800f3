#include "sandbox/local_provider.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <kj/debug.h>

#include "util/error.hpp"

namespace sandbox {
namespace {

// A running command. Destroying it before Wait() was called (for example
// because the Execute promise was cancelled) kills the command.
class Child {
 public:
  Child(pid_t pid, std::shared_ptr<std::unordered_set<pid_t>> running)
      : pid_(pid), running_(std::move(running)) {
    running_->insert(pid_);
  }
  ~Child() {
    if (!reaped_) Wait();
  }
  KJ_DISALLOW_COPY(Child);

  // Kills whatever is left in the process group and reaps the command. Only
  // called once both output pipes are closed, so the command has already
  // terminated unless it closed its outputs on purpose.
  int Wait() {
    kill(-pid_, SIGKILL);
    int status = 0;
    while (waitpid(pid_, &status, 0) == -1 && errno == EINTR) {
    }
    reaped_ = true;
    running_->erase(pid_);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return WEXITSTATUS(status);
  }

 private:
  pid_t pid_;
  std::shared_ptr<std::unordered_set<pid_t>> running_;
  bool reaped_ = false;
};

std::vector<char> Mutable(const std::string& s) {
  return std::vector<char>(s.c_str(), s.c_str() + s.size() + 1);
}

kj::Exception SystemError(const char* op) {
  return BROKER_ERROR(INFRASTRUCTURE, std::string(op) + ": " + strerror(errno));
}

}  // namespace

LocalInstance::LocalInstance(kj::LowLevelAsyncIoProvider& io,
                             util::TempDir dir, bool keep)
    : io_(io), dir_(std::make_unique<util::TempDir>(std::move(dir))) {
  id_ = "local-" + util::File::BaseName(dir_->Path());
  if (keep) dir_->Keep();
}

LocalInstance::~LocalInstance() { KillAll(); }

void LocalInstance::KillAll() {
  for (pid_t pid : *running_) kill(-pid, SIGKILL);
}

kj::Promise<CommandResult> LocalInstance::Execute(const std::string& command) {
  if (!dir_) return BROKER_ERROR(INFRASTRUCTURE, "Sandbox destroyed");
  int out_pipe[2];
  int err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) == -1) return SystemError("pipe");
  if (pipe2(err_pipe, O_CLOEXEC) == -1) {
    kj::Exception exc = SystemError("pipe");
    close(out_pipe[0]);
    close(out_pipe[1]);
    return kj::mv(exc);
  }
  kj::AutoCloseFd out_read(out_pipe[0]), out_write(out_pipe[1]);
  kj::AutoCloseFd err_read(err_pipe[0]), err_write(err_pipe[1]);

  // Everything the child needs is prepared before forking.
  std::vector<char> sh = Mutable("/bin/sh");
  std::vector<char> dash_c = Mutable("-c");
  std::vector<char> cmd = Mutable(command);
  char* args[] = {sh.data(), dash_c.data(), cmd.data(), nullptr};
  const char* path = getenv("PATH");
  std::vector<std::vector<char>> env_storage = {
      Mutable(std::string("PATH=") +
              (path ? path : "/usr/local/bin:/usr/bin:/bin")),
      Mutable("HOME=" + dir_->Path()), Mutable("TMPDIR=" + dir_->Path()),
      Mutable("LANG=C.UTF-8")};
  std::vector<char*> env;
  for (auto& e : env_storage) env.push_back(e.data());
  env.push_back(nullptr);
  std::string workdir = dir_->Path();

  pid_t pid = fork();
  if (pid == -1) return SystemError("fork");
  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_RDONLY);  // NOLINT
    if (devnull == -1 || chdir(workdir.c_str()) == -1) _exit(127);
    dup2(devnull, STDIN_FILENO);
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(err_pipe[1], STDERR_FILENO);
    execve(args[0], args, env.data());
    _exit(127);
  }
  // Also done here, so that the group exists before anyone tries to kill it.
  setpgid(pid, pid);
  out_write = nullptr;
  err_write = nullptr;
  auto child = kj::heap<Child>(pid, running_);

  auto out = io_.wrapInputFd(out_read.release(),
                             kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP);
  auto err = io_.wrapInputFd(err_read.release(),
                             kj::LowLevelAsyncIoProvider::TAKE_OWNERSHIP);
  auto read_out = out->readAllText().attach(kj::mv(out));
  auto read_err = err->readAllText().attach(kj::mv(err));
  auto result = kj::heap<CommandResult>();
  auto result_ptr = result.get();
  auto reads = kj::heapArrayBuilder<kj::Promise<void>>(2);
  reads.add(read_out.then(
      [result_ptr](kj::String s) { result_ptr->stdout_text = s.cStr(); }));
  reads.add(read_err.then(
      [result_ptr](kj::String s) { result_ptr->stderr_text = s.cStr(); }));
  Child* child_ptr = child.get();
  return kj::joinPromises(reads.finish())
      .then([result_ptr, child_ptr]() {
        result_ptr->exit_code = child_ptr->Wait();
        return kj::mv(*result_ptr);
      })
      .attach(kj::mv(result), kj::mv(child));
}

kj::Promise<void> LocalInstance::WriteFile(const std::string& path,
                                           const std::string& content) {
  std::string error_msg;
  if (!IsValidPath(path, &error_msg)) {
    return BROKER_ERROR(INVALID_REQUEST, error_msg);
  }
  if (!dir_) return BROKER_ERROR(INFRASTRUCTURE, "Sandbox destroyed");
  try {
    std::string dest = util::File::JoinPath(dir_->Path(), path);
    util::File::MakeDirs(util::File::BaseDir(dest));
    util::File::WriteAll(dest, content);
  } catch (const std::exception& exc) {
    return BROKER_ERROR(INFRASTRUCTURE, exc.what());
  }
  return kj::READY_NOW;
}

kj::Promise<void> LocalInstance::Interrupt() {
  if (!dir_) return BROKER_ERROR(INFRASTRUCTURE, "Sandbox destroyed");
  KillAll();
  return kj::READY_NOW;
}

kj::Promise<void> LocalInstance::Reset() {
  if (!dir_) return BROKER_ERROR(INFRASTRUCTURE, "Sandbox destroyed");
  KillAll();
  try {
    util::File::ClearDirectory(dir_->Path());
  } catch (const std::exception& exc) {
    return BROKER_ERROR(INFRASTRUCTURE, exc.what());
  }
  return kj::READY_NOW;
}

kj::Promise<void> LocalInstance::Destroy() {
  if (!dir_) return kj::READY_NOW;
  KillAll();
  // The TempDir destructor removes the directory, unless it is kept.
  dir_.reset();
  return kj::READY_NOW;
}

LocalProvider::LocalProvider(kj::LowLevelAsyncIoProvider& io,
                             std::string base_dir, bool keep)
    : io_(io), base_dir_(std::move(base_dir)), keep_(keep) {
  util::File::MakeDirs(base_dir_);
}

kj::Promise<kj::Own<Instance>> LocalProvider::Create(
    const std::string& language) {
  try {
    util::TempDir dir(base_dir_);
    KJ_LOG(INFO, "Created local sandbox", dir.Path(), language);
    return kj::Own<Instance>(
        kj::heap<LocalInstance>(io_, std::move(dir), keep_));
  } catch (const std::exception& exc) {
    return BROKER_ERROR(INFRASTRUCTURE, exc.what());
  }
}

}  // namespace sandbox
