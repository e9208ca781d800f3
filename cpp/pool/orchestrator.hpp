#ifndef POOL_ORCHESTRATOR_HPP
#define POOL_ORCHESTRATOR_HPP

#include <kj/async.h>
#include <kj/timer.h>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "language/adapter.hpp"
#include "language/registry.hpp"
#include "pool/sandbox_pool.hpp"
#include "pool/session_registry.hpp"

namespace pool {

struct RunRequest {
  std::string language;
  std::string source;
  // 0 selects the default timeout.
  uint32_t timeout_seconds = 0;
  // Empty for a one-shot run.
  std::string session_id;
  // When set, must own the session.
  std::string principal;
  // (path, content) pairs written in the sandbox before the source runs.
  std::vector<std::pair<std::string, std::string>> files;
};

struct OrchestratorOptions {
  uint32_t default_timeout = 30;
  uint32_t max_timeout = 300;
};

// Entry point of every request: finds a sandbox, runs the adapter under a
// deadline and gives the sandbox back exactly once, whatever happened.
class Orchestrator {
 public:
  Orchestrator(const language::Registry& registry, SandboxPool* pool,
               SessionRegistry* sessions, kj::Timer& timer,
               OrchestratorOptions options);
  KJ_DISALLOW_COPY(Orchestrator);

  // Timeouts are reported in the outcome. The promise is rejected with the
  // broker error kinds: UNSUPPORTED_LANGUAGE, INVALID_REQUEST,
  // SESSION_NOT_FOUND, SESSION_BUSY, CAPACITY_EXHAUSTED, PROVISION_FAILED,
  // INFRASTRUCTURE and SHUTTING_DOWN.
  kj::Promise<language::Outcome> Run(RunRequest request);

  kj::Promise<const Session*> OpenSession(const std::string& language,
                                          const std::string& principal);
  void CloseSession(const std::string& session_id,
                    const std::string& principal = "");
  std::vector<Session> ListSessions(const std::string& principal) const {
    return sessions_.List(principal);
  }
  PoolStats Stats() const { return pool_.Stats(); }

  // Refuses new work, cancels the runs in progress, ends every session and
  // drains the pool.
  kj::Promise<void> Shutdown();

  // Effective timeout for a requested one.
  uint32_t TimeoutSeconds(uint32_t requested) const;

 private:
  class RunScope;

  kj::Promise<language::Outcome> RunIn(kj::Own<RunScope> scope,
                                       const language::Capability& capability,
                                       RunRequest request);

  const language::Registry& registry_;
  SandboxPool& pool_;
  SessionRegistry& sessions_;
  kj::Timer& timer_;
  OrchestratorOptions options_;
  bool shutting_down_ = false;
  kj::Canceler runs_;
};

}  // namespace pool

#endif
