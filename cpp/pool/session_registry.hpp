#ifndef POOL_SESSION_REGISTRY_HPP
#define POOL_SESSION_REGISTRY_HPP

#include <kj/async.h>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "pool/sandbox_pool.hpp"

namespace pool {

struct Session {
  std::string id;
  std::string principal;
  std::string language;
  int64_t created_at = 0;
  Handle* handle = nullptr;
  // A run is using the sandbox.
  bool busy = false;
  // End was called while busy; the sandbox is given back when the run ends.
  bool ending = false;
  // The sandbox failed; it is destroyed instead of reused.
  bool discard = false;
};

// Sessions bind one sandbox to one principal until they are ended
// explicitly. Sessions are never evicted for being idle.
class SessionRegistry {
 public:
  explicit SessionRegistry(SandboxPool* pool) : pool_(*pool) {}
  KJ_DISALLOW_COPY(SessionRegistry);

  // Acquires a sandbox and binds it to a new session with an unguessable id.
  kj::Promise<const Session*> Create(const std::string& language,
                                     const std::string& principal);

  // Gives the sandbox back to the pool, which resets it. If a run is using the
  // session, the session disappears at once and the sandbox is given back when
  // the run ends. Raises SESSION_NOT_FOUND.
  void End(const std::string& session_id);

  // Raises SESSION_NOT_FOUND for unknown ids and for sessions owned by a
  // different principal, when principal is not empty.
  const Session& Resolve(const std::string& session_id,
                         const std::string& principal = "") const;

  // Marks the session busy for the duration of a run. Raises SESSION_BUSY if
  // another run is using it.
  Session* Checkout(const std::string& session_id,
                    const std::string& principal = "");

  // Ends a run started by Checkout. An unhealthy sandbox invalidates the
  // session.
  void Checkin(Session* session, bool healthy);

  // Ends the session and destroys its sandbox instead of reusing it.
  void Invalidate(const std::string& session_id);

  // Sessions of principal, or all of them if principal is empty, sorted by
  // creation time.
  std::vector<Session> List(const std::string& principal = "") const;

  // Ends every session; used at shutdown.
  void Clear();

  size_t Size() const { return sessions_.size(); }

 private:
  void GiveBack(kj::Own<Session> session, bool healthy);

  SandboxPool& pool_;
  std::unordered_map<std::string, kj::Own<Session>> sessions_;
  // Sessions ended while busy, by id.
  std::unordered_map<std::string, kj::Own<Session>> ending_;
};

}  // namespace pool

#endif
