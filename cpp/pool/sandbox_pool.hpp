#ifndef POOL_SANDBOX_POOL_HPP
#define POOL_SANDBOX_POOL_HPP

#include <kj/async.h>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "sandbox/provider.hpp"

namespace pool {

enum class HandleState {
  PROVISIONING,
  IDLE,
  ACTIVE_EPHEMERAL,
  ACTIVE_SESSION,
  RESETTING,
  DISCARDED
};

const char* HandleStateName(HandleState state);

// One provisioned sandbox, as seen by the pool. Handles are owned by the pool
// and are in exactly one of its collections at any time; callers only get
// pointers, which stay valid until they give the handle back.
struct Handle {
  uint64_t id = 0;
  std::string language;
  HandleState state = HandleState::PROVISIONING;
  int64_t created_at = 0;  // seconds since the epoch
  std::string session_id;
  std::string principal;
  kj::Own<sandbox::Instance> instance;

  const std::string& RemoteId() const { return instance->Id(); }
};

struct PoolOptions {
  uint32_t capacity = 20;
  // Languages that are pre-provisioned by Warm and always listed by Stats.
  std::vector<std::string> languages;
  // Reset every ephemeral handle on release, not only after failed uses.
  bool reset_after_use = false;
};

struct LanguageStats {
  uint32_t idle = 0;
  uint32_t ephemeral = 0;
  uint32_t session = 0;
};

struct PoolStats {
  uint32_t capacity = 0;
  uint32_t provisioning = 0;
  uint32_t discarding = 0;
  bool draining = false;
  std::map<std::string, LanguageStats> languages;

  // Number of sandboxes counted against the capacity.
  uint32_t Total() const;
};

class SandboxPool;

// An acquired ephemeral handle. Unless released explicitly, or detached to be
// bound to a session, the handle is released as failed when the lease is
// destroyed, so that a handle is given back exactly once whatever the path
// that drops it.
class Lease {
 public:
  Lease(SandboxPool* pool, Handle* handle) : pool_(pool), handle_(handle) {}
  Lease(Lease&& other) noexcept : pool_(other.pool_), handle_(other.handle_) {
    other.handle_ = nullptr;
  }
  Lease& operator=(Lease&& other) noexcept;
  ~Lease();
  KJ_DISALLOW_COPY(Lease);

  Handle* get() const { return handle_; }
  Handle* operator->() const { return handle_; }
  explicit operator bool() const { return handle_ != nullptr; }

  void Release(bool outcome_ok);
  void Discard();

  // The caller becomes responsible for giving the handle back.
  Handle* Detach();

 private:
  SandboxPool* pool_;
  Handle* handle_;
};

// Owns every sandbox of the broker. All the methods must be called from the
// thread running the event loop; each of them runs to completion before any
// other pool operation can start, which makes the capacity check and the
// collection updates atomic.
//
// Handles move between three collections: idle (per language), active
// ephemeral and active session. A handle that is being reset stays in the
// collection it was in and cannot be acquired; it becomes idle only when the
// reset completes. Sandboxes being provisioned or destroyed count against the
// capacity.
class SandboxPool : public kj::TaskSet::ErrorHandler {
 public:
  SandboxPool(sandbox::Provider& provider, PoolOptions options);
  KJ_DISALLOW_COPY(SandboxPool);

  // Returns an idle handle for language, or provisions a new one if the
  // capacity allows it. The handle is moved to the ephemeral collection.
  // Fails with CAPACITY_EXHAUSTED, PROVISION_FAILED or SHUTTING_DOWN.
  kj::Promise<Lease> Acquire(const std::string& language);

  // Gives back an ephemeral handle. The handle is reset first if the use
  // failed (or if every use is followed by a reset), and destroyed if the
  // reset fails or the pool is draining. Does not wait for the reset.
  void Release(Handle* handle, bool outcome_ok);

  // Moves an acquired ephemeral handle to the session collection.
  void BindToSession(Handle* handle, const std::string& session_id,
                     const std::string& principal);

  // Takes a handle away from its session; it is reset and made idle, or
  // destroyed if the reset fails.
  void UnbindFromSession(Handle* handle);

  // Destroys an acquired handle, ephemeral or session bound, without trying to
  // reuse it.
  void Discard(Handle* handle);

  // Creates a new idle sandbox. Failures are reported to the caller and never
  // retried. The returned pointer is only valid until the handle is acquired.
  kj::Promise<Handle*> Provision(const std::string& language);

  // Provisions initial_size / |languages| idle sandboxes per configured
  // language. Failures are logged and skipped.
  kj::Promise<void> Warm(uint32_t initial_size);

  // Destroys every sandbox and refuses further acquisitions. Handles that are
  // still in use are destroyed too; their holders must still give them back.
  // The returned promise resolves when every sandbox is destroyed.
  kj::Promise<void> Drain();

  PoolStats Stats() const;

  // Resolves when no background reset or destruction is pending. Only one
  // caller may wait at a time, and not while Drain is pending.
  kj::Promise<void> OnSettled() { return tasks_.onEmpty(); }

  bool Draining() const { return draining_; }

  void taskFailed(kj::Exception&& exception) override;

 private:
  using HandleMap = std::unordered_map<uint64_t, kj::Own<Handle>>;

  class Reservation;

  // Reserves a slot and creates a sandbox. The slot is released in the same
  // continuation that delivers the handle, so the caller can insert it in a
  // collection without ever exceeding the capacity.
  kj::Promise<kj::Own<Handle>> Create(const std::string& language);

  // Removes an acquired handle from the ephemeral or the session collection.
  kj::Own<Handle> Take(Handle* handle);
  HandleMap& CollectionOf(Handle* handle);

  // Gives back a provisioning slot, waking up Drain with the last one.
  void ReleaseSlot();

  void MakeIdle(kj::Own<Handle> handle);
  void StartReset(Handle* handle);
  void Destroy(kj::Own<Handle> handle);
  kj::Promise<void> DestroyInstance(Handle* handle);
  uint32_t Total() const { return Stats().Total(); }

  sandbox::Provider& provider_;
  PoolOptions options_;
  uint64_t next_id_ = 0;
  uint32_t provisioning_ = 0;
  uint32_t discarding_ = 0;
  bool draining_ = false;

  std::map<std::string, std::vector<kj::Own<Handle>>> idle_;
  HandleMap ephemeral_;
  HandleMap session_;
  // Handles destroyed by Drain while in use, kept until given back.
  HandleMap retired_;

  kj::Maybe<kj::ForkedPromise<void>> drained_;
  // Fulfilled when the last provisioning ends during a drain.
  kj::Maybe<kj::Own<kj::PromiseFulfiller<void>>> provisioned_;
  kj::Canceler resets_;
  kj::TaskSet tasks_;
};

}  // namespace pool

#endif
