#include "pool/sandbox_pool.hpp"

#include <kj/debug.h>
#include <ctime>

#include "util/error.hpp"

namespace pool {

const char* HandleStateName(HandleState state) {
  switch (state) {
    case HandleState::PROVISIONING:
      return "provisioning";
    case HandleState::IDLE:
      return "idle";
    case HandleState::ACTIVE_EPHEMERAL:
      return "ephemeral";
    case HandleState::ACTIVE_SESSION:
      return "session";
    case HandleState::RESETTING:
      return "resetting";
    case HandleState::DISCARDED:
      return "discarded";
  }
  return "unknown";
}

uint32_t PoolStats::Total() const {
  uint32_t total = provisioning + discarding;
  for (const auto& language : languages) {
    total += language.second.idle + language.second.ephemeral +
             language.second.session;
  }
  return total;
}

// A capacity slot held while a sandbox is being provisioned. The slot is given
// back when the provisioning ends or, if the caller goes away first, when the
// reservation is destroyed.
class SandboxPool::Reservation {
 public:
  explicit Reservation(SandboxPool* pool) : pool_(*pool) {
    pool_.provisioning_++;
  }
  ~Reservation() { Release(); }
  KJ_DISALLOW_COPY(Reservation);

  void Release() {
    if (!active_) return;
    active_ = false;
    pool_.ReleaseSlot();
  }

 private:
  SandboxPool& pool_;
  bool active_ = true;
};

SandboxPool::SandboxPool(sandbox::Provider& provider, PoolOptions options)
    : provider_(provider), options_(std::move(options)), tasks_(*this) {}

Lease& Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    if (handle_ != nullptr) Release(false);
    pool_ = other.pool_;
    handle_ = other.handle_;
    other.handle_ = nullptr;
  }
  return *this;
}

Lease::~Lease() {
  if (handle_ != nullptr) Release(false);
}

void Lease::Release(bool outcome_ok) {
  KJ_REQUIRE(handle_ != nullptr, "Lease already given back");
  Handle* handle = handle_;
  handle_ = nullptr;
  auto error = kj::runCatchingExceptions(
      [this, handle, outcome_ok]() { pool_->Release(handle, outcome_ok); });
  KJ_IF_MAYBE(exc, error) {
    KJ_LOG(ERROR, "Could not release sandbox", exc->getDescription());
  }
}

void Lease::Discard() {
  KJ_REQUIRE(handle_ != nullptr, "Lease already given back");
  Handle* handle = handle_;
  handle_ = nullptr;
  pool_->Discard(handle);
}

Handle* Lease::Detach() {
  Handle* handle = handle_;
  handle_ = nullptr;
  return handle;
}

kj::Promise<Lease> SandboxPool::Acquire(const std::string& language) {
  if (draining_) return BROKER_ERROR(SHUTTING_DOWN, "The pool is draining");
  auto idle = idle_.find(language);
  if (idle != idle_.end() && !idle->second.empty()) {
    kj::Own<Handle> handle = kj::mv(idle->second.back());
    idle->second.pop_back();
    handle->state = HandleState::ACTIVE_EPHEMERAL;
    Handle* ptr = handle.get();
    ephemeral_[ptr->id] = kj::mv(handle);
    KJ_LOG(INFO, "Acquired idle sandbox", ptr->RemoteId(), language);
    return Lease(this, ptr);
  }
  return Create(language).then([this](kj::Own<Handle> handle) {
    handle->state = HandleState::ACTIVE_EPHEMERAL;
    Handle* ptr = handle.get();
    ephemeral_[ptr->id] = kj::mv(handle);
    KJ_LOG(INFO, "Acquired new sandbox", ptr->RemoteId(), ptr->language);
    return Lease(this, ptr);
  });
}

kj::Promise<kj::Own<Handle>> SandboxPool::Create(const std::string& language) {
  if (draining_) return BROKER_ERROR(SHUTTING_DOWN, "The pool is draining");
  if (Total() >= options_.capacity) {
    return BROKER_ERROR(CAPACITY_EXHAUSTED,
                        "All " + std::to_string(options_.capacity) +
                            " sandboxes are in use");
  }
  auto reservation = kj::heap<Reservation>(this);
  Reservation* slot = reservation.get();
  auto handle = kj::heap<Handle>();
  handle->id = next_id_++;
  handle->language = language;
  handle->created_at = time(nullptr);
  return provider_.Create(language)
      .then(
          [this, slot, handle = kj::mv(handle)](
              kj::Own<sandbox::Instance> instance) mutable -> kj::Own<Handle> {
            slot->Release();
            handle->instance = kj::mv(instance);
            if (draining_) {
              Destroy(kj::mv(handle));
              BROKER_THROW(SHUTTING_DOWN, "The pool is draining");
            }
            return kj::mv(handle);
          },
          [slot, language](kj::Exception exc) -> kj::Own<Handle> {
            slot->Release();
            KJ_LOG(WARNING, "Provisioning failed", language,
                   exc.getDescription());
            BROKER_THROW(PROVISION_FAILED,
                         language + ": " + util::ErrorMessage(exc));
          })
      .attach(kj::mv(reservation));
}

void SandboxPool::ReleaseSlot() {
  provisioning_--;
  if (provisioning_ > 0) return;
  KJ_IF_MAYBE(fulfiller, provisioned_) { (*fulfiller)->fulfill(); }
  provisioned_ = nullptr;
}

kj::Promise<Handle*> SandboxPool::Provision(const std::string& language) {
  return Create(language).then([this](kj::Own<Handle> handle) {
    Handle* ptr = handle.get();
    MakeIdle(kj::mv(handle));
    return ptr;
  });
}

kj::Promise<void> SandboxPool::Warm(uint32_t initial_size) {
  if (options_.languages.empty()) return kj::READY_NOW;
  size_t per_language = initial_size / options_.languages.size();
  auto provisions = kj::heapArrayBuilder<kj::Promise<void>>(
      per_language * options_.languages.size());
  for (const auto& language : options_.languages) {
    for (size_t i = 0; i < per_language; i++) {
      provisions.add(Provision(language).then(
          [](Handle*) {},
          [language](kj::Exception exc) {
            KJ_LOG(WARNING, "Could not pre-provision a sandbox", language,
                   exc.getDescription());
          }));
    }
  }
  return kj::joinPromises(provisions.finish()).then([this]() {
    KJ_LOG(INFO, "Pool warmed up", Total(), options_.capacity);
  });
}

void SandboxPool::Release(Handle* handle, bool outcome_ok) {
  auto retired = retired_.find(handle->id);
  if (retired != retired_.end() && retired->second.get() == handle) {
    retired_.erase(retired);
    return;
  }
  auto it = ephemeral_.find(handle->id);
  KJ_REQUIRE(it != ephemeral_.end() && it->second.get() == handle &&
                 handle->state == HandleState::ACTIVE_EPHEMERAL,
             "Released a handle that was not acquired", handle->id);
  if (draining_) {
    Destroy(Take(handle));
  } else if (!outcome_ok || options_.reset_after_use) {
    StartReset(handle);
  } else {
    MakeIdle(Take(handle));
  }
}

void SandboxPool::BindToSession(Handle* handle, const std::string& session_id,
                                const std::string& principal) {
  auto it = ephemeral_.find(handle->id);
  KJ_REQUIRE(it != ephemeral_.end() && it->second.get() == handle &&
                 handle->state == HandleState::ACTIVE_EPHEMERAL,
             "Bound a handle that was not acquired", handle->id);
  handle->state = HandleState::ACTIVE_SESSION;
  handle->session_id = session_id;
  handle->principal = principal;
  session_[handle->id] = kj::mv(it->second);
  ephemeral_.erase(it);
}

void SandboxPool::UnbindFromSession(Handle* handle) {
  auto retired = retired_.find(handle->id);
  if (retired != retired_.end() && retired->second.get() == handle) {
    retired_.erase(retired);
    return;
  }
  auto it = session_.find(handle->id);
  KJ_REQUIRE(it != session_.end() && it->second.get() == handle &&
                 handle->state == HandleState::ACTIVE_SESSION,
             "Unbound a handle that is not bound to a session", handle->id);
  if (draining_) {
    Destroy(Take(handle));
  } else {
    StartReset(handle);
  }
}

void SandboxPool::Discard(Handle* handle) {
  auto retired = retired_.find(handle->id);
  if (retired != retired_.end() && retired->second.get() == handle) {
    retired_.erase(retired);
    return;
  }
  KJ_LOG(INFO, "Discarding sandbox", handle->RemoteId());
  Destroy(Take(handle));
}

SandboxPool::HandleMap& SandboxPool::CollectionOf(Handle* handle) {
  auto it = ephemeral_.find(handle->id);
  if (it != ephemeral_.end() && it->second.get() == handle) return ephemeral_;
  it = session_.find(handle->id);
  KJ_REQUIRE(it != session_.end() && it->second.get() == handle,
             "Handle not owned by the pool", handle->id);
  return session_;
}

kj::Own<Handle> SandboxPool::Take(Handle* handle) {
  HandleMap& collection = CollectionOf(handle);
  auto it = collection.find(handle->id);
  kj::Own<Handle> owned = kj::mv(it->second);
  collection.erase(it);
  return owned;
}

void SandboxPool::MakeIdle(kj::Own<Handle> handle) {
  handle->state = HandleState::IDLE;
  handle->session_id.clear();
  handle->principal.clear();
  idle_[handle->language].push_back(kj::mv(handle));
}

void SandboxPool::StartReset(Handle* handle) {
  // The handle stays where it is, and cannot be acquired, until the reset
  // completes.
  handle->state = HandleState::RESETTING;
  tasks_.add(resets_.wrap(handle->instance->Reset().then(
      [this, handle]() {
        if (draining_) {
          Destroy(Take(handle));
        } else {
          MakeIdle(Take(handle));
        }
      },
      [this, handle](kj::Exception exc) {
        KJ_LOG(WARNING, "Reset failed, discarding the sandbox",
               handle->RemoteId(), exc.getDescription());
        Destroy(Take(handle));
      })));
}

void SandboxPool::Destroy(kj::Own<Handle> handle) {
  tasks_.add(DestroyInstance(handle.get()).attach(kj::mv(handle)));
}

kj::Promise<void> SandboxPool::DestroyInstance(Handle* handle) {
  handle->state = HandleState::DISCARDED;
  discarding_++;
  std::string remote_id = handle->RemoteId();
  return handle->instance->Destroy().then(
      [this]() { discarding_--; },
      [this, remote_id](kj::Exception exc) {
        discarding_--;
        KJ_LOG(ERROR, "Could not destroy sandbox", remote_id,
               exc.getDescription());
      });
}

kj::Promise<void> SandboxPool::Drain() {
  KJ_IF_MAYBE(drained, drained_) { return drained->addBranch(); }
  KJ_LOG(INFO, "Draining the pool", Total());
  draining_ = true;
  resets_.cancel("The pool is draining");
  for (auto& language : idle_) {
    for (auto& handle : language.second) Destroy(kj::mv(handle));
  }
  idle_.clear();
  for (HandleMap* collection : {&ephemeral_, &session_}) {
    for (auto& entry : *collection) {
      if (entry.second->state == HandleState::RESETTING) {
        Destroy(kj::mv(entry.second));
      } else {
        // Still in use: the holder keeps a pointer to it.
        tasks_.add(DestroyInstance(entry.second.get()));
        retired_[entry.first] = kj::mv(entry.second);
      }
    }
    collection->clear();
  }
  // A sandbox still being provisioned is destroyed as soon as it exists, in
  // the continuation that releases its slot.
  kj::Promise<void> provisioned = kj::READY_NOW;
  if (provisioning_ > 0) {
    auto paf = kj::newPromiseAndFulfiller<void>();
    provisioned_ = kj::mv(paf.fulfiller);
    provisioned = kj::mv(paf.promise);
  }
  drained_ = provisioned.then([this]() { return tasks_.onEmpty(); }).fork();
  return KJ_ASSERT_NONNULL(drained_).addBranch();
}

PoolStats SandboxPool::Stats() const {
  PoolStats stats;
  stats.capacity = options_.capacity;
  stats.provisioning = provisioning_;
  stats.discarding = discarding_;
  stats.draining = draining_;
  for (const auto& language : options_.languages) stats.languages[language];
  for (const auto& language : idle_) {
    stats.languages[language.first].idle += language.second.size();
  }
  for (const auto& entry : ephemeral_) {
    stats.languages[entry.second->language].ephemeral++;
  }
  for (const auto& entry : session_) {
    stats.languages[entry.second->language].session++;
  }
  return stats;
}

void SandboxPool::taskFailed(kj::Exception&& exception) {
  if (draining_) {
    KJ_LOG(INFO, "Background task stopped", exception.getDescription());
    return;
  }
  KJ_LOG(ERROR, "Background task failed", exception.getDescription());
}

}  // namespace pool
