#include "pool/orchestrator.hpp"

#include <kj/debug.h>
#include <algorithm>

#include "util/error.hpp"
#include "util/misc.hpp"

namespace pool {

// The sandbox used by one run: an ephemeral lease or a checked-out session.
// It is given back exactly once, by Finish or, if the run is dropped first,
// by the destructor.
class Orchestrator::RunScope {
 public:
  enum class Disposition { OK, FAILED, BROKEN };

  explicit RunScope(Lease lease) : lease_(kj::mv(lease)) {}
  RunScope(SessionRegistry* sessions, Session* session)
      : lease_(nullptr, nullptr), sessions_(sessions), session_(session) {}
  ~RunScope() {
    if (finished_) return;
    auto error = kj::runCatchingExceptions(
        [this]() { Finish(Disposition::FAILED); });
    KJ_IF_MAYBE(exc, error) {
      KJ_LOG(ERROR, "Could not give back a sandbox", exc->getDescription());
    }
  }
  KJ_DISALLOW_COPY(RunScope);

  bool InSession() const { return session_ != nullptr; }

  Handle* handle() const {
    return session_ != nullptr ? session_->handle : lease_.get();
  }

  void Finish(Disposition disposition) {
    KJ_REQUIRE(!finished_, "Sandbox already given back");
    finished_ = true;
    if (session_ != nullptr) {
      sessions_->Checkin(session_, disposition != Disposition::BROKEN);
    } else if (disposition == Disposition::BROKEN) {
      lease_.Discard();
    } else {
      lease_.Release(disposition == Disposition::OK);
    }
  }

 private:
  Lease lease_;
  SessionRegistry* sessions_ = nullptr;
  Session* session_ = nullptr;
  bool finished_ = false;
};

namespace {
language::Outcome TimeoutOutcome() {
  language::Outcome outcome;
  outcome.error = "Execution timed out";
  outcome.exit_code = -1;
  outcome.failure = language::Failure::TIMEOUT;
  return outcome;
}
}  // namespace

Orchestrator::Orchestrator(const language::Registry& registry,
                           SandboxPool* pool, SessionRegistry* sessions,
                           kj::Timer& timer, OrchestratorOptions options)
    : registry_(registry),
      pool_(*pool),
      sessions_(*sessions),
      timer_(timer),
      options_(options) {}

uint32_t Orchestrator::TimeoutSeconds(uint32_t requested) const {
  if (requested == 0) requested = options_.default_timeout;
  return std::min(requested, options_.max_timeout);
}

kj::Promise<language::Outcome> Orchestrator::Run(RunRequest request) {
  return runs_.wrap(kj::evalNow([&]() -> kj::Promise<language::Outcome> {
    if (shutting_down_) {
      BROKER_THROW(SHUTTING_DOWN, "The broker is shutting down");
    }
    std::string error_msg;
    for (const auto& file : request.files) {
      if (!sandbox::IsValidPath(file.first, &error_msg)) {
        BROKER_THROW(INVALID_REQUEST, file.first + ": " + error_msg);
      }
    }
    if (!request.session_id.empty()) {
      const Session& session =
          sessions_.Resolve(request.session_id, request.principal);
      const language::Capability& capability = registry_.Resolve(
          request.language.empty() ? session.language : request.language);
      if (capability.name != session.language) {
        BROKER_THROW(INVALID_REQUEST, "Session " + session.id +
                                          " runs " + session.language);
      }
      auto scope = kj::heap<RunScope>(
          &sessions_, sessions_.Checkout(request.session_id, request.principal));
      std::string session_id = request.session_id;
      return RunIn(kj::mv(scope), capability, kj::mv(request))
          .then([session_id](language::Outcome outcome) {
            outcome.session_id = session_id;
            return outcome;
          });
    }
    const language::Capability& capability =
        registry_.Resolve(request.language);
    return pool_.Acquire(capability.name)
        .then([this, &capability,
               request = kj::mv(request)](Lease lease) mutable {
          return RunIn(kj::heap<RunScope>(kj::mv(lease)), capability,
                       kj::mv(request));
        });
  }));
}

kj::Promise<language::Outcome> Orchestrator::RunIn(
    kj::Own<RunScope> scope, const language::Capability& capability,
    RunRequest request) {
  uint32_t timeout = TimeoutSeconds(request.timeout_seconds);
  Handle* handle = scope->handle();
  sandbox::Instance& instance = *handle->instance;
  std::string execution_id = util::RandomHex(16);
  kj::TimePoint start = timer_.now();
  KJ_LOG(INFO, "Running", execution_id, capability.name, handle->RemoteId(),
         timeout);

  kj::Promise<void> written = kj::READY_NOW;
  for (auto& file : request.files) {
    written = written.then([&instance, file = kj::mv(file)]() {
      return instance.WriteFile(file.first, file.second);
    });
  }
  auto work = written.then([&instance, &adapter = *capability.adapter,
                            source = kj::mv(request.source)]() {
    return adapter.Execute(instance, source);
  });
  auto deadline = timer_.afterDelay(timeout * kj::SECONDS).then([]() {
    return TimeoutOutcome();
  });

  RunScope* run = scope.get();
  auto finish = [this, run, execution_id, start](
                    language::Outcome outcome,
                    RunScope::Disposition disposition) {
    outcome.execution_id = execution_id;
    outcome.duration_ms = (timer_.now() - start) / kj::MILLISECONDS;
    KJ_LOG(INFO, "Execution finished", execution_id, outcome.exit_code,
           static_cast<int>(outcome.failure), outcome.duration_ms);
    run->Finish(disposition);
    return outcome;
  };
  // The losing branch is cancelled, which kills a command still running,
  // before the sandbox is given back.
  return work.exclusiveJoin(kj::mv(deadline))
      .then(
          [run, &instance, finish](language::Outcome outcome)
              -> kj::Promise<language::Outcome> {
            if (outcome.failure != language::Failure::TIMEOUT) {
              auto disposition = outcome.failure == language::Failure::NONE
                                     ? RunScope::Disposition::OK
                                     : RunScope::Disposition::FAILED;
              return finish(kj::mv(outcome), disposition);
            }
            KJ_LOG(WARNING, "Execution timed out", run->handle()->RemoteId());
            if (!run->InSession()) {
              return finish(kj::mv(outcome), RunScope::Disposition::FAILED);
            }
            // A session keeps its sandbox, which must not be handed to the
            // next run with the timed-out command still in it.
            return instance.Interrupt().then(
                [finish, outcome]() {
                  return finish(outcome, RunScope::Disposition::FAILED);
                },
                [finish, outcome, run](kj::Exception exc) {
                  KJ_LOG(ERROR, "Could not interrupt the sandbox",
                         run->handle()->RemoteId(), exc.getDescription());
                  return finish(outcome, RunScope::Disposition::BROKEN);
                });
          },
          [run, finish, execution_id](
              kj::Exception exc) -> kj::Promise<language::Outcome> {
            if (util::ClassifyError(exc) == util::ErrorKind::INFRASTRUCTURE) {
              KJ_LOG(ERROR, "Sandbox failed", execution_id,
                     run->handle()->RemoteId(), exc.getDescription());
              run->Finish(RunScope::Disposition::BROKEN);
              kj::throwFatalException(kj::mv(exc));
            }
            KJ_LOG(WARNING, "Adapter failed", execution_id,
                   exc.getDescription());
            language::Outcome outcome;
            outcome.failure_message = util::ErrorMessage(exc);
            outcome.error = outcome.failure_message;
            outcome.exit_code = -1;
            outcome.failure = language::Failure::ADAPTER_ERROR;
            return finish(kj::mv(outcome), RunScope::Disposition::FAILED);
          })
      .attach(kj::mv(scope));
}

kj::Promise<const Session*> Orchestrator::OpenSession(
    const std::string& language, const std::string& principal) {
  return runs_.wrap(kj::evalNow([&]() {
    if (shutting_down_) {
      BROKER_THROW(SHUTTING_DOWN, "The broker is shutting down");
    }
    return sessions_.Create(registry_.Resolve(language).name, principal);
  }));
}

void Orchestrator::CloseSession(const std::string& session_id,
                                const std::string& principal) {
  sessions_.Resolve(session_id, principal);
  sessions_.End(session_id);
}

kj::Promise<void> Orchestrator::Shutdown() {
  if (!shutting_down_) {
    shutting_down_ = true;
    KJ_LOG(INFO, "Shutting down", sessions_.Size());
    runs_.cancel(BROKER_ERROR(SHUTTING_DOWN, "The broker is shutting down"));
    sessions_.Clear();
  }
  return pool_.Drain();
}

}  // namespace pool
