#include "pool/session_registry.hpp"

#include <kj/debug.h>
#include <algorithm>
#include <ctime>
#include <tuple>

#include "util/error.hpp"
#include "util/misc.hpp"

namespace pool {

namespace {

// Const-preserving lookup shared by Resolve and Checkout.
template <typename Sessions>
auto FindSession(Sessions& sessions, const std::string& session_id,
                 const std::string& principal)
    -> decltype(*sessions.begin()->second) {
  auto it = sessions.find(session_id);
  if (it == sessions.end() ||
      (!principal.empty() && it->second->principal != principal)) {
    BROKER_THROW(SESSION_NOT_FOUND, session_id);
  }
  return *it->second;
}

}  // namespace

kj::Promise<const Session*> SessionRegistry::Create(
    const std::string& language, const std::string& principal) {
  return pool_.Acquire(language).then(
      [this, language, principal](Lease lease) -> const Session* {
        auto session = kj::heap<Session>();
        do {
          session->id = util::RandomHex(16);
        } while (sessions_.count(session->id) || ending_.count(session->id));
        session->principal = principal;
        session->language = language;
        session->created_at = time(nullptr);
        session->handle = lease.Detach();
        pool_.BindToSession(session->handle, session->id, principal);
        KJ_LOG(INFO, "Session opened", session->id, language,
               session->handle->RemoteId());
        const Session* ptr = session.get();
        sessions_[session->id] = kj::mv(session);
        return ptr;
      });
}

void SessionRegistry::End(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) BROKER_THROW(SESSION_NOT_FOUND, session_id);
  kj::Own<Session> session = kj::mv(it->second);
  sessions_.erase(it);
  KJ_LOG(INFO, "Session closed", session_id);
  if (session->busy) {
    session->ending = true;
    ending_[session_id] = kj::mv(session);
    return;
  }
  GiveBack(kj::mv(session), true);
}

const Session& SessionRegistry::Resolve(const std::string& session_id,
                                        const std::string& principal) const {
  return FindSession(sessions_, session_id, principal);
}

Session* SessionRegistry::Checkout(const std::string& session_id,
                                   const std::string& principal) {
  Session& session = FindSession(sessions_, session_id, principal);
  if (session.busy) {
    BROKER_THROW(SESSION_BUSY, "Session " + session_id + " is running code");
  }
  session.busy = true;
  return &session;
}

void SessionRegistry::Checkin(Session* session, bool healthy) {
  KJ_REQUIRE(session->busy, "Session not checked out", session->id);
  session->busy = false;
  if (session->ending) {
    auto it = ending_.find(session->id);
    KJ_ASSERT(it != ending_.end());
    kj::Own<Session> owned = kj::mv(it->second);
    ending_.erase(it);
    GiveBack(kj::mv(owned), healthy);
    return;
  }
  if (!healthy) Invalidate(session->id);
}

void SessionRegistry::Invalidate(const std::string& session_id) {
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) BROKER_THROW(SESSION_NOT_FOUND, session_id);
  kj::Own<Session> session = kj::mv(it->second);
  sessions_.erase(it);
  KJ_LOG(WARNING, "Session invalidated", session_id);
  session->discard = true;
  if (session->busy) {
    session->ending = true;
    ending_[session_id] = kj::mv(session);
    return;
  }
  GiveBack(kj::mv(session), false);
}

std::vector<Session> SessionRegistry::List(const std::string& principal) const {
  std::vector<Session> sessions;
  for (const auto& entry : sessions_) {
    if (!principal.empty() && entry.second->principal != principal) continue;
    sessions.push_back(*entry.second);
  }
  std::sort(sessions.begin(), sessions.end(),
            [](const Session& a, const Session& b) {
              return std::tie(a.created_at, a.id) < std::tie(b.created_at, b.id);
            });
  return sessions;
}

void SessionRegistry::Clear() {
  std::vector<std::string> ids;
  for (const auto& entry : sessions_) ids.push_back(entry.first);
  for (const auto& id : ids) End(id);
}

void SessionRegistry::GiveBack(kj::Own<Session> session, bool healthy) {
  if (healthy && !session->discard) {
    pool_.UnbindFromSession(session->handle);
  } else {
    pool_.Discard(session->handle);
  }
}

}  // namespace pool
