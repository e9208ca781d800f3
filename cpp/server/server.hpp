#ifndef SERVER_SERVER_HPP
#define SERVER_SERVER_HPP

#include "capnp/broker.capnp.h"
#include "pool/orchestrator.hpp"

namespace server {

// Cap'n Proto face of the broker. Errors reach the client as exceptions that
// keep their kind (see util/error.hpp); timeouts are part of the outcome.
class Server : public capnproto::Broker::Server {
 public:
  explicit Server(pool::Orchestrator* orchestrator)
      : orchestrator_(*orchestrator) {}

  kj::Promise<void> runCode(RunCodeContext context) override;
  kj::Promise<void> openSession(OpenSessionContext context) override;
  kj::Promise<void> closeSession(CloseSessionContext context) override;
  kj::Promise<void> listSessions(ListSessionsContext context) override;
  kj::Promise<void> stats(StatsContext context) override;

 private:
  pool::Orchestrator& orchestrator_;
};

}  // namespace server

#endif
