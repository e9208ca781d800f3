#include "server/server.hpp"

#include <kj/debug.h>

namespace server {
namespace {
void SetOutcome(const language::Outcome& outcome,
                capnproto::Outcome::Builder builder) {
  builder.setOutput(outcome.output);
  builder.setError(outcome.error);
  builder.setExitCode(outcome.exit_code);
  builder.setSessionId(outcome.session_id);
  builder.setExecutionId(outcome.execution_id);
  builder.setDurationMs(outcome.duration_ms);
  switch (outcome.failure) {
    case language::Failure::NONE:
      builder.getFailure().setNone();
      break;
    case language::Failure::TIMEOUT:
      builder.getFailure().setTimeout();
      break;
    case language::Failure::ADAPTER_ERROR:
      builder.getFailure().setAdapterError(outcome.failure_message);
      break;
  }
}
}  // namespace

kj::Promise<void> Server::runCode(RunCodeContext context) {
  auto params = context.getParams().getRequest();
  pool::RunRequest request;
  request.language = params.getLanguage();
  request.source = params.getSource();
  request.timeout_seconds = params.getTimeoutSeconds();
  request.session_id = params.getSessionId();
  request.principal = params.getPrincipal();
  for (auto file : params.getFiles()) {
    auto content = file.getContent().asChars();
    request.files.emplace_back(std::string(file.getPath()),
                               std::string(content.begin(), content.size()));
  }
  KJ_LOG(INFO, "runCode", request.language, request.session_id,
         request.files.size());
  return orchestrator_.Run(kj::mv(request))
      .then([context](language::Outcome outcome) mutable {
        SetOutcome(outcome, context.getResults().initOutcome());
      });
}

kj::Promise<void> Server::openSession(OpenSessionContext context) {
  std::string language = context.getParams().getLanguage();
  std::string principal = context.getParams().getPrincipal();
  return orchestrator_.OpenSession(language, principal)
      .then([context](const pool::Session* session) mutable {
        context.getResults().setSessionId(session->id);
        context.getResults().setLanguage(session->language);
      });
}

kj::Promise<void> Server::closeSession(CloseSessionContext context) {
  orchestrator_.CloseSession(context.getParams().getSessionId());
  return kj::READY_NOW;
}

kj::Promise<void> Server::listSessions(ListSessionsContext context) {
  auto sessions =
      orchestrator_.ListSessions(context.getParams().getPrincipal());
  auto list = context.getResults().initSessions(sessions.size());
  for (size_t i = 0; i < sessions.size(); i++) {
    list[i].setSessionId(sessions[i].id);
    list[i].setLanguage(sessions[i].language);
    list[i].setPrincipal(sessions[i].principal);
    list[i].setCreatedAt(sessions[i].created_at);
  }
  return kj::READY_NOW;
}

kj::Promise<void> Server::stats(StatsContext context) {
  pool::PoolStats stats = orchestrator_.Stats();
  auto builder = context.getResults().initStats();
  builder.setCapacity(stats.capacity);
  builder.setProvisioning(stats.provisioning);
  builder.setDiscarding(stats.discarding);
  builder.setDraining(stats.draining);
  auto languages = builder.initLanguages(stats.languages.size());
  size_t i = 0;
  for (const auto& language : stats.languages) {
    languages[i].setLanguage(language.first);
    languages[i].setIdle(language.second.idle);
    languages[i].setEphemeral(language.second.ephemeral);
    languages[i].setSession(language.second.session);
    i++;
  }
  return kj::READY_NOW;
}

}  // namespace server
