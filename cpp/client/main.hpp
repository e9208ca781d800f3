#ifndef CLIENT_MAIN_HPP
#define CLIENT_MAIN_HPP
#include <kj/main.h>
#include <string>
#include <utility>
#include <vector>

namespace client {

// Command line client of the broker. Each subcommand performs one call and
// exits with a status that tells apart the broker errors (see exit_codes.hpp).
class Main {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit Main(kj::ProcessContext& context) : context(context) {}
  kj::MainFunc getMain();

 private:
  kj::MainFunc getRunMain();
  kj::MainFunc getOpenSessionMain();
  kj::MainFunc getCloseSessionMain();
  kj::MainFunc getListSessionsMain();
  kj::MainFunc getStatsMain();

  kj::MainBuilder::Validity Run();
  kj::MainBuilder::Validity OpenSession();
  kj::MainBuilder::Validity CloseSession();
  kj::MainBuilder::Validity ListSessions();
  kj::MainBuilder::Validity Stats();

  kj::ProcessContext& context;
  std::string language_;
  std::string source_path_ = "-";
  uint32_t timeout_ = 0;
  std::string session_id_;
  std::string principal_;
  // (local path, path in the sandbox)
  std::vector<std::pair<std::string, std::string>> files_;
};
}  // namespace client
#endif
