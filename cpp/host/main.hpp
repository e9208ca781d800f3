#ifndef HOST_MAIN_HPP
#define HOST_MAIN_HPP
#include <kj/main.h>

namespace host {

class Main {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit Main(kj::ProcessContext& context) : context(context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace host
#endif
