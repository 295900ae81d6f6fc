#include "runner/main.hpp"
#include "server/main.hpp"
#include "util/version.hpp"

class CodeRunnerMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodeRunnerMain(kj::ProcessContext& context)
      : context(context), sm(&context), rm(&context) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Code Runner (" CODE_RUNNER_VERSION ")",
                           "Runs untrusted programs in Docker containers")
        .addSubCommand("server", KJ_BIND_METHOD(sm, getMain),
                       "run the HTTP server")
        .addSubCommand("run", KJ_BIND_METHOD(rm, getMain),
                       "run a single program")
        .build();
  }

 private:
  kj::ProcessContext& context;
  server::Main sm;
  runner::Main rm;
};

KJ_MAIN(CodeRunnerMain);
