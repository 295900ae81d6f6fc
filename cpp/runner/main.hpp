#ifndef RUNNER_MAIN_HPP
#define RUNNER_MAIN_HPP
#include <kj/main.h>

namespace runner {

// Runs a single program, read from a file or from stdin, and prints its
// output.
class Main {
 public:
  explicit Main(kj::ProcessContext* context) : context(*context) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
};
}  // namespace runner
#endif
