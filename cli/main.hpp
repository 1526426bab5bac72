#ifndef CLI_MAIN_HPP
#define CLI_MAIN_HPP
#include <kj/main.h>

#include <string>

namespace cli {

// Exit codes of the validation commands.
static const constexpr int kExitSuccess = 0;
static const constexpr int kExitFailure = 1;
static const constexpr int kExitFatal = 2;

class Main {
 public:
  enum Mode { ALL_TESTS, EXAMPLES_ONLY };

  Main(kj::ProcessContext* context, Mode mode)
      : context(*context), mode_(mode) {}
  kj::MainBuilder::Validity Run();
  kj::MainFunc getMain();

 private:
  kj::ProcessContext& context;
  Mode mode_;
  std::string problem_path_;
  std::string solution_path_;
};
}  // namespace cli
#endif
