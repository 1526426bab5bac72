#include "cli/main.hpp"
#include "util/version.hpp"

class CodecheckMain {
 public:
  // NOLINTNEXTLINE(google-runtime-references)
  explicit CodecheckMain(kj::ProcessContext& context)
      : context(context),
        all(&context, cli::Main::ALL_TESTS),
        examples(&context, cli::Main::EXAMPLES_ONLY) {}
  kj::MainFunc getMain() {
    return kj::MainBuilder(context, "Codecheck (" + util::version + ")",
                           "Validates solutions to programming problems")
        .addSubCommand("validate", KJ_BIND_METHOD(all, getMain),
                       "run all the test cases of a problem")
        .addSubCommand("examples", KJ_BIND_METHOD(examples, getMain),
                       "run only the public examples of a problem")
        .build();
  }

 private:
  kj::ProcessContext& context;
  cli::Main all;
  cli::Main examples;
};

KJ_MAIN(CodecheckMain);
