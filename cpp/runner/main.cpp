#include "runner/main.hpp"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/debug.h>
#include <string>

#include "docker/client.hpp"
#include "server/executor.hpp"
#include "server/languages.hpp"
#include "server/options.hpp"
#include "util/file.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace runner {
kj::MainBuilder::Validity Main::Run() {
  auto validity = server::ValidateRuntimeOptions();
  if (validity.getError() != nullptr) return validity;
  auto maybe_language = server::FindLanguage(Flags::language.c_str());
  const server::Language* language = nullptr;
  KJ_IF_MAYBE(l, maybe_language) { language = l; }
  if (language == nullptr) {
    std::string supported;
    for (const auto& l : server::Languages()) {
      if (!supported.empty()) supported += ", ";
      supported += l.name;
    }
    return kj::str("unsupported language, use one of: ", supported.c_str());
  }
  std::string code = Flags::code_file.empty()
                         ? util::File::ReadStdin()
                         : util::File::Read(Flags::code_file);

  util::LogManager log_manager(context);
  auto io = kj::setupAsyncIo();
  auto& timer = io.provider->getTimer();
  auto daemon = io.provider->getNetwork()
                    .parseAddress(server::DockerAddress().c_str())
                    .wait(io.waitScope);
  kj::HttpHeaderTable table;
  auto http = kj::newHttpClient(timer, table, *daemon);
  docker::Client client(http.get(), table);
  server::Executor executor(&client, &timer, server::LimitsFromFlags());

  std::string output;
  auto failure = kj::runCatchingExceptions([&]() {
    output = executor.Execute(*language, code).wait(io.waitScope);
  });
  KJ_IF_MAYBE(exc, failure) { context.exitError(exc->getDescription()); }
  context.exitInfo(kj::StringPtr(output.c_str(), output.size()));
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context, "Code Runner (" CODE_RUNNER_VERSION ")",
                          "Runs a program in a Docker container and prints "
                          "its output");
  server::AddRuntimeOptions(builder)
      .addOptionWithArg({'l', "language"}, util::setString(Flags::language),
                        "<LANGUAGE>", "Language of the program")
      .addOptionWithArg({'f', "file"}, util::setString(Flags::code_file),
                        "<FILE>",
                        "File containing the program. Defaults to stdin")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run));
  return builder.build();
}
}  // namespace runner
