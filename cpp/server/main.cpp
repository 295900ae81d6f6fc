#include "server/main.hpp"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/debug.h>

#include "docker/client.hpp"
#include "server/executor.hpp"
#include "server/options.hpp"
#include "server/service.hpp"
#include "util/daemon.hpp"
#include "util/flags.hpp"
#include "util/log_manager.hpp"
#include "util/misc.hpp"
#include "util/version.hpp"

namespace server {
kj::MainBuilder::Validity Main::Run() {
  auto validity = ValidateRuntimeOptions();
  if (validity.getError() != nullptr) return validity;
  if (Flags::port < 0 || Flags::port > 65535) return "invalid port";

  if (Flags::daemon) {
    util::daemonize("server", Flags::pidfile);
  }
  util::LogManager log_manager(context);
  auto io = kj::setupAsyncIo();
  auto& network = io.provider->getNetwork();
  auto& timer = io.provider->getTimer();

  std::string docker_address = DockerAddress();
  auto daemon =
      network.parseAddress(docker_address.c_str()).wait(io.waitScope);
  KJ_LOG(INFO, "Using the Docker daemon at", docker_address);

  kj::HttpHeaderTable::Builder headers;
  auto& table = headers.getFutureTable();
  auto http = kj::newHttpClient(timer, table, *daemon);
  docker::Client client(http.get(), table);
  Executor executor(&client, &timer, LimitsFromFlags());
  Service service(&headers, &executor, Flags::max_body_size);
  auto built_table = headers.build();
  kj::HttpServer http_server(timer, *built_table, service);

  auto address =
      network.parseAddress(Flags::listen_address.c_str(), Flags::port)
          .wait(io.waitScope);
  auto listener = address->listen();
  auto url = kj::str("http://", Flags::listen_address.c_str(), ":",
                     listener->getPort());
  KJ_LOG(INFO, "Code execution server listening", url);
  http_server.listenHttp(*listener).wait(io.waitScope);
  return true;
}

kj::MainFunc Main::getMain() {
  kj::MainBuilder builder(context,
                          "Code Runner Server (" CODE_RUNNER_VERSION ")",
                          "Runs the programs POSTed to /execute in Docker "
                          "containers and replies with their output");
  AddRuntimeOptions(builder)
      .addOption({'d', "daemon"}, util::setBool(Flags::daemon),
                 "Become a daemon")
      .addOptionWithArg({'P', "pidfile"}, util::setString(Flags::pidfile),
                        "<PIDFILE>", "Path where the pidfile should be stored")
      .addOptionWithArg({'l', "address"},
                        util::setString(Flags::listen_address), "<ADDRESS>",
                        "Address to listen on")
      .addOptionWithArg({'p', "port"}, util::setInt(Flags::port), "<PORT>",
                        "Port to listen on")
      .addOptionWithArg({'b', "max-body-size"},
                        util::setUint(Flags::max_body_size), "<BYTES>",
                        "Maximum size of a request body")
      .callAfterParsing(KJ_BIND_METHOD(*this, Run));
  return builder.build();
}
}  // namespace server
