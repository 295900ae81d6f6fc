#ifndef SERVER_OPTIONS_HPP
#define SERVER_OPTIONS_HPP

#include <kj/main.h>
#include <string>

#include "server/executor.hpp"

namespace server {

// Adds the options of every sub-command that runs containers: logging,
// daemon address and limits.
kj::MainBuilder& AddRuntimeOptions(kj::MainBuilder& builder);

// Checks the values given to the options added by AddRuntimeOptions.
kj::MainBuilder::Validity ValidateRuntimeOptions();

ExecutionLimits LimitsFromFlags();

// Address of the Docker daemon, in the form kj::Network::parseAddress wants:
// --docker-host, else $DOCKER_HOST, else the default local socket.
std::string DockerAddress();

}  // namespace server

#endif
