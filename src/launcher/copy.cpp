// Licensed to the Apache Software Foundation (ASF) under one
// or more contributor license agreements.  See the NOTICE file
// distributed with this work for additional information
// regarding copyright ownership.  The ASF licenses this file
// to you under the Apache License, Version 2.0 (the
// "License"); you may not use this file except in compliance
// with the License.  You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include <iostream>
#include <string>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/process.hpp>
#include <process/shared.hpp>

#include <stout/exit.hpp>
#include <stout/flags.hpp>
#include <stout/foreach.hpp>
#include <stout/json.hpp>
#include <stout/protobuf.hpp>
#include <stout/stringify.hpp>
#include <stout/try.hpp>

#include <ocibridge/engine.hpp>
#include <ocibridge/executor.hpp>
#include <ocibridge/fetcher.hpp>

#include <ocibridge/docker/spec.hpp>

#include "docker/docker.hpp"
#include "docker/engine.hpp"
#include "docker/fetcher.hpp"

#include "executor/flags.hpp"

#include "logging/logging.hpp"

using namespace ocibridge;
using namespace ocibridge::internal;

using process::Future;
using process::Owned;
using process::Shared;

using std::cerr;
using std::cout;
using std::endl;
using std::string;


int main(int argc, char** argv)
{
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  ocibridge::internal::Flags flags;

  // Load flags from environment and command line.
  Try<flags::Warnings> load = flags.load("OCIBRIDGE_", argc, argv);

  if (flags.help) {
    cout << flags.usage() << endl;
    return EXIT_SUCCESS;
  }

  if (load.isError()) {
    cerr << flags.usage(load.error()) << endl;
    return EXIT_FAILURE;
  }

  logging::initialize(argv[0], true, flags); // Catch signals.

  // Log any flag warnings (after logging is initialized).
  foreach (const flags::Warning& warning, load->warnings) {
    LOG(WARNING) << warning.message;
  }

  VLOG(1) << stringify(flags);

  if (flags.direction.isNone()) {
    EXIT(EXIT_FAILURE) << flags.usage("Missing required option --direction");
  }

  if (flags.image.isNone()) {
    EXIT(EXIT_FAILURE) << flags.usage("Missing required option --image");
  }

  if (flags.path.isNone()) {
    EXIT(EXIT_FAILURE) << flags.usage("Missing required option --path");
  }

  // Parse the reference up front so a malformed one fails before
  // anything is pulled.
  Option<docker::spec::ImageReference> reference;
  if (flags.direction.get() == "to_daemon") {
    Try<docker::spec::ImageReference> parse =
      docker::spec::parseImageReference(flags.image.get());

    if (parse.isError()) {
      EXIT(EXIT_FAILURE)
        << flags.usage("Failed to parse --image: " + parse.error());
    }

    reference = parse.get();
  }

  FetchOptions options;
  options.set_pull_policy(parsePullPolicy(flags.pull_policy).get());
  if (flags.platform.isSome()) {
    options.set_platform(flags.platform.get());
  }

  process::initialize();

  Try<Owned<Docker>> create = Docker::create(
      flags.docker,
      flags.docker_socket);

  if (create.isError()) {
    EXIT(EXIT_FAILURE)
      << "Unable to create docker abstraction: " << create.error();
  }

  Shared<Docker> docker = create->share();

  ToolExecutor::Config config;
  config.image = flags.tool_image;
  config.socket = flags.docker_socket;
  config.removeTimeout = flags.remove_timeout;

  ToolExecutor executor(
      Shared<ImageFetcher>(new DockerImageFetcher(docker)),
      Shared<ContainerEngine>(new DockerContainerEngine(docker)),
      config);

  Future<Try<Nothing, TransferError>> init = executor.init(options);
  init.await();

  if (!init.isReady()) {
    EXIT(EXIT_FAILURE) << "Failed to initialize the transfer tool: "
                       << (init.isFailed() ? init.failure() : "discarded");
  }

  if (init->isError()) {
    EXIT(EXIT_FAILURE) << init->error().message;
  }

  Future<Try<TransferInfo, TransferError>> transfer =
    reference.isSome()
      ? executor.copyToDaemon(flags.path.get(), reference.get())
      : executor.copyToOCI(flags.image.get(), flags.path.get());

  transfer.await();

  if (!transfer.isReady()) {
    EXIT(EXIT_FAILURE) << "Failed to copy '" << flags.image.get() << "': "
                       << (transfer.isFailed() ? transfer.failure()
                                               : "discarded");
  }

  if (transfer->isError()) {
    const TransferError& error = transfer->error();

    LOG(ERROR) << "Failed to copy '" << flags.image.get() << "' ("
               << error.type << "): " << error.message;

    if (error.cleanup.isSome()) {
      LOG(ERROR) << TransferError::CONTAINER_REMOVE << ": "
                 << error.cleanup.get();
    }

    return EXIT_FAILURE;
  }

  const TransferInfo& info = transfer->get();

  if (info.has_cleanup_error()) {
    LOG(WARNING) << "Copied '" << flags.image.get() << "' but hit "
                 << TransferError::CONTAINER_REMOVE << ": "
                 << info.cleanup_error();
  }

  cout << stringify(JSON::protobuf(info)) << endl;

  return EXIT_SUCCESS;
}
