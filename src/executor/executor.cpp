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

#include <ostream>
#include <string>
#include <vector>

#include <glog/logging.h>

#include <process/clock.hpp>
#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/shared.hpp>
#include <process/time.hpp>

#include <stout/duration.hpp>
#include <stout/foreach.hpp>
#include <stout/none.hpp>
#include <stout/os.hpp>
#include <stout/path.hpp>
#include <stout/some.hpp>
#include <stout/strings.hpp>
#include <stout/stringify.hpp>
#include <stout/unreachable.hpp>

#include <stout/os/mkdir.hpp>
#include <stout/os/stat.hpp>

#include <ocibridge/executor.hpp>

using process::Clock;
using process::Failure;
using process::Future;
using process::Owned;
using process::Promise;
using process::Shared;
using process::Time;

using std::ostream;
using std::string;
using std::vector;

namespace ocibridge {

using Transfer = Try<TransferInfo, TransferError>;


ostream& operator<<(ostream& stream, const TransferError::Type& type)
{
  switch (type) {
    case TransferError::TOOL_FETCH:
      return stream << "TOOL_FETCH";
    case TransferError::DESTINATION_CREATE:
      return stream << "DESTINATION_CREATE";
    case TransferError::CONTAINER_CREATE:
      return stream << "CONTAINER_CREATE";
    case TransferError::CONTAINER_START:
      return stream << "CONTAINER_START";
    case TransferError::CONTAINER_RUN:
      return stream << "CONTAINER_RUN";
    case TransferError::CONTAINER_REMOVE:
      return stream << "CONTAINER_REMOVE";
  }

  UNREACHABLE();
}


template <typename T>
static string reason(const Future<T>& future)
{
  return future.isFailed() ? future.failure() : "discarded";
}


// Starts the created container and waits for the tool to exit. Any
// failure, including a discard, is turned into a `TransferError`.
static Future<Transfer> execute(
    const Shared<ContainerEngine>& engine,
    const string& containerId,
    const string& cmd,
    const vector<string>& binds)
{
  return engine->start(containerId)
    .then([=]() -> Future<Transfer> {
      const Time start = Clock::now();

      LOG(INFO) << "Executing '" << cmd << "' in container " << containerId
                << " with host bindings: " << strings::join(", ", binds);

      return engine->wait(containerId)
        .then([=](const Option<int>& status) -> Future<Transfer> {
          const Duration elapsed = Clock::now() - start;

          LOG(INFO) << "'" << cmd << "' took " << elapsed;

          if (status.isSome() && status.get() != 0) {
            return Transfer(TransferError(
                TransferError::CONTAINER_RUN,
                "'" + cmd + "' in container " + containerId +
                " exited with status " + stringify(status.get())));
          }

          TransferInfo info;
          if (status.isSome()) {
            info.set_exit_status(status.get());
          }
          info.mutable_elapsed()->set_nanoseconds(elapsed.ns());

          return Transfer(info);
        })
        .recover([=](const Future<Transfer>& future) -> Future<Transfer> {
          LOG(INFO) << "'" << cmd << "' stopped being waited for after "
                    << (Clock::now() - start);

          return Transfer(TransferError(
              TransferError::CONTAINER_RUN,
              "Failed to run container " + containerId + " executing '" +
              cmd + "': " + reason(future)));
        });
    })
    .recover([=](const Future<Transfer>& future) -> Future<Transfer> {
      return Transfer(TransferError(
          TransferError::CONTAINER_START,
          "Failed to start container " + containerId + " for running '" +
          cmd + "': " + reason(future)));
    });
}


// Force-removes the container within `timeout`. Returns the reason
// removal failed, if it did.
static Future<Option<string>> cleanup(
    const Shared<ContainerEngine>& engine,
    const string& containerId,
    const Duration& timeout)
{
  return engine->remove(containerId, true)
    .after(timeout, [timeout](Future<Nothing> future) -> Future<Nothing> {
      future.discard();
      return Failure("Timed out after " + stringify(timeout));
    })
    .then([]() -> Option<string> { return None(); })
    .recover([containerId](const Future<Option<string>>& future)
        -> Future<Option<string>> {
      return Option<string>(
          "Failed to remove container " + containerId + ": " + reason(future));
    });
}


ToolExecutor::ToolExecutor(
    const Shared<ImageFetcher>& _fetcher,
    const Shared<ContainerEngine>& _engine,
    const Config& _config)
  : fetcher(_fetcher),
    engine(_engine),
    config(_config) {}


Future<Try<Nothing, TransferError>> ToolExecutor::init(
    const FetchOptions& options) const
{
  LOG(INFO) << "Fetching transfer tool '" << config.image << "', required"
            << " for copying images from and to OCI layouts";

  const string image = config.image;

  return fetcher->fetch(image, options)
    .then([](const ImageFetcher::Image& fetched)
        -> Future<Try<Nothing, TransferError>> {
      VLOG(1) << "Transfer tool '" << fetched.name << "' (" << fetched.id
              << ") is available";

      return Try<Nothing, TransferError>(Nothing());
    })
    .recover([image](const Future<Try<Nothing, TransferError>>& future)
        -> Future<Try<Nothing, TransferError>> {
      return Try<Nothing, TransferError>(TransferError(
          TransferError::TOOL_FETCH,
          "Failed to fetch transfer tool image '" + image + "': " +
          reason(future)));
    });
}


Future<Transfer> ToolExecutor::copyToOCI(
    const string& image,
    const string& path) const
{
  // NOTE: The layout directory is named after everything before the
  // first ':' of the reference, which drops a tag but also cuts a
  // registry port or a digest.
  const string name = strings::split(image, ":", 2).front();
  const string destination = path::join(path, name);

  Try<Nothing> mkdir = os::mkdir(destination);
  if (mkdir.isError()) {
    return Transfer(TransferError(
        TransferError::DESTINATION_CREATE,
        "Failed to create destination path '" + destination + "': " +
        mkdir.error()));
  }

  // Existing path components are accepted by `os::mkdir` even when
  // they are not directories.
  if (!os::stat::isdir(destination)) {
    return Transfer(TransferError(
        TransferError::DESTINATION_CREATE,
        "Failed to create destination path '" + destination +
        "': Not a directory"));
  }

  const vector<string> command = {
    "copy",
    "docker-daemon:" + image,
    "oci:" + path::join(OCI_MOUNT_POINT, image)
  };

  return run(command, path);
}


Future<Transfer> ToolExecutor::copyToDaemon(
    const string& path,
    const docker::spec::ImageReference& reference) const
{
  const vector<string> command = {
    "copy",
    "oci:" + path::join(OCI_MOUNT_POINT, stringify(reference)),
    "docker-daemon:" + docker::spec::getName(reference)
  };

  return run(command, path);
}


Future<Transfer> ToolExecutor::run(
    const vector<string>& command,
    const string& path) const
{
  ContainerEngine::Config container;
  container.image = config.image;
  container.command = command;
  container.tty = false;
  container.binds = {
    path + ":" + OCI_MOUNT_POINT,
    config.socket + ":" + TOOL_DOCKER_SOCKET
  };

  const string cmd = strings::join(" ", command);
  const Shared<ContainerEngine> engine = this->engine;
  const Duration removeTimeout = config.removeTimeout;

  Owned<Promise<Transfer>> promise(new Promise<Transfer>());

  Future<string> created = engine->create(container);

  // Discarding the returned future is forwarded to the pending step,
  // but a created container is removed before the future completes.
  promise->future().onDiscard([created]() mutable {
    created.discard();
  });

  created.onAny([=](const Future<string>& future) {
    if (!future.isReady()) {
      promise->set(Transfer(TransferError(
          TransferError::CONTAINER_CREATE,
          "Failed to create container for running '" + cmd + "': " +
          reason(future))));
      return;
    }

    const string containerId = future.get();

    VLOG(1) << "Created container " << containerId << " from '"
            << container.image << "' for running '" << cmd << "'";

    Future<Transfer> transfer =
      execute(engine, containerId, cmd, container.binds);

    promise->future().onDiscard([transfer]() mutable {
      transfer.discard();
    });

    transfer.onAny([=](const Future<Transfer>& future) {
      const Transfer result = future.isReady()
        ? future.get()
        : Transfer(TransferError(
              TransferError::CONTAINER_RUN,
              "Failed to run container " + containerId + " executing '" +
              cmd + "': " + reason(future)));

      cleanup(engine, containerId, removeTimeout)
        .onAny([=](const Future<Option<string>>& removal) {
          Option<string> warning;
          if (!removal.isReady()) {
            warning = "Failed to remove container " + containerId + ": " +
                      reason(removal);
          } else {
            warning = removal.get();
          }

          if (result.isError()) {
            TransferError error = result.error();
            if (warning.isSome()) {
              LOG(WARNING) << warning.get();
              error.cleanup = warning;
            }

            promise->set(Transfer(error));
            return;
          }

          TransferInfo info = result.get();
          info.set_container_id(containerId);
          foreach (const string& argument, container.command) {
            info.add_command(argument);
          }
          foreach (const string& bind, container.binds) {
            info.add_binds(bind);
          }

          if (warning.isSome()) {
            LOG(WARNING) << "Transfer succeeded but " << warning.get();
            info.set_cleanup_error(warning.get());
          }

          promise->set(Transfer(info));
        });
    });
  });

  return promise->future();
}

} // namespace ocibridge {
