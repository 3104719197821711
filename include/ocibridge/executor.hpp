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

#ifndef __OCIBRIDGE_EXECUTOR_HPP__
#define __OCIBRIDGE_EXECUTOR_HPP__

#include <iosfwd>
#include <string>
#include <vector>

#include <process/future.hpp>
#include <process/shared.hpp>

#include <stout/duration.hpp>
#include <stout/error.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>

#include <ocibridge/engine.hpp>
#include <ocibridge/fetcher.hpp>

#include <ocibridge/docker/spec.hpp>

// ONLY USEFUL AFTER RUNNING PROTOC.
#include <ocibridge/ocibridge.pb.h>

namespace ocibridge {

// The skopeo image used to copy images between the engine and
// OCI layout directories.
constexpr char DEFAULT_TOOL_IMAGE[] = "quay.io/skopeo/stable:latest";

// Where the host directory holding the OCI layouts is mounted inside
// the tool container.
constexpr char OCI_MOUNT_POINT[] = "/oci";

constexpr char DEFAULT_DOCKER_SOCKET[] = "/var/run/docker.sock";

// Where the engine socket is mounted in the tool container. The tool
// connects to the engine through this path.
constexpr char TOOL_DOCKER_SOCKET[] = "/var/run/docker.sock";

// Upper bound on removing a tool container once it has exited.
constexpr Duration DEFAULT_REMOVE_TIMEOUT = Seconds(30);


// Represents the errors returned by the `ToolExecutor` via a `Try`
// that has failed. The type tells which step of the transfer failed.
class TransferError : public Error
{
public:
  enum Type
  {
    TOOL_FETCH,          // The tool image could not be fetched.
    DESTINATION_CREATE,  // The destination directory could not be created.
    CONTAINER_CREATE,    // The tool container could not be created.
    CONTAINER_START,     // The tool container could not be started.
    CONTAINER_RUN,       // Waiting failed or the tool exited non-zero.
    CONTAINER_REMOVE     // The tool container could not be removed; only
                         // reported next to the outcome of a transfer.
  };

  TransferError(Type _type, const std::string& message)
    : Error(message), type(_type) {}

  Type type;

  // Set when removing the container also failed after the transfer
  // itself failed.
  Option<std::string> cleanup;
};


std::ostream& operator<<(std::ostream& stream, const TransferError::Type& type);


/**
 * Copies images between the local store of a container engine and
 * OCI layout directories on the host by running a transfer tool
 * (skopeo) in a short lived container.
 *
 * Each copy runs exactly one container that has the host directory
 * mounted at `OCI_MOUNT_POINT` and the engine socket mounted at
 * `TOOL_DOCKER_SOCKET`, so the tool talks to the engine that runs
 * it. The container is removed on every path once it has been
 * created. Discarding the future returned by a copy stops waiting for
 * the tool, but the returned future is only completed once the
 * container has been removed (or removal timed out).
 *
 * NOTE: Overlapping copies against the same host directory are not
 * serialized.
 */
class ToolExecutor
{
public:
  struct Config
  {
    Config()
      : image(DEFAULT_TOOL_IMAGE),
        socket(DEFAULT_DOCKER_SOCKET),
        removeTimeout(DEFAULT_REMOVE_TIMEOUT) {}

    // The transfer tool image.
    std::string image;

    // Path of the engine socket on the host.
    std::string socket;

    // How long to wait for the container to be removed.
    Duration removeTimeout;
  };

  ToolExecutor(
      const process::Shared<ImageFetcher>& fetcher,
      const process::Shared<ContainerEngine>& engine,
      const Config& config = Config());

  /**
   * Makes sure the tool image is in the local store, pulling it as
   * `options` dictate. Safe to call more than once.
   */
  process::Future<Try<Nothing, TransferError>> init(
      const FetchOptions& options) const;

  /**
   * Copies `image` from the engine's store into an OCI layout below
   * `path`. The layout directory is named after `image` with its tag
   * removed and is created if needed.
   */
  process::Future<Try<TransferInfo, TransferError>> copyToOCI(
      const std::string& image,
      const std::string& path) const;

  /**
   * Copies the OCI layout for `reference` below `path` into the
   * engine's store, as an image named `getName(reference)`.
   */
  process::Future<Try<TransferInfo, TransferError>> copyToDaemon(
      const std::string& path,
      const docker::spec::ImageReference& reference) const;

  const Config& getConfig() const
  {
    return config;
  }

private:
  process::Future<Try<TransferInfo, TransferError>> run(
      const std::vector<std::string>& command,
      const std::string& path) const;

  process::Shared<ImageFetcher> fetcher;
  process::Shared<ContainerEngine> engine;
  const Config config;
};

} // namespace ocibridge {

#endif // __OCIBRIDGE_EXECUTOR_HPP__
