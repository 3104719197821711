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

#ifndef __DOCKER_HPP__
#define __DOCKER_HPP__

#include <string>
#include <vector>

#include <process/future.hpp>
#include <process/owned.hpp>
#include <process/subprocess.hpp>

#include <stout/json.hpp>
#include <stout/none.hpp>
#include <stout/nothing.hpp>
#include <stout/option.hpp>
#include <stout/try.hpp>
#include <stout/version.hpp>

// Default prefix used for the DOCKER_HOST of the docker CLI.
constexpr char DEFAULT_DOCKER_HOST_PREFIX[] = "unix://";

namespace ocibridge {
namespace internal {

// Abstraction for working with Docker (modeled on CLI).
//
// Every operation forks the docker CLI against the daemon listening on
// `socket`. Futures returned by the long running operations (`wait`
// and `pull`) can be discarded, which kills the CLI process.
class Docker
{
public:
  // Create Docker abstraction and optionally validate docker.
  static Try<process::Owned<Docker>> create(
      const std::string& path,
      const std::string& socket,
      bool validate = true);

  virtual ~Docker() {}

  class Image
  {
  public:
    static Try<Image> create(const JSON::Object& json);

    // Returns the ID of the image, e.g., 'sha256:...'.
    const std::string id;

    // Returns the 'REPOSITORY:TAG' names of the image.
    const std::vector<std::string> repoTags;

  private:
    Image(const std::string& _id, const std::vector<std::string>& _repoTags)
      : id(_id), repoTags(_repoTags) {}
  };

  // See https://docs.docker.com/engine/reference/commandline/create
  // for a complete explanation of each option.
  class CreateOptions
  {
  public:
    CreateOptions() : tty(false) {}

    // "--tty" option.
    bool tty;

    // "--volume" option.
    std::vector<std::string> volumes;

    // "IMAGE[:TAG|@DIGEST]" part of docker create.
    std::string image;

    // Arguments for docker create.
    std::vector<std::string> arguments;
  };

  // Performs 'docker create IMAGE'. Returns the ID of the created
  // container.
  virtual process::Future<std::string> create(
      const CreateOptions& options) const;

  // Performs 'docker start CONTAINER'.
  virtual process::Future<Nothing> start(
      const std::string& containerName) const;

  // Performs 'docker wait CONTAINER'. Blocks until the container
  // stops and returns its exit code, or None if docker did not print
  // one. The future fails if the docker CLI itself fails.
  virtual process::Future<Option<int>> wait(
      const std::string& containerName) const;

  // Performs 'docker rm (-f) CONTAINER'.
  virtual process::Future<Nothing> rm(
      const std::string& containerName,
      bool force = false) const;

  // Performs 'docker image inspect IMAGE'. Fails if the image is not
  // in the local store.
  virtual process::Future<Image> inspectImage(const std::string& image) const;

  // Performs 'docker pull IMAGE' unless the image is already in the
  // local store, or always if `force` is set. Returns the inspected
  // image after pulling.
  virtual process::Future<Image> pull(
      const std::string& image,
      const Option<std::string>& platform = None(),
      bool force = false) const;

  // Returns the current docker version.
  virtual process::Future<Version> version() const;

  // Validate current docker version is not less than minVersion.
  virtual Try<Nothing> validateVersion(const Version& minVersion) const;

  virtual std::string getPath()
  {
    return path;
  }

  virtual std::string getSocket()
  {
    return socket;
  }

protected:
  // Uses the specified path to the Docker CLI tool.
  Docker(const std::string& _path, const std::string& _socket)
    : path(_path),
      socket(DEFAULT_DOCKER_HOST_PREFIX + _socket) {}

private:
  // Runs the docker CLI with the given arguments (after '-H SOCKET')
  // and returns its standard output. Fails if the CLI exits non-zero.
  process::Future<std::string> execute(
      const std::vector<std::string>& arguments) const;

  static process::Future<Version> _version(const std::string& output);

  static process::Future<Option<int>> _wait(
      const std::string& containerName,
      const std::string& output);

  static process::Future<Image> _inspectImage(const std::string& output);

  static process::Future<Image> _pull(
      const Docker& docker,
      const std::string& image,
      const Option<std::string>& platform);

  const std::string path;
  const std::string socket;
};

} // namespace internal {
} // namespace ocibridge {

#endif // __DOCKER_HPP__
