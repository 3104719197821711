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

#ifndef __OCIBRIDGE_ENGINE_HPP__
#define __OCIBRIDGE_ENGINE_HPP__

#include <string>
#include <vector>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>

namespace ocibridge {

/**
 * Provides the container lifecycle operations needed to run a short
 * lived tool container on a container engine: create, start, wait
 * and remove. Engine clients usually offer much more; implementations
 * of this interface adapt such a client and expose only these four.
 */
class ContainerEngine
{
public:
  /**
   * Describes the container to be created.
   */
  struct Config
  {
    Config() : tty(false) {}

    // "IMAGE[:TAG|@DIGEST]" to create the container from.
    std::string image;

    // Arguments passed to the entrypoint of the image.
    std::vector<std::string> command;

    // Whether a pseudo-TTY is allocated for the container.
    bool tty;

    // Bind mounts in 'HOST_PATH:CONTAINER_PATH[:OPTIONS]' form.
    std::vector<std::string> binds;
  };

  virtual ~ContainerEngine() {}

  /**
   * Creates (but does not start) a container.
   *
   * @return the ID of the created container.
   */
  virtual process::Future<std::string> create(const Config& config) const = 0;

  /**
   * Starts a created container.
   */
  virtual process::Future<Nothing> start(
      const std::string& containerId) const = 0;

  /**
   * Waits for the container to leave the running state. The returned
   * future fails if the engine reports an error while waiting, and is
   * otherwise set to the exit code of the container, or None if the
   * engine did not report one. Discarding the returned future stops
   * waiting but does not stop the container.
   */
  virtual process::Future<Option<int>> wait(
      const std::string& containerId) const = 0;

  /**
   * Removes the container. If `force` is set a running container is
   * killed first.
   */
  virtual process::Future<Nothing> remove(
      const std::string& containerId,
      bool force = false) const = 0;
};

} // namespace ocibridge {

#endif // __OCIBRIDGE_ENGINE_HPP__
