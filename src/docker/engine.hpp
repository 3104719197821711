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

#ifndef __DOCKER_ENGINE_HPP__
#define __DOCKER_ENGINE_HPP__

#include <string>

#include <process/future.hpp>
#include <process/shared.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include <ocibridge/engine.hpp>

#include "docker/docker.hpp"

namespace ocibridge {
namespace internal {

// Adapts the docker CLI abstraction to the container lifecycle
// operations of `ContainerEngine`.
class DockerContainerEngine : public ContainerEngine
{
public:
  explicit DockerContainerEngine(const process::Shared<Docker>& _docker)
    : docker(_docker) {}

  ~DockerContainerEngine() override {}

  process::Future<std::string> create(const Config& config) const override;

  process::Future<Nothing> start(
      const std::string& containerId) const override;

  process::Future<Option<int>> wait(
      const std::string& containerId) const override;

  process::Future<Nothing> remove(
      const std::string& containerId,
      bool force = false) const override;

private:
  process::Shared<Docker> docker;
};

} // namespace internal {
} // namespace ocibridge {

#endif // __DOCKER_ENGINE_HPP__
