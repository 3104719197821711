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

#include <string>

#include "docker/engine.hpp"

using process::Future;

using std::string;

namespace ocibridge {
namespace internal {

Future<string> DockerContainerEngine::create(const Config& config) const
{
  Docker::CreateOptions options;
  options.tty = config.tty;
  options.volumes = config.binds;
  options.image = config.image;
  options.arguments = config.command;

  return docker->create(options);
}


Future<Nothing> DockerContainerEngine::start(const string& containerId) const
{
  return docker->start(containerId);
}


Future<Option<int>> DockerContainerEngine::wait(
    const string& containerId) const
{
  return docker->wait(containerId);
}


Future<Nothing> DockerContainerEngine::remove(
    const string& containerId,
    bool force) const
{
  return docker->rm(containerId, force);
}

} // namespace internal {
} // namespace ocibridge {
