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

#ifndef __DOCKER_FETCHER_HPP__
#define __DOCKER_FETCHER_HPP__

#include <string>

#include <process/future.hpp>
#include <process/shared.hpp>

#include <ocibridge/fetcher.hpp>

#include "docker/docker.hpp"

namespace ocibridge {
namespace internal {

// Fetches images into the local store of the docker daemon, pulling
// them from their registries as the pull policy dictates.
class DockerImageFetcher : public ImageFetcher
{
public:
  explicit DockerImageFetcher(const process::Shared<Docker>& _docker)
    : docker(_docker) {}

  ~DockerImageFetcher() override {}

  process::Future<Image> fetch(
      const std::string& image,
      const FetchOptions& options) const override;

private:
  process::Shared<Docker> docker;
};

} // namespace internal {
} // namespace ocibridge {

#endif // __DOCKER_FETCHER_HPP__
