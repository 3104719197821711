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

#ifndef __TESTS_MOCKDOCKER_HPP__
#define __TESTS_MOCKDOCKER_HPP__

#include <string>

#include <gmock/gmock.h>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include "docker/docker.hpp"

using ::testing::_;
using ::testing::Invoke;

namespace ocibridge {
namespace internal {
namespace tests {

// Definition of a mock Docker to be used in tests with gmock. Calls
// without an explicit expectation fall through to the docker CLI at
// `path`.
class MockDocker : public Docker
{
public:
  MockDocker(const std::string& path, const std::string& socket);
  ~MockDocker() override;

  MOCK_CONST_METHOD1(
      create,
      process::Future<std::string>(const Docker::CreateOptions&));

  MOCK_CONST_METHOD1(
      start,
      process::Future<Nothing>(const std::string&));

  MOCK_CONST_METHOD1(
      wait,
      process::Future<Option<int>>(const std::string&));

  MOCK_CONST_METHOD2(
      rm,
      process::Future<Nothing>(const std::string&, bool));

  MOCK_CONST_METHOD1(
      inspectImage,
      process::Future<Docker::Image>(const std::string&));

  MOCK_CONST_METHOD3(
      pull,
      process::Future<Docker::Image>(
          const std::string&,
          const Option<std::string>&,
          bool));

  process::Future<std::string> _create(
      const Docker::CreateOptions& options) const
  {
    return Docker::create(options);
  }

  process::Future<Nothing> _start(const std::string& containerName) const
  {
    return Docker::start(containerName);
  }

  process::Future<Option<int>> _wait(const std::string& containerName) const
  {
    return Docker::wait(containerName);
  }

  process::Future<Nothing> _rm(
      const std::string& containerName,
      bool force) const
  {
    return Docker::rm(containerName, force);
  }

  process::Future<Docker::Image> _inspectImage(const std::string& image) const
  {
    return Docker::inspectImage(image);
  }

  process::Future<Docker::Image> _pull(
      const std::string& image,
      const Option<std::string>& platform,
      bool force) const
  {
    return Docker::pull(image, platform, force);
  }
};

} // namespace tests {
} // namespace internal {
} // namespace ocibridge {

#endif // __TESTS_MOCKDOCKER_HPP__
