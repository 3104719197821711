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

#ifndef __TESTS_MOCK_ENGINE_HPP__
#define __TESTS_MOCK_ENGINE_HPP__

#include <string>

#include <gmock/gmock.h>

#include <process/future.hpp>

#include <stout/nothing.hpp>
#include <stout/option.hpp>

#include <ocibridge/engine.hpp>
#include <ocibridge/fetcher.hpp>

#include <ocibridge/ocibridge.pb.h>

namespace ocibridge {
namespace internal {
namespace tests {

class MockContainerEngine : public ContainerEngine
{
public:
  MockContainerEngine();
  ~MockContainerEngine() override;

  MOCK_CONST_METHOD1(
      create,
      process::Future<std::string>(const ContainerEngine::Config&));

  MOCK_CONST_METHOD1(
      start,
      process::Future<Nothing>(const std::string&));

  MOCK_CONST_METHOD1(
      wait,
      process::Future<Option<int>>(const std::string&));

  MOCK_CONST_METHOD2(
      remove,
      process::Future<Nothing>(const std::string&, bool));
};


class MockImageFetcher : public ImageFetcher
{
public:
  MockImageFetcher();
  ~MockImageFetcher() override;

  MOCK_CONST_METHOD2(
      fetch,
      process::Future<ImageFetcher::Image>(
          const std::string&,
          const FetchOptions&));
};

} // namespace tests {
} // namespace internal {
} // namespace ocibridge {

#endif // __TESTS_MOCK_ENGINE_HPP__
