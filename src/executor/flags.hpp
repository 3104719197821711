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

#ifndef __EXECUTOR_FLAGS_HPP__
#define __EXECUTOR_FLAGS_HPP__

#include <string>

#include <stout/duration.hpp>
#include <stout/flags.hpp>
#include <stout/option.hpp>

#include "logging/flags.hpp"

namespace ocibridge {
namespace internal {

// Flags of the 'ocibridge-copy' tool. They can also be given as
// environment variables with the 'OCIBRIDGE_' prefix.
class Flags : public virtual logging::Flags
{
public:
  Flags();

  std::string docker;
  std::string docker_socket;
  std::string tool_image;
  Duration remove_timeout;
  std::string pull_policy;
  Option<std::string> platform;
  Option<std::string> direction;
  Option<std::string> image;
  Option<std::string> path;
};

} // namespace internal {
} // namespace ocibridge {

#endif // __EXECUTOR_FLAGS_HPP__
