/* Flow-NetChan
 * Copyright 2023 Akamai Technologies, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the
 * "License"); you may not use this file except in
 * compliance with the License.  You may obtain a copy
 * of the License at
 *
 *   https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in
 * writing, software distributed under the License is
 * distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR
 * CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing
 * permissions and limitations under the License. */

/// @file
#include "netchan/channel/address_cache.hpp"

namespace netchan::channel
{

std::optional<Socket_address> Address_cache::local_address() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_local_address;
}

std::optional<Socket_address> Address_cache::remote_address() const
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  return m_remote_address;
}

void Address_cache::set(std::optional<Socket_address>&& local_address,
                        std::optional<Socket_address>&& remote_address)
{
  flow::util::Lock_guard<decltype(m_mutex)> lock(m_mutex);
  m_local_address = std::move(local_address);
  m_remote_address = std::move(remote_address);
}

} // namespace netchan::channel
