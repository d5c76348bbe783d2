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
#pragma once

#include "netchan/channel/channel_fwd.hpp"
#include "netchan/platform/endpoint.hpp"
#include <flow/util/util.hpp>
#include <optional>

namespace netchan::channel
{

// Types.

/**
 * Lock-guarded snapshot of a channel's local and remote addresses.  The channel writes it (once, on thread W,
 * when activation completes); anyone may read it from any thread.  This is the only state of a channel that is
 * not confined to thread W.
 */
class Address_cache
{
public:
  // Methods.

  /**
   * Local address; nullopt if not (yet) known.
   * @return See above.
   */
  std::optional<Socket_address> local_address() const;

  /**
   * Remote address; nullopt if not (yet) known or not applicable.
   * @return See above.
   */
  std::optional<Socket_address> remote_address() const;

  /**
   * Replaces both addresses atomically.
   *
   * @param local_address
   *        New local address.
   * @param remote_address
   *        New remote address.
   */
  void set(std::optional<Socket_address>&& local_address, std::optional<Socket_address>&& remote_address);

private:
  // Data.

  /// Protects the below.
  mutable flow::util::Mutex_non_recursive m_mutex;

  /// See local_address().
  std::optional<Socket_address> m_local_address;

  /// See remote_address().
  std::optional<Socket_address> m_remote_address;
}; // class Address_cache

} // namespace netchan::channel
