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

#include "netchan/platform/endpoint.hpp"
#include "netchan/util/native_handle.hpp"
#include <boost/noncopyable.hpp>
#include <optional>

namespace netchan::platform
{

// Types.

/**
 * The platform connection primitive: one accepted connection, as handed out by a Platform_listener.  It starts
 * out in Connection_state::S_SETUP; a channel::Child_channel start()s it on its own callback queue.
 *
 * ### Thread safety ###
 * Same as Platform_listener.
 */
class Platform_connection :
  private boost::noncopyable
{
public:
  // Types.

  /// Handler for state transitions; #Error_code is success unless the state is Connection_state::S_FAILED.
  using State_handler = Function<void (Connection_state new_state, const Error_code& err_code)>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Platform_connection();

  // Methods.

  /**
   * Current state.
   * @return See above.
   */
  virtual Connection_state state() const = 0;

  /**
   * Starts the connection; `on_state_func` shall be invoked on `queue`.  Must be called at most once.
   *
   * @param queue
   *        Callback queue.
   * @param on_state_func
   *        Handler.
   */
  virtual void start(util::Task_engine* queue, State_handler&& on_state_func) = 0;

  /// Closes the connection; a Connection_state::S_CANCELLED notification follows unless already terminal.
  virtual void cancel() = 0;

  /**
   * Local address; nullopt if not known.
   * @return See above.
   */
  virtual std::optional<Socket_address> local_address() const = 0;

  /**
   * Remote address; nullopt if not known.
   * @return See above.
   */
  virtual std::optional<Socket_address> remote_address() const = 0;

  /**
   * The underlying native socket, if any, while not closed; else `Native_handle()`.  Owned by `*this`.
   * @return See above.
   */
  virtual util::Native_handle native_handle() const = 0;
}; // class Platform_connection

} // namespace netchan::platform
