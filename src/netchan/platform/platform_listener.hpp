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

#include "netchan/platform/listener_parameters.hpp"
#include <boost/noncopyable.hpp>
#include <optional>

namespace netchan::platform
{

// Types.

/**
 * The platform listening primitive at its interface boundary: an object that, once constructed from
 * Listener_parameters and start()ed on a callback queue, listens for incoming connections and reports both its
 * state transitions and each new connection through handlers invoked on that queue.
 *
 * The state machine is: Listener_state::S_SETUP, then (after start()) any of `S_WAITING`/`S_READY` any number
 * of times, then exactly one of `S_FAILED` (with a non-success #Error_code) or `S_CANCELLED` (after cancel()).
 * Nothing is reported after a terminal state.  `S_SETUP` itself is never reported.
 *
 * ### Thread safety ###
 * Handlers must be set before start().  state(), port() and parameters() are safe to call from any thread at
 * any time.  cancel() may be called from any thread, any number of times.
 */
class Platform_listener :
  private boost::noncopyable
{
public:
  // Types.

  /// Handler for state transitions; #Error_code is success unless the state is Listener_state::S_FAILED.
  using State_handler = Function<void (Listener_state new_state, const Error_code& err_code)>;

  /// Handler for each newly arrived connection; the connection is in Connection_state::S_SETUP.
  using New_connection_handler = Function<void (Platform_connection_ptr new_connection)>;

  // Constructors/destructor.

  /// Boring virtual destructor.
  virtual ~Platform_listener();

  // Methods.

  /**
   * Current state.
   * @return See above.
   */
  virtual Listener_state state() const = 0;

  /**
   * Parameters with which `*this` was constructed.
   * @return See above.
   */
  virtual const Listener_parameters& parameters() const = 0;

  /**
   * The actual local port, once known (typically when Listener_state::S_READY); nullopt before then or if
   * not applicable (Unix-domain).
   *
   * @return See above.
   */
  virtual std::optional<uint16_t> port() const = 0;

  /**
   * Sets the service under which to advertise; must be called before start() to have an effect.
   *
   * @param service
   *        Service.
   */
  virtual void set_service(const Service_endpoint& service) = 0;

  /**
   * Sets the state handler.  Must be called before start().
   *
   * @param handler
   *        Handler.
   */
  virtual void set_state_handler(State_handler&& handler) = 0;

  /**
   * Sets the new-connection handler.  Must be called before start().
   *
   * @param handler
   *        Handler.
   */
  virtual void set_new_connection_handler(New_connection_handler&& handler) = 0;

  /**
   * Starts listening; handlers shall be invoked on `queue`.  Must be called at most once.
   *
   * @param queue
   *        Callback queue.  Must remain valid until the handler reporting a terminal state has finished.
   */
  virtual void start(util::Task_engine* queue) = 0;

  /// Stops listening; a Listener_state::S_CANCELLED notification follows unless already in a terminal state.
  virtual void cancel() = 0;
}; // class Platform_listener

} // namespace netchan::platform
