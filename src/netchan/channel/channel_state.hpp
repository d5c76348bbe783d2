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
#include <variant>

namespace netchan::channel
{

// Types.

/**
 * The lifecycle state of a channel: `Idle` -> `Activating` -> `Active` -> `Closed`, with `Closed` reachable from
 * each of the others and absorbing.  `Activating` carries the one pending activation completion handler.
 *
 * This is pure bookkeeping: it enforces the transitions (and what an illegal request gets back) but invokes
 * nothing.  Handlers it gives back are for the caller to invoke.
 *
 * ### Thread safety ###
 * None; it lives on thread W of its channel.
 */
class Channel_state
{
public:
  // Types.

  /// The states, without payload.
  enum class Kind
  {
    /// Created; nothing requested yet.
    S_IDLE,
    /// Activation requested; its completion is pending.
    S_ACTIVATING,
    /// Activated.
    S_ACTIVE,
    /// Closed (terminal).
    S_CLOSED
  }; // enum class Kind

  /// What begin_closing() leaves the caller to do.
  struct Close_result
  {
    /// If the channel was activating: the pending activation handler, to be failed.  Else empty.
    Task_err m_on_activated_func;
    /// Whether the channel was active.
    bool m_was_active;
  };

  // Constructors/destructor.

  /// Starts out `Idle`.
  Channel_state();

  // Methods.

  /**
   * Current state.
   * @return See above.
   */
  Kind kind() const;

  /**
   * Shortcut for `kind() == Kind::S_CLOSED`.
   * @return See above.
   */
  bool closed() const;

  /**
   * Reason given to begin_closing(); success unless closed().
   * @return See above.
   */
  const Error_code& closed_reason() const;

  /**
   * `Idle` -> `Activating`, storing `on_done_func`.  On error nothing changes, and `on_done_func` is not
   * touched.
   *
   * @param on_done_func
   *        The pending activation handler.
   * @return Success; or error::Code::S_IO_ON_CLOSED_CHANNEL if `Closed`;
   *         or error::Code::S_INAPPROPRIATE_OPERATION_FOR_STATE if `Activating` or `Active`.
   */
  Error_code begin_activating(Task_err&& on_done_func);

  /**
   * `Activating` -> `Active`.  Pre-condition: `Activating`.
   *
   * @return The pending activation handler, to be invoked with success.
   */
  Task_err become_active();

  /**
   * Any non-`Closed` state -> `Closed(reason)`.  Pre-condition: `!closed()`.
   *
   * @param reason
   *        Why.
   * @return See Close_result.
   */
  Close_result begin_closing(const Error_code& reason);

  /**
   * Takes the pending activation handler out, if `Activating`, leaving an empty one in its place; else returns an
   * empty handler.  Used only on destruction.
   *
   * @return See above.
   */
  Task_err take_pending_activation();

private:
  // Types.

  /// `Idle`.
  struct Idle {};

  /// `Activating`.
  struct Activating
  {
    /// The pending activation handler.
    Task_err m_on_done_func;
  };

  /// `Active`.
  struct Active {};

  /// `Closed`.
  struct Closed
  {
    /// Reason.
    Error_code m_reason;
  };

  // Data.

  /// The state.
  std::variant<Idle, Activating, Active, Closed> m_value;
}; // class Channel_state

// Free functions.

/**
 * Prints string representation of the given state to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Channel_state::Kind val);

} // namespace netchan::channel
