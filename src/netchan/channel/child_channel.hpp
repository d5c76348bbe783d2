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

#include "netchan/channel/state_managed_channel.hpp"
#include "netchan/platform/platform_connection.hpp"
#include "netchan/platform/protocol_options.hpp"

namespace netchan::channel
{

// Types.

/**
 * The channel a Listener_channel creates around each accepted platform::Platform_connection.  It has the same
 * lifecycle as any State_managed_channel: async_register() takes it from `Idle` through `Activating` (the child
 * protocol options are applied to the socket and the connection is start()ed on the child loop's callback queue)
 * to `Active` (the connection reported platform::Connection_state::S_READY; addresses are now cached).  A
 * connection failure closes it with the failure's error; closing it cancels the connection.
 *
 * From registration until closed, a Child_channel keeps itself alive; so the listener, which merely hands it off,
 * need not keep a reference to it.  Once closed, it lives only as long as the user holds it.
 *
 * It does no I/O of its own; native_handle() exposes the socket to whoever consumes the child.
 *
 * ### Thread safety ###
 * Same as State_managed_channel.
 */
class Child_channel :
  public State_managed_channel
{
public:
  // Constructors/destructor.

  /// Cancels the connection, if not already closed.
  ~Child_channel() override;

  // Methods.

  /**
   * Creates an `Idle` child.
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param nickname
   *        Human-readable name.
   * @param loop
   *        Owning loop.  Must outlive the returned object.
   * @param connection
   *        The accepted connection, in platform::Connection_state::S_SETUP.
   * @param protocol_options
   *        Options to apply to the connection.
   * @param configurator
   *        Optional hook to modify (a copy of) `protocol_options` at registration.
   * @return The channel.
   */
  static Child_channel_ptr create(flow::log::Logger* logger_ptr, util::String_view nickname,
                                  util::Event_loop* loop, platform::Platform_connection_ptr connection,
                                  const platform::Protocol_options& protocol_options,
                                  const Child_parameters_configurator& configurator);

  /**
   * Registers the child: applies options and starts the connection; see class doc header.  `on_done_func`
   * receives success once the connection is ready; error::Code::S_INAPPROPRIATE_OPERATION_FOR_STATE or
   * error::Code::S_IO_ON_CLOSED_CHANNEL if not `Idle`; or the error that closed the child meanwhile.
   *
   * @param on_done_func
   *        Completion handler.
   */
  void async_register(Task_err&& on_done_func);

  /**
   * The connection's socket, or `Native_handle()` if none or closed.  Owned by the connection.
   * @return See above.
   */
  util::Native_handle native_handle() const;

  /**
   * The protocol options as applied at registration (i.e., after the configurator ran); until then, as given to
   * create().  Thread W only (e.g., from a completion handler).
   *
   * @return See above.
   */
  const platform::Protocol_options& protocol_options0() const;

private:
  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param nickname
   *        See create().
   * @param loop
   *        See create().
   * @param connection
   *        See create().
   * @param protocol_options
   *        See create().
   * @param configurator
   *        See create().
   */
  explicit Child_channel(flow::log::Logger* logger_ptr, util::String_view nickname, util::Event_loop* loop,
                         platform::Platform_connection_ptr&& connection,
                         const platform::Protocol_options& protocol_options,
                         const Child_parameters_configurator& configurator);

  // Methods.

  /**
   * Thread W: body of async_register().
   *
   * @param on_done_func
   *        See async_register().
   */
  void register0(Task_err&& on_done_func);

  /**
   * Thread W: reacts to a state notification from #m_connection.
   *
   * @param new_state
   *        State.
   * @param err_code
   *        Error, if `S_FAILED`.
   */
  void on_connection_state0(platform::Connection_state new_state, const Error_code& err_code);

  /// Implements State_managed_channel API: cancels #m_connection; gives up the self-reference.
  void do_close0() override;

  // Data.

  /// The connection.
  const platform::Platform_connection_ptr m_connection;

  /// Thread W: see protocol_options0().
  platform::Protocol_options m_protocol_options;

  /// See create().
  const Child_parameters_configurator m_configurator;

  /// Thread W: `*this`, from registration until closed; else null.
  std::shared_ptr<State_managed_channel> m_self_ref;
}; // class Child_channel

} // namespace netchan::channel
