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
#include "netchan/channel/channel_option.hpp"
#include "netchan/platform/platform_listener.hpp"
#include "netchan/channel/error.hpp"
#include <any>
#include <typeinfo>

namespace netchan::channel
{

// Types.

/**
 * A channel wrapping a platform::Platform_listener: it binds, listens, and hands each accepted connection to a
 * newly created Child_channel on a loop drawn from the configured child loop group.
 *
 * ### Lifecycle ###
 * A Listener_channel starts out `Idle`.  Activation takes it to `Activating`:
 *   - async_activate() builds platform::Listener_parameters from the options and the target, lets the configurator
 *     (Config::m_parameters_configurator) modify them, constructs the listener via Config::m_listener_factory and
 *     start()s it on the loop's callback queue.
 *   - async_adopt_preconfigured() start()s a listener given to create() instead, which must still be in
 *     platform::Listener_state::S_SETUP.
 *
 * When the platform reports platform::Listener_state::S_READY, the local address is resolved and cached, the
 * channel becomes `Active`, and the activation handler succeeds.  If the platform reports
 * platform::Listener_state::S_FAILED instead (or at any point before close), the channel closes with that error,
 * which is what the pending activation handler (if any) gets.  Closing cancels the listener; the platform
 * confirms with platform::Listener_state::S_CANCELLED, upon which the channel drops the listener.
 *
 * Only one activation may be pending: a second request while `Activating` or `Active` fails with
 * error::Code::S_INAPPROPRIATE_OPERATION_FOR_STATE without touching the platform.
 *
 * ### Options ###
 * See async_set_option(), async_get_option() and namespace option.  `SO_REUSEADDR`, `SO_REUSEPORT` and
 * option::Allow_local_endpoint_reuse are folded into a single platform "allow local endpoint reuse" flag at
 * activation.
 *
 * ### Data transfer ###
 * A listener transfers no data: it reads automatically (handing out children) and cannot be written to.
 * async_write() and async_close_half() fail with error::Code::S_OPERATION_UNSUPPORTED; flush() and read() do
 * nothing; is_writable() is always `true`.
 *
 * ### Thread safety ###
 * Same as State_managed_channel.
 */
class Listener_channel :
  public State_managed_channel
{
public:
  // Types.

  /// Configuration given to create().
  struct Config
  {
    /// Human-readable name used in logging.
    std::string m_nickname;

    /// Options of the listener; the held alternative (stream or datagram) never changes.
    platform::Protocol_options m_protocol_options;

    /// Options of each accepted child; independent of #m_protocol_options.
    platform::Protocol_options m_child_protocol_options;

    /// Loops for the children.  Null means use the listener's own loop.  Must outlive the listener and children.
    util::Event_loop_group* m_child_loop_group = 0;

    /// Optional hook; see class doc header.
    platform::Parameters_configurator m_parameters_configurator;

    /// Optional hook; see Child_channel.
    Child_parameters_configurator m_child_parameters_configurator;

    /// Constructs the platform listener; empty means platform::asio_listener_factory().
    platform::Listener_factory m_listener_factory;
  }; // struct Config

  /// Outbound event requesting activation on the given target; same as async_activate().
  struct Bind_to_endpoint_event
  {
    /// Target.
    platform::Endpoint m_target;
  };

  /// Any other outbound event; a listener supports none.
  struct Opaque_event
  {
    /// Payload.
    std::any m_payload;
  };

  /// Outbound user event; see async_trigger_outbound_event().
  using Outbound_event = std::variant<Bind_to_endpoint_event, Opaque_event>;

  /// Completion handler of async_get_option().
  template<typename Option>
  using On_option_value_func = Function<void (const Error_code& err_code, const typename Option::Value& value)>;

  // Constructors/destructor.

  /// Cancels the platform listener, if still present.
  ~Listener_channel() override;

  // Methods.

  /**
   * Creates an `Idle` listener channel, to be activated via async_activate().
   *
   * @param logger_ptr
   *        Logger to use for subsequently logging.
   * @param loop
   *        Owning loop.  Must outlive the returned object.
   * @param config
   *        Configuration; copied.
   * @return The channel.
   */
  static Listener_channel_ptr create(flow::log::Logger* logger_ptr, util::Event_loop* loop, const Config& config);

  /**
   * Creates an `Idle` listener channel wrapping an already constructed listener, to be activated via
   * async_adopt_preconfigured().
   *
   * @param logger_ptr
   *        See other create().
   * @param loop
   *        See other create().
   * @param config
   *        See other create().
   * @param listener
   *        The listener; must not have been start()ed.
   * @return The channel.
   */
  static Listener_channel_ptr create(flow::log::Logger* logger_ptr, util::Event_loop* loop, const Config& config,
                                     platform::Platform_listener_ptr listener);

  /**
   * Activates the channel by constructing and starting a listener on `target`; see class doc header.
   * `on_done_func` receives: success once ready; error::Code::S_IO_ON_CLOSED_CHANNEL;
   * error::Code::S_INAPPROPRIATE_OPERATION_FOR_STATE; an error from listener construction; an error reported by the
   * platform; or, if closed meanwhile, error::Code::S_IO_ON_CLOSED_CHANNEL.
   *
   * @param target
   *        Host/port (numeric host for the boost.asio backend; port 0 for any), Unix path, or service.
   * @param on_done_func
   *        Completion handler.
   */
  void async_activate(const platform::Endpoint& target, Task_err&& on_done_func);

  /**
   * Activates the channel by starting the listener given to create(); see class doc header.
   * Fails with error::Code::S_NOT_PRE_CONFIGURED, without side effects, if there is no such listener or it is not
   * in platform::Listener_state::S_SETUP.  Otherwise same as async_activate().
   *
   * @param on_done_func
   *        Completion handler.
   */
  void async_adopt_preconfigured(Task_err&& on_done_func);

  /**
   * Sets an option; see namespace option.  Fails with error::Code::S_IO_ON_CLOSED_CHANNEL once closed;
   * error::Code::S_OPERATION_UNSUPPORTED for option::Auto_read `false`;
   * error::Code::S_UNSUPPORTED_SOCKET_OPTION for a socket option the protocol options do not know.
   * Errors do not affect the channel.
   *
   * @tparam Option
   *         An option type from namespace option, other than option::Listener_handle.
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @param on_done_func
   *        Completion handler.
   */
  template<typename Option>
  void async_set_option(const Option& option, const typename Option::Value& value, Task_err&& on_done_func);

  /**
   * Gets an option; see namespace option.  Errors as for async_set_option(), except there is no
   * error::Code::S_OPERATION_UNSUPPORTED.  On error the value is default-constructed.
   *
   * @tparam Option
   *         An option type from namespace option.
   * @param option
   *        Option.
   * @param on_done_func
   *        Completion handler.
   */
  template<typename Option>
  void async_get_option(const Option& option, On_option_value_func<Option>&& on_done_func);

  /**
   * Fails with error::Code::S_OPERATION_UNSUPPORTED (or error::Code::S_IO_ON_CLOSED_CHANNEL once closed).
   *
   * @param on_done_func
   *        Completion handler.
   */
  void async_write(Task_err&& on_done_func);

  /// Does nothing.
  void flush();

  /// Does nothing; the listener always reads.
  void read();

  /**
   * Fails with error::Code::S_OPERATION_UNSUPPORTED (or error::Code::S_IO_ON_CLOSED_CHANNEL once closed).
   *
   * @param on_done_func
   *        Completion handler.
   */
  void async_close_half(Task_err&& on_done_func);

  /**
   * Bind_to_endpoint_event: same as async_activate().  Anything else fails with
   * error::Code::S_OPERATION_UNSUPPORTED.
   *
   * @param event
   *        Event.
   * @param on_done_func
   *        Completion handler.
   */
  void async_trigger_outbound_event(const Outbound_event& event, Task_err&& on_done_func);

  /**
   * Always `true`.
   * @return See above.
   */
  bool is_writable() const;

private:
  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param loop
   *        See create().
   * @param config
   *        See create().
   * @param listener
   *        See create(); may be null.
   */
  explicit Listener_channel(flow::log::Logger* logger_ptr, util::Event_loop* loop, const Config& config,
                            platform::Platform_listener_ptr&& listener);

  // Methods.

  /**
   * Thread W: body of async_activate().
   *
   * @param target
   *        See async_activate().
   * @param on_done_func
   *        See async_activate().
   */
  void activate0(const platform::Endpoint& target, Task_err&& on_done_func);

  /**
   * Thread W: body of async_adopt_preconfigured().
   *
   * @param on_done_func
   *        See async_adopt_preconfigured().
   */
  void adopt_preconfigured0(Task_err&& on_done_func);

  /// Thread W: installs the platform handlers on #m_listener and start()s it.
  void start_listener0();

  /**
   * Thread W: reacts to a state notification from #m_listener.
   *
   * @param new_state
   *        State.
   * @param err_code
   *        Error, if `S_FAILED`.
   */
  void on_listener_state0(platform::Listener_state new_state, const Error_code& err_code);

  /**
   * Thread W: reacts to a new connection from #m_listener: makes a child and hands it off.
   *
   * @param new_connection
   *        The connection.
   */
  void on_new_connection0(platform::Platform_connection_ptr&& new_connection);

  /// Thread W: the listener is ready: resolve and cache the address; become active.
  void bind_complete0();

  /**
   * Thread W: the local address: #m_listener's required local endpoint, with the actual port substituted for 0.
   *
   * @param err_code
   *        Set to error::Code::S_UNABLE_TO_RESOLVE_ENDPOINT if unknown; else success.
   * @return See above; nullopt on error.
   */
  std::optional<Socket_address> resolve_local_address0(Error_code* err_code) const;

  /**
   * Thread W: the remote address, which a listener does not have.
   *
   * @param err_code
   *        Set to error::Code::S_OPERATION_UNSUPPORTED.
   * @return nullopt.
   */
  std::optional<Socket_address> resolve_remote_address0(Error_code* err_code) const;

  /// Implements State_managed_channel API: cancels #m_listener, if present.
  void do_close0() override;

  /**
   * Thread W: set for option::Auto_read.
   *
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @return See async_set_option().
   */
  Error_code set_option0(const option::Auto_read& option, bool value);

  /**
   * Thread W: set for option::Socket_option.
   *
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @return See async_set_option().
   */
  Error_code set_option0(const option::Socket_option& option, int value);

  /**
   * Thread W: set for option::Allow_local_endpoint_reuse.
   *
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @return See async_set_option().
   */
  Error_code set_option0(const option::Allow_local_endpoint_reuse& option, bool value);

  /**
   * Thread W: set for option::Enable_peer_to_peer.
   *
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @return See async_set_option().
   */
  Error_code set_option0(const option::Enable_peer_to_peer& option, bool value);

  /**
   * Thread W: set for option::Multipath_service.
   *
   * @param option
   *        Option.
   * @param value
   *        Value.
   * @return See async_set_option().
   */
  Error_code set_option0(const option::Multipath_service& option, platform::Multipath_service_type value);

  /**
   * Thread W: get for option::Auto_read.
   *
   * @param option
   *        Option.
   * @param value
   *        Output.
   * @return See async_get_option().
   */
  Error_code get_option0(const option::Auto_read& option, bool* value) const;

  /**
   * Thread W: get for option::Socket_option.
   *
   * @param option
   *        Option.
   * @param value
   *        Output.
   * @return See async_get_option().
   */
  Error_code get_option0(const option::Socket_option& option, int* value) const;

  /**
   * Thread W: get for option::Allow_local_endpoint_reuse.
   *
   * @param option
   *        Option.
   * @param value
   *        Output.
   * @return See async_get_option().
   */
  Error_code get_option0(const option::Allow_local_endpoint_reuse& option, bool* value) const;

  /**
   * Thread W: get for option::Enable_peer_to_peer.
   *
   * @param option
   *        Option.
   * @param value
   *        Output.
   * @return See async_get_option().
   */
  Error_code get_option0(const option::Enable_peer_to_peer& option, bool* value) const;

  /**
   * Thread W: get for option::Multipath_service.
   *
   * @param option
   *        Option.
   * @param value
   *        Output.
   * @return See async_get_option().
   */
  Error_code get_option0(const option::Multipath_service& option, platform::Multipath_service_type* value) const;

  /**
   * Thread W: get for option::Listener_handle.
   *
   * @param option
   *        Option.
   * @param value
   *        Output.
   * @return See async_get_option().
   */
  Error_code get_option0(const option::Listener_handle& option, platform::Platform_listener_ptr* value) const;

  // Data.

  /// Config given to ctor, with #Config::m_listener_factory filled in.  Its protocol options are not used: see below.
  const Config m_config;

  /// Thread W: the listener options; see option::Socket_option.
  platform::Protocol_options m_protocol_options;

  /// Thread W: the listener, from activation (or construction) until the platform confirms cancellation.
  platform::Platform_listener_ptr m_listener;

  /// Thread W: see option::Socket_option::reuse_address().
  bool m_reuse_address;

  /// Thread W: see option::Socket_option::reuse_port().
  bool m_reuse_port;

  /// Thread W: see option::Allow_local_endpoint_reuse.
  bool m_allow_local_endpoint_reuse;

  /// Thread W: see option::Enable_peer_to_peer.
  bool m_enable_peer_to_peer;

  /// Thread W: see option::Multipath_service.
  platform::Multipath_service_type m_multipath_service_type;
}; // class Listener_channel

// Template implementations.

template<typename Option>
void Listener_channel::async_set_option(const Option& option, const typename Option::Value& value,
                                        Task_err&& on_done_func)
{
  post_or_run([this, option, value, on_done_func = std::move(on_done_func)]()
  {
    const auto err_code = state0().closed() ? Error_code(error::Code::S_IO_ON_CLOSED_CHANNEL)
                                            : set_option0(option, value);
    FLOW_LOG_TRACE("Listener [" << *this << "]: Set option [" << typeid(Option).name() << "] "
                   "result [" << err_code << "].");
    on_done_func(err_code);
  });
}

template<typename Option>
void Listener_channel::async_get_option(const Option& option, On_option_value_func<Option>&& on_done_func)
{
  post_or_run([this, option, on_done_func = std::move(on_done_func)]()
  {
    typename Option::Value value{};
    const auto err_code = state0().closed() ? Error_code(error::Code::S_IO_ON_CLOSED_CHANNEL)
                                            : get_option0(option, &value);
    FLOW_LOG_TRACE("Listener [" << *this << "]: Get option [" << typeid(Option).name() << "] "
                   "result [" << err_code << "].");
    on_done_func(err_code, err_code ? typename Option::Value{} : value);
  });
}

} // namespace netchan::channel
