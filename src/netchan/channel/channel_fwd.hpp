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

#include "netchan/platform/platform_fwd.hpp"
#include <memory>

/**
 * Flow-NetChan module containing the channels: Listener_channel, which adapts a platform::Platform_listener into
 * a channel with a bind/activate/close lifecycle, and Child_channel, to which it hands each accepted connection.
 * Both share State_managed_channel, the generic lifecycle (idle -> activating -> active -> closed) driven on one
 * owning util::Event_loop.
 *
 * The API is asynchronous throughout: each operation takes a completion handler (#Task_err or similar), invoked
 * exactly once, from thread W of the owning loop.  If the operation is invoked from thread W itself, the handler
 * is typically invoked synchronously before the operation returns; otherwise the operation is posted onto
 * thread W.
 */
namespace netchan::channel
{

// Types.

// Find doc headers near the bodies of these compound types.

class Address_cache;
class Channel_state;
struct Pipeline_handlers;
class State_managed_channel;
class Listener_channel;
class Child_channel;

/// Short-hand for `util` completion handler type, which has the usual one `Error_code` argument.
using Task_err = util::Task_err;

/// Short-hand for the address type used by channels.
using Socket_address = platform::Socket_address;

/// Short-hand for ref-counted pointer to a Listener_channel.
using Listener_channel_ptr = std::shared_ptr<Listener_channel>;

/// Short-hand for ref-counted pointer to a Child_channel.
using Child_channel_ptr = std::shared_ptr<Child_channel>;

/// User hook invoked with a copy of the child protocol options at each child's registration, before they apply.
using Child_parameters_configurator = Function<void (platform::Protocol_options* options)>;

/**
 * Prints string representation of the given channel to the given `ostream`.
 *
 * @relatesalso State_managed_channel
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const State_managed_channel& val);

} // namespace netchan::channel
