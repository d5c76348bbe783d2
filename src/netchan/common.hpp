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

/* @todo More consistent to move this below `#include "netchan/..."`; but flow/common.hpp needs to #undef a couple
 * things before `#define`ing them (FLOW_LOG_CFG_COMPONENT_ENUM_*) for that to work.  It really should anyway. */
#include <flow/util/util.hpp>

#include "netchan/detail/common.hpp"
#include <boost/filesystem.hpp>

/* We build in C++17 mode ourselves, and the API headers (templates in particular) require it of the `#include`ing
 * translation unit too.  Therefore enforce it by failing compile unless compiler's C++17 or newer mode is in use. */
#if (!defined(__cplusplus)) || (__cplusplus < 201703L)
#  error "To compile a translation unit that `#include`s any netchan/ API headers, use C++17 compile mode or later."
#endif

/**
 * Catch-all namespace for the Flow-NetChan project: an event-loop channel layer over callback-driven platform
 * listening sockets.  The key object is channel::Listener_channel, which wraps a platform listening primitive
 * (see platform::Platform_listener) whose notifications arrive on a background callback queue, and presents it
 * as a channel with a strict bind/activate/close lifecycle that is driven entirely from one owning event loop.
 *
 * Flow-NetChan modules overview
 * -----------------------------
 *   - netchan::util: Event loops (util::Event_loop, util::Event_loop_group) and small utilities such as
 *     util::Native_handle.
 *   - netchan::platform: The platform listening primitive, at its interface boundary (platform::Platform_listener,
 *     platform::Platform_connection), plus a boost.asio-based implementation of it (platform::Asio_listener).
 *   - netchan::channel: The channels themselves: channel::Listener_channel and the channel::Child_channel objects
 *     it hands accepted connections to; their options, addresses and errors.
 *
 * Threads
 * -------
 * Each channel is permanently bound to one util::Event_loop; all of its state is touched from that loop's thread
 * only (thread W in comments).  The platform delivers notifications on the loop's separate callback queue
 * (thread C), and they are re-posted onto thread W before anything is done about them.  The only exception
 * is the address cache (channel::Address_cache), which has its own lock so addresses can be read from any thread.
 */
namespace netchan
{

// Types.  They're outside of `namespace ::netchan::util` for brevity due to their frequent use.

/**
 * @namespace netchan::fs
 * @brief Short-hand for `filesystem` namespace.  Used for Unix-domain socket paths.
 */
namespace fs = boost::filesystem;

/// Short-hand for `flow::Error_code` which is very common.
using Error_code = flow::Error_code;

/// Short-hand for polymorphic functor holder which is very common.  This is essentially `std::function`.
template<typename Signature>
using Function = flow::Function<Signature>;

#ifdef NETCHAN_DOXYGEN_ONLY // Actual compilation will ignore the below; but Doxygen will scan it and generate docs.

/**
 * The `flow::log::Component` payload enumeration containing various log components used by Flow-NetChan internal
 * logging.  Internal code specifies members thereof when indicating the log component for each particular piece
 * of logging code.  The user specifies it, albeit rarely, when configuring their program's logging
 * such as via `flow::log::Config::init_component_to_union_idx_mapping()` and
 * `flow::log::Config::init_component_names()`.
 *
 * The individual `enum` values are not documented right here, because `flow::log` auto-generates those via
 * certain macro magic.  See `log_component_enum_declare.macros.hpp` instead.
 */
enum class Log_component
{
  /// Placeholder for Doxygen purposes only.
  S_END_SENTINEL
};

// Constants.

/**
 * The map generated by `flow::log` macro magic that maps each enumerated value in netchan::Log_component to its
 * string representation as used in log output and verbosity config.
 */
extern const boost::unordered_multimap<Log_component, std::string> S_NETCHAN_LOG_COMPONENT_NAME_MAP;

#endif // NETCHAN_DOXYGEN_ONLY

} // namespace netchan
