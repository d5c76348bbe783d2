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

#include "netchan/common.hpp"

/**
 * Namespace containing the netchan::channel module's extension of boost.system error conventions, so that that API
 * can return codes/messages from within its own new set of error codes/messages.  Note that many errors
 * netchan::channel might report are not from this set: most notably, when the platform listening primitive reports
 * a failure, that failure's own #Error_code (typically from `boost::asio::error` or `boost::system::errc`) is
 * passed through as-is.  (If you're familiar with the boost.system framework, you'll know such mixing is normal.)
 *
 * See flow's `flow::net_flow::error` doc header which was used as the model for this and similar.
 */
namespace netchan::channel::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by netchan::channel functions/methods *outside of*
 * platform-reported errors such as `boost::asio::error::address_in_use`.
 * These values are convertible to #Error_code (a/k/a `boost::system::error_code`) and thus
 * extend the set of errors that #Error_code can represent.
 *
 * @internal
 *
 * When you add a value to this `enum`, also add its description to
 * error.cpp's Category::message().  This description must be identical to the
 * description in the /// comment below, or at least as close as possible.
 *
 * When you add a value to this `enum`, also add its symbolic representation to error.cpp's
 * Category::code_symbol().  This string must be identical to the symbol, minus the `S_`;
 * e.g., Code::S_NOT_PRE_CONFIGURED => `"NOT_PRE_CONFIGURED"`.
 *
 * If you add a value, add it to the end, but ahead of Code::S_END_SENTINEL.
 */
enum class Code
{
  /// Operation attempted on a channel that has been closed (by the user or due to a platform failure).
  S_IO_ON_CLOSED_CHANNEL = S_CODE_LOWEST_INT_VALUE,

  /// Operation not supported by this kind of channel (e.g., writing to a listener, disabling auto-read).
  S_OPERATION_UNSUPPORTED,

  /// Cannot adopt the platform listener: it is absent, or it is not in its initial not-yet-started state.
  S_NOT_PRE_CONFIGURED,

  /// Bind succeeded, but no concrete local endpoint (or assigned port) could be obtained from the platform.
  S_UNABLE_TO_RESOLVE_ENDPOINT,

  /// Operation not allowed in the channel's current lifecycle state (e.g., activating an already-activating channel).
  S_INAPPROPRIATE_OPERATION_FOR_STATE,

  /// Socket option not recognized by the channel's transport (stream or datagram) option set.
  S_UNSUPPORTED_SOCKET_OPTION,

  /// Endpoint cannot be used as specified: the host is not a numeric address, or a path is too long, etc.
  S_INVALID_ENDPOINT,

  /// Async completion handler is being called prematurely, because underlying object is shutting down, as user desires.
  S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (a/k/a boost.system `error_code`)
 * representing that error.  This is needed to make the
 * `boost::system::error_code::error_code<Code>()` template implementation work.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a channel::error::Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character.  If none is recognized, Code::S_END_SENTINEL is the result.
 * The recognized values are:
 *   - "1", "2", ...: Corresponds to the `int` conversion of that Code.
 *   - Case-insensitive encoding of the non-S_-prefix part of the actual Code member; e.g.,
 *     "NOT_PRE_CONFIGURED" (or "not_pre_configured" or...) for Code::S_NOT_PRE_CONFIGURED.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);

/**
 * Serializes a channel::error::Code to a standard output stream.  The output string is compatible with the reverse
 * `istream>>` operator.  When printing an #Error_code storing a Code, continue to do the standard thing:
 * output the #Error_code itself plus its `.message()`.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);

} // namespace netchan::channel::error

namespace boost::system
{

// Types.

/**
 * Specializes this `struct` to make `enum` `Code` convertible to `Error_code`; the official boost.system way.
 */
template<>
struct is_error_code_enum<::netchan::channel::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
