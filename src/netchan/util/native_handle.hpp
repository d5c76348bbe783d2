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

#include <flow/common.hpp>
#include <ostream>

namespace netchan::util
{

#ifndef FLOW_OS_LINUX
static_assert(false, "Flow-NetChan ejects accepted sockets as POSIX FDs; build in Linux only.");
#endif

// Types.

/**
 * A freshly accepted peer socket's descriptor, ejected from the listening engine (see platform::Asio_listener)
 * and owned from then on by the platform::Platform_connection wrapping it.  Copying it does not duplicate the
 * descriptor; moving it leaves the source null(), which is how the descriptor changes owners.
 *
 * It does not close the descriptor on destruction: the owner does that with close_native_handle().
 */
struct Native_handle
{
  // Types.

  /// The descriptor type.
  using handle_t = int;

  // Constants.

  /// #m_native_handle value meaning "no descriptor."
  static constexpr handle_t S_NULL_HANDLE = -1;

  // Data.

  /// The descriptor, or #S_NULL_HANDLE.
  handle_t m_native_handle;

  // Constructors/destructor.

  /**
   * Wraps the given descriptor (by default none).
   *
   * @param native_handle
   *        Descriptor or #S_NULL_HANDLE.
   */
  Native_handle(handle_t native_handle = S_NULL_HANDLE);

  /**
   * Takes over `src`'s descriptor; `src` becomes null().
   *
   * @param src
   *        Source.
   */
  Native_handle(Native_handle&& src);

  /// Copies the descriptor number.
  Native_handle(const Native_handle&) = default;

  // Methods.

  /**
   * Takes over `src`'s descriptor; `src` becomes null().  No-op if `&src == this`.
   *
   * @param src
   *        Source.
   * @return `*this`.
   */
  Native_handle& operator=(Native_handle&& src);

  /// Copies the descriptor number.
  Native_handle& operator=(const Native_handle&) = default;

  /**
   * Whether there is no descriptor.
   * @return See above.
   */
  bool null() const;
}; // struct Native_handle

// Free functions.

/**
 * Closes the descriptor, if any, and makes `*hndl` null().  A `close()` error is ignored: the descriptor is gone
 * either way.
 *
 * @param hndl
 *        Handle; not null.
 */
void close_native_handle(Native_handle* hndl);

/**
 * Prints `"fd[N]"`, or `"fd[none]"` if null().
 *
 * @relatesalso Native_handle
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Native_handle& val);

} // namespace netchan::util
