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
#include "netchan/util/native_handle.hpp"
#include <unistd.h>
#include <cassert>
#include <utility>

namespace netchan::util
{

Native_handle::Native_handle(handle_t native_handle) :
  m_native_handle(native_handle)
{
}

Native_handle::Native_handle(Native_handle&& src) :
  m_native_handle(std::exchange(src.m_native_handle, S_NULL_HANDLE))
{
}

Native_handle& Native_handle::operator=(Native_handle&& src)
{
  if (&src != this)
  {
    m_native_handle = std::exchange(src.m_native_handle, S_NULL_HANDLE);
  }
  return *this;
}

bool Native_handle::null() const
{
  return m_native_handle == S_NULL_HANDLE;
}

void close_native_handle(Native_handle* hndl)
{
  assert(hndl);
  if (!hndl->null())
  {
    ::close(hndl->m_native_handle);
    hndl->m_native_handle = Native_handle::S_NULL_HANDLE;
  }
}

std::ostream& operator<<(std::ostream& os, const Native_handle& val)
{
  os << "fd[";
  if (val.null())
  {
    return os << "none]";
  }
  return os << val.m_native_handle << ']';
}

} // namespace netchan::util
