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
#include "netchan/channel/error.hpp"
#include "netchan/util/util_fwd.hpp"

namespace netchan::channel::error
{

// Types.

/**
 * The boost.system category for errors returned by the netchan::channel module.  Think of it as the polymorphic
 * counterpart of error::Code, and it kicks in when, for `Error_code ec`, something
 * like `ec.message()` is invoked.
 *
 * Note that this class's declaration is not available outside this translation unit.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Implements super-class API: returns a `static` string representing this `error_category`.
   * @return See above.
   */
  const char* name() const noexcept override;

  /**
   * Implements super-class API: given the integer error code of an error in this category, returns a description of
   * that error.
   *
   * @param val
   *        Error code of a Category error (realistically, a #Code `enum` value cast to `int`).
   * @return String describing the error.
   */
  std::string message(int val) const override;

  /**
   * The guts of the `ostream << Code` operation: outputs, e.g., Code::S_NOT_PRE_CONFIGURED => `"NOT_PRE_CONFIGURED"`.
   * @param code
   *        A Code.
   * @return What would/should be printed to an `ostream` given `code`.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "netchan/channel";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_IO_ON_CLOSED_CHANNEL:
    return "Operation attempted on a channel that has been closed (by the user or due to a platform failure).";
  case Code::S_OPERATION_UNSUPPORTED:
    return "Operation not supported by this kind of channel (e.g., writing to a listener, disabling auto-read).";
  case Code::S_NOT_PRE_CONFIGURED:
    return "Cannot adopt the platform listener: it is absent, or it is not in its initial not-yet-started state.";
  case Code::S_UNABLE_TO_RESOLVE_ENDPOINT:
    return "Bind succeeded, but no concrete local endpoint (or assigned port) could be obtained from the platform.";
  case Code::S_INAPPROPRIATE_OPERATION_FOR_STATE:
    return "Operation not allowed in the channel's current lifecycle state (e.g., activating an already-activating "
           "channel).";
  case Code::S_UNSUPPORTED_SOCKET_OPTION:
    return "Socket option not recognized by the channel's transport (stream or datagram) option set.";
  case Code::S_INVALID_ENDPOINT:
    return "Endpoint cannot be used as specified: the host is not a numeric address, or a path is too long, etc.";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "Async completion handler is being called prematurely, because underlying object is shutting down, "
           "as user desires.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_IO_ON_CLOSED_CHANNEL:
    return "IO_ON_CLOSED_CHANNEL";
  case Code::S_OPERATION_UNSUPPORTED:
    return "OPERATION_UNSUPPORTED";
  case Code::S_NOT_PRE_CONFIGURED:
    return "NOT_PRE_CONFIGURED";
  case Code::S_UNABLE_TO_RESOLVE_ENDPOINT:
    return "UNABLE_TO_RESOLVE_ENDPOINT";
  case Code::S_INAPPROPRIATE_OPERATION_FOR_STATE:
    return "INAPPROPRIATE_OPERATION_FOR_STATE";
  case Code::S_UNSUPPORTED_SOCKET_OPTION:
    return "UNSUPPORTED_SOCKET_OPTION";
  case Code::S_INVALID_ENDPOINT:
    return "INVALID_ENDPOINT";
  case Code::S_OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER:
    return "OBJECT_SHUTDOWN_ABORTED_COMPLETION_HANDLER";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace netchan::channel::error
