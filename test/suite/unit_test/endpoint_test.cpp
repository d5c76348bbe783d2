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

#include "netchan/platform/endpoint.hpp"
#include "netchan/channel/error.hpp"
#include <flow/error/error.hpp>
#include <flow/util/util.hpp>
#include <gtest/gtest.h>

namespace netchan::platform::test
{

using boost::asio::ip::make_address;
using flow::util::ostream_op_string;
namespace error = channel::error;

TEST(Socket_address, From_numeric_host_port)
{
  Error_code err_code;
  const auto v4 = Socket_address::from_endpoint(Host_port_endpoint{ "127.0.0.1", 8080 }, &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(v4);
  EXPECT_TRUE(v4->is_ip());
  EXPECT_EQ(v4->port(), 8080);
  EXPECT_EQ(ostream_op_string(*v4), "127.0.0.1:8080");

  const auto v6 = Socket_address::from_endpoint(Host_port_endpoint{ "::1", 0 }, &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(v6);
  EXPECT_EQ(ostream_op_string(*v6), "[::1]:0");
}

TEST(Socket_address, From_unix_path)
{
  Error_code err_code;
  const auto address = Socket_address::from_endpoint(Unix_endpoint{ "/tmp/netchan.sock" }, &err_code);
  EXPECT_FALSE(err_code);
  ASSERT_TRUE(address);
  EXPECT_FALSE(address->is_ip());
  EXPECT_FALSE(address->port());
  EXPECT_EQ(address->unix_path(), fs::path("/tmp/netchan.sock"));
  EXPECT_EQ(ostream_op_string(*address), "unix:/tmp/netchan.sock");
}

TEST(Socket_address, Not_convertible)
{
  Error_code err_code;
  EXPECT_FALSE(Socket_address::from_endpoint(Host_port_endpoint{ "localhost", 80 }, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ENDPOINT);

  err_code.clear();
  EXPECT_FALSE(Socket_address::from_endpoint(Service_endpoint{ "svc", "_x._tcp", "local", "" }, &err_code));
  EXPECT_EQ(err_code, error::Code::S_INVALID_ENDPOINT);

  // Null err_code => exception.
  EXPECT_THROW(Socket_address::from_endpoint(Host_port_endpoint{ "not an address", 1 }), flow::error::Runtime_error);
}

TEST(Socket_address, Port_substitution_and_equality)
{
  Socket_address address(make_address("0.0.0.0"), 0);
  address.set_port(54321);
  EXPECT_EQ(address, Socket_address(make_address("0.0.0.0"), 54321));
  EXPECT_NE(address, Socket_address(make_address("0.0.0.0"), 54322));
  EXPECT_NE(address, Socket_address(fs::path("/x")));
  EXPECT_EQ(ostream_op_string(address), "0.0.0.0:54321");
}

TEST(Endpoint, Printing)
{
  EXPECT_EQ(ostream_op_string(Endpoint(Host_port_endpoint{ "10.0.0.1", 5 })), "host_port[10.0.0.1:5]");
  EXPECT_EQ(ostream_op_string(Endpoint(Service_endpoint{ "a", "_b._tcp", "", "eth0" })),
            "service[a|_b._tcp||if=eth0]");
}

} // namespace netchan::platform::test
