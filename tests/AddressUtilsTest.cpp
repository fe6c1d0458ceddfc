#include "../include/AddressUtils.hpp"
#include <gtest/gtest.h>

TEST(AddressUtilsTest, ParsesLiteralAddressesOnly) {
    EXPECT_TRUE(is_valid_ip_address("1.1.1.1"));
    EXPECT_TRUE(is_valid_ip_address("2606:4700:4700::1111"));
    EXPECT_FALSE(is_valid_ip_address("999.1.1.1"));
    EXPECT_FALSE(is_valid_ip_address("dns.google"));
    EXPECT_FALSE(is_valid_ip_address(""));

    sockaddr_storage addr;
    socklen_t len = 0;
    ASSERT_TRUE(parse_ip_address("2001:db8::1", addr, len));
    EXPECT_EQ(address_to_string(addr), "2001:db8::1");
}
