#ifndef ADDRESS_UTILS_HPP
#define ADDRESS_UTILS_HPP

#include <string>
#include <sys/socket.h>

// Parses a literal IPv4 or IPv6 address. Host names are not resolved.
bool parse_ip_address(const std::string& ip, sockaddr_storage& addr, socklen_t& addr_len);

bool is_valid_ip_address(const std::string& ip);

// Numeric form of a socket address, empty on failure.
std::string address_to_string(const sockaddr_storage& addr);

#endif // ADDRESS_UTILS_HPP
