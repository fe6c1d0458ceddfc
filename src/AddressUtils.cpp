#include "../include/AddressUtils.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>

bool parse_ip_address(const std::string& ip, sockaddr_storage& addr, socklen_t& addr_len) {
    std::memset(&addr, 0, sizeof(addr));

    sockaddr_in* v4 = reinterpret_cast<sockaddr_in*>(&addr);
    if (inet_pton(AF_INET, ip.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        addr_len = sizeof(sockaddr_in);
        return true;
    }

    std::memset(&addr, 0, sizeof(addr));
    sockaddr_in6* v6 = reinterpret_cast<sockaddr_in6*>(&addr);
    if (inet_pton(AF_INET6, ip.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        addr_len = sizeof(sockaddr_in6);
        return true;
    }

    addr_len = 0;
    return false;
}

bool is_valid_ip_address(const std::string& ip) {
    sockaddr_storage addr;
    socklen_t addr_len;
    return parse_ip_address(ip, addr, addr_len);
}

std::string address_to_string(const sockaddr_storage& addr) {
    char buf[INET6_ADDRSTRLEN];
    const void* src = nullptr;

    if (addr.ss_family == AF_INET) {
        src = &reinterpret_cast<const sockaddr_in*>(&addr)->sin_addr;
    } else if (addr.ss_family == AF_INET6) {
        src = &reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_addr;
    } else {
        return "";
    }

    if (inet_ntop(addr.ss_family, src, buf, sizeof(buf)) == nullptr) {
        return "";
    }
    return buf;
}
