#include <filesystem>
#include "common/io_utils.hpp"
#include "config.hpp"
#include "egress.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace tci;
namespace fs = std::filesystem;

TEST(EgressTest, SplitsEndpoints) {
    EXPECT_EQ(split_endpoint("pypi.org:443"), make_pair(string("pypi.org"), 443));
    EXPECT_EQ(split_endpoint("10.0.0.1:8080"), make_pair(string("10.0.0.1"), 8080));
    EXPECT_EQ(split_endpoint("[2001:db8::1]:53"), make_pair(string("2001:db8::1"), 53));

    EXPECT_THROW(split_endpoint("pypi.org"), invalid_argument);
    EXPECT_THROW(split_endpoint(":443"), invalid_argument);
    EXPECT_THROW(split_endpoint("pypi.org:"), invalid_argument);
    EXPECT_THROW(split_endpoint("pypi.org:0"), invalid_argument);
    EXPECT_THROW(split_endpoint("pypi.org:65536"), invalid_argument);
    EXPECT_THROW(split_endpoint("pypi.org:http"), invalid_argument);
    EXPECT_THROW(split_endpoint("[2001:db8::1:53"), invalid_argument);
}

TEST(EgressTest, NumericHostsResolveToThemselves) {
    auto endpoints = resolve_egress({"127.0.0.1:80", "127.0.0.1:80", "[::1]:443"});
    ASSERT_EQ(endpoints.size(), 2u);
    EXPECT_EQ(endpoints[0].address, "127.0.0.1");
    EXPECT_FALSE(endpoints[0].ipv6);
    EXPECT_EQ(endpoints[0].port, 80);
    EXPECT_EQ(endpoints[1].address, "::1");
    EXPECT_TRUE(endpoints[1].ipv6);
    EXPECT_EQ(endpoints[1].port, 443);

    EXPECT_THROW(resolve_egress({"no-such-host.invalid:80"}), runtime_error);
}

TEST(EgressTest, ReadsNameservers) {
    fs::path conf = SANDBOX_DIR / "egress-resolv.conf";
    write_file_content(conf,
                       "# generated\n"
                       "search example.com\n"
                       "nameserver 10.0.0.2\n"
                       "nameserver fe80::1%eth0\n"
                       "nameserver not-an-address\n"
                       "nameserver 10.0.0.2\n");
    auto servers = read_nameservers(conf.string());
    ASSERT_EQ(servers.size(), 2u);
    EXPECT_EQ(servers[0].address, "10.0.0.2");
    EXPECT_EQ(servers[0].port, 53);
    EXPECT_EQ(servers[1].address, "fe80::1");
    EXPECT_TRUE(servers[1].ipv6);
    fs::remove(conf);

    EXPECT_TRUE(read_nameservers((SANDBOX_DIR / "missing-resolv.conf").string()).empty());
}

TEST(EgressTest, ClassidsAreDistinct) {
    EXPECT_EQ(egress_classid(1), 0x10000001u);
    EXPECT_EQ(egress_classid(0x12345), 0x10012345u);
    EXPECT_NE(egress_classid(0x10001), egress_classid(0x1));
    EXPECT_NE(egress_classid(65535), egress_classid(65536));
}

TEST(EgressTest, CountsRejectedPackets) {
    string listing =
        "Chain TCI-10000001 (1 references)\n"
        "    pkts      bytes target     prot opt in     out     source               destination\n"
        "      12      720 ACCEPT     tcp  --  *      *       0.0.0.0/0            151.101.0.223        tcp dpt:443\n"
        "       0        0 ACCEPT     udp  --  *      *       0.0.0.0/0            151.101.0.223        udp dpt:443\n"
        "       3      180 REJECT     all  --  *      *       0.0.0.0/0            0.0.0.0/0            reject-with icmp-port-unreachable\n";
    EXPECT_EQ(count_rejected(listing), 3u);
    EXPECT_EQ(count_rejected("Chain TCI-10000001 (1 references)\n"), 0u);
    EXPECT_EQ(count_rejected(""), 0u);
}
