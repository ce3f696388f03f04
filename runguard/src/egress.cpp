#include "egress.hpp"
#include <arpa/inet.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <netdb.h>
#include <stdlib.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include "common/utils.hpp"

using namespace std;

static const char *IPTABLES = "iptables";
static const char *IP6TABLES = "ip6tables";

pair<string, int> split_endpoint(const string &entry) {
    auto colon = entry.rfind(':');
    if (colon == string::npos || colon == 0 || colon + 1 == entry.size())
        throw invalid_argument("malformed egress endpoint " + entry);
    string host = entry.substr(0, colon);
    if (host.front() == '[') {
        if (host.size() < 3 || host.back() != ']') throw invalid_argument("malformed egress endpoint " + entry);
        host = host.substr(1, host.size() - 2);
    }

    int port = 0;
    if (!boost::conversion::try_lexical_convert(entry.substr(colon + 1), port) || port <= 0 || port > 65535)
        throw invalid_argument("invalid port in egress endpoint " + entry);
    return {host, port};
}

static bool is_ipv6(const string &address) {
    return address.find(':') != string::npos;
}

static void add_unique(vector<egress_endpoint> &endpoints, const egress_endpoint &endpoint) {
    for (auto &e : endpoints)
        if (e.address == endpoint.address && e.port == endpoint.port) return;
    endpoints.push_back(endpoint);
}

vector<egress_endpoint> resolve_egress(const vector<string> &allowlist) {
    vector<egress_endpoint> endpoints;
    for (auto &entry : allowlist) {
        auto [host, port] = split_endpoint(entry);

        struct addrinfo hints = {};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        struct addrinfo *result = nullptr;
        int ret = getaddrinfo(host.c_str(), nullptr, &hints, &result);
        if (ret != 0)
            throw runtime_error(fmt::format("unable to resolve egress host {}: {}", host, gai_strerror(ret)));

        for (auto *ai = result; ai; ai = ai->ai_next) {
            if (ai->ai_family != AF_INET && ai->ai_family != AF_INET6) continue;
            char buf[INET6_ADDRSTRLEN] = {};
            const void *addr = ai->ai_family == AF_INET6
                                   ? (const void *)&((struct sockaddr_in6 *)ai->ai_addr)->sin6_addr
                                   : (const void *)&((struct sockaddr_in *)ai->ai_addr)->sin_addr;
            if (!inet_ntop(ai->ai_family, addr, buf, sizeof(buf))) continue;
            add_unique(endpoints, {buf, ai->ai_family == AF_INET6, port});
        }
        freeaddrinfo(result);
    }
    return endpoints;
}

vector<egress_endpoint> read_nameservers(const string &path) {
    vector<egress_endpoint> servers;
    ifstream fin(path);
    string line;
    while (getline(fin, line)) {
        istringstream ss(line);
        string key, address;
        if (!(ss >> key >> address) || key != "nameserver") continue;
        // 链路本地地址可能带有 %网卡 后缀
        address = address.substr(0, address.find('%'));
        unsigned char buf[sizeof(struct in6_addr)];
        bool v6 = is_ipv6(address);
        if (inet_pton(v6 ? AF_INET6 : AF_INET, address.c_str(), buf) != 1) {
            LOG(WARNING) << "ignoring malformed nameserver " << address << " in " << path;
            continue;
        }
        add_unique(servers, {address, v6, 53});
    }
    return servers;
}

uint32_t egress_classid(pid_t pid) {
    // classid 的高 16 位是 major，低 16 位是 minor
    return ((0x1000u + ((uint32_t)pid >> 16)) << 16) | ((uint32_t)pid & 0xffffu);
}

uint64_t count_rejected(const string &listing) {
    uint64_t rejected = 0;
    istringstream fin(listing);
    string line;
    while (getline(fin, line)) {
        istringstream ss(line);
        string pkts, bytes, target;
        if (!(ss >> pkts >> bytes >> target) || target != "REJECT") continue;
        uint64_t value;
        if (boost::conversion::try_lexical_convert(pkts, value)) rejected += value;
    }
    return rejected;
}

static void run_iptables(const string &command, const vector<string> &args) {
    int ret = tci::call_process(command, "-w", args);
    if (ret != 0)
        throw runtime_error(fmt::format("{} {} exited with code {}", command, boost::algorithm::join(args, " "), ret));
}

egress_firewall::egress_firewall(uint32_t classid, const vector<egress_endpoint> &allowed)
    : chain_name(fmt::format("TCI-{:08x}", classid)), classid_text(to_string(classid)) {
    vector<egress_endpoint> nameservers = read_nameservers();
    try {
        for (const char *command : {IPTABLES, IP6TABLES}) {
            bool v6 = string(command) == IP6TABLES;
            run_iptables(command, {"-N", chain_name});
            installed.push_back(command);

            for (auto *list : {&allowed, &nameservers}) {
                for (auto &endpoint : *list) {
                    if (endpoint.ipv6 != v6) continue;
                    for (const char *protocol : {"tcp", "udp"})
                        run_iptables(command, {"-A", chain_name, "-d", endpoint.address, "-p", protocol,
                                               "--dport", to_string(endpoint.port), "-j", "ACCEPT"});
                }
            }
            run_iptables(command, {"-A", chain_name, "-j", "REJECT"});
            run_iptables(command, {"-I", "OUTPUT", "-m", "cgroup", "--cgroup", classid_text, "-j", chain_name});
        }
    } catch (...) {
        remove();
        throw;
    }
    LOG(INFO) << fmt::format("egress firewall {} allows {} endpoints and {} nameservers", chain_name, allowed.size(), nameservers.size());
}

egress_firewall::~egress_firewall() {
    remove();
}

const string &egress_firewall::chain() const {
    return chain_name;
}

uint64_t egress_firewall::rejected_packets() const {
    uint64_t rejected = 0;
    for (auto &command : installed) {
        char path[] = "/tmp/tci-egress-XXXXXX";
        int fd = mkstemp(path);
        if (fd < 0) throw system_error(errno, system_category(), "creating iptables listing file");
        close(fd);

        tci::spawn_options options;
        options.stdout_file = path;
        options.new_process_group = false;
        tci::process_status status;
        try {
            status = tci::wait_process(tci::spawn_process({command, "-w", "-n", "-v", "-x", "-L", chain_name}, options));
        } catch (...) {
            unlink(path);
            throw;
        }

        ifstream fin(path);
        stringstream listing;
        listing << fin.rdbuf();
        unlink(path);
        if (status.exitcode != 0)
            throw runtime_error(fmt::format("{} -L {} exited with code {}", command, chain_name, status.exitcode));
        rejected += count_rejected(listing.str());
    }
    return rejected;
}

void egress_firewall::remove() noexcept {
    for (auto &command : installed) {
        vector<vector<string>> steps = {
            {"-D", "OUTPUT", "-m", "cgroup", "--cgroup", classid_text, "-j", chain_name},
            {"-F", chain_name},
            {"-X", chain_name}};
        for (auto &args : steps) {
            try {
                run_iptables(command, args);
            } catch (exception &e) {
                LOG(WARNING) << "removing egress firewall: " << e.what();
            }
        }
    }
    installed.clear();
}
