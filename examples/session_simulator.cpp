// Example session simulator - fake OpenVPN server
// Rewrites a status-version 2 file and appends to a server log so that
// tunnelwatch can be run against it without a real VPN server:
//
//   session_simulator /tmp/sim/status.log /tmp/sim/server.log &
//   tunnelwatch -s /tmp/sim/status.log -l /tmp/sim/server.log -i 2

#include <tunnelwatch/types.hpp>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

static volatile std::sig_atomic_t g_running = 1;

void signal_handler(int) {
    g_running = 0;
}

struct SimSession {
    std::string username;
    std::string real_ip;
    uint16_t port;
    std::string virtual_ip;
    uint64_t bytes_received;
    uint64_t bytes_sent;
    std::time_t since;
};

std::string log_time(std::time_t t) {
    return fmt::format("{:%a %b %e %H:%M:%S %Y}", fmt::localtime(t));
}

void write_status(const std::string& path, const std::vector<SimSession>& sessions) {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        std::time_t now = std::time(nullptr);
        out << "TITLE,OpenVPN 2.6.8 x86_64-pc-linux-gnu (simulated)\n";
        out << fmt::format("TIME,{},{}\n", log_time(now), now);
        out << "HEADER,CLIENT_LIST,Common Name,Real Address,Virtual Address,Virtual IPv6 Address,"
               "Bytes Received,Bytes Sent,Connected Since,Connected Since (time_t),Username,"
               "Client ID,Peer ID,Data Channel Cipher\n";
        int client_id = 0;
        for (const auto& s : sessions) {
            out << tunnelwatch::CLIENT_LIST_MARKER
                << fmt::format("{},{}:{},{},,{},{},{},{},{},{},{},AES-256-GCM\n",
                               s.username, s.real_ip, s.port, s.virtual_ip,
                               s.bytes_received, s.bytes_sent, log_time(s.since), s.since,
                               s.username, client_id, client_id);
            client_id++;
        }
        out << "GLOBAL_STATS,Max bcast/mcast queue length,0\n";
        out << "END\n";
    }
    // Status files are replaced whole, like OpenVPN does
    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::cerr << "Cannot replace " << path << ": " << ec.message() << "\n";
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <status-file> <server-log> [interval-sec]\n";
        return 1;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::string status_path = argv[1];
    std::string log_path = argv[2];
    int interval = argc > 3 ? std::atoi(argv[3]) : 5;
    if (interval <= 0) interval = 5;

    std::ofstream log(log_path, std::ios::app);
    if (!log) {
        std::cerr << "Cannot open " << log_path << "\n";
        return 1;
    }

    const char* usernames[] = {"john.doe", "jane.smith", "admin", "remote.user", "demo.user"};
    const char* real_ips[] = {"192.168.1.100", "10.0.0.50", "172.16.0.10", "203.0.113.7"};

    std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> action(0, 9);
    std::uniform_int_distribution<int> port_dist(10000, 65000);
    std::uniform_int_distribution<int> traffic(1000, 500000);

    std::vector<SimSession> sessions;
    int next_vip = 2;

    std::cout << "Simulating OpenVPN server, status " << status_path
              << ", log " << log_path << ". Press Ctrl+C to stop\n";

    while (g_running) {
        std::time_t now = std::time(nullptr);
        int roll = action(rng);

        if (roll < 3 && sessions.size() < 8) {
            // New login
            SimSession s;
            s.username = usernames[rng() % std::size(usernames)];
            s.real_ip = real_ips[rng() % std::size(real_ips)];
            s.port = static_cast<uint16_t>(port_dist(rng));
            s.virtual_ip = fmt::format("10.8.0.{}", next_vip);
            next_vip = next_vip >= 250 ? 2 : next_vip + 1;
            s.bytes_received = 0;
            s.bytes_sent = 0;
            s.since = now;
            log << fmt::format("{} {}:{} [{}] Peer Connection Initiated with [AF_INET]{}:{}\n",
                               log_time(now), s.real_ip, s.port, s.username, s.real_ip, s.port);
            sessions.push_back(s);
            std::cout << "+ " << s.username << " " << s.real_ip << ":" << s.port << "\n";
        } else if (roll < 5 && !sessions.empty()) {
            // Explicit logout
            size_t idx = rng() % sessions.size();
            const auto& s = sessions[idx];
            log << fmt::format("{} {}/{}:{} SIGTERM[soft,remote-exit] received, client-instance exiting\n",
                               log_time(now), s.username, s.real_ip, s.port);
            std::cout << "- " << s.username << " " << s.real_ip << ":" << s.port << "\n";
            sessions.erase(sessions.begin() + static_cast<std::ptrdiff_t>(idx));
        } else if (roll == 5 && !sessions.empty()) {
            // Silent drop (only the status file notices)
            size_t idx = rng() % sessions.size();
            std::cout << "x " << sessions[idx].real_ip << ":" << sessions[idx].port << "\n";
            sessions.erase(sessions.begin() + static_cast<std::ptrdiff_t>(idx));
        } else if (roll == 6) {
            // Failed authentication
            std::string ip = real_ips[rng() % std::size(real_ips)];
            int port = port_dist(rng);
            log << fmt::format("{} {}:{} TLS Auth Error: Auth Username/Password verification failed for peer\n",
                               log_time(now), ip, port);
            std::cout << "! " << ip << ":" << port << "\n";
        }

        for (auto& s : sessions) {
            s.bytes_received += static_cast<uint64_t>(traffic(rng));
            s.bytes_sent += static_cast<uint64_t>(traffic(rng));
        }

        log.flush();
        write_status(status_path, sessions);

        for (int i = 0; i < interval * 5 && g_running; ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }
    }

    std::cout << "\nSimulator stopped\n";
    return 0;
}
