#include "port_prober.h"
#include "socket.h"
#include "logger.h"
#include <algorithm>
#include <sstream>
#include <system_error>
#include <thread>

namespace netlaunch {

const std::vector<int>& preset_ports(PortPreset preset) {
    static const std::vector<int> basic_ports = {
        21,   // FTP
        22,   // SSH
        80,   // HTTP
        443,  // HTTPS
        445,  // SMB
        548,  // AFP
        3389, // RDP
        5900, // VNC
        8080  // Web Alt
    };

    static const std::vector<int> deep_ports = [] {
        std::vector<int> ports = basic_ports;
        const int extra[] = {
            3000, 3001, 5000, 8000, 8008, 8081, 8443, // Web dev servers
            23,    // Telnet
            25,    // SMTP
            53,    // DNS
            110,   // POP3
            143,   // IMAP
            139,   // NetBIOS
            3306,  // MySQL
            5432,  // PostgreSQL
            6379,  // Redis
            27017  // MongoDB
        };
        ports.insert(ports.end(), std::begin(extra), std::end(extra));
        return ports;
    }();

    return preset == PortPreset::Deep ? deep_ports : basic_ports;
}

bool probe_port(const std::string& host, int port, int timeout_ms) {
    socket_t sock = create_tcp_client(host, port, timeout_ms);
    if (!is_valid_socket(sock)) {
        return false;
    }

    close_socket(sock);
    LOG_PROBE_DEBUG(host << ":" << port << " is open");
    return true;
}

std::vector<int> probe_ports(const std::string& host,
                             const std::vector<int>& ports,
                             size_t concurrency,
                             int timeout_ms) {
    if (concurrency == 0) {
        concurrency = 1;
    }

    std::vector<int> open_ports;

    for (size_t batch_start = 0; batch_start < ports.size(); batch_start += concurrency) {
        size_t batch_end = std::min(ports.size(), batch_start + concurrency);

        // char rather than bool so each thread writes its own byte
        std::vector<char> batch_open(batch_end - batch_start, 0);
        std::vector<std::thread> workers;
        workers.reserve(batch_end - batch_start);

        for (size_t i = batch_start; i < batch_end; ++i) {
            char* slot = &batch_open[i - batch_start];
            int port = ports[i];
            try {
                workers.emplace_back([&host, port, timeout_ms, slot]() {
                    *slot = probe_port(host, port, timeout_ms) ? 1 : 0;
                });
            } catch (const std::system_error& e) {
                LOG_PROBE_WARN("Could not start probe thread for " << host << ":" << port << ": " << e.what());
            }
        }

        for (auto& worker : workers) {
            worker.join();
        }

        for (size_t i = batch_start; i < batch_end; ++i) {
            if (batch_open[i - batch_start]) {
                open_ports.push_back(ports[i]);
            }
        }
    }

    std::sort(open_ports.begin(), open_ports.end());
    LOG_PROBE_DEBUG("Probed " << ports.size() << " ports on " << host << ", " << open_ports.size() << " open");
    return open_ports;
}

std::vector<int> scan_ports(const std::string& host, PortPreset preset,
                            size_t concurrency, int timeout_ms) {
    return probe_ports(host, preset_ports(preset), concurrency, timeout_ms);
}

bool parse_port_spec(const std::string& spec, std::vector<int>& ports_out) {
    ports_out.clear();

    if (spec.empty() || spec == "basic") {
        ports_out = preset_ports(PortPreset::Basic);
        return true;
    }
    if (spec == "deep") {
        ports_out = preset_ports(PortPreset::Deep);
        return true;
    }

    std::istringstream stream(spec);
    std::string token;
    while (std::getline(stream, token, ',')) {
        if (token.empty()) {
            continue;
        }
        try {
            size_t consumed = 0;
            int port = std::stoi(token, &consumed);
            if (consumed != token.size() || port <= 0 || port > 65535) {
                return false;
            }
            ports_out.push_back(port);
        } catch (const std::exception& e) {
            LOG_PROBE_WARN("Invalid port '" << token << "': " << e.what());
            return false;
        }
    }

    return !ports_out.empty();
}

} // namespace netlaunch
