#pragma once

#include "catalog/byte_stream.hpp"
#include "catalog/catalog_client.hpp"
#include "download/status_sink.hpp"
#include "io/io.hpp"
#include "io/wait.hpp"
#include "system/cancellation.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <array>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <netinet/in.h>
#include <optional>
#include <poll.h>
#include <span>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    explicit TemporaryDirectory(const std::string& base = "/tmp") {
        std::string tpl = base + "/ipswdl_tests_XXXXXX";
        std::vector<char> buf(tpl.begin(), tpl.end());
        buf.push_back('\0');
        char* p = ::mkdtemp(buf.data());
        if (!p) {
            throw std::runtime_error("mkdtemp failed in " + base);
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

inline bool WriteTextFile(const std::string& path, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        return false;
    }
    os << content;
    return os.good();
}

inline std::string ReadTextFile(const std::string& path) {
    std::ifstream is(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> ListDir(const std::string& dir) {
    std::vector<std::string> out;
    std::error_code ec;
    for (const auto& e : std::filesystem::directory_iterator(dir, ec)) {
        out.push_back(e.path().filename().string());
    }
    std::sort(out.begin(), out.end());
    return out;
}

inline std::string ReadAll(ipswdl::IReader& reader) {
    std::string out;
    std::array<std::uint8_t, 1024> buf{};
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0)
            break;
        if (n < 0)
            return {};
        out.append(reinterpret_cast<const char*>(buf.data()), static_cast<size_t>(n));
    }
    return out;
}

// Byte stream that hands out a fixed body in chunks. `on_chunk` runs after
// each delivered chunk with the running byte count, which lets tests trigger
// cancellation at a precise position.
class MemoryByteStream final : public ipswdl::IByteStream {
  public:
    MemoryByteStream(std::string body, std::uint64_t declared, size_t chunk_size)
        : body_(std::move(body)), declared_(declared), chunk_(chunk_size) {}

    std::function<void(std::uint64_t delivered)> on_chunk;
    // When set, WaitNext fails once this many bytes have been delivered.
    std::optional<std::uint64_t> fail_after;

    std::uint64_t DeclaredLength() const override { return declared_; }

    ipswdl::Result WaitNext(int wake_fd, ipswdl::StreamEvent& out) override {
        out.data.clear();
        // Cancellation wins over a chunk that is ready at the same time.
        if (wake_fd >= 0 && ipswdl::PollReadable(wake_fd, 0)) {
            out.kind = ipswdl::StreamEvent::Kind::Woken;
            return ipswdl::Result::Ok();
        }
        if (fail_after && pos_ >= *fail_after) {
            return ipswdl::Result::Fail(-1, "connection reset by peer");
        }
        if (pos_ >= body_.size()) {
            out.kind = ipswdl::StreamEvent::Kind::End;
            return ipswdl::Result::Ok();
        }
        const size_t n = std::min(chunk_, body_.size() - pos_);
        out.kind = ipswdl::StreamEvent::Kind::Chunk;
        out.data.assign(body_.begin() + static_cast<std::ptrdiff_t>(pos_),
                        body_.begin() + static_cast<std::ptrdiff_t>(pos_ + n));
        pos_ += n;
        if (on_chunk) on_chunk(pos_);
        return ipswdl::Result::Ok();
    }

  private:
    std::string body_;
    std::uint64_t declared_;
    size_t chunk_;
    size_t pos_ = 0;
};

// In-memory catalog. Listings and bodies are keyed by device identifier.
class FakeCatalogClient final : public ipswdl::ICatalogClient {
  public:
    struct Body {
        std::string data;
        std::uint64_t declared = 0;
        size_t chunk = 16;
        std::function<void(std::uint64_t)> on_chunk;
        std::optional<std::uint64_t> fail_after;
    };

    std::vector<ipswdl::Device> devices;
    std::map<std::string, ipswdl::FirmwareListing> listings;
    std::map<std::string, std::string> listing_errors;
    std::map<std::string, Body> bodies; // keyed by FirmwareEntry::identifier
    bool fail_open = false;

    int list_devices_calls = 0;
    int list_firmware_calls = 0;
    int open_calls = 0;
    std::function<void(const ipswdl::Device&)> on_list_firmware;

    ipswdl::Result ListDevices(std::vector<ipswdl::Device>& out) override {
        ++list_devices_calls;
        out = devices;
        return ipswdl::Result::Ok();
    }

    ipswdl::Result ListFirmware(const ipswdl::Device& device,
                                ipswdl::FirmwareListing& out) override {
        ++list_firmware_calls;
        if (on_list_firmware) on_list_firmware(device);
        if (auto it = listing_errors.find(device.identifier); it != listing_errors.end()) {
            return ipswdl::Result::Fail(-1, it->second);
        }
        auto it = listings.find(device.identifier);
        if (it == listings.end()) {
            return ipswdl::Result::Fail(-1, "HTTP 404");
        }
        out = it->second;
        return ipswdl::Result::Ok();
    }

    ipswdl::Result OpenDownloadStream(const ipswdl::FirmwareEntry& entry,
                                      std::unique_ptr<ipswdl::IByteStream>& out) override {
        ++open_calls;
        if (fail_open) {
            return ipswdl::Result::Fail(-1, "HTTP 503");
        }
        auto it = bodies.find(entry.identifier);
        if (it == bodies.end()) {
            return ipswdl::Result::Fail(-1, "HTTP 404");
        }
        auto s = std::make_unique<MemoryByteStream>(it->second.data, it->second.declared, it->second.chunk);
        s->on_chunk = it->second.on_chunk;
        s->fail_after = it->second.fail_after;
        out = std::move(s);
        return ipswdl::Result::Ok();
    }
};

// Minimal HTTP/1.1 server on 127.0.0.1 serving fixed routes from a helper
// thread, one connection at a time. Routes are matched on the full request
// target, query included. A route with `hold_after` sends that many body bytes
// and then keeps the connection open until the client goes away or the server
// stops.
class LoopbackHttpServer {
  public:
    struct Route {
        std::string body;
        int status = 200;
        std::optional<size_t> hold_after;
    };

    LoopbackHttpServer() {
        // Loopback requests must never be routed through a proxy from the environment.
        ::setenv("no_proxy", "127.0.0.1,localhost", 1);
        ::setenv("NO_PROXY", "127.0.0.1,localhost", 1);

        listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");
        const int one = 1;
        (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 8) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        (void)::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        if (::pipe2(stop_, O_CLOEXEC) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("pipe2 failed");
        }
    }

    ~LoopbackHttpServer() {
        Stop();
        ::close(listen_fd_);
        ::close(stop_[0]);
        ::close(stop_[1]);
    }

    LoopbackHttpServer(const LoopbackHttpServer&) = delete;
    LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

    void AddRoute(const std::string& target, Route route) { routes_[target] = std::move(route); }

    void Start() {
        thread_ = std::thread([this] { Serve(); });
    }

    void Stop() {
        if (!stopped_.exchange(true)) {
            (void)!::write(stop_[1], "x", 1);
        }
        if (thread_.joinable()) thread_.join();
    }

    std::string BaseUrl() const { return "http://127.0.0.1:" + std::to_string(port_); }
    int Requests() const { return requests_.load(); }

  private:
    static bool SendAll(int fd, const char* p, size_t n) {
        while (n > 0) {
            const ssize_t w = ::send(fd, p, n, MSG_NOSIGNAL);
            if (w < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            p += w;
            n -= static_cast<size_t>(w);
        }
        return true;
    }

    void Serve() {
        while (true) {
            pollfd fds[2] = {{listen_fd_, POLLIN, 0}, {stop_[0], POLLIN, 0}};
            if (::poll(fds, 2, -1) < 0) {
                if (errno == EINTR) continue;
                return;
            }
            if (fds[1].revents != 0) return;
            const int c = ::accept4(listen_fd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (c < 0) continue;
            Handle(c);
            ::close(c);
        }
    }

    void Handle(int c) {
        std::string req;
        char buf[4096];
        while (req.find("\r\n\r\n") == std::string::npos) {
            const ssize_t n = ::recv(c, buf, sizeof(buf), 0);
            if (n <= 0) return;
            req.append(buf, static_cast<size_t>(n));
        }
        ++requests_;

        const size_t sp1 = req.find(' ');
        const size_t sp2 = req.find(' ', sp1 + 1);
        const std::string target = req.substr(sp1 + 1, sp2 - sp1 - 1);

        auto it = routes_.find(target);
        if (it == routes_.end()) {
            const std::string head = "HTTP/1.1 404 Not Found\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
            (void)SendAll(c, head.data(), head.size());
            return;
        }

        const Route& r = it->second;
        const std::string head = "HTTP/1.1 " + std::to_string(r.status) + (r.status < 400 ? " OK" : " Error") +
                                 "\r\nContent-Length: " + std::to_string(r.body.size()) +
                                 "\r\nConnection: close\r\n\r\n";
        if (!SendAll(c, head.data(), head.size())) return;

        const size_t limit = r.hold_after ? std::min(*r.hold_after, r.body.size()) : r.body.size();
        if (!SendAll(c, r.body.data(), limit)) return;

        if (r.hold_after) {
            while (true) {
                pollfd fds[2] = {{c, POLLIN, 0}, {stop_[0], POLLIN, 0}};
                if (::poll(fds, 2, -1) < 0) {
                    if (errno == EINTR) continue;
                    return;
                }
                if (fds[1].revents != 0) return;
                if (::recv(c, buf, sizeof(buf), 0) <= 0) return;
            }
        }
    }

    int listen_fd_ = -1;
    int stop_[2] = {-1, -1};
    std::uint16_t port_ = 0;
    std::map<std::string, Route> routes_;
    std::thread thread_;
    std::atomic<bool> stopped_{false};
    std::atomic<int> requests_{0};
};

class RecordingStatusSink final : public ipswdl::IStatusSink {
  public:
    std::vector<std::pair<ipswdl::StatusTone, std::string>> lines;

    void Emit(ipswdl::StatusTone tone, const std::string& line) override {
        lines.emplace_back(tone, line);
    }

    bool Contains(const std::string& needle) const {
        return std::any_of(lines.begin(), lines.end(),
                           [&](const auto& l) { return l.second.find(needle) != std::string::npos; });
    }
};

inline ipswdl::Device MakeDevice(const std::string& name, const std::string& identifier) {
    return ipswdl::Device{.name = name, .identifier = identifier, .platform = "", .cpid = 0, .bdid = 0};
}

inline ipswdl::FirmwareEntry MakeEntry(const std::string& identifier,
                                       const std::string& version,
                                       const std::string& buildid,
                                       std::uint64_t size) {
    ipswdl::FirmwareEntry e;
    e.identifier = identifier;
    e.version = version;
    e.buildid = buildid;
    e.filesize = size;
    return e;
}

} // namespace testutil
