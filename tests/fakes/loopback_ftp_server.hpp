#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>
#include <fmt/core.h>

namespace rmirror::testing {

/// FTP-сервер на 127.0.0.1 со сценарием ответов. Обслуживает сессии по одной
/// и записывает каждую полученную команду до ответа на неё.
class LoopbackFtpServer {
public:
    LoopbackFtpServer() {
        listener_ = listen_on_loopback(port_);
        thread_ = std::jthread([this](std::stop_token stop) { serve(stop); });
    }

    ~LoopbackFtpServer() {
        thread_.request_stop();
        if (thread_.joinable()) thread_.join();
        close_fd(listener_);
    }

    LoopbackFtpServer(const LoopbackFtpServer&) = delete;
    LoopbackFtpServer& operator=(const LoopbackFtpServer&) = delete;

    /// listing отдаётся на LIST как есть (строки через \r\n).
    void add_directory(const std::string& path, std::string listing) {
        std::lock_guard lock(mutex_);
        directories_[path] = std::move(listing);
    }

    void add_file(const std::string& path, std::string content) {
        std::lock_guard lock(mutex_);
        files_[path] = std::move(content);
    }

    void disable_epsv() { epsv_enabled_ = false; }
    void disable_rest() { rest_enabled_ = false; }

    [[nodiscard]] auto port() const -> std::uint16_t { return port_; }
    [[nodiscard]] auto sessions() const -> int { return sessions_.load(); }
    [[nodiscard]] auto commands() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return commands_;
    }

private:
    struct Session {
        int data_listener = -1;
        std::uint64_t rest_offset = 0;
        std::string cwd = "/";
    };

    static constexpr std::size_t kDataChunk = 7;

    static auto listen_on_loopback(std::uint16_t& port) -> int {
        const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        if (fd < 0) {
            throw std::runtime_error(fmt::format("socket: {}", std::strerror(errno)));
        }
        const int yes = 1;
        ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(fd, 4) != 0 ||
            ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            const auto message = fmt::format("listen on loopback: {}", std::strerror(errno));
            ::close(fd);
            throw std::runtime_error(message);
        }
        port = ntohs(addr.sin_port);
        return fd;
    }

    static void close_fd(int& fd) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    // Ждёт данных короткими интервалами, чтобы заметить остановку сервера
    static auto wait_readable(int fd, const std::stop_token& stop) -> bool {
        while (!stop.stop_requested()) {
            pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
            const int ready = ::poll(&pfd, 1, 50);
            if (ready > 0) return true;
            if (ready < 0 && errno != EINTR) return false;
        }
        return false;
    }

    static auto send_text(int fd, std::string_view text) -> bool {
        std::size_t sent = 0;
        while (sent < text.size()) {
            const auto n = ::send(fd, text.data() + sent, text.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                if (n < 0 && errno == EINTR) continue;
                return false;
            }
            sent += static_cast<std::size_t>(n);
        }
        return true;
    }

    static auto read_line(int fd, std::string& buffer, const std::stop_token& stop) -> std::optional<std::string> {
        while (true) {
            if (const auto eol = buffer.find("\r\n"); eol != std::string::npos) {
                auto line = buffer.substr(0, eol);
                buffer.erase(0, eol + 2);
                return line;
            }
            if (!wait_readable(fd, stop)) return std::nullopt;
            char chunk[512];
            const auto n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) return std::nullopt;
            buffer.append(chunk, static_cast<std::size_t>(n));
        }
    }

    void serve(std::stop_token stop) {
        while (wait_readable(listener_, stop)) {
            const int control = ::accept(listener_, nullptr, nullptr);
            if (control < 0) continue;
            sessions_.fetch_add(1);
            run_session(control, stop);
            ::close(control);
        }
    }

    void run_session(int control, const std::stop_token& stop) {
        Session session;
        // Многострочное приветствие
        if (send_text(control, "220-rmirror loopback server\r\n220 Ready\r\n")) {
            std::string buffer;
            while (auto line = read_line(control, buffer, stop)) {
                {
                    std::lock_guard lock(mutex_);
                    commands_.push_back(*line);
                }
                if (!handle(control, session, *line, stop)) break;
            }
        }
        close_fd(session.data_listener);
    }

    auto open_data_listener(Session& session) -> std::uint16_t {
        close_fd(session.data_listener);
        std::uint16_t port = 0;
        session.data_listener = listen_on_loopback(port);
        return port;
    }

    auto handle(int control, Session& session, const std::string& line, const std::stop_token& stop) -> bool {
        const auto space = line.find(' ');
        const auto verb = line.substr(0, space);
        const auto arg = space == std::string::npos ? std::string() : line.substr(space + 1);

        if (verb == "USER") return send_text(control, "331 Password required\r\n");
        if (verb == "PASS") return send_text(control, "230-Anonymous access granted\r\n230 Logged in\r\n");
        if (verb == "TYPE") return send_text(control, "200 Type set to I\r\n");
        if (verb == "CWD") {
            std::lock_guard lock(mutex_);
            if (!directories_.contains(arg)) {
                return send_text(control, "550 No such directory\r\n");
            }
            session.cwd = arg;
            return send_text(control, "250 Directory changed\r\n");
        }
        if (verb == "EPSV") {
            if (!epsv_enabled_) return send_text(control, "500 EPSV not understood\r\n");
            const auto port = open_data_listener(session);
            return send_text(control, fmt::format("229 Entering Extended Passive Mode (|||{}|)\r\n", port));
        }
        if (verb == "PASV") {
            const auto port = open_data_listener(session);
            return send_text(control, fmt::format("227 Entering Passive Mode (127,0,0,1,{},{})\r\n",
                                                  port / 256, port % 256));
        }
        if (verb == "REST") {
            if (!rest_enabled_) return send_text(control, "502 REST not implemented\r\n");
            std::uint64_t offset = 0;
            const auto [ptr, ec] = std::from_chars(arg.data(), arg.data() + arg.size(), offset);
            if (ec != std::errc{} || ptr != arg.data() + arg.size()) {
                return send_text(control, "501 Invalid offset\r\n");
            }
            session.rest_offset = offset;
            return send_text(control, fmt::format("350 Restarting at {}\r\n", offset));
        }
        if (verb == "LIST") {
            std::string listing;
            {
                std::lock_guard lock(mutex_);
                listing = directories_[session.cwd];
            }
            return transfer(control, session, listing, stop);
        }
        if (verb == "RETR") {
            std::optional<std::string> content;
            {
                std::lock_guard lock(mutex_);
                if (const auto it = files_.find(arg); it != files_.end()) content = it->second;
            }
            if (!content) {
                session.rest_offset = 0;
                close_fd(session.data_listener);
                return send_text(control, "550 No such file\r\n");
            }
            const auto offset = std::min<std::uint64_t>(session.rest_offset, content->size());
            return transfer(control, session, std::string_view(*content).substr(offset), stop);
        }
        if (verb == "QUIT") {
            (void)send_text(control, "221 Goodbye\r\n");
            return false;
        }
        return send_text(control, "502 Command not implemented\r\n");
    }

    auto transfer(int control, Session& session, std::string_view payload, const std::stop_token& stop) -> bool {
        session.rest_offset = 0;
        if (session.data_listener < 0) {
            return send_text(control, "425 Use EPSV or PASV first\r\n");
        }
        if (!send_text(control, "150 Opening BINARY mode data connection\r\n")) {
            return false;
        }
        const int data = wait_readable(session.data_listener, stop)
            ? ::accept(session.data_listener, nullptr, nullptr) : -1;
        close_fd(session.data_listener);
        if (data < 0) {
            return false;
        }

        bool sent = true;
        for (std::size_t pos = 0; pos < payload.size() && sent; pos += kDataChunk) {
            sent = send_text(data, payload.substr(pos, kDataChunk));
        }
        ::close(data);
        if (!sent) {
            return send_text(control, "426 Connection closed; transfer aborted\r\n");
        }
        return send_text(control, "226 Transfer complete\r\n");
    }

    mutable std::mutex mutex_;
    std::map<std::string, std::string> directories_;
    std::map<std::string, std::string> files_;
    std::vector<std::string> commands_;

    std::atomic<bool> epsv_enabled_{true};
    std::atomic<bool> rest_enabled_{true};
    std::atomic<int> sessions_{0};

    int listener_ = -1;
    std::uint16_t port_ = 0;
    std::jthread thread_;
};

} // namespace rmirror::testing
