#include "ftp_client.hpp"
#include "ftp_parsers.hpp"
#include "infra/retry.hpp"
#include <charconv>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <utility>

namespace rmirror::adapters::ftp {

auto FtpOptions::from_config(const infra::Config& config) -> FtpOptions {
    FtpOptions options;
    options.host = config.remote.host;
    options.port = config.remote.port;
    options.username = config.remote.username;
    options.password = config.remote.password;
    options.timeout = std::chrono::seconds(config.remote.timeout_seconds);
    options.buffer_size = config.download.chunk_size > 0 ? config.download.chunk_size : 8192;
    return options;
}

FtpClient::FtpClient(FtpOptions options)
    : options_(std::move(options)) {}

FtpClient::~FtpClient() {
    close();
}

auto FtpClient::connect() -> infra::VoidResult {
    // Сбои установки соединения повторяются здесь же, до попыток передачи
    return infra::with_retry(
        [this](int) { return connect_once_(); },
        infra::RetryPolicy{.max_attempts = options_.connect_attempts},
        {},
        [this](int attempt, const infra::Error& err) {
            spdlog::warn("Connection attempt {}/{} to {} failed: {}",
                         attempt + 1, options_.connect_attempts, options_.host, err.message);
            control_.close();
            read_buffer_.clear();
        });
}

auto FtpClient::connect_once_() -> infra::VoidResult {
    auto socket = TcpSocket::connect_to(options_.host, options_.port, options_.timeout);
    if (!socket) {
        return std::unexpected(std::move(socket.error()));
    }
    control_ = std::move(*socket);
    read_buffer_.clear();

    auto greeting = read_reply_();
    while (greeting && greeting->is_preliminary()) { // 120: сервис будет готов позже
        greeting = read_reply_();
    }
    if (!greeting) {
        return std::unexpected(std::move(greeting.error()));
    }
    if (greeting->code != 220) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
            fmt::format("Unexpected greeting: {}", greeting->text)));
    }

    auto user = command_(fmt::format("USER {}", options_.username));
    if (!user) {
        return std::unexpected(std::move(user.error()));
    }
    if (user->code == 331) {
        auto pass = command_(fmt::format("PASS {}", options_.password));
        if (!pass) {
            return std::unexpected(std::move(pass.error()));
        }
        user = std::move(pass);
    }
    if (user->code != 230 && user->code != 202) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
            fmt::format("Login failed: {}", user->text)));
    }

    if (auto type = expect_("TYPE I", 2); !type) {
        return std::unexpected(std::move(type.error()));
    }

    spdlog::debug("Logged in to {} as {}", options_.host, options_.username);
    return {};
}

auto FtpClient::read_line_() -> infra::Result<std::string> {
    while (true) {
        if (const auto eol = read_buffer_.find('\n'); eol != std::string::npos) {
            auto line = read_buffer_.substr(0, eol);
            read_buffer_.erase(0, eol + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return line;
        }

        char chunk[1024];
        auto received = control_.receive(chunk, sizeof(chunk));
        if (!received) {
            return std::unexpected(std::move(received.error()));
        }
        if (*received == 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed,
                                                     "Control connection closed by server"));
        }
        read_buffer_.append(chunk, *received);
    }
}

auto FtpClient::read_reply_() -> infra::Result<Reply> {
    auto first = read_line_();
    if (!first) {
        return std::unexpected(std::move(first.error()));
    }

    Reply reply;
    const auto& line = *first;
    if (line.size() < 3 ||
        std::from_chars(line.data(), line.data() + 3, reply.code).ec != std::errc{}) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ProtocolError,
            fmt::format("Malformed reply: '{}'", line)));
    }
    reply.text = line;

    // Многострочный ответ: "123-..." ... "123 ..."
    if (line.size() > 3 && line[3] == '-') {
        const auto terminator = line.substr(0, 3) + " ";
        while (true) {
            auto next = read_line_();
            if (!next) {
                return std::unexpected(std::move(next.error()));
            }
            reply.text += '\n';
            reply.text += *next;
            if (next->starts_with(terminator)) break;
        }
    }
    return reply;
}

auto FtpClient::command_(std::string_view command) -> infra::Result<Reply> {
    if (!control_.is_open()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ConnectionFailed, "Not connected"));
    }
    spdlog::trace("FTP > {}", command.starts_with("PASS") ? "PASS ****" : command);

    if (auto sent = control_.send_all(fmt::format("{}\r\n", command)); !sent) {
        return std::unexpected(std::move(sent.error()));
    }
    auto reply = read_reply_();
    if (reply) {
        spdlog::trace("FTP < {}", reply->text);
    }
    return reply;
}

auto FtpClient::expect_(std::string_view command, int expected_class) -> infra::Result<Reply> {
    auto reply = command_(command);
    if (!reply) {
        return reply;
    }
    if (reply->code / 100 != expected_class) {
        // 4xx — временный отказ, 5xx — постоянный; оба повторяются на уровне передачи
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
            fmt::format("{} rejected: {}", command, reply->text)));
    }
    return reply;
}

auto FtpClient::open_data_channel_() -> infra::Result<TcpSocket> {
    // Адрес канала данных берём у управляющего соединения (серверы за NAT отдают в PASV внутренний IP)
    auto host = control_.peer_address();
    if (host.empty()) {
        host = options_.host;
    }

    if (auto epsv = command_("EPSV"); epsv && epsv->code == 229) {
        if (const auto port = parse_epsv_reply(epsv->text)) {
            return TcpSocket::connect_to(host, *port, options_.timeout);
        }
    } else if (!epsv && epsv.error().code != infra::ErrorCode::RemoteRejected) {
        return std::unexpected(std::move(epsv.error()));
    }

    auto pasv = command_("PASV");
    if (!pasv) {
        return std::unexpected(std::move(pasv.error()));
    }
    if (pasv->code != 227) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
            fmt::format("Passive mode rejected: {}", pasv->text)));
    }
    const auto endpoint = parse_pasv_reply(pasv->text);
    if (!endpoint) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ProtocolError,
            fmt::format("Cannot parse PASV reply: {}", pasv->text)));
    }
    return TcpSocket::connect_to(host, endpoint->port, options_.timeout);
}

auto FtpClient::finish_transfer_() -> infra::VoidResult {
    auto done = read_reply_();
    if (!done) {
        return std::unexpected(std::move(done.error()));
    }
    if (done->code != 226 && done->code != 250) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
            fmt::format("Transfer not completed: {}", done->text)));
    }
    return {};
}

auto FtpClient::change_directory(std::string_view path) -> infra::VoidResult {
    if (auto reply = expect_(fmt::format("CWD {}", path), 2); !reply) {
        return std::unexpected(std::move(reply.error()));
    }
    return {};
}

auto FtpClient::list_directory(std::string_view path)
    -> infra::Result<std::vector<remote::RemoteEntry>>
{
    if (auto cwd = change_directory(path); !cwd) {
        return std::unexpected(std::move(cwd.error()));
    }

    auto data = open_data_channel_();
    if (!data) {
        return std::unexpected(std::move(data.error()));
    }

    auto start = command_("LIST");
    if (!start) {
        return std::unexpected(std::move(start.error()));
    }
    if (!start->is_preliminary()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
            fmt::format("LIST rejected: {}", start->text)));
    }

    std::string listing;
    std::vector<char> buffer(options_.buffer_size);
    while (true) {
        auto received = data->receive(buffer.data(), buffer.size());
        if (!received) {
            return std::unexpected(std::move(received.error()));
        }
        if (*received == 0) break;
        listing.append(buffer.data(), *received);
    }
    data->close();

    if (auto done = finish_transfer_(); !done) {
        return std::unexpected(std::move(done.error()));
    }

    auto entries = parse_listing(listing);
    spdlog::debug("Listed {}: {} entries", path, entries.size());
    return entries;
}

auto FtpClient::retrieve(std::string_view path,
                         std::uint64_t resume_offset,
                         const remote::ChunkSink& on_chunk) -> infra::VoidResult
{
    auto data = open_data_channel_();
    if (!data) {
        return std::unexpected(std::move(data.error()));
    }

    if (resume_offset > 0) {
        auto rest = command_(fmt::format("REST {}", resume_offset));
        if (!rest) {
            return std::unexpected(std::move(rest.error()));
        }
        if (rest->code != 350) {
            return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
                fmt::format("Resume at {} rejected: {}", resume_offset, rest->text)));
        }
    }

    auto start = command_(fmt::format("RETR {}", path));
    if (!start) {
        return std::unexpected(std::move(start.error()));
    }
    if (!start->is_preliminary()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RemoteRejected,
            fmt::format("RETR {} rejected: {}", path, start->text)));
    }

    std::vector<char> buffer(options_.buffer_size);
    while (true) {
        auto received = data->receive(buffer.data(), buffer.size());
        if (!received) {
            return std::unexpected(std::move(received.error()));
        }
        if (*received == 0) break;

        if (auto sunk = on_chunk(std::string_view(buffer.data(), *received)); !sunk) {
            // Передача брошена посередине: управляющее соединение в неизвестном состоянии
            data->close();
            control_.close();
            read_buffer_.clear();
            return sunk;
        }
    }
    data->close();

    return finish_transfer_();
}

void FtpClient::close() noexcept {
    if (!control_.is_open()) {
        return;
    }
    // QUIT вежливый: ответ не обязателен
    if (control_.send_all("QUIT\r\n")) {
        if (auto reply = read_reply_(); !reply) {
            spdlog::debug("No reply to QUIT from {}: {}", options_.host, reply.error().message);
        }
    }
    control_.close();
    read_buffer_.clear();
}

auto make_client_factory(const infra::Config& config) -> remote::ClientFactory {
    return [options = FtpOptions::from_config(config)]() -> std::unique_ptr<remote::RemoteClient> {
        return std::make_unique<FtpClient>(options);
    };
}

} // namespace rmirror::adapters::ftp
