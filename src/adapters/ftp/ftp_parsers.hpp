#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "adapters/remote/remote_client.hpp"

namespace rmirror::adapters::ftp {

/// Разбор строки Unix-листинга LIST:
///   drwxr-xr-x 2 user group 4096 Jan 1 12:00 name with spaces
/// Пропускает "." и "..", строки короче 9 полей; нечисловой размер — 0.
[[nodiscard]] auto parse_list_line(std::string_view line) -> std::optional<remote::RemoteEntry>;

[[nodiscard]] auto parse_listing(std::string_view text) -> std::vector<remote::RemoteEntry>;

struct PassiveEndpoint {
    std::string host;
    std::uint16_t port = 0;
};

/// 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2)
[[nodiscard]] auto parse_pasv_reply(std::string_view text) -> std::optional<PassiveEndpoint>;

/// 229 Entering Extended Passive Mode (|||port|)
[[nodiscard]] auto parse_epsv_reply(std::string_view text) -> std::optional<std::uint16_t>;

} // namespace rmirror::adapters::ftp
