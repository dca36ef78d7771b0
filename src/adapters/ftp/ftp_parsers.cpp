#include "ftp_parsers.hpp"
#include <array>
#include <charconv>
#include <fmt/core.h>
#include <regex>

namespace rmirror::adapters::ftp {

namespace {

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t';
}

template<typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    T value{};
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto parse_list_line(std::string_view line) -> std::optional<remote::RemoteEntry> {
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.remove_suffix(1);
    }

    // 8 полей до имени: права, ссылки, владелец, группа, размер, месяц, день, время/год
    std::array<std::string_view, 8> fields{};
    std::size_t pos = 0;
    for (auto& field : fields) {
        while (pos < line.size() && is_space(line[pos])) ++pos;
        const auto start = pos;
        while (pos < line.size() && !is_space(line[pos])) ++pos;
        if (start == pos) {
            return std::nullopt;
        }
        field = line.substr(start, pos - start);
    }
    while (pos < line.size() && is_space(line[pos])) ++pos;
    if (pos >= line.size()) {
        return std::nullopt;
    }

    std::string_view name = line.substr(pos);
    const auto permissions = fields[0];

    // Символическая ссылка: "name -> target"
    if (permissions.starts_with('l')) {
        if (const auto arrow = name.find(" -> "); arrow != std::string_view::npos) {
            name = name.substr(0, arrow);
        }
    }

    if (name == "." || name == "..") {
        return std::nullopt;
    }

    remote::RemoteEntry entry;
    entry.name = std::string(name);
    entry.kind = permissions.starts_with('d') ? remote::EntryKind::Directory : remote::EntryKind::File;
    if (entry.kind == remote::EntryKind::File) {
        entry.size_bytes = parse_number<std::uint64_t>(fields[4]).value_or(0);
    }
    return entry;
}

auto parse_listing(std::string_view text) -> std::vector<remote::RemoteEntry> {
    std::vector<remote::RemoteEntry> entries;
    while (!text.empty()) {
        const auto eol = text.find('\n');
        const auto line = text.substr(0, eol);
        if (auto entry = parse_list_line(line)) {
            entries.push_back(std::move(*entry));
        }
        if (eol == std::string_view::npos) break;
        text.remove_prefix(eol + 1);
    }
    return entries;
}

auto parse_pasv_reply(std::string_view text) -> std::optional<PassiveEndpoint> {
    static const std::regex rx(R"((\d+),(\d+),(\d+),(\d+),(\d+),(\d+))");
    std::match_results<std::string_view::const_iterator> match;
    if (!std::regex_search(text.begin(), text.end(), match, rx)) {
        return std::nullopt;
    }

    std::array<unsigned, 6> parts{};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const auto value = parse_number<unsigned>(std::string_view(&*match[i + 1].first,
                                                                   static_cast<std::size_t>(match[i + 1].length())));
        if (!value || *value > 255) {
            return std::nullopt;
        }
        parts[i] = *value;
    }

    return PassiveEndpoint{
        .host = fmt::format("{}.{}.{}.{}", parts[0], parts[1], parts[2], parts[3]),
        .port = static_cast<std::uint16_t>(parts[4] * 256 + parts[5]),
    };
}

auto parse_epsv_reply(std::string_view text) -> std::optional<std::uint16_t> {
    const auto open = text.find('(');
    const auto close = text.find(')', open == std::string_view::npos ? 0 : open);
    if (open == std::string_view::npos || close == std::string_view::npos || close - open < 5) {
        return std::nullopt;
    }

    // (<d><d><d>port<d>), разделитель — первый символ внутри скобок
    auto inner = text.substr(open + 1, close - open - 1);
    const char delim = inner.front();
    if (inner.size() < 5 || inner[1] != delim || inner[2] != delim || inner.back() != delim) {
        return std::nullopt;
    }
    inner = inner.substr(3, inner.size() - 4);

    const auto port = parse_number<unsigned>(inner);
    if (!port || *port == 0 || *port > 65535) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*port);
}

} // namespace rmirror::adapters::ftp
