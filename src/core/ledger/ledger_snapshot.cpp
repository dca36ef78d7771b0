// Сериализация снимка журнала. Формат — JSON с ключами прежнего загрузчика:
// directories, files, completed_files, failed_files, session_start_time,
// last_save_time, total_files_processed. Время — секунды Unix (double).
// Строки, не являющиеся корректным UTF-8 (имена Latin-1 с FTP), пишутся как
// ведущий байт NUL + percent-кодирование байтов и восстанавливаются при чтении.
#include "progress_ledger.hpp"
#include <algorithm>
#include <charconv>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace rmirror::core {

namespace {

auto to_epoch(TimePoint tp) -> double {
    return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

auto from_epoch(double seconds) -> TimePoint {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::duration<double>(seconds)));
}

void emit_time(YAML::Emitter& out, const char* key, const std::optional<TimePoint>& tp) {
    out << YAML::Key << key << YAML::Value;
    if (tp) {
        out << to_epoch(*tp);
    } else {
        out << YAML::Null;
    }
}

auto read_time(const YAML::Node& node) -> std::optional<TimePoint> {
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    return from_epoch(node.as<double>());
}

// Маркер закодированной строки; в путях POSIX байт 0 невозможен
constexpr char kRawMarker = '\0';

auto is_valid_utf8(std::string_view text) -> bool {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        char32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cont & 0x3F);
        }
        // Overlong, суррогаты и значения вне Unicode
        static constexpr char32_t kMinForLength[] = {0, 0x80, 0x800, 0x10000};
        if (cp < kMinForLength[extra] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

auto encode_text(const std::string& text) -> std::string {
    if (is_valid_utf8(text) && (text.empty() || text.front() != kRawMarker)) {
        return text;
    }
    std::string encoded(1, kRawMarker);
    for (const char c : text) {
        const auto byte = static_cast<unsigned char>(c);
        if (byte > 0x20 && byte < 0x7F && byte != '%') {
            encoded.push_back(c);
        } else {
            encoded += fmt::format("%{:02X}", byte);
        }
    }
    return encoded;
}

auto decode_text(const std::string& text) -> std::string {
    if (text.empty() || text.front() != kRawMarker) {
        return text;
    }
    std::string decoded;
    for (std::size_t i = 1; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            unsigned value = 0;
            const auto* first = text.data() + i + 1;
            if (auto [ptr, ec] = std::from_chars(first, first + 2, value, 16); ec == std::errc{} && ptr == first + 2) {
                decoded.push_back(static_cast<char>(value));
                i += 2;
                continue;
            }
        }
        decoded.push_back(text[i]);
    }
    return decoded;
}

template<typename T>
auto read_or(const YAML::Node& node, T fallback) -> T {
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<T>();
}

// Ключи сортируются, чтобы снимки были стабильны между сохранениями
template<typename Map>
auto sorted_keys(const Map& map) -> std::vector<std::string> {
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [key, value] : map) keys.push_back(key);
    std::ranges::sort(keys);
    return keys;
}

auto parse_file(const std::string& key, const YAML::Node& node) -> std::optional<FileRecord> {
    const auto status = parse_file_status(read_or<std::string>(node["status"], "pending"));
    if (!status) {
        return std::nullopt;
    }

    FileRecord record;
    record.remote_id = decode_text(read_or<std::string>(node["remote_path"], key));
    record.local_path = decode_text(read_or<std::string>(node["local_path"], ""));
    // 0 в снимке означает неизвестный размер
    if (const auto size = node["size_bytes"]; size && !size.IsNull()) {
        if (const auto value = size.as<std::uint64_t>(); value > 0) {
            record.expected_size = value;
        }
    }
    record.bytes_transferred = read_or<std::uint64_t>(node["downloaded_bytes"], 0);
    record.status = *status;
    record.start_time = read_time(node["start_time"]);
    record.end_time = read_time(node["end_time"]);
    if (const auto msg = node["error_message"]; msg && !msg.IsNull()) {
        record.error_message = decode_text(msg.as<std::string>());
    }
    record.retry_count = read_or<std::uint32_t>(node["retry_count"], 0);
    return record;
}

auto parse_directory(const std::string& key, const YAML::Node& node) -> std::optional<DirectoryRecord> {
    const auto status = parse_directory_status(read_or<std::string>(node["status"], "pending"));
    if (!status) {
        return std::nullopt;
    }

    DirectoryRecord dir;
    dir.remote_path = decode_text(read_or<std::string>(node["remote_path"], key));
    dir.local_path = decode_text(read_or<std::string>(node["local_path"], ""));
    dir.total_files = read_or<std::uint64_t>(node["total_files"], 0);
    dir.completed_files = read_or<std::uint64_t>(node["completed_files"], 0);
    dir.failed_files = read_or<std::uint64_t>(node["failed_files"], 0);
    dir.skipped_files = read_or<std::uint64_t>(node["skipped_files"], 0);
    dir.total_bytes = read_or<std::uint64_t>(node["total_bytes"], 0);
    dir.transferred_bytes = read_or<std::uint64_t>(node["downloaded_bytes"], 0);
    dir.status = *status;
    dir.start_time = read_time(node["start_time"]);
    dir.end_time = read_time(node["end_time"]);
    dir.total_files = std::max(dir.total_files, dir.finished_files());
    return dir;
}

} // namespace

auto ProgressLedger::to_json_() const -> std::string {
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetDoublePrecision(17);
    out.SetOutputCharset(YAML::EscapeAsJson);

    out << YAML::BeginMap;

    out << YAML::Key << "directories" << YAML::Value << YAML::BeginMap;
    for (const auto& key : sorted_keys(directories_)) {
        const auto& dir = directories_.at(key);
        out << YAML::Key << encode_text(key) << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "remote_path" << YAML::Value << encode_text(dir.remote_path);
        out << YAML::Key << "local_path" << YAML::Value << encode_text(dir.local_path);
        out << YAML::Key << "total_files" << YAML::Value << dir.total_files;
        out << YAML::Key << "completed_files" << YAML::Value << dir.completed_files;
        out << YAML::Key << "failed_files" << YAML::Value << dir.failed_files;
        out << YAML::Key << "skipped_files" << YAML::Value << dir.skipped_files;
        out << YAML::Key << "total_bytes" << YAML::Value << dir.total_bytes;
        out << YAML::Key << "downloaded_bytes" << YAML::Value << dir.transferred_bytes;
        emit_time(out, "start_time", dir.start_time);
        emit_time(out, "end_time", dir.end_time);
        out << YAML::Key << "status" << YAML::Value << std::string(to_string(dir.status));
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "files" << YAML::Value << YAML::BeginMap;
    for (const auto& key : sorted_keys(files_)) {
        const auto& record = files_.at(key);
        out << YAML::Key << encode_text(key) << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "remote_path" << YAML::Value << encode_text(record.remote_id);
        out << YAML::Key << "local_path" << YAML::Value << encode_text(record.local_path);
        out << YAML::Key << "size_bytes" << YAML::Value;
        if (record.expected_size) {
            out << *record.expected_size;
        } else {
            out << YAML::Null;
        }
        out << YAML::Key << "downloaded_bytes" << YAML::Value << record.bytes_transferred;
        out << YAML::Key << "status" << YAML::Value << std::string(to_string(record.status));
        emit_time(out, "start_time", record.start_time);
        emit_time(out, "end_time", record.end_time);
        out << YAML::Key << "error_message" << YAML::Value;
        if (record.error_message) {
            out << encode_text(*record.error_message);
        } else {
            out << YAML::Null;
        }
        out << YAML::Key << "retry_count" << YAML::Value << record.retry_count;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    auto encoded_set = [](const std::unordered_set<std::string>& set) {
        std::vector<std::string> items;
        items.reserve(set.size());
        for (const auto& item : set) items.push_back(encode_text(item));
        std::ranges::sort(items);
        return items;
    };
    const auto completed = encoded_set(completed_);
    const auto failed = encoded_set(failed_);
    out << YAML::Key << "completed_files" << YAML::Value << completed;
    out << YAML::Key << "failed_files" << YAML::Value << failed;

    out << YAML::Key << "session_start_time" << YAML::Value << to_epoch(session_start_);
    out << YAML::Key << "last_save_time" << YAML::Value << to_epoch(std::chrono::system_clock::now());
    out << YAML::Key << "total_files_processed" << YAML::Value << total_files_processed_;

    out << YAML::EndMap;
    return out.c_str();
}

auto ProgressLedger::from_json_(const std::string& text) -> infra::VoidResult {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerCorrupt,
            fmt::format("Cannot parse progress file: {}", e.what())));
    }
    if (!root.IsMap()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerCorrupt,
            "Progress file is not a JSON object"));
    }

    std::size_t skipped = 0;

    if (const auto dirs = root["directories"]; dirs && dirs.IsMap()) {
        for (const auto& entry : dirs) {
            try {
                const auto key = decode_text(entry.first.as<std::string>());
                if (auto dir = parse_directory(key, entry.second)) {
                    directories_.emplace(key, std::move(*dir));
                } else {
                    ++skipped;
                }
            } catch (const YAML::Exception& e) {
                spdlog::debug("Skipping malformed directory entry: {}", e.what());
                ++skipped;
            }
        }
    }

    if (const auto files = root["files"]; files && files.IsMap()) {
        for (const auto& entry : files) {
            try {
                const auto key = decode_text(entry.first.as<std::string>());
                if (auto record = parse_file(key, entry.second)) {
                    files_.emplace(key, std::move(*record));
                } else {
                    ++skipped;
                }
            } catch (const YAML::Exception& e) {
                spdlog::debug("Skipping malformed file entry: {}", e.what());
                ++skipped;
            }
        }
    }

    auto read_set = [&](const char* key, std::unordered_set<std::string>& target) {
        const auto node = root[key];
        if (!node || !node.IsSequence()) return;
        for (const auto& item : node) {
            try {
                target.insert(decode_text(item.as<std::string>()));
            } catch (const YAML::Exception& e) {
                spdlog::debug("Skipping malformed {} entry: {}", key, e.what());
                ++skipped;
            }
        }
    };
    read_set("completed_files", completed_);
    read_set("failed_files", failed_);

    if (skipped > 0) {
        spdlog::warn("Skipped {} malformed entries in {}", skipped, snapshot_path_.string());
    }
    return {};
}

} // namespace rmirror::core
