#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include "../../adapters/remote/remote_client.hpp"
#include "../../infra/config/config.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../ledger/progress_ledger.hpp"
#include "../rate_governor/rate_governor.hpp"
#include "../space_governor/space_governor.hpp"
#include "../transfer_engine/transfer_engine.hpp"
#include "session_stats.hpp"

namespace rmirror::core {

struct SessionStatus {
    LedgerStatistics ledger;
    std::optional<DiskUsage> disk;      // nullopt, если запрос к ФС не удался
    RateStats rate;
    SessionStatsSnapshot session;
};

/// Верхний уровень: каталоги по порядку, проверки места между ними,
/// финальный сброс журнала на любом пути выхода.
class SessionController {
public:
    /// FTP-клиент из конфигурации.
    explicit SessionController(infra::Config config);
    SessionController(infra::Config config, adapters::remote::ClientFactory factory);

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    /// Основной запуск. false — сессия прервана (место, остановка) или
    /// хотя бы один каталог не удалось обработать.
    [[nodiscard]] auto download_all() -> bool;

    /// Повтор упавших файлов с retry_count < max_retries. true — все успешны.
    [[nodiscard]] auto retry_failed(std::uint32_t max_retries = 3) -> bool;

    [[nodiscard]] auto status() const -> SessionStatus;

    /// Потокобезопасно; можно вызывать из наблюдателя сигналов.
    void request_stop();
    [[nodiscard]] auto stop_requested() const -> bool { return stop_source_.stop_requested(); }

    /// Причина последнего неуспеха download_all/retry_failed (для кода выхода).
    [[nodiscard]] auto last_error() const -> const std::optional<infra::Error>& { return last_error_; }

    [[nodiscard]] auto ledger() const -> std::shared_ptr<ProgressLedger> { return ledger_; }
    [[nodiscard]] auto engine() -> TransferEngine& { return engine_; }
    [[nodiscard]] auto session_stats() const -> SessionStatsSnapshot { return stats_.snapshot(); }

private:
    class Finalizer;

    [[nodiscard]] auto prepare_directories_() -> bool;
    [[nodiscard]] auto ensure_space_before_(const std::string& directory) -> bool;
    void fail_(infra::Error err);

    const infra::Config config_;
    std::shared_ptr<ProgressLedger> ledger_;
    RateGovernor rate_;
    SpaceGovernor space_;
    SessionStats stats_;
    TransferEngine engine_;

    std::stop_source stop_source_;
    std::optional<infra::Error> last_error_;
};

} // namespace rmirror::core
