#pragma once

#include "../ledger/progress_ledger.hpp"
#include "session_controller.hpp"
#include "session_stats.hpp"

namespace rmirror::core {

/// Таблица статистики журнала (после каждого каталога и в конце сессии).
void print_ledger_statistics(const LedgerStatistics& stats);

/// Итоги запуска: счётчики и первые 10 упавших файлов.
void print_session_summary(const SessionStatsSnapshot& stats);

/// Полный отчёт для --status.
void print_status(const SessionStatus& status);

} // namespace rmirror::core
