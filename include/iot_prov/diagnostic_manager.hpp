#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

namespace diag
{

    enum class Severity
    {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    struct Event
    {
        std::chrono::system_clock::time_point timestamp;
        Severity                              severity;
        std::string                           component;
        std::string                           message;
    };

    struct LogConfig
    {
        Severity                   minimumSeverity{Severity::INFO};
        bool                       logToStdout{true};
        std::optional<std::string> filePath{};
        std::size_t                maxFileSizeBytes{0};
    };

    /**
     * Process-wide event sink. Every line goes to stdout and/or the configured
     * log file as soon as it is logged, and the most recent events are kept in
     * memory so a run can be summarised or exported afterwards.
     */
    class DiagnosticManager
    {
      public:
        explicit DiagnosticManager(const LogConfig& cfg = {});
        ~DiagnosticManager();

        DiagnosticManager(const DiagnosticManager&)            = delete;
        DiagnosticManager& operator=(const DiagnosticManager&) = delete;

        static constexpr std::size_t kHistoryLimit = 512;

        void log(Severity sev, const std::string& component, const std::string& message);

        std::vector<Event> fetchRecent(std::size_t maxEvents) const;
        bool exportRecentEvents(std::size_t maxEvents, bool asJson, const std::filesystem::path& destination) const;

        static std::string                severityToString(Severity sev);
        static std::optional<Severity>    severityFromString(const std::string& name);

      private:
        void        rotateLogIfNeeded();
        void        persistEvent(const Event& ev);
        bool        shouldLog(Severity sev) const;
        std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) const;

        LogConfig             m_logCfg{};
        std::filesystem::path m_logPath;
        std::ofstream         m_logFile;
        std::deque<Event>     m_history;
    };

} // namespace diag
