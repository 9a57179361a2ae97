#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace config
{
    struct DebugConfig;
}

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

    Severity    severityFromChar(char c);
    const char* severityName(Severity sev);

    struct Event
    {
        std::chrono::system_clock::time_point timestamp;
        Severity                              severity;
        std::string                           component;
        std::string                           message;
        std::optional<std::string>            extraJson;
    };

    struct LogConfig
    {
        Severity                   minimumSeverity{Severity::INFO};
        bool                       logToStdout{true};
        std::optional<std::string> filePath{};
        std::size_t                maxFileSizeBytes{0};
        std::size_t                maxRecentEvents{1000};
    };

    LogConfig logConfigFromDebug(const config::DebugConfig& dbg);

    /**
     * Structured event log shared by all pipeline stages. Events are written
     * synchronously to the configured sinks and kept in a bounded in-memory
     * ring for later inspection.
     */
    class DiagnosticManager
    {
      public:
        explicit DiagnosticManager(const LogConfig& cfg = {});
        ~DiagnosticManager();

        DiagnosticManager(const DiagnosticManager&)            = delete;
        DiagnosticManager& operator=(const DiagnosticManager&) = delete;

        void log(Severity sev, const std::string& component, const std::string& message,
                 const std::optional<std::string>& extraJson = std::nullopt);

        // Newest first.
        std::vector<Event> fetchRecent(std::size_t maxEvents) const;
        std::size_t        count(Severity sev) const;

        void      updateLogConfig(const LogConfig& cfg);
        LogConfig logConfig() const;

      private:
        void        rotateLogIfNeeded();
        void        persistEvent(const Event& ev);
        bool        shouldLog(Severity sev) const;
        std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) const;

        LogConfig             m_logCfg{};
        std::filesystem::path m_logPath;
        std::ofstream         m_logFile;

        mutable std::mutex m_mtx;
        std::deque<Event>  m_recent;
        std::size_t        m_counts[5]{};
    };

} // namespace diag
