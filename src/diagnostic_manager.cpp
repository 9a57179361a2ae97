#include "diagnostic_manager.hpp"

#include "config_manager.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace diag {

Severity severityFromChar(char c)
{
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    switch (c) {
    case 'D': return Severity::DEBUG;
    case 'I': return Severity::INFO;
    case 'W': return Severity::WARN;
    case 'E': return Severity::ERROR;
    case 'F': return Severity::FATAL;
    default: return Severity::INFO;
    }
}

const char* severityName(Severity sev)
{
    switch (sev) {
    case Severity::DEBUG: return "DEBUG";
    case Severity::INFO: return "INFO";
    case Severity::WARN: return "WARN";
    case Severity::ERROR: return "ERROR";
    case Severity::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

LogConfig logConfigFromDebug(const config::DebugConfig& dbg)
{
    LogConfig cfg;
    cfg.minimumSeverity = severityFromChar(dbg.level);
    cfg.logToStdout = dbg.toStdout;
    if (!dbg.fileName.empty()) {
        cfg.filePath = dbg.fileName;
        cfg.maxFileSizeBytes = dbg.fileSize;
    }
    return cfg;
}

DiagnosticManager::DiagnosticManager(const LogConfig& cfg)
    : m_logCfg(cfg)
{
    if (m_logCfg.filePath)
        m_logPath = *m_logCfg.filePath;
}

DiagnosticManager::~DiagnosticManager()
{
    std::lock_guard<std::mutex> lk(m_mtx);
    if (m_logFile.is_open())
        m_logFile.close();
}

void DiagnosticManager::log(Severity sev, const std::string& component,
                            const std::string& message,
                            const std::optional<std::string>& extraJson)
{
    std::lock_guard<std::mutex> lock(m_mtx);
    if (!shouldLog(sev))
        return;

    Event ev;
    ev.timestamp = std::chrono::system_clock::now();
    ev.severity = sev;
    ev.component = component;
    ev.message = message;
    ev.extraJson = extraJson;

    persistEvent(ev);

    m_counts[static_cast<int>(sev)]++;
    m_recent.push_back(std::move(ev));
    while (m_logCfg.maxRecentEvents > 0 && m_recent.size() > m_logCfg.maxRecentEvents)
        m_recent.pop_front();
}

std::vector<Event> DiagnosticManager::fetchRecent(std::size_t maxEvents) const
{
    std::lock_guard<std::mutex> lock(m_mtx);
    std::vector<Event> out;
    maxEvents = std::min(maxEvents, m_recent.size());
    auto it = m_recent.end();
    for (std::size_t i = 0; i < maxEvents; ++i) {
        --it;
        out.push_back(*it);
    }
    return out;
}

std::size_t DiagnosticManager::count(Severity sev) const
{
    std::lock_guard<std::mutex> lock(m_mtx);
    return m_counts[static_cast<int>(sev)];
}

void DiagnosticManager::updateLogConfig(const LogConfig& cfg)
{
    std::lock_guard<std::mutex> lk(m_mtx);
    const bool pathChanged = cfg.filePath != m_logCfg.filePath;
    m_logCfg = cfg;
    if (pathChanged && m_logFile.is_open())
        m_logFile.close();
    m_logPath = m_logCfg.filePath ? std::filesystem::path(*m_logCfg.filePath) : std::filesystem::path{};
}

LogConfig DiagnosticManager::logConfig() const
{
    std::lock_guard<std::mutex> lk(m_mtx);
    return m_logCfg;
}

void DiagnosticManager::rotateLogIfNeeded()
{
    if (!m_logCfg.filePath || m_logCfg.maxFileSizeBytes == 0)
        return;

    std::error_code ec;
    if (!std::filesystem::exists(m_logPath, ec))
        return;

    auto size = std::filesystem::file_size(m_logPath, ec);
    if (ec || size < m_logCfg.maxFileSizeBytes)
        return;

    std::filesystem::path rotated = m_logPath;
    rotated += ".1";
    m_logFile.close();
    std::filesystem::remove(rotated, ec);
    std::filesystem::rename(m_logPath, rotated, ec);
    if (ec)
        std::cerr << "Failed to rotate log file " << m_logPath << ": " << ec.message() << std::endl;
    m_logFile.open(m_logPath, std::ios::out | std::ios::trunc);
}

void DiagnosticManager::persistEvent(const Event& ev)
{
    auto line = formatTimestamp(ev.timestamp) + " [" + severityName(ev.severity) + "] " + ev.component + ": " + ev.message;
    if (ev.extraJson)
        line += " " + *ev.extraJson;

    if (m_logCfg.logToStdout)
        std::cout << line << std::endl;

    if (m_logCfg.filePath) {
        if (!m_logFile.is_open()) {
            if (m_logPath.has_parent_path()) {
                std::error_code ec;
                std::filesystem::create_directories(m_logPath.parent_path(), ec);
            }
            m_logFile.open(m_logPath, std::ios::out | std::ios::app);
        }
        m_logFile << line << std::endl;
        m_logFile.flush();
        rotateLogIfNeeded();
    }
}

bool DiagnosticManager::shouldLog(Severity sev) const
{
    return static_cast<int>(sev) >= static_cast<int>(m_logCfg.minimumSeverity);
}

std::string DiagnosticManager::formatTimestamp(const std::chrono::system_clock::time_point& tp) const
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmStruct {};
#if defined(_WIN32)
    localtime_s(&tmStruct, &t);
#else
    localtime_r(&t, &tmStruct);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmStruct, "%F %T");
    return oss.str();
}

} // namespace diag
