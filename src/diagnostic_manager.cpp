#include "diagnostic_manager.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace diag {

DiagnosticManager::DiagnosticManager(const LogConfig& cfg)
    : m_logCfg(cfg)
{
    if (m_logCfg.filePath)
        m_logPath = *m_logCfg.filePath;
}

DiagnosticManager::~DiagnosticManager()
{
    if (m_logFile.is_open())
        m_logFile.close();
}

void DiagnosticManager::log(Severity sev, const std::string& component,
                            const std::string& message)
{
    if (!shouldLog(sev))
        return;

    Event ev;
    ev.timestamp = std::chrono::system_clock::now();
    ev.severity = sev;
    ev.component = component;
    ev.message = message;

    persistEvent(ev);

    m_history.push_back(std::move(ev));
    while (m_history.size() > kHistoryLimit)
        m_history.pop_front();
}

std::vector<Event> DiagnosticManager::fetchRecent(std::size_t maxEvents) const
{
    std::vector<Event> out;
    maxEvents = std::min(maxEvents, m_history.size());
    auto it = m_history.end();
    for (std::size_t i = 0; i < maxEvents; ++i) {
        --it;
        out.push_back(*it);
    }
    return out;
}

bool DiagnosticManager::exportRecentEvents(std::size_t maxEvents, bool asJson,
                                           const std::filesystem::path& destination) const
{
    auto events = fetchRecent(maxEvents);
    std::ofstream ofs(destination, std::ios::out | std::ios::trunc);
    if (!ofs)
        return false;

    if (asJson) {
        nlohmann::json arr = nlohmann::json::array();
        for (const auto& ev : events) {
            arr.push_back({
                {"timestamp", formatTimestamp(ev.timestamp)},
                {"severity", severityToString(ev.severity)},
                {"component", ev.component},
                {"message", ev.message},
            });
        }
        ofs << arr.dump(2) << '\n';
    } else {
        for (const auto& ev : events) {
            ofs << formatTimestamp(ev.timestamp) << " [" << severityToString(ev.severity) << "] "
                << ev.component << ": " << ev.message << '\n';
        }
    }
    return static_cast<bool>(ofs);
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
    m_logFile.open(m_logPath, std::ios::out | std::ios::trunc);
}

void DiagnosticManager::persistEvent(const Event& ev)
{
    const auto line = formatTimestamp(ev.timestamp) + " [" + severityToString(ev.severity) + "] " + ev.component + ": " + ev.message;

    if (m_logCfg.logToStdout) {
        if (ev.severity >= Severity::ERROR)
            std::cerr << line << std::endl;
        else
            std::cout << line << std::endl;
    }

    if (m_logCfg.filePath) {
        if (!m_logFile.is_open())
            m_logFile.open(m_logPath, std::ios::out | std::ios::app);
        m_logFile << line << std::endl;
        m_logFile.flush();
        rotateLogIfNeeded();
    }
}

bool DiagnosticManager::shouldLog(Severity sev) const
{
    return static_cast<int>(sev) >= static_cast<int>(m_logCfg.minimumSeverity);
}

std::string DiagnosticManager::severityToString(Severity sev)
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

std::optional<Severity> DiagnosticManager::severityFromString(const std::string& name)
{
    std::string upper = name;
    for (auto& c : upper)
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    if (upper == "DEBUG")
        return Severity::DEBUG;
    if (upper == "INFO")
        return Severity::INFO;
    if (upper == "WARN" || upper == "WARNING")
        return Severity::WARN;
    if (upper == "ERROR")
        return Severity::ERROR;
    if (upper == "FATAL")
        return Severity::FATAL;
    return std::nullopt;
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
