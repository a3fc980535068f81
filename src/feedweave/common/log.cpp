#include "feedweave/common/log.hpp"

namespace feedweave
{

const char* to_string(LogLevel level) noexcept
{
    switch (level)
    {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warning: return "warning";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "unknown";
}

StreamLogSink::StreamLogSink(std::ostream& out, LogLevel min_level)
    : m_out{out}
    , m_min_level{min_level}
{}

bool StreamLogSink::enabled(LogLevel level) const noexcept
{
    return level != LogLevel::Off && level >= m_min_level;
}

void StreamLogSink::write(LogLevel level, const std::string& component, const std::string& message)
{
    if (!enabled(level))
    {
        return;
    }
    std::lock_guard<std::mutex> lock{m_mutex};
    m_out << "[feedweave] [" << to_string(level) << "] [" << component << "] "
          << message << "\n" << std::flush;
}

LogSinkPtr make_default_log_sink()
{
    return std::make_shared<StreamLogSink>(std::clog, LogLevel::Warning);
}

Logger::Logger(LogSinkPtr sink, std::string component)
    : m_sink{std::move(sink)}
    , m_component{std::move(component)}
{}

bool Logger::enabled(LogLevel level) const noexcept
{
    return m_sink && m_sink->enabled(level);
}

void Logger::log(LogLevel level, const std::string& message) const
{
    if (enabled(level))
    {
        m_sink->write(level, m_component, message);
    }
}

} // namespace feedweave
