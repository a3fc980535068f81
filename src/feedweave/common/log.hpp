/**
 * @file log.hpp
 * @brief Leveled, component-tagged logging with pluggable sinks.
 */
#pragma once
#include "feedweave/common/common.hpp"
#include <mutex>
#include <ostream>

namespace feedweave
{

enum class LogLevel
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

const char* to_string(LogLevel level) noexcept;

/**
 * @brief Destination for log records.
 *
 * @par Thread Safety
 * - write() may be called from worker threads (bounded-time collection),
 *   so implementations must synchronize internally.
 */
class ILogSink
{
public:
    virtual ~ILogSink() = default;

    /**
     * @brief Check whether records at this level would be written.
     */
    virtual bool enabled(LogLevel level) const noexcept = 0;

    /**
     * @brief Write one record.
     * @param level Severity of the record.
     * @param component Short tag of the emitting component (e.g. "engine").
     * @param message The record text, without trailing newline.
     */
    virtual void write(LogLevel level, const std::string& component, const std::string& message) = 0;
};

using LogSinkPtr = std::shared_ptr<ILogSink>;

/**
 * @brief Sink writing one line per record to a std::ostream.
 *
 * @details
 * Line format: `[feedweave] [warning] [engine] message`.
 * Records below the minimum level are dropped.
 */
class StreamLogSink : public ILogSink
{
public:
    StreamLogSink(std::ostream& out, LogLevel min_level);

    bool enabled(LogLevel level) const noexcept override;
    void write(LogLevel level, const std::string& component, const std::string& message) override;

    LogLevel min_level() const noexcept
    {
        return m_min_level;
    }

private:
    std::ostream& m_out;
    LogLevel m_min_level;
    std::mutex m_mutex;
};

/**
 * @brief Sink that discards everything.
 */
class NullLogSink : public ILogSink
{
public:
    bool enabled(LogLevel) const noexcept override { return false; }
    void write(LogLevel, const std::string&, const std::string&) override {}
};

/**
 * @brief Default sink: std::clog at Warning and above.
 */
LogSinkPtr make_default_log_sink();

/**
 * @brief Component-tagged logging facade over a sink.
 *
 * @details
 * Logger is cheap to copy. A Logger constructed with a null sink writes
 * nothing.
 */
class Logger
{
public:
    Logger() = default;
    Logger(LogSinkPtr sink, std::string component);

    void log(LogLevel level, const std::string& message) const;

    void debug(const std::string& message) const { log(LogLevel::Debug, message); }
    void info(const std::string& message) const { log(LogLevel::Info, message); }
    void warning(const std::string& message) const { log(LogLevel::Warning, message); }
    void error(const std::string& message) const { log(LogLevel::Error, message); }

    bool enabled(LogLevel level) const noexcept;

    /**
     * @brief Get a logger sharing this sink under another component tag.
     */
    Logger child(std::string component) const
    {
        return Logger{m_sink, std::move(component)};
    }

    const std::string& component() const noexcept
    {
        return m_component;
    }

private:
    LogSinkPtr m_sink{};
    std::string m_component{};
};

} // namespace feedweave
