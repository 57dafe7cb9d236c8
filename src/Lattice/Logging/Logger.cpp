#include <Lattice/Logging/Logger.hpp>

#include <iostream>

namespace Lattice::Logging
{
    std::string_view ToString(LogLevel level) noexcept
    {
        switch (level)
        {
            case LogLevel::Trace:
                return "Trace";
            case LogLevel::Debug:
                return "Debug";
            case LogLevel::Info:
                return "Info";
            case LogLevel::Warning:
                return "Warning";
            case LogLevel::Error:
                return "Error";
            case LogLevel::Off:
                return "Off";
        }
        return "Unknown";
    }

    void StderrSink(void*, LogLevel level, std::string_view message)
    {
        std::cerr << "[Lattice][" << ToString(level) << "] " << message << '\n';
    }

    const Logger& Logger::Stderr() noexcept
    {
        static const Logger logger {LogLevel::Info, &StderrSink};
        return logger;
    }

    void Logger::Write(LogLevel level, std::string_view message) const
    {
        if (!IsEnabled(level))
            return;
        m_sink(m_userData, level, message);
    }
}// namespace Lattice::Logging
