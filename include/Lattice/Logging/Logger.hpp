/// @file Logger.hpp
/// @brief Leveled logger injected into components through their option structs.
///
/// A `Logger` is an immutable value: a minimum level plus a sink function. Components hold a
/// `const Logger*` and log nothing when it is null, so the library keeps no global logging state.
///
/// ### Typical usage
/// @code
/// Lattice::Syntax::ParseOptions options;
/// options.logger = &Lattice::Logging::Logger::Stderr();
/// @endcode
#pragma once

#include <Lattice/Defines.hpp>
#include <Lattice/Primitives.hpp>

#include <format>
#include <string_view>
#include <utility>

namespace Lattice::Logging
{
    enum class LogLevel : UInt8
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Off,
    };

    [[nodiscard]] LATTICE_API std::string_view ToString(LogLevel level) noexcept;

    /// @brief Receives one formatted message. `userData` is the pointer given to the logger.
    using LogSink = void (*)(void* userData, LogLevel level, std::string_view message);

    /// @brief Writes `[Lattice][Level] message` lines to `std::cerr`.
    LATTICE_API void StderrSink(void* userData, LogLevel level, std::string_view message);

    class LATTICE_API Logger
    {
    public:
        constexpr Logger() noexcept = default;

        constexpr Logger(LogLevel minimum, LogSink sink, void* userData = nullptr) noexcept
            : m_minimum(minimum)
            , m_sink(sink)
            , m_userData(userData)
        {
        }

        /// @brief Process-wide immutable logger writing `Info` and above to standard error.
        [[nodiscard]] static const Logger& Stderr() noexcept;

        [[nodiscard]] constexpr LogLevel MinimumLevel() const noexcept { return m_minimum; }

        [[nodiscard]] constexpr bool IsEnabled(LogLevel level) const noexcept
        {
            return m_sink != nullptr && level != LogLevel::Off && level >= m_minimum;
        }

        template<typename... Args>
        void Log(LogLevel level, std::format_string<Args...> format, Args&&... args) const
        {
            if (!IsEnabled(level))
                return;
            Write(level, std::format(format, std::forward<Args>(args)...));
        }

        template<typename... Args>
        void Debug(std::format_string<Args...> format, Args&&... args) const
        {
            Log(LogLevel::Debug, format, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void Info(std::format_string<Args...> format, Args&&... args) const
        {
            Log(LogLevel::Info, format, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void Warning(std::format_string<Args...> format, Args&&... args) const
        {
            Log(LogLevel::Warning, format, std::forward<Args>(args)...);
        }

        template<typename... Args>
        void Error(std::format_string<Args...> format, Args&&... args) const
        {
            Log(LogLevel::Error, format, std::forward<Args>(args)...);
        }

        /// @brief Sends an already formatted message to the sink if `level` is enabled.
        void Write(LogLevel level, std::string_view message) const;

    private:
        LogLevel m_minimum {LogLevel::Off};
        LogSink  m_sink {nullptr};
        void*    m_userData {nullptr};
    };

    /// @brief Logs through `logger` when it is non-null.
    template<typename... Args>
    void Log(const Logger* logger, LogLevel level, std::format_string<Args...> format, Args&&... args)
    {
        if (logger)
            logger->Log(level, format, std::forward<Args>(args)...);
    }
}// namespace Lattice::Logging
