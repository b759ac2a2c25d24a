#include "safe_io/utils.hpp"

#include <atomic>
#include <cstdio>

#ifdef _WIN32
#    include <Windows.h>
#    include <io.h>
#endif

namespace safe_io
{
    namespace
    {
        std::atomic<Level> g_level{Level::Info};
    } // namespace

    namespace detail
    {
        void configure_console() noexcept
        {
#ifdef _WIN32
            static const bool configured = [] {
                if (!_isatty(_fileno(stdout)))
                {
                    return true;
                }

                ::SetConsoleOutputCP(CP_UTF8);

                const HANDLE handle = ::GetStdHandle(STD_OUTPUT_HANDLE);
                if (handle != INVALID_HANDLE_VALUE)
                {
                    DWORD mode = 0;
                    if (::GetConsoleMode(handle, &mode))
                    {
                        ::SetConsoleMode(handle, mode | ENABLE_PROCESSED_OUTPUT | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
                    }
                }
                return true;
            }();
            (void)configured;
#endif
        }
    } // namespace detail

    std::string_view to_string(Level level) noexcept
    {
        switch (level)
        {
        case Level::Debug:
            return "debug";
        case Level::Info:
            return "info";
        case Level::Warn:
            return "warn";
        case Level::Error:
            return "error";
        }
        return "unknown";
    }

    void set_level(Level level) noexcept
    {
        g_level.store(level, std::memory_order_relaxed);
    }

    Level level() noexcept
    {
        return g_level.load(std::memory_order_relaxed);
    }

    bool enabled(Level level) noexcept
    {
        return level >= safe_io::level();
    }
} // namespace safe_io
