#pragma once

#include <fmt/format.h>
#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace safe_io {
    namespace detail {
        void configure_console() noexcept;
    }

    enum class Level {
        Debug,
        Info,
        Warn,
        Error,
    };

    [[nodiscard]] std::string_view to_string(Level level) noexcept;

    // Messages below the threshold are dropped. Defaults to Info.
    void set_level(Level level) noexcept;
    [[nodiscard]] Level level() noexcept;
    [[nodiscard]] bool enabled(Level level) noexcept;

    // Format to string
    template <class... Args>
    [[nodiscard]] inline std::string sformat(fmt::format_string<Args...> fmt_str, Args&&... args) {
        return fmt::format(fmt_str, std::forward<Args>(args)...);
    }

    // Print to stdout
    template <class... Args>
    inline void print(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::configure_console();
        fmt::print(stdout, fmt_str, std::forward<Args>(args)...);
        fmt::print(stdout, "\n");
        std::fflush(stdout);
    }

    // Print to stderr
    template <class... Args>
    inline void eprint(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::configure_console();
        fmt::print(stderr, fmt_str, std::forward<Args>(args)...);
        fmt::print(stderr, "\n");
        std::fflush(stderr);
    }

    // "[level] message", warnings and errors on stderr
    template <class... Args>
    inline void log(Level lvl, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }
        const auto message = fmt::format(fmt_str, std::forward<Args>(args)...);
        if (lvl >= Level::Warn) {
            eprint("[{}] {}", to_string(lvl), message);
        } else {
            print("[{}] {}", to_string(lvl), message);
        }
    }

    template <class... Args>
    inline void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Debug, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Info, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void warn(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Warn, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void error(fmt::format_string<Args...> fmt_str, Args&&... args) {
        log(Level::Error, fmt_str, std::forward<Args>(args)...);
    }

} // namespace safe_io
