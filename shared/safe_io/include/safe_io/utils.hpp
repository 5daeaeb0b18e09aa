#pragma once

#include <fmt/format.h>
#include <fmt/ostream.h>

#include <cstdio>
#include <string>
#include <string_view>
#include <utility>

namespace safe_io {
    enum class Verbosity {
        Quiet,
        Normal,
        Verbose,
    };

    namespace detail {
        void configure_console() noexcept;

        template <class... Args>
        inline void emit(std::FILE* stream, std::string_view prefix, fmt::format_string<Args...> fmt_str, Args&&... args) {
            configure_console();
            if (!prefix.empty()) {
                fmt::print(stream, "{}", prefix);
            }
            fmt::print(stream, fmt_str, std::forward<Args>(args)...);
            fmt::print(stream, "\n");
            std::fflush(stream);
        }
    }

    // Process-wide threshold consulted by info/warn/debug. print/eprint ignore it.
    void set_verbosity(Verbosity level) noexcept;
    [[nodiscard]] Verbosity verbosity() noexcept;

    [[nodiscard]] inline bool enabled(Verbosity level) noexcept {
        return static_cast<int>(level) <= static_cast<int>(verbosity());
    }

    // Format to string
    template <class... Args>
    [[nodiscard]] inline std::string sformat(fmt::format_string<Args...> fmt_str, Args&&... args) {
        return fmt::format(fmt_str, std::forward<Args>(args)...);
    }

    // Print to stdout
    template <class... Args>
    inline void print(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::emit(stdout, {}, fmt_str, std::forward<Args>(args)...);
    }

    // Print to stderr
    template <class... Args>
    inline void eprint(fmt::format_string<Args...> fmt_str, Args&&... args) {
        detail::emit(stderr, {}, fmt_str, std::forward<Args>(args)...);
    }

    template <class... Args>
    inline void info(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(Verbosity::Normal)) {
            detail::emit(stdout, {}, fmt_str, std::forward<Args>(args)...);
        }
    }

    template <class... Args>
    inline void warn(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(Verbosity::Normal)) {
            detail::emit(stderr, "warning: ", fmt_str, std::forward<Args>(args)...);
        }
    }

    template <class... Args>
    inline void debug(fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (enabled(Verbosity::Verbose)) {
            detail::emit(stdout, "[debug] ", fmt_str, std::forward<Args>(args)...);
        }
    }

} // namespace safe_io
