#include "safe_io/utils.hpp"

#include <atomic>
#include <cstdio>

#ifdef _WIN32
#    include <Windows.h>
#    include <fcntl.h>
#    include <io.h>
#endif

namespace safe_io
{
    namespace
    {
        std::atomic<Verbosity> g_verbosity{Verbosity::Normal};
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
                ::SetConsoleCP(CP_UTF8);

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

    void set_verbosity(Verbosity level) noexcept
    {
        g_verbosity.store(level, std::memory_order_relaxed);
    }

    Verbosity verbosity() noexcept
    {
        return g_verbosity.load(std::memory_order_relaxed);
    }
} // namespace safe_io
