#pragma once

#include <chrono>

namespace tricurate
{
    /// Writes the lifetime of this object into the referenced duration on destruction
    class time_this
    {
    public:
        time_this()                            = delete;
        time_this(const time_this&)            = delete;
        time_this(time_this&&)                 = delete;
        time_this& operator=(const time_this&) = delete;
        time_this& operator=(time_this&&)      = delete;

        explicit time_this(std::chrono::steady_clock::duration& time) :
            _time { time }
        {
        }

        ~time_this()
        {
            _time = std::chrono::steady_clock::now() - _start;
        }

    private:
        std::chrono::time_point<std::chrono::steady_clock> _start = std::chrono::steady_clock::now();
        std::chrono::steady_clock::duration&               _time;
    };
}
