#pragma once

#include <spdlog/spdlog.h>

#include "tricurate/formatters.h"
#include "tricurate/option.h"

namespace tricurate
{
    class option_printer
    {
    public:
        template <class T>
        static void print(const option<T>& option)
        {
            SPDLOG_INFO("{}: {}", option.name(), option.value());
        }
    };
}
