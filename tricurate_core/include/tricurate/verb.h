#pragma once

namespace tricurate
{
    /// What the application was asked to do
    enum class verb
    {
        RUN,
        HELP,
        VERSION
    };
}
