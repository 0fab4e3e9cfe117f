#pragma once

#include <stdexcept>
#include <string>

namespace tricurate
{
    /// Base of the geometric failures a triangulation can report
    class triangulation_exception : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    /// The triangulated point lies behind at least one contributing camera
    class cheirality_exception : public triangulation_exception
    {
    public:
        explicit cheirality_exception(const std::string& what = "point lies behind a contributing camera") :
            triangulation_exception(what)
        {
        }
    };

    /// The views do not constrain a finite point (rank deficient system or point at infinity)
    class underconstrained_exception : public triangulation_exception
    {
    public:
        explicit underconstrained_exception(const std::string& what = "triangulation is underconstrained") :
            triangulation_exception(what)
        {
        }
    };

    /// Unusable configuration detected at run time, e.g. a non-positive total sampling weight
    class configuration_error : public std::invalid_argument
    {
    public:
        using std::invalid_argument::invalid_argument;
    };
}
