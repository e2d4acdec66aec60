#include <affine2d/assert.hpp>
#include <affine2d/transform.hpp>

#include <fmt/format.h>

#include <ostream>

namespace affine2d
{

namespace
{

template <typename T>
std::string format_transform(transform<T> const & a)
{
    return fmt::format(
        "transform<{}>({}, {}, {},  {}, {}, {})",
        precision_name(precision_of(a)),
        a.xx(), a.xy(), a.x(),
        a.yx(), a.yy(), a.y());
}

} /* namespace */

std::string_view precision_name(precision p)
{
    switch(p)
    {
        case precision::float32:
            return "float32";
        case precision::float64:
            return "float64";
        case precision::float80:
            return "float80";
        case precision::float128:
            return "float128";
    }

    // Unknown enumerator
    AFFINE2D_ASSERT(false);
    return "unknown";
}

std::string to_string(transform<float> const & a)
{
    return format_transform(a);
}

std::string to_string(transform<double> const & a)
{
    return format_transform(a);
}

std::string to_string(transform<long double> const & a)
{
    return format_transform(a);
}

std::ostream & operator<<(std::ostream & os, transform<float> const & a)
{
    return os << to_string(a);
}

std::ostream & operator<<(std::ostream & os, transform<double> const & a)
{
    return os << to_string(a);
}

std::ostream & operator<<(std::ostream & os, transform<long double> const & a)
{
    return os << to_string(a);
}

} /* namespace affine2d */
