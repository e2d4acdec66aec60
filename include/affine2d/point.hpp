#ifndef AFFINE2D_POINT_HPP
#define AFFINE2D_POINT_HPP

#include "precision.hpp"

namespace affine2d
{

template <typename T = default_precision_t>
struct point
{
    using value_type = T;

    T x;
    T y;
};

template <typename T>
[[nodiscard]] constexpr bool operator==(point<T> const & a, point<T> const & b)
{
    return a.x == b.x && a.y == b.y;
}

template <typename T>
[[nodiscard]] constexpr bool operator!=(point<T> const & a, point<T> const & b)
{
    return !(a == b);
}

} /* namespace affine2d */

#endif /* AFFINE2D_POINT_HPP */
