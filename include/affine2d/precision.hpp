#ifndef AFFINE2D_PRECISION_HPP
#define AFFINE2D_PRECISION_HPP

#include <affine2d/export.hpp>

#include <limits>
#include <string_view>
#include <type_traits>

#ifndef AFFINE2D_DEFAULT_PRECISION
#define AFFINE2D_DEFAULT_PRECISION double
#endif

namespace affine2d
{

using default_precision_t = AFFINE2D_DEFAULT_PRECISION;

enum class precision
{
    float32,
    float64,
    float80,
    float128
};

template <typename T>
inline constexpr bool is_precision_v = std::is_floating_point_v<T>;

namespace detail
{

template <int Digits> struct precision_from_digits;

template <> struct precision_from_digits<24>
{
    static constexpr auto value = precision::float32;
};

template <> struct precision_from_digits<53>
{
    static constexpr auto value = precision::float64;
};

template <> struct precision_from_digits<64>
{
    static constexpr auto value = precision::float80;
};

template <> struct precision_from_digits<113>
{
    static constexpr auto value = precision::float128;
};

} /* namespace detail */

template <typename T>
inline constexpr precision precision_of_v =
    detail::precision_from_digits<std::numeric_limits<T>::digits>::value;

/*
 * Promotion rule table. Combining two precisions yields the wider one.
 * Pairs that are not listed here have no `type` member.
 */
template <typename T1, typename T2> struct promotion {};

template <> struct promotion<float, float> { using type = float; };
template <> struct promotion<float, double> { using type = double; };
template <> struct promotion<float, long double> { using type = long double; };

template <> struct promotion<double, float> { using type = double; };
template <> struct promotion<double, double> { using type = double; };
template <> struct promotion<double, long double> { using type = long double; };

template <> struct promotion<long double, float> { using type = long double; };
template <> struct promotion<long double, double> { using type = long double; };
template <> struct promotion<long double, long double>
{
    using type = long double;
};

template <typename T1, typename T2>
using promoted_t = typename promotion<T1, T2>::type;

[[nodiscard]] AFFINE2D_EXPORT std::string_view precision_name(precision p);

} /* namespace affine2d */

#endif /* AFFINE2D_PRECISION_HPP */
