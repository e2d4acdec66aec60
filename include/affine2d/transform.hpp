#ifndef AFFINE2D_TRANSFORM_HPP
#define AFFINE2D_TRANSFORM_HPP

#include <affine2d/export.hpp>
#include "errors.hpp"
#include "point.hpp"
#include "precision.hpp"

#include <array>
#include <cmath>
#include <iosfwd>
#include <iterator>
#include <string>
#include <type_traits>

/*
 * Affine 2D transforms.
 *
 * A transform C is defined by 6 real coefficients Cxx, Cxy, Cx, Cyx, Cyy and
 * Cy, and maps (x,y) to (xp,yp) with:
 *
 *     xp = Cxx*x + Cxy*y + Cx
 *     yp = Cyx*x + Cyy*y + Cy
 *
 * Transforms are immutable values; every operation yields a new transform.
 * Operations named *_output adjust what the transform produces, those named
 * *_input adjust its argument before it is applied.
 */

namespace affine2d
{

namespace detail
{

template <typename U>
using enable_if_real_t = std::enable_if_t<std::is_arithmetic_v<U>>;

} /* namespace detail */

template <typename T = default_precision_t>
class transform
{
    static_assert(
        is_precision_v<T>, "transform coefficients must be floating-point");

    public:
    using value_type = T;

    constexpr transform() noexcept:
        m_coefficients{T(1), T(0), T(0), T(0), T(1), T(0)}
    {}

    constexpr transform(T xx, T xy, T x, T yx, T yy, T y) noexcept:
        m_coefficients{xx, xy, x, yx, yy, y}
    {}

    template <typename U>
    explicit constexpr transform(transform<U> const & other) noexcept:
        m_coefficients{
            static_cast<T>(other.xx()),
            static_cast<T>(other.xy()),
            static_cast<T>(other.x()),
            static_cast<T>(other.yx()),
            static_cast<T>(other.yy()),
            static_cast<T>(other.y())}
    {}

    [[nodiscard]] constexpr T xx() const noexcept { return m_coefficients[0]; }
    [[nodiscard]] constexpr T xy() const noexcept { return m_coefficients[1]; }
    [[nodiscard]] constexpr T x() const noexcept { return m_coefficients[2]; }
    [[nodiscard]] constexpr T yx() const noexcept { return m_coefficients[3]; }
    [[nodiscard]] constexpr T yy() const noexcept { return m_coefficients[4]; }
    [[nodiscard]] constexpr T y() const noexcept { return m_coefficients[5]; }

    [[nodiscard]] constexpr std::array<T, 6> const & coefficients() const
    noexcept
    {
        return m_coefficients;
    }

    [[nodiscard]] constexpr point<T> apply(T const px, T const py) const
    noexcept
    {
        auto const qx = xx()*px + xy()*py + x();
        auto const qy = yx()*px + yy()*py + y();

        return {qx, qy};
    }

    template <
        typename U, typename V,
        typename = detail::enable_if_real_t<U>,
        typename = detail::enable_if_real_t<V>>
    [[nodiscard]] constexpr point<T> operator()(U const px, V const py) const
    noexcept
    {
        return apply(static_cast<T>(px), static_cast<T>(py));
    }

    template <typename U>
    [[nodiscard]] constexpr point<T> operator()(point<U> const & p) const
    noexcept
    {
        return apply(static_cast<T>(p.x), static_cast<T>(p.y));
    }

    private:
    std::array<T, 6> m_coefficients;
}; /* class transform */

template <typename T>
[[nodiscard]] bool operator==(
    transform<T> const & a, transform<T> const & b) noexcept
{
    return a.coefficients() == b.coefficients();
}

template <typename T>
[[nodiscard]] bool operator!=(
    transform<T> const & a, transform<T> const & b) noexcept
{
    return !(a == b);
}

/* Construction and conversion */

template <typename T = default_precision_t>
[[nodiscard]] constexpr transform<T> identity() noexcept
{
    return {};
}

// Converting to the precision the transform already has yields it unchanged.
template <typename T, typename U>
[[nodiscard]] constexpr transform<T> convert(transform<U> const & a) noexcept
{
    if constexpr(std::is_same_v<T, U>)
    {
        return a;
    }
    else
    {
        return transform<T>{a};
    }
}

template <typename T>
[[nodiscard]] constexpr precision precision_of(transform<T> const &) noexcept
{
    return precision_of_v<T>;
}

/* Application */

template <
    typename T, typename U, typename V,
    typename = detail::enable_if_real_t<U>,
    typename = detail::enable_if_real_t<V>>
[[nodiscard]] constexpr point<T> apply(
    transform<T> const & a, U const px, V const py) noexcept
{
    return a(px, py);
}

template <typename T, typename U>
[[nodiscard]] constexpr point<T> apply(
    transform<T> const & a, point<U> const & p) noexcept
{
    return a(p);
}

/* Translation */

template <
    typename T, typename U, typename V,
    typename = detail::enable_if_real_t<U>,
    typename = detail::enable_if_real_t<V>>
[[nodiscard]] constexpr transform<T> translate_output(
    U const dx, V const dy, transform<T> const & a) noexcept
{
    return {a.xx(), a.xy(), a.x() + static_cast<T>(dx),
            a.yx(), a.yy(), a.y() + static_cast<T>(dy)};
}

template <typename T, typename U>
[[nodiscard]] constexpr transform<T> translate_output(
    point<U> const & d, transform<T> const & a) noexcept
{
    return translate_output(d.x, d.y, a);
}

template <
    typename T, typename U, typename V,
    typename = detail::enable_if_real_t<U>,
    typename = detail::enable_if_real_t<V>>
[[nodiscard]] constexpr transform<T> translate_input(
    transform<T> const & a, U const dx, V const dy) noexcept
{
    auto const tx = static_cast<T>(dx);
    auto const ty = static_cast<T>(dy);

    return {a.xx(), a.xy(), a.xx()*tx + a.xy()*ty + a.x(),
            a.yx(), a.yy(), a.yx()*tx + a.yy()*ty + a.y()};
}

template <typename T, typename U>
[[nodiscard]] constexpr transform<T> translate_input(
    transform<T> const & a, point<U> const & d) noexcept
{
    return translate_input(a, d.x, d.y);
}

/* Scaling */

template <typename T, typename U, typename = detail::enable_if_real_t<U>>
[[nodiscard]] constexpr transform<T> scale_output(
    U const rho, transform<T> const & a) noexcept
{
    auto const r = static_cast<T>(rho);

    return {r*a.xx(), r*a.xy(), r*a.x(),
            r*a.yx(), r*a.yy(), r*a.y()};
}

template <typename T, typename U, typename = detail::enable_if_real_t<U>>
[[nodiscard]] constexpr transform<T> scale_input(
    transform<T> const & a, U const rho) noexcept
{
    auto const r = static_cast<T>(rho);

    return {r*a.xx(), r*a.xy(), a.x(),
            r*a.yx(), r*a.yy(), a.y()};
}

/* Rotation, angles in radians counterclockwise about (0,0) */

template <typename T, typename U, typename = detail::enable_if_real_t<U>>
[[nodiscard]] transform<T> rotate_output(
    U const theta, transform<T> const & a)
{
    auto const cs = std::cos(static_cast<T>(theta));
    auto const sn = std::sin(static_cast<T>(theta));

    return {cs*a.xx() - sn*a.yx(),
            cs*a.xy() - sn*a.yy(),
            cs*a.x()  - sn*a.y(),
            cs*a.yx() + sn*a.xx(),
            cs*a.yy() + sn*a.xy(),
            cs*a.y()  + sn*a.x()};
}

template <typename T, typename U, typename = detail::enable_if_real_t<U>>
[[nodiscard]] transform<T> rotate_input(
    transform<T> const & a, U const theta)
{
    auto const cs = std::cos(static_cast<T>(theta));
    auto const sn = std::sin(static_cast<T>(theta));

    return {a.xx()*cs + a.xy()*sn,
            a.xy()*cs - a.xx()*sn,
            a.x(),
            a.yx()*cs + a.yy()*sn,
            a.yy()*cs - a.yx()*sn,
            a.y()};
}

/* Determinant, Jacobian and inverse */

// Determinant of the linear part, the translation is ignored.
template <typename T>
[[nodiscard]] constexpr T determinant(transform<T> const & a) noexcept
{
    return a.xx()*a.yy() - a.xy()*a.yx();
}

template <typename T>
[[nodiscard]] T jacobian(transform<T> const & a) noexcept
{
    return std::abs(determinant(a));
}

template <typename T>
[[nodiscard]] transform<T> invert(transform<T> const & a)
{
    auto const d = determinant(a);
    if(d == T(0))
        throw singular_transform{};

    auto const txx =  a.yy()/d;
    auto const txy = -a.xy()/d;
    auto const tyx = -a.yx()/d;
    auto const tyy =  a.xx()/d;

    return {txx, txy, -txx*a.x() - txy*a.y(),
            tyx, tyy, -tyx*a.x() - tyy*a.y()};
}

// Yields the point which the transform maps to (0,0).
template <typename T>
[[nodiscard]] point<T> intercept(transform<T> const & a)
{
    auto const d = determinant(a);
    if(d == T(0))
        throw singular_transform{};

    return {(a.xy()*a.y() - a.yy()*a.x())/d,
            (a.yx()*a.x() - a.xx()*a.y())/d};
}

/* Composition, compose(a, b) applies b then a */

// There is nothing to compose, always throws missing_operand.
AFFINE2D_EXPORT transform<> compose();

template <typename T>
[[nodiscard]] constexpr transform<T> compose(transform<T> const & a) noexcept
{
    return a;
}

template <typename Ta, typename Tb>
[[nodiscard]] constexpr transform<promoted_t<Ta, Tb>> compose(
    transform<Ta> const & ta, transform<Tb> const & tb) noexcept
{
    using T = promoted_t<Ta, Tb>;
    auto const a = convert<T>(ta);
    auto const b = convert<T>(tb);

    return {a.xx()*b.xx() + a.xy()*b.yx(),
            a.xx()*b.xy() + a.xy()*b.yy(),
            a.xx()*b.x()  + a.xy()*b.y() + a.x(),
            a.yx()*b.xx() + a.yy()*b.yx(),
            a.yx()*b.xy() + a.yy()*b.yy(),
            a.yx()*b.x()  + a.yy()*b.y() + a.y()};
}

template <typename Ta, typename Tb, typename Tc, typename... Rest>
[[nodiscard]] constexpr auto compose(
    transform<Ta> const & a,
    transform<Tb> const & b,
    transform<Tc> const & c,
    transform<Rest> const &... rest) noexcept
{
    return compose(compose(a, b), c, rest...);
}

// Composes [first, last) so that *first is applied last.
template <typename InputIt>
[[nodiscard]] auto compose_range(InputIt first, InputIt last)
{
    using value_type = typename std::iterator_traits<InputIt>::value_type;
    using T = typename value_type::value_type;

    if(first == last)
        throw missing_operand{};

    auto result = transform<T>{*first};
    for(++first; first != last; ++first)
    {
        result = compose(result, *first);
    }

    return result;
}

/* Division */

// right_divide(a, b) is compose(a, invert(b)), solving x∘b = a for x.
template <typename Ta, typename Tb>
[[nodiscard]] transform<promoted_t<Ta, Tb>> right_divide(
    transform<Ta> const & ta, transform<Tb> const & tb)
{
    using T = promoted_t<Ta, Tb>;
    auto const a = convert<T>(ta);
    auto const b = convert<T>(tb);

    auto const d = determinant(b);
    if(d == T(0))
        throw singular_transform{"right operand is not invertible"};

    auto const rxx = (a.xx()*b.yy() - a.xy()*b.yx())/d;
    auto const rxy = (a.xy()*b.xx() - a.xx()*b.xy())/d;
    auto const ryx = (a.yx()*b.yy() - a.yy()*b.yx())/d;
    auto const ryy = (a.yy()*b.xx() - a.yx()*b.xy())/d;

    return {rxx, rxy, a.x() - (rxx*b.x() + rxy*b.y()),
            ryx, ryy, a.y() - (ryx*b.x() + ryy*b.y())};
}

// left_divide(a, b) is compose(invert(a), b), solving a∘x = b for x.
template <typename Ta, typename Tb>
[[nodiscard]] transform<promoted_t<Ta, Tb>> left_divide(
    transform<Ta> const & ta, transform<Tb> const & tb)
{
    using T = promoted_t<Ta, Tb>;
    auto const a = convert<T>(ta);
    auto const b = convert<T>(tb);

    auto const d = determinant(a);
    if(d == T(0))
        throw singular_transform{"left operand is not invertible"};

    auto const txx =  a.yy()/d;
    auto const txy = -a.xy()/d;
    auto const tyx = -a.yx()/d;
    auto const tyy =  a.xx()/d;
    auto const tx = b.x() - a.x();
    auto const ty = b.y() - a.y();

    return {txx*b.xx() + txy*b.yx(),
            txx*b.xy() + txy*b.yy(),
            txx*tx     + txy*ty,
            tyx*b.xx() + tyy*b.yx(),
            tyx*b.xy() + tyy*b.yy(),
            tyx*tx     + tyy*ty};
}

/* Operators */

template <typename Ta, typename Tb>
[[nodiscard]] constexpr auto operator*(
    transform<Ta> const & a, transform<Tb> const & b) noexcept
{
    return compose(a, b);
}

template <typename T, typename U>
[[nodiscard]] constexpr point<T> operator*(
    transform<T> const & a, point<U> const & p) noexcept
{
    return a(p);
}

template <typename T, typename U, typename = detail::enable_if_real_t<U>>
[[nodiscard]] constexpr transform<T> operator*(
    U const rho, transform<T> const & a) noexcept
{
    return scale_output(rho, a);
}

template <typename T, typename U, typename = detail::enable_if_real_t<U>>
[[nodiscard]] constexpr transform<T> operator*(
    transform<T> const & a, U const rho) noexcept
{
    return scale_input(a, rho);
}

template <typename T, typename U>
[[nodiscard]] constexpr transform<T> operator+(
    point<U> const & d, transform<T> const & a) noexcept
{
    return translate_output(d, a);
}

template <typename T, typename U>
[[nodiscard]] constexpr transform<T> operator+(
    transform<T> const & a, point<U> const & d) noexcept
{
    return translate_input(a, d);
}

template <typename Ta, typename Tb>
[[nodiscard]] auto operator/(transform<Ta> const & a, transform<Tb> const & b)
{
    return right_divide(a, b);
}

/* Textual representation, for diagnostics only */

[[nodiscard]] AFFINE2D_EXPORT std::string to_string(
    transform<float> const & a);
[[nodiscard]] AFFINE2D_EXPORT std::string to_string(
    transform<double> const & a);
[[nodiscard]] AFFINE2D_EXPORT std::string to_string(
    transform<long double> const & a);

AFFINE2D_EXPORT std::ostream & operator<<(
    std::ostream & os, transform<float> const & a);
AFFINE2D_EXPORT std::ostream & operator<<(
    std::ostream & os, transform<double> const & a);
AFFINE2D_EXPORT std::ostream & operator<<(
    std::ostream & os, transform<long double> const & a);

} /* namespace affine2d */

#endif /* AFFINE2D_TRANSFORM_HPP */
