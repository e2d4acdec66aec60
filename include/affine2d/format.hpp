#ifndef AFFINE2D_FORMAT_HPP
#define AFFINE2D_FORMAT_HPP

#include "point.hpp"
#include "precision.hpp"
#include "transform.hpp"

#include <fmt/format.h>

/*
 * {fmt} support, e.g.
 *
 *     fmt::print("{} maps (0,0) to {}\n", t, t(0.0, 0.0));
 *
 * Points accept the format specification of their coordinates.
 */

template <>
struct fmt::formatter<affine2d::precision>: fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(affine2d::precision const p, FormatContext & ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            affine2d::precision_name(p), ctx);
    }
};

template <typename T>
struct fmt::formatter<affine2d::transform<T>>: fmt::formatter<std::string_view>
{
    template <typename FormatContext>
    auto format(affine2d::transform<T> const & t, FormatContext & ctx) const
    {
        return fmt::formatter<std::string_view>::format(
            affine2d::to_string(t), ctx);
    }
};

template <typename T>
struct fmt::formatter<affine2d::point<T>>: fmt::formatter<T>
{
    template <typename FormatContext>
    auto format(affine2d::point<T> const & p, FormatContext & ctx) const
    {
        auto out = ctx.out();
        *out++ = '(';
        ctx.advance_to(out);
        out = fmt::formatter<T>::format(p.x, ctx);
        *out++ = ',';
        *out++ = ' ';
        ctx.advance_to(out);
        out = fmt::formatter<T>::format(p.y, ctx);
        *out++ = ')';
        return out;
    }
};

#endif /* AFFINE2D_FORMAT_HPP */
