#include "pngsaver.hpp"

#include <affine2d/assert.hpp>
#include <affine2d/format.hpp>
#include <affine2d/transform.hpp>

#include <fmt/format.h>
#include <fmt/color.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

constexpr auto pi = 3.14159265358979323846;

void usage(char const * program_name)
{
    std::cerr <<
        fmt::format("Usage: {} ", program_name) <<
        fmt::format(fmt::emphasis::underline, "png-file") <<
        " " <<
        fmt::format(fmt::emphasis::underline, "size") <<
        " " <<
        fmt::format(fmt::emphasis::underline, "angle-degrees") <<
        " " <<
        fmt::format(fmt::emphasis::underline, "scale") <<
        "\n";
}

class grey_image
{
    public:
    grey_image(std::size_t width, std::size_t height):
        m_pixels(width * height, std::uint8_t{0}),
        m_width{width},
        m_height{height}
    {}

    [[nodiscard]] std::size_t width() const { return m_width; }
    [[nodiscard]] std::size_t height() const { return m_height; }
    [[nodiscard]] std::uint8_t const * data() const { return m_pixels.data(); }

    [[nodiscard]] std::uint8_t at(std::size_t x, std::size_t y) const
    {
        AFFINE2D_ASSERT(x < m_width && y < m_height);
        return m_pixels[y * m_width + x];
    }

    void set(std::size_t x, std::size_t y, std::uint8_t v)
    {
        AFFINE2D_ASSERT(x < m_width && y < m_height);
        m_pixels[y * m_width + x] = v;
    }

    private:
    std::vector<std::uint8_t> m_pixels;
    std::size_t m_width;
    std::size_t m_height;
};

grey_image checkerboard(std::size_t size, std::size_t cell)
{
    auto result = grey_image{size, size};

    for(auto y = std::size_t{0}; y < size; ++y)
    {
        for(auto x = std::size_t{0}; x < size; ++x)
        {
            auto const odd = ((x / cell) + (y / cell)) % 2 != 0;
            result.set(x, y, odd ? std::uint8_t{200} : std::uint8_t{55});
        }
    }

    return result;
}

// Fills every output pixel with the source pixel the inverse of `t` maps its
// centre to.
grey_image resample(grey_image const & src, affine2d::transform<> const & t)
{
    auto const back = affine2d::invert(t);
    auto result = grey_image{src.width(), src.height()};

    for(auto v = std::size_t{0}; v < result.height(); ++v)
    {
        for(auto u = std::size_t{0}; u < result.width(); ++u)
        {
            auto const [sx, sy] = back(u + 0.5, v + 0.5);
            if(!std::isfinite(sx) || !std::isfinite(sy))
                continue;

            auto const ix = std::floor(sx);
            auto const iy = std::floor(sy);

            if(ix < 0.0 || iy < 0.0 ||
               ix >= static_cast<double>(src.width()) ||
               iy >= static_cast<double>(src.height()))
                continue;

            result.set(u, v, src.at(
                static_cast<std::size_t>(ix), static_cast<std::size_t>(iy)));
        }
    }

    return result;
}

} /* namespace */

int main(int argc, char const * argv[])
{
    if(argc < 5)
    {
        std::cerr << fmt::format("{}: too few arguments\n", argv[0]);
        usage(argv[0]);
        return -1;
    }

    auto size = std::size_t{0};
    auto angle = 0.0;
    auto scale = 0.0;

    try
    {
        size = std::stoul(argv[2]);
        angle = std::stod(argv[3]) * pi / 180.0;
        scale = std::stod(argv[4]);
    }
    catch(std::logic_error const & e)
    {
        std::cerr << fmt::format("{}: invalid argument ({})\n", argv[0], e.what());
        usage(argv[0]);
        return -1;
    }

    if(size == 0)
    {
        std::cerr << fmt::format("{}: size must be positive\n", argv[0]);
        return -1;
    }

    if(!std::isfinite(scale) || scale <= 0.0 || !std::isfinite(angle))
    {
        std::cerr << fmt::format(
            "{}: scale must be a positive finite number and angle finite\n",
            argv[0]);
        return -1;
    }

    auto const c = static_cast<double>(size) / 2.0;

    // Move the centre to the origin, scale, rotate and move it back.
    auto const t = affine2d::translate_output(c, c,
        affine2d::rotate_output(angle,
            affine2d::scale_output(scale,
                affine2d::translate_input(affine2d::identity(), -c, -c))));

    fmt::print("{}\n", t);

    auto const src = checkerboard(size, std::max(size / 8, std::size_t{1}));

    try
    {
        auto const dst = resample(src, t);

        if(!save_png(argv[1], dst.data(), dst.width(), dst.height()))
            return -1;
    }
    catch(affine2d::singular_transform const & e)
    {
        std::cerr << fmt::format("{}: {}\n", argv[0], e.what());
        return -1;
    }

    fmt::print("Image {}x{} written to {}\n", size, size, argv[1]);
}
