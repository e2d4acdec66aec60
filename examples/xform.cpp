#include <affine2d/format.hpp>
#include <affine2d/transform.hpp>

#include <fmt/format.h>
#include <fmt/color.h>

#include <array>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

void usage(char const * program_name)
{
    std::cerr << fmt::format("Usage: {}", program_name);

    for(auto const name: {"xx", "xy", "x", "yx", "yy", "y"})
    {
        std::cerr << " " << fmt::format(fmt::emphasis::underline, name);
    }

    std::cerr <<
        " [" <<
        fmt::format(fmt::emphasis::underline, "px") <<
        " " <<
        fmt::format(fmt::emphasis::underline, "py") <<
        "]...\n";
}

double double_from_string(char const * str)
{
    auto consumed = std::size_t{0};
    auto const value = std::stod(str, &consumed);

    if(str[consumed] != '\0')
        throw std::invalid_argument{fmt::format("'{}' is not a number", str)};

    return value;
}

} /* namespace */

int main(int argc, char const * argv[])
{
    if(argc < 7 || (argc - 7) % 2 != 0)
    {
        std::cerr << fmt::format("{}: wrong number of arguments\n", argv[0]);
        usage(argv[0]);
        return -1;
    }

    auto c = std::array<double, 6>{};
    auto points = std::vector<affine2d::point<>>{};

    try
    {
        for(auto i = 0u; i < c.size(); ++i)
        {
            c[i] = double_from_string(argv[i+1]);
        }

        for(auto i = 7; i < argc; i += 2)
        {
            points.push_back(
                {double_from_string(argv[i]), double_from_string(argv[i+1])});
        }
    }
    catch(std::logic_error const & e)
    {
        std::cerr << fmt::format("{}: invalid argument ({})\n", argv[0], e.what());
        usage(argv[0]);
        return -1;
    }

    auto const t = affine2d::transform<>{c[0], c[1], c[2], c[3], c[4], c[5]};

    fmt::print("transform:   {}\n", t);
    fmt::print("determinant: {}\n", affine2d::determinant(t));
    fmt::print("jacobian:    {}\n", affine2d::jacobian(t));

    for(auto const & p: points)
    {
        fmt::print("{} -> {}\n", p, t(p));
    }

    try
    {
        fmt::print("inverse:     {}\n", affine2d::invert(t));
        fmt::print("intercept:   {}\n", affine2d::intercept(t));
    }
    catch(affine2d::singular_transform const & e)
    {
        std::cerr << fmt::format(fmt::fg(fmt::color::red), "{}: {}\n", argv[0], e.what());
        return 1;
    }
}
