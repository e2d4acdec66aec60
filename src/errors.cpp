#include <affine2d/errors.hpp>

namespace affine2d
{

error::error(std::string const & what):
    std::runtime_error{what}
{}

error::error(char const * what):
    std::runtime_error{what}
{}

singular_transform::singular_transform():
    error{"transform is not invertible"}
{}

singular_transform::singular_transform(std::string const & what):
    error{what}
{}

missing_operand::missing_operand():
    error{"missing operand(s) for composition"}
{}

} /* namespace affine2d */
