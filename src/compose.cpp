#include <affine2d/transform.hpp>

namespace affine2d
{

transform<> compose()
{
    throw missing_operand{};
}

} /* namespace affine2d */
