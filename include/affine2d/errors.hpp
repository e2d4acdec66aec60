#ifndef AFFINE2D_ERRORS_HPP
#define AFFINE2D_ERRORS_HPP

#include <affine2d/export.hpp>

#include <stdexcept>
#include <string>

namespace affine2d
{

class AFFINE2D_EXPORT error: public std::runtime_error
{
    public:
    explicit error(std::string const & what);
    explicit error(char const * what);
}; /* class error */

// Thrown when an operation needs the inverse of a transform whose linear
// part has a zero determinant.
class AFFINE2D_EXPORT singular_transform: public error
{
    public:
    singular_transform();
    explicit singular_transform(std::string const & what);
}; /* class singular_transform */

// Thrown when a composition is requested without any operand.
class AFFINE2D_EXPORT missing_operand: public error
{
    public:
    missing_operand();
}; /* class missing_operand */

} /* namespace affine2d */

#endif /* AFFINE2D_ERRORS_HPP */
