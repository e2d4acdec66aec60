#ifndef AFFINE2D_ASSERT_HPP
#define AFFINE2D_ASSERT_HPP

#ifndef AFFINE2D_ASSERT
#ifndef NDEBUG
#include <cassert>
#define AFFINE2D_ASSERT(x) assert(x)
#else
#define AFFINE2D_ASSERT(x)
#endif
#endif

#endif /* AFFINE2D_ASSERT_HPP */
