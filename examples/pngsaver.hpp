#ifndef AFFINE2D_EXAMPLES_PNGSAVER_HPP
#define AFFINE2D_EXAMPLES_PNGSAVER_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>

// Writes an 8-bit grey image, rows stored top to bottom.
bool save_png(
    std::filesystem::path const & file, std::uint8_t const * data,
    std::size_t const width, std::size_t const height);

#endif /* AFFINE2D_EXAMPLES_PNGSAVER_HPP */
