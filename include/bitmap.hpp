#ifndef CANFUZZ_BITMAP_HPP
#define CANFUZZ_BITMAP_HPP

/**
 * @file bitmap.hpp
 * @brief Positional masks over directive digit strings
 *
 * A bitmap selects which digits of an id or payload are free to vary:
 *
 *   digits:  1 2 3 4 5 6
 *   bitmap:  T F T F          (positions 4..5 are beyond the bitmap)
 *   mask  -> "13"
 *
 * Rules (shared by brute force and mutation):
 * - bitmap[i] == true   digit i is free
 * - bitmap[i] == false  digit i is fixed, copied from the base value
 * - i >= bitmap.size()  fixed
 * - bitmap entries past the end of the digit string are ignored
 *
 * merge(mask(b, d), d, b) == d for every bitmap b and digit string d.
 */

#include <cstddef>
#include <string>
#include <vector>

namespace canfuzz {

using Bitmap = std::vector<bool>;

/// Free digits of `digits`, in order
std::string mask(const Bitmap& bitmap, const std::string& digits);

/// Write `masked` back over the free positions of `digits`.
/// If `masked` runs short the remaining free positions keep their base digit.
std::string merge(const std::string& masked, const std::string& digits, const Bitmap& bitmap);

/// Number of free positions bitmap selects within a string of `length` digits
size_t free_positions(const Bitmap& bitmap, size_t length);

/// Bitmap with every one of `length` positions free
Bitmap all_free(size_t length);

/// Parse "True,False,True" / "1 0 1" / "[True, False]" into a bitmap
bool parse_bitmap(const std::string& text, Bitmap& out);

/// Render a bitmap as "True,False,..."
std::string to_string(const Bitmap& bitmap);

} // namespace canfuzz

#endif // CANFUZZ_BITMAP_HPP
