/**
 * @file text.hpp
 * @brief Normalization and inspection helpers shared by the validated text types.
 */
#pragma once
#include "sceneit/common/common.hpp"

namespace sceneit
{

/// Upper bound, in code points, for titles and person names.
constexpr std::size_t k_max_name_length = 100;

/**
 * @brief Trim the input and collapse every internal whitespace run to a single space.
 *
 * @details
 * `"  Scott Pilgrim   vs.\tThe World "` becomes `"Scott Pilgrim vs. The World"`.
 * Only ASCII whitespace is recognized.
 */
std::string normalize_whitespace(const std::string& input);

/**
 * @brief Check for control characters.
 * @return True if the UTF-8 text contains a C0 control (U+0000..U+001F), DEL
 *         (U+007F), or a C1 control (U+0080..U+009F).
 */
bool has_control_chars(const std::string& text) noexcept;

/**
 * @brief Count the code points of UTF-8 text.
 * @note Malformed sequences are counted by their lead bytes; no validation is done.
 */
std::size_t code_point_count(const std::string& text) noexcept;

/**
 * @brief Normalize and validate a person's name (author or character).
 * @param input Raw name text.
 * @param subject Used in error messages, e.g. "Author name".
 * @return The normalized name.
 * @throw ValidationError with `EmptyName`, `NameTooLong` or `ContainsControlChars`.
 */
std::string validated_name(const std::string& input, const std::string& subject);

} // namespace sceneit
