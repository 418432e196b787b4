/**
 * @file text.cpp
 */
#include "sceneit/common/text.hpp"
#include "sceneit/common/validation_error.hpp"

#include <cctype>

namespace sceneit
{

std::string normalize_whitespace(const std::string& input)
{
    std::string result;
    result.reserve(input.size());

    bool pending_space = false;
    for (char ch : input)
    {
        if (std::isspace(static_cast<unsigned char>(ch)))
        {
            pending_space = !result.empty();
            continue;
        }
        if (pending_space)
        {
            result.push_back(' ');
            pending_space = false;
        }
        result.push_back(ch);
    }
    return result;
}

bool has_control_chars(const std::string& text) noexcept
{
    for (size_t i = 0; i < text.size(); ++i)
    {
        auto byte = static_cast<unsigned char>(text[i]);
        if (byte < 0x20 || byte == 0x7F)
        {
            return true;
        }
        // C1 controls are encoded as 0xC2 0x80..0x9F
        if (byte == 0xC2 && i + 1 < text.size())
        {
            auto next = static_cast<unsigned char>(text[i + 1]);
            if (next >= 0x80 && next <= 0x9F)
            {
                return true;
            }
        }
    }
    return false;
}

std::size_t code_point_count(const std::string& text) noexcept
{
    std::size_t count = 0;
    for (char ch : text)
    {
        // Continuation bytes look like 10xxxxxx
        if ((static_cast<unsigned char>(ch) & 0xC0) != 0x80)
        {
            ++count;
        }
    }
    return count;
}

std::string validated_name(const std::string& input, const std::string& subject)
{
    std::string name = normalize_whitespace(input);
    if (name.empty())
    {
        throw ValidationError(ValidationErrorCode::EmptyName, subject + " must not be empty");
    }
    if (code_point_count(name) > k_max_name_length)
    {
        throw ValidationError(
            ValidationErrorCode::NameTooLong,
            subject + " must be at most " + std::to_string(k_max_name_length) + " characters");
    }
    if (has_control_chars(name))
    {
        throw ValidationError(ValidationErrorCode::ContainsControlChars,
                              subject + " contains control characters");
    }
    return name;
}

} // namespace sceneit
