#include "junsigned/common.hpp"
#include "junsigned/NumberFormatException.hpp"
#include "junsigned/NumberRangeException.hpp"
#include "junsigned/UNumber.hpp"

#include <charconv>
#include <system_error>
#include <utility>

using namespace junsigned;

namespace
{

[[noreturn]] void throwFormatError(const std::string_view text, [[maybe_unused]] const std::source_location& loc)
{
    std::string input(text);
#if JUNSIGNED_INCLUDE_ERROR_CONTEXT
    std::string msg = NumberFormatException::buildErrorMessage(input);
    msg.append(" [at ")
        .append(loc.file_name())
        .append(":")
        .append(std::to_string(loc.line()))
        .append(" ")
        .append(loc.function_name())
        .append("]");
    throw NumberFormatException(std::move(input), msg);
#else
    throw NumberFormatException(std::move(input));
#endif
}

} // namespace

int internal::parseInt(const std::string_view text, const std::source_location& loc)
{
    std::string_view digits = text;

    // from_chars does not take a leading '+'; accept "+5" but not "+" or "+-5".
    if (!digits.empty() && digits.front() == '+')
    {
        digits.remove_prefix(1);
        if (digits.empty() || digits.front() == '-')
            throwFormatError(text, loc);
    }

    int value = 0;
    const char* b = digits.data();
    const char* e = b + digits.size();
    if (auto [ptr, ec] = std::from_chars(b, e, value); ec == std::errc{} && ptr == e)
        return value;

    throwFormatError(text, loc);
}

void internal::throwRangeError(const long long value, const long long min, const long long max,
                               [[maybe_unused]] const std::source_location& loc)
{
#if JUNSIGNED_INCLUDE_ERROR_CONTEXT
    std::string msg = NumberRangeException::buildErrorMessage(value, min, max);
    msg.append(" [at ")
        .append(loc.file_name())
        .append(":")
        .append(std::to_string(loc.line()))
        .append(" ")
        .append(loc.function_name())
        .append("]");
    throw NumberRangeException(value, min, max, msg);
#else
    throw NumberRangeException(value, min, max);
#endif
}

std::ostream& junsigned::operator<<(std::ostream& os, const UNumber& number)
{
    return os << number.toString();
}
