/**
 * @file NumberFormatException.hpp
 * @brief Exception class for unparsable numeric strings in junsigned.
 */

#pragma once

#include "NumberException.hpp"

#include <string>
#include <utility>

namespace junsigned
{

/**
 * @class NumberFormatException
 * @ingroup exceptions
 * @brief Thrown when a string is not a valid decimal integer literal.
 *
 * Raised by the string factories (`UShort::valueOf(std::string_view)`,
 * `UByte::valueOf(std::string_view)`) before any range check takes place. The rejected
 * input is kept verbatim and can be retrieved with getInput().
 *
 * ### Example
 * @code
 * try {
 *     auto v = UShort::valueOf("abc");
 * } catch (const NumberFormatException& e) {
 *     std::cerr << e.what() << std::endl; // For input string: "abc"
 * }
 * @endcode
 */
class NumberFormatException final : public NumberException
{
  public:
    /**
     * @brief Construct a NumberFormatException for the given input.
     * @param input The string that failed to parse.
     * @param message Optional error message. If omitted, it is generated from @p input.
     */
    explicit NumberFormatException(std::string input, const std::string& message = "")
        : NumberException(message.empty() ? buildErrorMessage(input) : message), _input(std::move(input))
    {
    }

    /**
     * @brief The string that failed to parse.
     */
    [[nodiscard]] const std::string& getInput() const noexcept { return _input; }

    /**
     * @brief Builds the default message used when no explicit message is given.
     */
    static std::string buildErrorMessage(const std::string& input)
    {
        return "For input string: \"" + input + "\"";
    }

  private:
    std::string _input; ///< Rejected input, verbatim.
};

} // namespace junsigned
