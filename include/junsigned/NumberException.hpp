/**
 * @file NumberException.hpp
 * @brief Base exception class for junsigned errors.
 * @author MangaD
 * @date 2025
 * @version 1.0
 */

#pragma once

#include <stdexcept>
#include <string>

namespace junsigned
{

/**
 * @class NumberException
 * @ingroup exceptions
 * @brief Represents any error raised while constructing or computing an unsigned value.
 *
 * NumberException is the common base of the exceptions thrown by junsigned. Catch it to
 * handle parse failures and range violations in one place, or catch the concrete
 * subclasses to tell them apart.
 *
 * ### Example: Catching all junsigned errors
 * @code
 * #include <junsigned/UShort.hpp>
 * using namespace junsigned;
 *
 * try {
 *     auto v = UShort::valueOf(userInput);
 * } catch (const NumberFormatException& ex) {
 *     std::cerr << "not a number: " << ex.getInput() << std::endl;
 * } catch (const NumberException& ex) {
 *     std::cerr << ex.what() << std::endl;
 * }
 * @endcode
 *
 * @see NumberFormatException
 * @see NumberRangeException
 */
class NumberException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs a NumberException with a custom error message.
     * @param message A human-readable description of the error.
     */
    explicit NumberException(const std::string& message = "NumberException") : std::runtime_error(message) {}

    /**
     * @brief Destroys the NumberException.
     */
    ~NumberException() override = default;
};

} // namespace junsigned
