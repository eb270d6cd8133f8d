/**
 * @file NumberRangeException.hpp
 * @brief Exception class for out-of-range values in junsigned.
 */

#pragma once

#include "NumberException.hpp"

#include <sstream>
#include <string>

namespace junsigned
{

/**
 * @class NumberRangeException
 * @ingroup exceptions
 * @brief Thrown when a constructed or computed value falls outside its type's range.
 *
 * Every validating factory and every checked arithmetic operation throws this exception
 * instead of clamping or wrapping. It carries the offending value together with the
 * inclusive bounds that were violated.
 *
 * ### Example
 * @code
 * try {
 *     auto v = UShort::MAX.add(1);
 * } catch (const NumberRangeException& e) {
 *     std::cerr << e.getValue() << " not in [" << e.getMin() << ", " << e.getMax() << "]" << std::endl;
 * }
 * @endcode
 */
class NumberRangeException final : public NumberException
{
  public:
    /**
     * @brief Construct a NumberRangeException.
     * @param value The offending value.
     * @param min Inclusive lower bound of the target type.
     * @param max Inclusive upper bound of the target type.
     * @param message Optional error message. If omitted, it is generated from the other arguments.
     */
    NumberRangeException(const long long value, const long long min, const long long max,
                         const std::string& message = "")
        : NumberException(message.empty() ? buildErrorMessage(value, min, max) : message), _value(value), _min(min),
          _max(max)
    {
    }

    /**
     * @brief The value that was rejected.
     */
    [[nodiscard]] long long getValue() const noexcept { return _value; }

    /**
     * @brief Inclusive lower bound that applied.
     */
    [[nodiscard]] long long getMin() const noexcept { return _min; }

    /**
     * @brief Inclusive upper bound that applied.
     */
    [[nodiscard]] long long getMax() const noexcept { return _max; }

    /**
     * @brief Builds the default message used when no explicit message is given.
     */
    static std::string buildErrorMessage(const long long value, const long long min, const long long max)
    {
        std::ostringstream oss;
        oss << "Value is out of range : " << value << " (expected " << min << ".." << max << ")";
        return oss.str();
    }

  private:
    long long _value;
    long long _min;
    long long _max;
};

} // namespace junsigned
