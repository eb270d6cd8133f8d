/**
 * @file common.hpp
 * @brief Common types, build switches and internal helpers for junsigned.
 * @author MangaD
 * @date 2025
 * @version 1.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <source_location>
#include <string>
#include <string_view>

/**
 * @defgroup junsigned junsigned: C++20 Java-style unsigned integer types
 * @brief All core classes and functions of the junsigned library.
 *
 * junsigned provides immutable, range-checked unsigned integer value types with an API
 * modelled on Java's `Number` hierarchy. They are meant for protocol fields, binary file
 * formats and hardware registers that are specified as unsigned quantities.
 *
 * Example usage:
 * @code
 * #include <junsigned/UShort.hpp>
 *
 * auto port = junsigned::UShort::valueOf("8080");
 * auto bytes = port.toBytes(); // {0x90, 0x1F}
 * @endcode
 */

/**
 * @defgroup core Core Types
 * @ingroup junsigned
 * @brief The unsigned value types and their common base class.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup junsigned
 * @brief Exception types used in junsigned for error handling.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup junsigned
 * @brief Implementation-only utilities for internal use.
 *
 * @warning Do not rely on this module from user code. It is subject to change without notice.
 */

/**
 * @def JUNSIGNED_INCLUDE_ERROR_CONTEXT
 * @brief Build-time switch that appends the throwing call site to exception messages.
 *
 * When defined to a non-zero value (CMake option `JUNSIGNED_INCLUDE_ERROR_CONTEXT=ON`),
 * every message produced by the internal throw helpers is suffixed with
 * ` [at file:line function]`.
 */
#ifndef JUNSIGNED_INCLUDE_ERROR_CONTEXT
#define JUNSIGNED_INCLUDE_ERROR_CONTEXT 0
#endif

/**
 * @namespace junsigned
 * @brief Java-style unsigned integer value types.
 *
 * Core Classes:
 * - UNumber: abstract base mirroring `java.lang.Number`
 * - UByte: 8-bit unsigned value
 * - UShort: 16-bit unsigned value
 *
 * Features:
 * - Exception-based error handling (NumberException and subclasses)
 * - Immutable values; arithmetic returns new instances
 * - Range violations are errors, never silent wrap-around
 * - Explicit masking factories for reinterpreting signed bit patterns
 *
 * @note All types are immutable and may be shared between threads without synchronization.
 */
namespace junsigned
{

/**
 * @typedef BigInteger
 * @ingroup core
 * @brief Arbitrary-precision integer returned by UNumber::toBigInteger().
 */
using BigInteger = boost::multiprecision::cpp_int;

} // namespace junsigned

/**
 * @namespace junsigned::internal
 * @brief Implementation-only helpers shared by the value types.
 *
 * @warning Not part of the public API. Subject to change or removal in future versions.
 *
 * @ingroup internal
 */
namespace junsigned::internal
{

/**
 * @brief Parse a decimal string the way `Integer.parseInt` does.
 * @ingroup internal
 *
 * Accepts an optional leading `+` or `-` followed by one or more ASCII digits, and nothing
 * else: no whitespace, no radix prefix, no trailing characters. The value must fit in `int`.
 *
 * @param[in] text The string to parse.
 * @return The parsed value.
 *
 * @throws NumberFormatException if @p text is not a valid `int` literal.
 */
[[nodiscard]] int parseInt(std::string_view text, const std::source_location& loc = std::source_location::current());

/**
 * @brief Throw a NumberRangeException for @p value and the violated bounds.
 * @ingroup internal
 *
 * When `JUNSIGNED_INCLUDE_ERROR_CONTEXT` is enabled, the message is suffixed with the
 * location captured in @p loc.
 *
 * @throws NumberRangeException Always.
 */
[[noreturn]] void throwRangeError(long long value, long long min, long long max,
                                  const std::source_location& loc = std::source_location::current());

/**
 * @brief Validate that @p value lies in `[min, max]`.
 * @ingroup internal
 *
 * @return @p value unchanged when in range.
 * @throws NumberRangeException otherwise.
 */
[[nodiscard]] inline long long checkRange(const long long value, const long long min, const long long max,
                                          const std::source_location& loc = std::source_location::current())
{
    if (value < min || value > max)
        throwRangeError(value, min, max, loc);
    return value;
}

} // namespace junsigned::internal
