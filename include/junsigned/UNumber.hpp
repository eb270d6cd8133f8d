/**
 * @file UNumber.hpp
 * @brief Abstract base class for all junsigned value types.
 * @author MangaD
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "common.hpp"

#include <cstdint>
#include <ostream>
#include <string>

namespace junsigned
{

/**
 * @class UNumber
 * @ingroup core
 * @brief Common interface of the unsigned value types, modelled on `java.lang.Number`.
 *
 * A UNumber exposes its value through a fixed set of widening projections (intValue(),
 * longValue(), floatValue(), doubleValue(), toBigInteger()), all of which are lossless for
 * every concrete type in this library. The narrowing projections shortValue() and
 * byteValue() keep only the low-order bits and reinterpret them as signed, exactly like a
 * Java `(short)` or `(byte)` cast.
 *
 * Concrete types are immutable. Equality is type-sensitive: a UByte and a UShort holding
 * the same number are not equal.
 *
 * @see UByte
 * @see UShort
 */
class UNumber
{
  public:
    virtual ~UNumber() = default;

    /**
     * @brief The value as a signed 32-bit integer.
     */
    [[nodiscard]] virtual int intValue() const noexcept = 0;

    /**
     * @brief The value as a signed 64-bit integer.
     */
    [[nodiscard]] virtual std::int64_t longValue() const noexcept = 0;

    /**
     * @brief The value as a single-precision float.
     */
    [[nodiscard]] virtual float floatValue() const noexcept = 0;

    /**
     * @brief The value as a double-precision float.
     */
    [[nodiscard]] virtual double doubleValue() const noexcept = 0;

    /**
     * @brief The value as an arbitrary-precision integer.
     */
    [[nodiscard]] virtual BigInteger toBigInteger() const = 0;

    /**
     * @brief Decimal representation of the value, without sign or leading zeros.
     */
    [[nodiscard]] virtual std::string toString() const = 0;

    /**
     * @brief Type-sensitive equality.
     *
     * @param other Any UNumber.
     * @return `true` if @p other has the same concrete type and the same value; `false`
     *         otherwise. Never throws.
     */
    [[nodiscard]] virtual bool equals(const UNumber& other) const noexcept = 0;

    /**
     * @brief Hash code consistent with equals().
     */
    [[nodiscard]] virtual int hashCode() const noexcept = 0;

    /**
     * @brief The low 16 bits of the value reinterpreted as a signed 16-bit integer.
     *
     * For a UShort this is the inverse of the masking factory:
     * `UShort::valueOf(u.shortValue()).equals(u)` holds for every `u`.
     */
    [[nodiscard]] std::int16_t shortValue() const noexcept { return static_cast<std::int16_t>(intValue()); }

    /**
     * @brief The low 8 bits of the value reinterpreted as a signed 8-bit integer.
     */
    [[nodiscard]] std::int8_t byteValue() const noexcept { return static_cast<std::int8_t>(intValue()); }

  protected:
    UNumber() = default;
    UNumber(const UNumber&) = default;
    UNumber& operator=(const UNumber&) = default;
};

/**
 * @brief Write the decimal representation of @p number to @p os.
 * @ingroup core
 */
std::ostream& operator<<(std::ostream& os, const UNumber& number);

} // namespace junsigned
