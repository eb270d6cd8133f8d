/**
 * @file UShort.hpp
 * @brief Immutable unsigned 16-bit value type.
 * @author MangaD
 * @date 2025
 * @version 1.0
 */

#pragma once

#include "NumberFormatException.hpp"
#include "NumberRangeException.hpp"
#include "UByte.hpp"
#include "UNumber.hpp"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace junsigned
{

/**
 * @class UShort
 * @ingroup core
 * @brief An `unsigned short`: an immutable value in `[0, 65535]`.
 *
 * UShort models protocol fields, file-format values and hardware registers that are defined
 * as unsigned 16-bit quantities. Values never change after construction; every arithmetic
 * operation returns a new instance.
 *
 * ### Construction
 * - valueOf(std::string_view): decimal text, parsed as an `int` and then range checked.
 * - valueOf(int): range checked.
 * - valueOf(std::int16_t): masks the bit pattern with `0xFFFF`. This is the only factory
 *   that never throws, and the only one that wraps.
 * - valueOf(const UByte&, const UByte&): composes two octets into one value.
 *
 * Validating factories and checked arithmetic throw NumberRangeException rather than
 * clamping or wrapping.
 *
 * ### Wire format
 * toBytes() produces a little-endian byte pair (low-order byte first).
 *
 * ### Example
 * @code
 * using namespace junsigned;
 *
 * auto reg = UShort::valueOf(0x1234);
 * auto bytes = reg.toBytes();           // {0x34, 0x12}
 * auto next = reg.add(1);               // 0x1235
 * auto wrapped = UShort::valueOf(static_cast<std::int16_t>(-1)); // 65535
 * UShort::MAX.add(1);                   // throws NumberRangeException
 * @endcode
 *
 * @note Overload resolution follows the usual integral rules: `int`, `char`, `std::uint8_t`
 *       and `std::uint16_t` arguments select valueOf(int); only an actual `std::int16_t`
 *       selects the masking factory.
 */
class UShort final : public UNumber
{
  public:
    /**
     * @brief The minimum value a UShort can hold, 0.
     */
    static constexpr int MIN_VALUE = 0x0000;

    /**
     * @brief The maximum value a UShort can hold, 2<sup>16</sup>-1.
     */
    static constexpr int MAX_VALUE = 0xffff;

    /**
     * @brief UShort holding MIN_VALUE.
     */
    static const UShort MIN;

    /**
     * @brief UShort holding MAX_VALUE.
     */
    static const UShort MAX;

    /**
     * @brief Parse a decimal string.
     *
     * The text must be a complete `int` literal: an optional `+` or `-` followed by digits.
     *
     * @param value Decimal text, e.g. `"8080"`.
     * @return The parsed value.
     *
     * @throws NumberFormatException if @p value is not a valid `int` literal (this includes
     *         literals too large for `int`).
     * @throws NumberRangeException if the parsed value is outside `[0, 65535]`.
     */
    [[nodiscard]] static UShort valueOf(std::string_view value);

    /**
     * @brief Create a UShort by masking @p value with `0xFFFF`.
     *
     * Reinterprets the signed bit pattern as unsigned, so `(int16_t) -1` becomes 65535.
     * Never throws.
     */
    [[nodiscard]] static UShort valueOf(std::int16_t value) noexcept;

    /**
     * @brief Create a UShort from an integer.
     *
     * @throws NumberRangeException if @p value is outside `[0, 65535]`.
     */
    [[nodiscard]] static UShort valueOf(int value);

    /**
     * @brief Compose a UShort from two octets.
     *
     * Computes `(low << 8) | high`: the octet passed as @p low becomes the high-order byte of
     * the result and @p high becomes the low-order byte. This matches the field layout of the
     * protocols this type was written for and is kept as-is; it is not the inverse of
     * toBytes().
     *
     * @param low Octet placed in bits 8..15.
     * @param high Octet placed in bits 0..7.
     *
     * @throws NumberRangeException never in practice; the composed value goes through the
     *         same validation as valueOf(int).
     */
    [[nodiscard]] static UShort valueOf(const UByte& low, const UByte& high);

    /**
     * @brief Encode the value as a little-endian byte pair.
     *
     * @return `{value % 256, value / 256}`.
     */
    [[nodiscard]] std::array<std::uint8_t, 2> toBytes() const;

    [[nodiscard]] int intValue() const noexcept override { return _value; }
    [[nodiscard]] std::int64_t longValue() const noexcept override { return _value; }
    [[nodiscard]] float floatValue() const noexcept override { return static_cast<float>(_value); }
    [[nodiscard]] double doubleValue() const noexcept override { return static_cast<double>(_value); }
    [[nodiscard]] BigInteger toBigInteger() const override { return BigInteger(_value); }
    [[nodiscard]] std::string toString() const override;

    /**
     * @brief Type-sensitive equality.
     * @return `true` only if @p other is a UShort holding the same value.
     */
    [[nodiscard]] bool equals(const UNumber& other) const noexcept override;

    [[nodiscard]] int hashCode() const noexcept override { return _value; }

    /**
     * @brief Three-way comparison against another UShort.
     * @return -1 if this is less than @p other, 0 if equal, 1 if greater.
     */
    [[nodiscard]] int compareTo(const UShort& other) const noexcept;

    /**
     * @brief Checked addition.
     * @throws NumberRangeException if the sum exceeds 65535.
     */
    [[nodiscard]] UShort add(const UShort& other) const;

    /**
     * @brief Checked addition of a signed delta.
     *
     * The sum is computed in a wider type, so any `int` delta is accepted without overflow.
     *
     * @throws NumberRangeException if the result is outside `[0, 65535]`.
     */
    [[nodiscard]] UShort add(int delta) const;

    /**
     * @brief Checked subtraction.
     * @throws NumberRangeException if @p other is greater than this value.
     */
    [[nodiscard]] UShort subtract(const UShort& other) const;

    /**
     * @brief Checked subtraction of a signed delta.
     * @throws NumberRangeException if the result is outside `[0, 65535]`.
     */
    [[nodiscard]] UShort subtract(int delta) const;

    [[nodiscard]] bool operator==(const UShort& other) const noexcept { return _value == other._value; }
    [[nodiscard]] std::strong_ordering operator<=>(const UShort& other) const noexcept
    {
        return _value <=> other._value;
    }

  private:
    std::uint16_t _value;

    explicit UShort(const std::uint16_t value) noexcept : _value(value) {}

    // Range-checked construction path shared by every validating factory.
    [[nodiscard]] static UShort checked(long long value);
};

} // namespace junsigned

namespace std
{

/**
 * @brief Hashes a junsigned::UShort through its hashCode().
 */
template <> struct hash<junsigned::UShort>
{
    size_t operator()(const junsigned::UShort& value) const noexcept { return hash<int>{}(value.hashCode()); }
};

} // namespace std
