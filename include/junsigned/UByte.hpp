/**
 * @file UByte.hpp
 * @brief Immutable unsigned 8-bit value type.
 */

#pragma once

#include "NumberFormatException.hpp"
#include "NumberRangeException.hpp"
#include "UNumber.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace junsigned
{

/**
 * @class UByte
 * @ingroup core
 * @brief An `unsigned byte`: an immutable value in `[0, 255]`.
 *
 * UByte is the 8-bit companion of UShort. It is used as the unit of UShort's byte-pair
 * encoding (UShort::valueOf(const UByte&, const UByte&) and UShort::toBytes()) and can be
 * used on its own wherever a protocol defines an unsigned octet.
 *
 * All factories except valueOf(std::int8_t) validate their input and throw
 * NumberRangeException when it falls outside `[0, 255]`. Arithmetic is checked the same way.
 *
 * @code
 * auto flags = UByte::valueOf(0x80);
 * auto raw = UByte::valueOf(static_cast<std::int8_t>(-128)); // 128, never throws
 * flags.equals(raw); // true
 * @endcode
 */
class UByte final : public UNumber
{
  public:
    /**
     * @brief The minimum value a UByte can hold, 0.
     */
    static constexpr int MIN_VALUE = 0x00;

    /**
     * @brief The maximum value a UByte can hold, 2<sup>8</sup>-1.
     */
    static constexpr int MAX_VALUE = 0xff;

    /**
     * @brief UByte holding MIN_VALUE.
     */
    static const UByte MIN;

    /**
     * @brief UByte holding MAX_VALUE.
     */
    static const UByte MAX;

    /**
     * @brief Parse a decimal string.
     *
     * @throws NumberFormatException if @p value is not a valid `int` literal.
     * @throws NumberRangeException if the parsed value is outside `[0, 255]`.
     */
    [[nodiscard]] static UByte valueOf(std::string_view value);

    /**
     * @brief Create a UByte by masking @p value with `0xFF`, so `(int8_t) -1` becomes 255.
     */
    [[nodiscard]] static UByte valueOf(std::int8_t value) noexcept;

    /**
     * @brief Create a UByte from an integer.
     *
     * @throws NumberRangeException if @p value is outside `[0, 255]`.
     */
    [[nodiscard]] static UByte valueOf(int value);

    [[nodiscard]] int intValue() const noexcept override { return _value; }
    [[nodiscard]] std::int64_t longValue() const noexcept override { return _value; }
    [[nodiscard]] float floatValue() const noexcept override { return static_cast<float>(_value); }
    [[nodiscard]] double doubleValue() const noexcept override { return static_cast<double>(_value); }
    [[nodiscard]] BigInteger toBigInteger() const override { return BigInteger(_value); }
    [[nodiscard]] std::string toString() const override;
    [[nodiscard]] bool equals(const UNumber& other) const noexcept override;
    [[nodiscard]] int hashCode() const noexcept override { return _value; }

    /**
     * @brief Three-way comparison against another UByte.
     * @return -1, 0 or 1.
     */
    [[nodiscard]] int compareTo(const UByte& other) const noexcept;

    /**
     * @brief Checked addition.
     * @throws NumberRangeException if the sum exceeds 255.
     */
    [[nodiscard]] UByte add(const UByte& other) const;

    /**
     * @brief Checked addition of a signed delta.
     * @throws NumberRangeException if the result is outside `[0, 255]`.
     */
    [[nodiscard]] UByte add(int delta) const;

    /**
     * @brief Checked subtraction.
     * @throws NumberRangeException if the result would be negative.
     */
    [[nodiscard]] UByte subtract(const UByte& other) const;

    /**
     * @brief Checked subtraction of a signed delta.
     * @throws NumberRangeException if the result is outside `[0, 255]`.
     */
    [[nodiscard]] UByte subtract(int delta) const;

    [[nodiscard]] bool operator==(const UByte& other) const noexcept { return _value == other._value; }
    [[nodiscard]] std::strong_ordering operator<=>(const UByte& other) const noexcept
    {
        return _value <=> other._value;
    }

  private:
    std::uint8_t _value;

    explicit UByte(const std::uint8_t value) noexcept : _value(value) {}

    // Range-checked construction path shared by every validating factory.
    [[nodiscard]] static UByte checked(long long value);
};

} // namespace junsigned

namespace std
{

/**
 * @brief Hashes a junsigned::UByte through its hashCode().
 */
template <> struct hash<junsigned::UByte>
{
    size_t operator()(const junsigned::UByte& value) const noexcept { return hash<int>{}(value.hashCode()); }
};

} // namespace std
