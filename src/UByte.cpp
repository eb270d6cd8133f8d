#include "junsigned/UByte.hpp"

using namespace junsigned;

const UByte UByte::MIN = UByte::valueOf(UByte::MIN_VALUE);
const UByte UByte::MAX = UByte::valueOf(UByte::MAX_VALUE);

UByte UByte::checked(const long long value)
{
    return UByte(static_cast<std::uint8_t>(internal::checkRange(value, MIN_VALUE, MAX_VALUE)));
}

UByte UByte::valueOf(const std::string_view value)
{
    return checked(internal::parseInt(value));
}

UByte UByte::valueOf(const std::int8_t value) noexcept
{
    return UByte(static_cast<std::uint8_t>(value & MAX_VALUE));
}

UByte UByte::valueOf(const int value)
{
    return checked(value);
}

std::string UByte::toString() const
{
    return std::to_string(_value);
}

bool UByte::equals(const UNumber& other) const noexcept
{
    if (const auto* o = dynamic_cast<const UByte*>(&other))
        return _value == o->_value;

    return false;
}

int UByte::compareTo(const UByte& other) const noexcept
{
    return _value < other._value ? -1 : (_value == other._value ? 0 : 1);
}

UByte UByte::add(const UByte& other) const
{
    return checked(static_cast<long long>(_value) + other._value);
}

UByte UByte::add(const int delta) const
{
    return checked(static_cast<long long>(_value) + delta);
}

UByte UByte::subtract(const UByte& other) const
{
    return checked(static_cast<long long>(_value) - other._value);
}

UByte UByte::subtract(const int delta) const
{
    return checked(static_cast<long long>(_value) - delta);
}
