#include "junsigned/UShort.hpp"

using namespace junsigned;

const UShort UShort::MIN = UShort::valueOf(UShort::MIN_VALUE);
const UShort UShort::MAX = UShort::valueOf(UShort::MAX_VALUE);

UShort UShort::checked(const long long value)
{
    return UShort(static_cast<std::uint16_t>(internal::checkRange(value, MIN_VALUE, MAX_VALUE)));
}

UShort UShort::valueOf(const std::string_view value)
{
    return checked(internal::parseInt(value));
}

UShort UShort::valueOf(const std::int16_t value) noexcept
{
    return UShort(static_cast<std::uint16_t>(value & MAX_VALUE));
}

UShort UShort::valueOf(const int value)
{
    return checked(value);
}

UShort UShort::valueOf(const UByte& low, const UByte& high)
{
    return checked(low.intValue() << 8 | high.intValue());
}

std::array<std::uint8_t, 2> UShort::toBytes() const
{
    const UByte h = UByte::valueOf(_value / 256);
    const UByte l = UByte::valueOf(_value % 256);
    return {static_cast<std::uint8_t>(l.intValue()), static_cast<std::uint8_t>(h.intValue())};
}

std::string UShort::toString() const
{
    return std::to_string(_value);
}

bool UShort::equals(const UNumber& other) const noexcept
{
    if (const auto* o = dynamic_cast<const UShort*>(&other))
        return _value == o->_value;

    return false;
}

int UShort::compareTo(const UShort& other) const noexcept
{
    return _value < other._value ? -1 : (_value == other._value ? 0 : 1);
}

UShort UShort::add(const UShort& other) const
{
    return checked(static_cast<long long>(_value) + other._value);
}

UShort UShort::add(const int delta) const
{
    return checked(static_cast<long long>(_value) + delta);
}

UShort UShort::subtract(const UShort& other) const
{
    return checked(static_cast<long long>(_value) - other._value);
}

UShort UShort::subtract(const int delta) const
{
    return checked(static_cast<long long>(_value) - delta);
}
