#include "TimestampProvider/Tai64N.hpp"

#include <cstdio>
#include <ctime>
#include <limits>
#include <tuple>

namespace
{
constexpr std::size_t SecondsFieldSize = 8;
constexpr std::size_t NanosecondsFieldSize = 4;
constexpr std::size_t TimestampBufferSize = 32;
constexpr std::int64_t NanosPerSecondSigned = 1000000000;
// Largest whole-second distance whose nanosecond count, plus a sub-second remainder, fits in int64_t
constexpr std::int64_t MaxDurationSeconds = std::numeric_limits<std::int64_t>::max() / NanosPerSecondSigned - 1;
constexpr int MaxIsoYear = 9999;
const char HexDigits[] = "0123456789abcdef";
}

Tai64N::Tai64N()
    : _seconds(UnixEpochLabel)
    , _nanoseconds(0)
{
}

Tai64N::Tai64N(std::uint64_t seconds, std::uint32_t nanoseconds)
    : _seconds(seconds)
    , _nanoseconds(nanoseconds)
{
}

std::optional<Tai64N> Tai64N::FromLabel(std::uint64_t seconds, std::uint32_t nanoseconds)
{
    if ((ReservedLabel <= seconds) || (NanosPerSecond <= nanoseconds))
    {
        return std::nullopt;
    }
    return Tai64N(seconds, nanoseconds);
}

std::optional<Tai64N> Tai64N::FromUnix(std::int64_t unixSeconds, std::uint32_t nanoseconds)
{
    if (NanosPerSecond <= nanoseconds)
    {
        return std::nullopt;
    }

    if (0 <= unixSeconds)
    {
        const std::uint64_t offset = static_cast<std::uint64_t>(unixSeconds);
        if ((ReservedLabel - UnixEpochLabel) <= offset)
        {
            return std::nullopt;
        }
        return Tai64N(UnixEpochLabel + offset, nanoseconds);
    }

    // -(x + 1) + 1 keeps INT64_MIN representable
    const std::uint64_t magnitude = static_cast<std::uint64_t>(-(unixSeconds + 1)) + 1;
    if (UnixEpochLabel < magnitude)
    {
        return std::nullopt;
    }
    return Tai64N(UnixEpochLabel - magnitude, nanoseconds);
}

Tai64N Tai64N::FromSystemTime(std::chrono::system_clock::time_point timePoint)
{
    // split in clock units first, so coarse clocks never overflow a nanosecond count
    const std::chrono::system_clock::duration sinceEpoch = timePoint.time_since_epoch();
    std::chrono::seconds unixSeconds = std::chrono::duration_cast<std::chrono::seconds>(sinceEpoch);
    std::chrono::system_clock::duration remainder = sinceEpoch - unixSeconds;
    if (std::chrono::system_clock::duration::zero() > remainder)
    {
        remainder += std::chrono::seconds(1);
        unixSeconds -= std::chrono::seconds(1);
    }

    const std::int64_t nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(remainder).count();
    const std::uint64_t label = static_cast<std::uint64_t>(static_cast<std::int64_t>(UnixEpochLabel) + static_cast<std::int64_t>(unixSeconds.count()));
    return Tai64N(label, static_cast<std::uint32_t>(nanoseconds));
}

bool Tai64N::FromBytes(const Tai64NBytes& bytes, Tai64N& output)
{
    std::uint64_t seconds = 0;
    for (std::size_t index = 0; index < SecondsFieldSize; ++index)
    {
        seconds = (seconds << 8) | bytes[index];
    }

    std::uint32_t nanoseconds = 0;
    for (std::size_t index = 0; index < NanosecondsFieldSize; ++index)
    {
        nanoseconds = (nanoseconds << 8) | bytes[SecondsFieldSize + index];
    }

    const std::optional<Tai64N> parsed = FromLabel(seconds, nanoseconds);
    if (false == parsed.has_value())
    {
        return false;
    }

    output = parsed.value();
    return true;
}

Tai64NBytes Tai64N::ToBytes() const
{
    Tai64NBytes bytes{};
    for (std::size_t index = 0; index < SecondsFieldSize; ++index)
    {
        bytes[index] = static_cast<std::uint8_t>(_seconds >> (8 * (SecondsFieldSize - 1 - index)));
    }
    for (std::size_t index = 0; index < NanosecondsFieldSize; ++index)
    {
        bytes[SecondsFieldSize + index] = static_cast<std::uint8_t>(_nanoseconds >> (8 * (NanosecondsFieldSize - 1 - index)));
    }
    return bytes;
}

std::int64_t Tai64N::UnixSeconds() const
{
    return static_cast<std::int64_t>(_seconds) - static_cast<std::int64_t>(UnixEpochLabel);
}

std::optional<std::chrono::system_clock::time_point> Tai64N::ToSystemTime() const
{
    using ClockDuration = std::chrono::system_clock::duration;

    const std::int64_t unixSeconds = UnixSeconds();
    const std::int64_t maxSeconds = std::chrono::duration_cast<std::chrono::seconds>(ClockDuration::max()).count();
    const std::int64_t minSeconds = std::chrono::duration_cast<std::chrono::seconds>(ClockDuration::min()).count();
    if ((maxSeconds <= unixSeconds) || (minSeconds >= unixSeconds))
    {
        return std::nullopt;
    }

    const ClockDuration sinceEpoch = std::chrono::duration_cast<ClockDuration>(std::chrono::seconds(unixSeconds)) +
                                     std::chrono::duration_cast<ClockDuration>(std::chrono::nanoseconds(_nanoseconds));
    return std::chrono::system_clock::time_point(sinceEpoch);
}

std::optional<std::chrono::nanoseconds> Tai64N::DurationSince(const Tai64N& earlier) const
{
    // both labels are below 2^63, so the difference fits
    const std::int64_t secondsDelta = static_cast<std::int64_t>(_seconds) - static_cast<std::int64_t>(earlier._seconds);
    if ((MaxDurationSeconds < secondsDelta) || (-MaxDurationSeconds > secondsDelta))
    {
        return std::nullopt;
    }

    const std::int64_t nanosDelta = static_cast<std::int64_t>(_nanoseconds) - static_cast<std::int64_t>(earlier._nanoseconds);
    return std::chrono::nanoseconds(secondsDelta * NanosPerSecondSigned + nanosDelta);
}

std::string Tai64N::ToIso8601() const
{
    const std::int64_t unixSeconds = UnixSeconds();
    std::tm timeStruct{};
    bool brokenDown = false;

    if ((std::numeric_limits<std::time_t>::min() <= unixSeconds) && (std::numeric_limits<std::time_t>::max() >= unixSeconds))
    {
        const std::time_t unixTime = static_cast<std::time_t>(unixSeconds);
#ifdef _WIN32
        brokenDown = (0 == gmtime_s(&timeStruct, &unixTime));
#else
        brokenDown = (nullptr != gmtime_r(&unixTime, &timeStruct));
#endif
    }

    const int year = timeStruct.tm_year + 1900;
    if ((false == brokenDown) || (0 > year) || (MaxIsoYear < year))
    {
        const Tai64NBytes bytes = ToBytes();
        std::string label = "@";
        for (const std::uint8_t byte : bytes)
        {
            label.push_back(HexDigits[byte >> 4]);
            label.push_back(HexDigits[byte & 0x0F]);
        }
        return label;
    }

    char buffer[TimestampBufferSize];
    const std::size_t length = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &timeStruct);

    char fraction[TimestampBufferSize];
    std::snprintf(fraction, sizeof(fraction), ".%09uZ", static_cast<unsigned int>(_nanoseconds));

    return std::string(buffer, length) + fraction;
}

bool Tai64N::operator==(const Tai64N& other) const
{
    return (_seconds == other._seconds) && (_nanoseconds == other._nanoseconds);
}

bool Tai64N::operator!=(const Tai64N& other) const
{
    return !(*this == other);
}

bool Tai64N::operator<(const Tai64N& other) const
{
    return std::tie(_seconds, _nanoseconds) < std::tie(other._seconds, other._nanoseconds);
}

bool Tai64N::operator>(const Tai64N& other) const
{
    return other < *this;
}

bool Tai64N::operator<=(const Tai64N& other) const
{
    return !(other < *this);
}

bool Tai64N::operator>=(const Tai64N& other) const
{
    return !(*this < other);
}
