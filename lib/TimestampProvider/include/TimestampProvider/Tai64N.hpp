#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

/** Size in bytes of a TAI64N external label. */
constexpr std::size_t Tai64NSize = 12;

using Tai64NBytes = std::array<std::uint8_t, Tai64NSize>;

/**
 * @brief TAI64N instant: a TAI64 seconds label plus a nanosecond count.
 *
 * The external form is 12 bytes: the 8-byte big-endian seconds label followed
 * by the 4-byte big-endian nanosecond count. Because both fields are big-endian
 * and the seconds come first, byte order of the external form matches
 * chronological order.
 */
class Tai64N
{
  public:
    /** Label of 1970-01-01T00:00:00Z (2^62 + 10 leap seconds). */
    static constexpr std::uint64_t UnixEpochLabel = (std::uint64_t{1} << 62) + 10;
    /** Labels at or above 2^63 are reserved by the TAI64 format. */
    static constexpr std::uint64_t ReservedLabel = std::uint64_t{1} << 63;
    static constexpr std::uint32_t NanosPerSecond = 1000000000;

    /**
     * @brief Instant at the Unix epoch.
     */
    Tai64N();

    /**
     * @brief Build an instant from its two label fields.
     *
     * @param[in] seconds TAI64 seconds label
     * @param[in] nanoseconds Sub-second part
     * @return Instant, or empty when the label is reserved or nanoseconds is
     *         not below one second
     */
    static std::optional<Tai64N> FromLabel(std::uint64_t seconds, std::uint32_t nanoseconds);

    /**
     * @brief Build an instant from a Unix time.
     *
     * @param[in] unixSeconds Seconds since the Unix epoch, may be negative
     * @param[in] nanoseconds Sub-second part, must be below one second
     * @return Instant, or empty when nanoseconds is out of range or the
     *         label would fall in the reserved range
     */
    static std::optional<Tai64N> FromUnix(std::int64_t unixSeconds, std::uint32_t nanoseconds);

    /**
     * @brief Build an instant from a system clock reading.
     *
     * Every representable time point maps to a valid label.
     *
     * @param[in] timePoint Clock reading
     * @return Instant with the reading's precision, at most nanoseconds
     */
    static Tai64N FromSystemTime(std::chrono::system_clock::time_point timePoint);

    /**
     * @brief Parse the 12-byte external form.
     *
     * @param[in] bytes External label
     * @param[out] output Parsed instant, untouched on failure
     * @return false if the nanosecond field is not below one second or the
     *         seconds label is in the reserved range
     */
    static bool FromBytes(const Tai64NBytes& bytes, Tai64N& output);

    /**
     * @brief Write the 12-byte external form, always accepted by FromBytes().
     */
    Tai64NBytes ToBytes() const;

    std::uint64_t Seconds() const { return _seconds; }
    std::uint32_t Nanoseconds() const { return _nanoseconds; }

    std::int64_t UnixSeconds() const;

    /**
     * @brief Convert to a system clock time point.
     *
     * @return Time point, or empty when the instant lies outside the range of
     *         std::chrono::system_clock::duration
     */
    std::optional<std::chrono::system_clock::time_point> ToSystemTime() const;

    /**
     * @brief Signed distance from an earlier instant to this one.
     *
     * @return Distance, or empty when it does not fit in std::chrono::nanoseconds
     *         (instants roughly 292 years apart or more)
     */
    std::optional<std::chrono::nanoseconds> DurationSince(const Tai64N& earlier) const;

    /**
     * @brief Render as "YYYY-MM-DDTHH:MM:SS.nnnnnnnnnZ" in UTC.
     *
     * Instants outside years 0000-9999, or that the C library cannot break
     * down, render as the external label "@" followed by 24 hex digits.
     */
    std::string ToIso8601() const;

    bool operator==(const Tai64N& other) const;
    bool operator!=(const Tai64N& other) const;
    bool operator<(const Tai64N& other) const;
    bool operator>(const Tai64N& other) const;
    bool operator<=(const Tai64N& other) const;
    bool operator>=(const Tai64N& other) const;

  private:
    Tai64N(std::uint64_t seconds, std::uint32_t nanoseconds);

    std::uint64_t _seconds;
    std::uint32_t _nanoseconds;
};
