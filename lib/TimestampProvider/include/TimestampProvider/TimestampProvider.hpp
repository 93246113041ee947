#pragma once

#include "TimestampProvider/Tai64N.hpp"

/**
 * @brief Clock capability that reports the current instant as TAI64N.
 */
class TimestampProvider
{
  public:
    virtual ~TimestampProvider() = default;

    /**
     * @brief Capture the current instant.
     *
     * @return Current TAI64N instant
     */
    virtual Tai64N Now() const = 0;
};

/**
 * @brief Infrastructure component reading the system wall clock.
 */
class SystemTimestampProvider : public TimestampProvider
{
  public:
    Tai64N Now() const override;
};
