#include "TimestampProvider/TimestampProvider.hpp"

#include <chrono>

Tai64N SystemTimestampProvider::Now() const
{
    return Tai64N::FromSystemTime(std::chrono::system_clock::now());
}
