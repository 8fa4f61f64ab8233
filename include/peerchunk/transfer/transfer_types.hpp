#pragma once

#include <chrono>

namespace peerchunk::transfer {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Seconds = std::chrono::duration<double>;

}
