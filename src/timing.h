#pragma once

#include <stdint.h>

namespace timing
{

/// Wall clock in seconds since the epoch, comparable with file timestamps
double now();

} // namespace timing
