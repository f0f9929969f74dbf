#include "timing.h"
#include <chrono>

namespace timing
{

double now()
{
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace timing
