#include "controllers/RandomSource.h"
#include <raylib.h>

namespace pm2d {

float RaylibRandom::nextUnit() {
    constexpr int span = 10000;
    return static_cast<float>(GetRandomValue(0, span - 1)) / static_cast<float>(span);
}

int RaylibRandom::nextInt(int bound) {
    if (bound <= 1) return 0;
    return GetRandomValue(0, bound - 1);
}

} // namespace pm2d
