#pragma once

namespace pm2d {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    // Uniform in [0, 1).
    virtual float nextUnit() = 0;
    // Uniform in [0, bound). bound must be positive.
    virtual int nextInt(int bound) = 0;
};

// Backed by raylib's GetRandomValue, so SetRandomSeed makes runs reproducible.
class RaylibRandom final : public RandomSource {
public:
    float nextUnit() override;
    int nextInt(int bound) override;
};

} // namespace pm2d
