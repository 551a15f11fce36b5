#ifndef TRAININGCONFIG_H
#define TRAININGCONFIG_H

#include <cstdint>
#include <string>

struct PhysicsConfig {
    double gravity = 9.8;          // m/s^2
    double massCart = 1.0;         // kg
    double massPole = 0.1;         // kg, per pole
    double poleLength = 0.5;       // m
    double dt = 0.02;              // s, fixed RK4 step
    double trackLimit = 2.4;       // |x| beyond this ends the episode
    double groundMargin = 0.1;     // m, 10 px at 100 px/m above the ground line
    double initialJitter = 0.025;  // rad, uniform half-width for angles and rates
};

struct PPOConfig {
    int epochs = 10;
    int batchSize = 64;
    float gamma = 0.99f;
    float gaeLambda = 0.95f;
    float clipEpsilon = 0.2f;
    float entropyCoef = 0.01f;
    float actorLr = 3e-4f;
    float criticLr = 1e-3f;

    // Off by default: one permutation is drawn before the epoch loop and
    // reused, and advantages are fed to the update unnormalized.
    bool reshuffleEachEpoch = false;
    bool normalizeAdvantages = false;
};

struct TrainingConfig {
    int numPoles = 1;
    int hiddenWidth = 64;
    float initialLogStd = -0.5f;

    int tickIntervalMs = 20;
    double timeScale = 1.0;        // multiplies measured wall-clock time
    bool asyncUpdates = true;
    int maxPendingUpdates = 4;
    int divergenceWarningThreshold = 10;

    std::uint32_t seed = 0;        // 0 = seed from std::random_device

    PhysicsConfig physics;
    PPOConfig ppo;

    bool isValid(std::string* error = nullptr) const;
};

#endif // TRAININGCONFIG_H
