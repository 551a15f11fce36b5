#include "TrainingConfig.h"

namespace {

bool fail(std::string* error, const char* message)
{
    if (error) *error = message;
    return false;
}

}

bool TrainingConfig::isValid(std::string* error) const
{
    if (numPoles < 1) return fail(error, "numPoles must be >= 1");
    if (hiddenWidth < 1) return fail(error, "hiddenWidth must be >= 1");
    if (tickIntervalMs < 1) return fail(error, "tickIntervalMs must be >= 1");
    if (!(timeScale > 0.0)) return fail(error, "timeScale must be > 0");
    if (maxPendingUpdates < 1) return fail(error, "maxPendingUpdates must be >= 1");
    if (divergenceWarningThreshold < 1) return fail(error, "divergenceWarningThreshold must be >= 1");

    if (!(physics.dt > 0.0)) return fail(error, "physics.dt must be > 0");
    if (!(physics.poleLength > 0.0)) return fail(error, "physics.poleLength must be > 0");
    if (!(physics.massCart > 0.0) || physics.massPole < 0.0)
        return fail(error, "physics masses must be positive");
    if (physics.initialJitter < 0.0) return fail(error, "physics.initialJitter must be >= 0");

    if (ppo.epochs < 1) return fail(error, "ppo.epochs must be >= 1");
    if (ppo.batchSize < 1) return fail(error, "ppo.batchSize must be >= 1");
    if (!(ppo.clipEpsilon > 0.0f && ppo.clipEpsilon < 1.0f))
        return fail(error, "ppo.clipEpsilon must be in (0, 1)");
    if (!(ppo.actorLr > 0.0f) || !(ppo.criticLr > 0.0f))
        return fail(error, "learning rates must be > 0");
    if (!(ppo.gamma >= 0.0f && ppo.gamma <= 1.0f)) return fail(error, "ppo.gamma must be in [0, 1]");
    if (!(ppo.gaeLambda >= 0.0f && ppo.gaeLambda <= 1.0f))
        return fail(error, "ppo.gaeLambda must be in [0, 1]");
    if (!(ppo.entropyCoef >= 0.0f)) return fail(error, "ppo.entropyCoef must be >= 0");

    return true;
}
