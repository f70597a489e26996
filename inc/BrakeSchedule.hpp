#pragma once

#include "Hyperparameters.hpp"

#include <cstdlib>


namespace SoftRacer{


/**
 * Probability curve for overriding the agent's action with a brake early in training. The curve is a gaussian bump
 * exp(-(x-μ)²/2σ²) scaled by brake_factor, evaluated on brake_region evenly spaced points spanning [0,brake_region],
 * one per total env step. Zero outside of the region.
 */
class BrakeSchedule{
    size_t region;
    double mu;
    double sigma;
    double factor;

public:
    BrakeSchedule(size_t region, double mu, double sigma, double factor);
    explicit BrakeSchedule(const Hyperparameters& hyperparams);

    [[nodiscard]] double probability(size_t total_step) const;
};


}
