#include "BrakeSchedule.hpp"

#include <stdexcept>
#include <algorithm>
#include <cmath>

using std::runtime_error;


namespace SoftRacer{


BrakeSchedule::BrakeSchedule(size_t region, double mu, double sigma, double factor):
    region(region),
    mu(mu),
    sigma(sigma),
    factor(factor)
{
    if (region < 2){
        throw runtime_error("ERROR: BrakeSchedule region must span at least 2 steps");
    }
    if (sigma <= 0){
        throw runtime_error("ERROR: BrakeSchedule sigma must be positive");
    }
}


BrakeSchedule::BrakeSchedule(const Hyperparameters& hyperparams):
    BrakeSchedule(
        std::max(hyperparams.brake_region, size_t(2)),
        hyperparams.brake_dist_mu,
        hyperparams.brake_dist_sigma,
        hyperparams.brake_factor)
{}


double BrakeSchedule::probability(size_t total_step) const{
    if (total_step >= region){
        return 0;
    }

    // Same spacing as linspace(0, region, region)
    double x = double(total_step) * double(region) / double(region - 1);

    return factor * std::exp(-std::pow(x - mu, 2) / (2*std::pow(sigma, 2)));
}


}
