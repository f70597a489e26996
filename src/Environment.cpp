#include "Environment.hpp"

#include <stdexcept>
#include <vector>

using std::runtime_error;
using std::vector;


namespace SoftRacer{

Environment::Environment(int64_t state_dim, int64_t action_dim, uint64_t seed):
    state_dim(state_dim),
    action_dim(action_dim),
    generator(seed)
{
    if (state_dim < 1 or action_dim < 1){
        throw runtime_error("ERROR: Environment state_dim and action_dim must be at least 1");
    }
}


Tensor Environment::sample_action(){
    std::uniform_real_distribution<float> dist(-1, 1);

    vector<float> action(action_dim);
    for (auto& a: action){
        a = dist(generator);
    }

    return torch::tensor(action, torch::kFloat32);
}


Tensor Environment::try_brake(const Tensor& action) const{
    if (action.numel() != action_dim){
        throw runtime_error("ERROR: try_brake expected action of size " + std::to_string(action_dim) + ", got " + std::to_string(action.numel()));
    }

    auto result = action.clone();

    // With a combined throttle/brake channel, -1 is a full brake
    if (action_dim > ACCELERATE){
        result[ACCELERATE] = -1;
    }
    if (action_dim > BRAKE){
        result[BRAKE] = 1;
    }

    return result;
}


int64_t Environment::get_state_dim() const{
    return state_dim;
}


int64_t Environment::get_action_dim() const{
    return action_dim;
}


}
