#include "misc.hpp"

#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <ctime>

using std::runtime_error;
using std::to_string;


namespace SoftRacer{

std::string get_timestamp() {
    std::ostringstream oss;
    std::time_t t = std::time(nullptr);
    oss << std::put_time(std::localtime(&t), "%Y-%m-%d_%H-%M-%S");
    return oss.str();
}


void soft_update(const torch::nn::Module& source, torch::nn::Module& target, float tau){
    if (tau <= 0 or tau > 1){
        throw runtime_error("ERROR: soft_update tau must be in range (0,1]");
    }

    torch::NoGradGuard no_grad;

    auto source_params = source.parameters();
    auto target_params = target.parameters();

    if (source_params.size() != target_params.size()){
        throw runtime_error("ERROR: soft_update parameter count mismatch: " + to_string(source_params.size()) + " != " + to_string(target_params.size()));
    }

    for (size_t i=0; i<target_params.size(); i++) {
        auto& p_source = source_params[i];
        auto& p_target = target_params[i];

        if (p_source.sizes() != p_target.sizes()){
            throw runtime_error("ERROR: soft_update parameter shape mismatch at index " + to_string(i));
        }

        p_target.mul_(1 - tau).add_(p_source, tau);
    }
}


void hard_update(const torch::nn::Module& source, torch::nn::Module& target){
    torch::NoGradGuard no_grad;

    auto source_params = source.parameters();
    auto target_params = target.parameters();
    auto source_buffers = source.buffers();
    auto target_buffers = target.buffers();

    if (source_params.size() != target_params.size() or source_buffers.size() != target_buffers.size()){
        throw runtime_error("ERROR: hard_update modules are not structural copies");
    }

    for (size_t i=0; i<target_params.size(); i++) {
        target_params[i].copy_(source_params[i]);
    }

    for (size_t i=0; i<target_buffers.size(); i++) {
        target_buffers[i].copy_(source_buffers[i]);
    }
}


bool rewrite_done(bool done, size_t episode_step, size_t max_episode_steps){
    if (episode_step == max_episode_steps){
        return false;
    }

    return done;
}


}
