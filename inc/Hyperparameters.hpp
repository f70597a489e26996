#pragma once

#include <optional>
#include <cstdlib>
#include <cstdint>
#include <string>

using std::optional;
using std::string;

namespace SoftRacer {

class Hyperparameters {
public:
    // Discount rate of the bootstrapped Q target
    float gamma = 0.99;

    // Polyak rate for the V target network
    float tau = 5e-3;

    // Entropy weight, only used when auto_entropy_tuning is off
    float w_entropy = 1e-3;
    bool auto_entropy_tuning = true;

    // Defaults to -action_dim when unset
    optional<float> target_entropy;

    // Actor regularization, each weighted independently
    float w_mean_reg = 0;
    float w_std_reg = 0;
    float w_pre_activation_reg = 0;

    float lr_actor = 3e-4;
    float lr_vf = 3e-4;
    float lr_qf_1 = 3e-4;
    float lr_qf_2 = 3e-4;
    float lr_entropy = 3e-4;
    float weight_decay = 0;

    // The actor is only stepped (and the V target only synced) every n-th update
    size_t policy_update_freq = 2;
    size_t batch_size = 32;

    // Capacity of the flat transition store, in transitions
    size_t buffer_size = 1'000'000;

    // Capacity of the sequence store in episodes, and the length of each sampled window
    size_t episode_size = 1'000;
    size_t step_size = 16;

    // Warm-up thresholds. Random actions are taken for the first initial_random_action env steps, and no update
    // happens until the store holds at least prefill_buffer transitions
    size_t initial_random_action = 10'000;
    size_t prefill_buffer = 10'000;

    // Number of consecutive updates per env step once warmed up
    size_t multiple_learn = 1;

    // Early braking demonstration bias: a gaussian bump over the first brake_region total steps
    bool brake_enable = false;
    size_t brake_region = 200'000;
    float brake_dist_mu = 100'000;
    float brake_dist_sigma = 30'000;
    float brake_factor = 0.1;

    size_t hidden_size = 256;
    size_t n_hidden_layers = 3;

    // Only used by the recurrent variant
    size_t lstm_size = 256;
    bool recurrent = false;

    size_t n_episodes = 5000;
    size_t max_episode_steps = 1000;
    size_t save_period = 100;
    size_t test_period = 100;
    size_t relaunch_period = 10;
    size_t interim_test_num = 1;

    uint64_t seed = 777;

    // Append one record per episode to the train.log file in the output directory
    bool log = true;

    // For now just controls the stderr log during training
    bool silent = true;

    /**
     * Check every field once, throw on the first invalid value. Nothing downstream re-checks these.
     */
    void validate() const;

    // All fields as space separated key=value pairs, for the head of the log file
    [[nodiscard]] string to_string() const;
};


}
