#pragma once

#include <torch/torch.h>
#include <string>
#include <random>

using std::string;
using std::mt19937;
using torch::Tensor;


namespace SoftRacer{


class StepResult{
public:
    Tensor next_state;
    float reward = 0;
    bool done = false;
};


/**
 * A driving simulator with a continuous [-1,1] box action space. Calls are blocking and single threaded; any failure
 * is thrown and ends the run.
 */
class Environment{
protected:
    int64_t state_dim;
    int64_t action_dim;
    mt19937 generator;

    Environment(int64_t state_dim, int64_t action_dim, uint64_t seed);

public:
    // Action channel layout shared by all driving environments, a channel may be absent if action_dim is smaller
    static const int64_t STEER = 0;
    static const int64_t ACCELERATE = 1;
    static const int64_t BRAKE = 2;

    virtual ~Environment() = default;

    /**
     * Start a new episode and return the first observation
     * @param relaunch restart the simulator itself, not just the race
     * @param sample_track draw a new track for this episode
     * @param render whether the simulator should display the race
     */
    virtual Tensor reset(bool relaunch, bool sample_track, bool render)=0;

    // The action tensor has shape [action_dim]
    virtual StepResult step(const Tensor& action)=0;

    // Uniform sample from the action space
    virtual Tensor sample_action();

    // Override the throttle/brake channels of an action with a full brake, other channels untouched
    [[nodiscard]] virtual Tensor try_brake(const Tensor& action) const;

    [[nodiscard]] virtual string get_track_name() const=0;

    // km/h at the most recent step
    [[nodiscard]] virtual float get_last_speed() const=0;

    // 1 is leading
    [[nodiscard]] virtual int64_t get_race_position() const=0;

    virtual void close()=0;

    [[nodiscard]] int64_t get_state_dim() const;
    [[nodiscard]] int64_t get_action_dim() const;
};

}
