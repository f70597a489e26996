#pragma once

#include <torch/torch.h>
#include <random>
#include <vector>

using std::mt19937;
using std::vector;

using torch::Tensor;


namespace SoftRacer{

/**
 * One environment step. State tensors are 1d with shape [D], actions 1d with shape [A]
 */
class Transition{
public:
    Tensor state;
    Tensor action;
    float reward = 0;
    Tensor next_state;

    // Already rewritten for step-cap truncation before it reaches a store
    bool done = false;
};


/**
 * Column-wise batch of transitions. Flat sampling gives [B,D] states, [B,A] actions and [B,1] rewards/dones.
 * Sequence sampling adds a time dimension after the batch dimension: [B,S,D], [B,S,A], [B,S,1].
 */
class TransitionBatch{
public:
    Tensor states;
    Tensor actions;
    Tensor rewards;
    Tensor next_states;
    Tensor dones;

    [[nodiscard]] int64_t get_batch_size() const;
    [[nodiscard]] TransitionBatch to(const torch::Device& device) const;
};


/**
 * Fixed capacity storage of interaction history. Not thread safe, only ever touched by the training loop.
 */
class ExperienceStore{
public:
    virtual ~ExperienceStore() = default;

    // O(1), stores at the current circular write position
    virtual void add(const Transition& transition)=0;

    // Called by the training loop at the end of every episode, regardless of how it ended
    virtual void end_episode()=0;

    // Throws if the store is not yet able to produce a full batch
    [[nodiscard]] virtual TransitionBatch sample()=0;

    // Number of transitions available to sample() (excludes any open, uncommitted episode)
    [[nodiscard]] virtual size_t size() const=0;
};


/**
 * Flat circular buffer of transitions. Batches are drawn uniformly, without replacement within a batch.
 */
class ReplayBuffer: public ExperienceStore{
    vector<Transition> transitions;
    size_t capacity;
    size_t batch_size;

    // Monotonic count of all adds, the write position is this mod capacity
    size_t n_added;

    mt19937 generator;

    void sample_indices(vector<size_t>& indices);

public:
    ReplayBuffer(size_t capacity, size_t batch_size, uint64_t seed);

    void add(const Transition& transition) override;
    void end_episode() override;
    [[nodiscard]] TransitionBatch sample() override;
    [[nodiscard]] size_t size() const override;

    // Index is into the underlying circular storage, not in insertion order
    [[nodiscard]] const Transition& at(size_t i) const;
    [[nodiscard]] size_t get_capacity() const;
};


/**
 * Circular buffer of whole episodes for recurrent training. Transitions accumulate into an open episode which is
 * committed by end_episode(). Batches are fixed-length contiguous windows, each drawn from a uniformly chosen stored
 * episode (with replacement across the batch) so that hidden states can be threaded through the window in order.
 */
class EpisodeBuffer: public ExperienceStore{
    vector<vector<Transition> > episodes;
    vector<Transition> open_episode;

    size_t capacity;
    size_t batch_size;
    size_t step_size;

    size_t n_committed;
    size_t n_transitions;

    mt19937 generator;

public:
    EpisodeBuffer(size_t capacity, size_t batch_size, size_t step_size, uint64_t seed);

    void add(const Transition& transition) override;

    // Episodes shorter than step_size can never supply a window, so they are dropped here
    void end_episode() override;

    [[nodiscard]] TransitionBatch sample() override;
    [[nodiscard]] size_t size() const override;

    [[nodiscard]] size_t get_n_episodes() const;
    [[nodiscard]] const vector<Transition>& get_episode(size_t i) const;
};


}
