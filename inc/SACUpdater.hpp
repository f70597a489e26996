#pragma once

#include "Hyperparameters.hpp"
#include "ReplayBuffer.hpp"
#include "SACLosses.hpp"
#include "Policy.hpp"

#include <torch/torch.h>
#include <filesystem>
#include <memory>

using std::filesystem::path;
using std::unique_ptr;
using std::shared_ptr;


namespace SoftRacer{


/**
 * The fixed set of networks trained by SAC with a state value critic. vf_target is a structural copy of vf which is
 * never stepped by an optimizer, only interpolated toward vf.
 */
class SACNetworks{
public:
    shared_ptr<TanhGaussianPolicy> actor;
    shared_ptr<QNet> qf_1;
    shared_ptr<QNet> qf_2;
    shared_ptr<ValueNet> vf;
    shared_ptr<ValueNet> vf_target;

    /**
     * Construct all five networks with the shapes given by hyperparams (stateless or recurrent per
     * hyperparams.recurrent), move them to device and hard copy vf into vf_target
     */
    static SACNetworks build(int64_t state_dim, int64_t action_dim, const Hyperparameters& hyperparams, const torch::Device& device);

    // Throws if any network is null or if stateless and recurrent networks are mixed
    [[nodiscard]] Recurrence get_recurrence() const;
};


/**
 * Performs one SAC update per call on a sampled batch, in a fixed order:
 * 1. entropy weight step (if auto tuning)
 * 2. twin Q critic steps toward r + γ·V_target(s')·(1-done)
 * 3. V critic step toward min(Q1,Q2)(s,ã) - α·logπ(ã|s) with ã resampled from the current policy
 * 4. every policy_update_freq calls: actor step, then V target soft update
 *
 * The same engine serves stateless and recurrent networks. Recurrent batches are [B,S,...] windows and every network
 * call within an update starts from its own zeroed hidden state.
 */
class SACUpdater{
    Hyperparameters hyperparams;
    SACNetworks networks;
    Recurrence recurrence;
    torch::Device device;

    torch::optim::Adam optimizer_actor;
    torch::optim::Adam optimizer_qf_1;
    torch::optim::Adam optimizer_qf_2;
    torch::optim::Adam optimizer_vf;

    // Only allocated with automatic entropy tuning, α = exp(log_alpha)
    Tensor log_alpha;
    unique_ptr<torch::optim::Adam> optimizer_alpha;

    float alpha;
    float target_entropy;

    // Incremented at the start of every update() call
    size_t update_step;

    [[nodiscard]] LSTMState fresh_hidden(const Approximator& model, int64_t batch_size) const;

public:
    /**
     * @param hyperparams validated here, read only afterwards
     * @param networks must all be non-null and share the same recurrence
     * @param action_dim used for the default target entropy (-action_dim)
     * @param device where the networks live, batches are moved here before use
     */
    SACUpdater(const Hyperparameters& hyperparams, const SACNetworks& networks, int64_t action_dim, const torch::Device& device);

    /**
     * @param batch from ReplayBuffer ([B,...]) for stateless networks or EpisodeBuffer ([B,S,...]) for recurrent
     * @return the five losses of this update, actor loss is 0 when the policy step was skipped
     */
    SACLosses update(const TransitionBatch& batch);

    // Single archive with keys actor, qf_1, qf_2, vf, vf_target, actor_optim, qf_1_optim, qf_2_optim, vf_optim, and
    // alpha_optim + log_alpha when auto tuning
    void save(const path& output_path) const;

    /**
     * A nonexistent path is reported and skipped, leaving the current parameters as they are. A checkpoint missing a
     * required key throws before any parameter is touched.
     * @return true if anything was loaded
     */
    bool load(const path& input_path);

    [[nodiscard]] float get_alpha() const;
    [[nodiscard]] float get_target_entropy() const;
    [[nodiscard]] size_t get_update_step() const;
    [[nodiscard]] Recurrence get_recurrence() const;
    [[nodiscard]] const SACNetworks& get_networks() const;
};


}
