#pragma once

#include <torch/torch.h>
#include <string>


namespace SoftRacer{

std::string get_timestamp();

/**
 * Polyak interpolation of every parameter in target toward source: θ_target ← τ·θ_source + (1-τ)·θ_target. The two
 * modules must be structural copies of each other (same parameter count and shapes, same registration order)
 * @param source the module being trained by gradient descent
 * @param target the module which is only ever moved by interpolation
 * @param tau interpolation rate in (0,1]
 */
void soft_update(const torch::nn::Module& source, torch::nn::Module& target, float tau);

// Copy all parameters and buffers from source into target
void hard_update(const torch::nn::Module& source, torch::nn::Module& target);

/**
 * Transitions which end because the step cap was hit are not real terminal states, so they are stored as
 * non-terminal to keep the bootstrap target intact.
 * @param done the raw done flag reported by the environment
 * @param episode_step 1-based index of the step that produced this transition
 * @param max_episode_steps the step cap of an episode
 * @return the done flag to store
 */
bool rewrite_done(bool done, size_t episode_step, size_t max_episode_steps);


}
