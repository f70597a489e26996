#pragma once

#include "Hyperparameters.hpp"
#include "BrakeSchedule.hpp"
#include "ReplayBuffer.hpp"
#include "Environment.hpp"
#include "TrainingLog.hpp"
#include "SACUpdater.hpp"
#include "Policy.hpp"
#include "misc.hpp"

#include <filesystem>
#include <optional>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <memory>
#include <random>
#include <vector>

using std::filesystem::path;
using std::make_unique;
using std::unique_ptr;
using std::shared_ptr;
using std::optional;
using std::ofstream;
using std::vector;
using std::cerr;


namespace SoftRacer{


/**
 * Object which handles the training and testing of the SAC RL model/algorithm. Owns the experience store (flat or
 * episodic, matching the recurrence of the networks) and drives the environment, delegating every parameter update
 * to SACUpdater.
 */
class SACAgent {
    Hyperparameters hyperparams;
    SACUpdater updater;
    unique_ptr<ExperienceStore> memory;
    optional<BrakeSchedule> brake_schedule;
    torch::Device device;
    mt19937 generator;

    // Actor state carried from step to step within one rollout, reset at the start of every episode
    LSTMState rollout_hidden;

    // When false every episode reuses the environment's current track
    bool sample_track;

    size_t total_step;
    size_t episode_step;
    size_t i_episode;

    inline static unique_ptr<ExperienceStore> build_memory(const Hyperparameters& hyperparams);
    inline void reset_rollout();
    inline void write_log(ofstream& log_file, const EpisodeStats& stats, const Environment& env) const;
    inline double run_test_episode(shared_ptr<Environment> env, size_t& n_steps);

public:
    /**
     * @param hyperparams warm-up, schedules and periods. To resume from a checkpoint without random warm-up, set
     * initial_random_action to 0 before constructing the agent.
     * @param networks the five networks, all stateless or all recurrent
     * @param action_dim dimension of the environment's action space
     * @param device where the networks live
     */
    inline SACAgent(const Hyperparameters& hyperparams, const SACNetworks& networks, int64_t action_dim, const torch::Device& device);

    /**
     * Uniform random during the initial warm-up (training only), otherwise sampled from the actor, or the actor's mode
     * if deterministic
     * @param state 1d observation [D]
     * @return 1d action [A] on the CPU
     */
    inline Tensor select_action(const Tensor& state, Environment& env, bool deterministic);

    /**
     * Run n_episodes training episodes, checkpointing into output_dir every save_period episodes and evaluating every
     * test_period. The run always ends with a final checkpoint and evaluation, and then the environment is closed.
     */
    inline void train(shared_ptr<Environment> env, const path& output_dir);

    // interim_test_num deterministic episodes without learning, then close the environment
    inline void test(shared_ptr<Environment> env);

    // interim_test_num deterministic episodes without learning, returns the score of each
    inline vector<double> interim_test(shared_ptr<Environment> env);

    // Pin all training and test episodes to the track the environment was built with
    inline void set_sample_track(bool value);

    inline void save(const path& output_path) const;
    inline bool load(const path& input_path);

    [[nodiscard]] inline const ExperienceStore& get_memory() const;
    [[nodiscard]] inline const SACUpdater& get_updater() const;
    [[nodiscard]] inline size_t get_total_step() const;
    [[nodiscard]] inline size_t get_episode_step() const;
};


unique_ptr<ExperienceStore> SACAgent::build_memory(const Hyperparameters& hyperparams){
    if (hyperparams.recurrent){
        return make_unique<EpisodeBuffer>(hyperparams.episode_size, hyperparams.batch_size, hyperparams.step_size, hyperparams.seed);
    }
    else{
        return make_unique<ReplayBuffer>(hyperparams.buffer_size, hyperparams.batch_size, hyperparams.seed);
    }
}


SACAgent::SACAgent(const Hyperparameters& hyperparams, const SACNetworks& networks, int64_t action_dim, const torch::Device& device):
        hyperparams(hyperparams),
        updater(hyperparams, networks, action_dim, device),
        memory(build_memory(hyperparams)),
        device(device),
        generator(hyperparams.seed),
        sample_track(true),
        total_step(0),
        episode_step(0),
        i_episode(0)
{
    if (hyperparams.brake_enable){
        brake_schedule.emplace(hyperparams);
    }
}


void SACAgent::reset_rollout(){
    rollout_hidden = updater.get_networks().actor->init_hidden(1);
}


Tensor SACAgent::select_action(const Tensor& state, Environment& env, bool deterministic){
    if (total_step < hyperparams.initial_random_action and not deterministic){
        return env.sample_action();
    }

    torch::NoGradGuard no_grad;

    auto& actor = *updater.get_networks().actor;

    // Batch of 1, and a sequence of length 1 for recurrent actors
    auto input = state.to(device, torch::kFloat32);
    input = actor.is_recurrent() ? input.view({1,1,-1}) : input.view({1,-1});

    Tensor action;
    if (deterministic){
        action = actor.mode(input, rollout_hidden);
    }
    else{
        action = actor.forward(input, rollout_hidden).action;
    }

    return action.reshape({-1}).to(torch::kCPU);
}


void SACAgent::write_log(ofstream& log_file, const EpisodeStats& stats, const Environment& env) const{
    auto losses = stats.get_mean_losses();

    if (not hyperparams.silent) {
        cerr << std::setprecision(3) << std::left
        << std::setw(7) << i_episode
        << std::setw(6) << episode_step
        << std::setw(10) << total_step
        << std::setw(6) << "score" << std::setw(10) << stats.get_score()
        << std::setw(6) << "l_pi" << std::setw(12) << losses.actor*float(hyperparams.policy_update_freq)
        << std::setw(6) << "l_q1" << std::setw(12) << losses.qf_1
        << std::setw(6) << "l_q2" << std::setw(12) << losses.qf_2
        << std::setw(5) << "l_v" << std::setw(12) << losses.vf
        << std::setw(8) << "l_alpha" << std::setw(12) << losses.alpha
        << std::setw(6) << "alpha" << std::setw(10) << updater.get_alpha()
        << std::setw(11) << env.get_track_name()
        << std::setw(4) << "pos" << std::setw(3) << env.get_race_position()
        << std::setw(10) << "max_speed" << std::setw(8) << stats.get_max_speed()
        << std::setw(10) << "avg_speed" << std::setw(8) << stats.get_avg_speed() << '\n';
    }

    // Episodes spent entirely in warm-up have no losses to report
    if (hyperparams.log and stats.has_losses()){
        log_file << format_log_record(
                i_episode,
                episode_step,
                total_step,
                stats,
                hyperparams.policy_update_freq,
                env.get_track_name(),
                env.get_race_position()) << '\n';
    }
}


void SACAgent::train(shared_ptr<Environment> env, const path& output_dir){
    if (!env) {
        throw std::runtime_error("ERROR: SACAgent::train Environment pointer is null");
    }

    if (not std::filesystem::exists(output_dir)) {
        std::filesystem::create_directories(output_dir);
    }

    ofstream log_file;

    if (hyperparams.log){
        path log_path = output_dir / "train.log";
        log_file.open(log_path);

        if (not log_file.is_open() or not log_file.good()){
            throw std::runtime_error("ERROR: could not write file: " + log_path.string());
        }

        log_file << "output_dir=" << output_dir.string() << " device=" << device.str() << '\n';
        log_file << hyperparams.to_string() << '\n';
    }

    std::uniform_real_distribution<double> uniform(0,1);
    EpisodeStats stats;

    for (i_episode=1; i_episode<=hyperparams.n_episodes; i_episode++){
        bool relaunch = (i_episode - 1) % hyperparams.relaunch_period == 0;
        auto state = env->reset(relaunch, sample_track, false);

        reset_rollout();
        episode_step = 0;
        stats.clear();

        bool done = false;

        while (not done and episode_step < hyperparams.max_episode_steps){
            auto action = select_action(state, *env, false);

            if (brake_schedule and uniform(generator) < brake_schedule->probability(total_step)){
                action = env->try_brake(action);
            }

            auto result = env->step(action);
            total_step++;
            episode_step++;

            Transition transition;
            transition.state = state;
            transition.action = action;
            transition.reward = result.reward;
            transition.next_state = result.next_state;
            transition.done = rewrite_done(result.done, episode_step, hyperparams.max_episode_steps);

            memory->add(transition);

            state = result.next_state;
            done = result.done;

            stats.add_step(result.reward, env->get_last_speed());

            auto n = memory->size();
            if (n >= hyperparams.batch_size and n >= hyperparams.prefill_buffer){
                for (size_t i=0; i<hyperparams.multiple_learn; i++){
                    stats.add_losses(updater.update(memory->sample()));
                }
            }
        }

        memory->end_episode();

        write_log(log_file, stats, *env);

        if (i_episode % hyperparams.save_period == 0){
            save(output_dir / ("checkpoint_ep" + std::to_string(i_episode) + ".pt"));
        }
        if (i_episode % hyperparams.test_period == 0){
            interim_test(env);
        }
    }

    save(output_dir / ("checkpoint_ep" + std::to_string(hyperparams.n_episodes) + ".pt"));
    interim_test(env);

    env->close();
}


double SACAgent::run_test_episode(shared_ptr<Environment> env, size_t& n_steps){
    auto state = env->reset(false, sample_track, false);
    reset_rollout();

    double score = 0;
    bool done = false;
    n_steps = 0;

    while (not done and n_steps < hyperparams.max_episode_steps){
        auto action = select_action(state, *env, true);
        auto result = env->step(action);

        state = result.next_state;
        done = result.done;
        score += result.reward;
        n_steps++;
    }

    return score;
}


vector<double> SACAgent::interim_test(shared_ptr<Environment> env){
    if (!env) {
        throw std::runtime_error("ERROR: SACAgent::interim_test Environment pointer is null");
    }

    vector<double> scores;

    for (size_t i=0; i<hyperparams.interim_test_num; i++){
        size_t n_steps;
        auto score = run_test_episode(env, n_steps);
        scores.emplace_back(score);

        cerr << "INFO: test " << i + 1 << '/' << hyperparams.interim_test_num
             << " score " << score
             << " steps " << n_steps
             << " track " << env->get_track_name()
             << " position " << env->get_race_position() << '\n';
    }

    return scores;
}


void SACAgent::test(shared_ptr<Environment> env){
    if (!env) {
        throw std::runtime_error("ERROR: SACAgent::test Environment pointer is null");
    }

    interim_test(env);
    env->close();
}


void SACAgent::save(const path& output_path) const{
    auto parent = output_path.parent_path();

    if (not parent.empty() and not std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }

    updater.save(output_path);

    cerr << "INFO: saved checkpoint " << output_path << '\n';
}


void SACAgent::set_sample_track(bool value){
    sample_track = value;
}


bool SACAgent::load(const path& input_path){
    return updater.load(input_path);
}


const ExperienceStore& SACAgent::get_memory() const{
    return *memory;
}


const SACUpdater& SACAgent::get_updater() const{
    return updater;
}


size_t SACAgent::get_total_step() const{
    return total_step;
}


size_t SACAgent::get_episode_step() const{
    return episode_step;
}


}
