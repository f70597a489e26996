#include "cpptrace/from_current.hpp"
#include "Hyperparameters.hpp"
#include "SACUpdater.hpp"
#include "SACAgent.hpp"
#include "TrackEnv.hpp"
#include "misc.hpp"

#include <CLI/CLI.hpp>

#include <filesystem>
#include <stdexcept>
#include <iostream>
#include <memory>
#include <string>

using std::filesystem::path;
using std::runtime_error;
using std::make_shared;
using std::string;
using std::cerr;

using namespace SoftRacer;


void train_or_test(Hyperparameters& hyperparams, path output_dir, const string& load_from, bool test, const string& track, const string& device_name){
    hyperparams.validate();

    torch::manual_seed(hyperparams.seed);
    torch::Device device(device_name);

    if (output_dir.empty()){
        output_dir = std::filesystem::weakly_canonical("output") / get_timestamp();
    }

    // A resumed run starts acting with the loaded policy right away
    if (not load_from.empty()){
        hyperparams.initial_random_action = 0;
    }

    // Without a track every episode draws a new one, starting from the oval
    auto env = make_shared<TrackEnv>(hyperparams.max_episode_steps, hyperparams.seed, track.empty() ? "oval" : track);

    auto networks = SACNetworks::build(env->get_state_dim(), env->get_action_dim(), hyperparams, device);

    cerr << "state space: " << env->get_state_dim() << '\n';
    cerr << "action space: " << env->get_action_dim() << '\n';

    SACAgent agent(hyperparams, networks, env->get_action_dim(), device);
    agent.set_sample_track(track.empty());

    if (not load_from.empty()){
        agent.load(load_from);
    }

    if (test){
        agent.test(env);
    }
    else{
        cerr << "INFO: writing to " << output_dir << '\n';
        agent.train(env, output_dir);
    }
}


int main(int argc, char* argv[]){
    CLI::App app{"Train a soft actor-critic driving policy"};
    Hyperparameters params;
    params.silent = false;

    path output_dir;
    string load_from;
    bool test = false;
    string track;
    string device = "cpu";
    float target_entropy = 0;

    app.add_option(
            "--output_dir",
            output_dir,
            "Directory for checkpoints and train.log, defaults to output/<timestamp>");

    app.add_option(
            "--load_from",
            load_from,
            "Checkpoint to resume from. Disables the initial random actions");

    app.add_flag(
            "--test",
            test,
            "Only run deterministic test episodes with the loaded policy");

    app.add_option(
            "--track",
            track,
            "Drive only this track: oval, speedway or technical. By default a new track is sampled every episode");

    app.add_option(
            "--device",
            device,
            "Torch device, e.g. cpu or cuda");

    app.add_option(
            "--gamma",
            params.gamma,
            "gamma");

    app.add_option(
            "--tau",
            params.tau,
            "Soft update rate of the V target");

    app.add_option(
            "--w_entropy",
            params.w_entropy,
            "Fixed entropy weight, only used without auto entropy tuning");

    app.add_option(
            "--auto_entropy_tuning",
            params.auto_entropy_tuning,
            "Learn the entropy weight (true/false)");

    auto* target_entropy_option = app.add_option(
            "--target_entropy",
            target_entropy,
            "Target entropy for auto tuning, defaults to -action_dim");

    app.add_option(
            "--w_mean_reg",
            params.w_mean_reg,
            "Weight of the squared mean penalty on the actor");

    app.add_option(
            "--w_std_reg",
            params.w_std_reg,
            "Weight of the squared std penalty on the actor");

    app.add_option(
            "--w_pre_activation_reg",
            params.w_pre_activation_reg,
            "Weight of the squared pre-tanh penalty on the actor");

    app.add_option(
            "--lr_actor",
            params.lr_actor,
            "lr_actor");

    app.add_option(
            "--lr_vf",
            params.lr_vf,
            "lr_vf");

    app.add_option(
            "--lr_qf_1",
            params.lr_qf_1,
            "lr_qf_1");

    app.add_option(
            "--lr_qf_2",
            params.lr_qf_2,
            "lr_qf_2");

    app.add_option(
            "--lr_entropy",
            params.lr_entropy,
            "lr_entropy");

    app.add_option(
            "--weight_decay",
            params.weight_decay,
            "Adam weight decay, shared by all networks");

    app.add_option(
            "--policy_update_freq",
            params.policy_update_freq,
            "Update the actor and V target once every n updates");

    app.add_option(
            "--batch_size",
            params.batch_size,
            "batch_size");

    app.add_option(
            "--buffer_size",
            params.buffer_size,
            "Capacity of the flat replay buffer, in transitions");

    app.add_option(
            "--episode_size",
            params.episode_size,
            "Capacity of the episode buffer, in episodes, ONLY FOR RECURRENT");

    app.add_option(
            "--step_size",
            params.step_size,
            "Length of each sampled sequence, ONLY FOR RECURRENT");

    app.add_option(
            "--initial_random_action",
            params.initial_random_action,
            "Number of env steps with uniformly random actions");

    app.add_option(
            "--prefill_buffer",
            params.prefill_buffer,
            "Minimum number of stored transitions before updating");

    app.add_option(
            "--multiple_learn",
            params.multiple_learn,
            "Number of updates per env step");

    app.add_option(
            "--brake_enable",
            params.brake_enable,
            "Randomly override actions with a full brake early in training (true/false)");

    app.add_option(
            "--brake_region",
            params.brake_region,
            "Number of total env steps covered by the brake schedule");

    app.add_option(
            "--brake_dist_mu",
            params.brake_dist_mu,
            "Center of the brake schedule, in env steps");

    app.add_option(
            "--brake_dist_sigma",
            params.brake_dist_sigma,
            "Width of the brake schedule, in env steps");

    app.add_option(
            "--brake_factor",
            params.brake_factor,
            "Peak brake probability");

    app.add_option(
            "--hidden_size",
            params.hidden_size,
            "hidden_size");

    app.add_option(
            "--n_hidden_layers",
            params.n_hidden_layers,
            "n_hidden_layers");

    app.add_option(
            "--lstm_size",
            params.lstm_size,
            "lstm_size, ONLY FOR RECURRENT");

    app.add_flag(
            "--recurrent",
            params.recurrent,
            "Use LSTM networks trained on sequences from the episode buffer");

    app.add_option(
            "--n_episodes",
            params.n_episodes,
            "n_episodes");

    app.add_option(
            "--max_episode_steps",
            params.max_episode_steps,
            "max_episode_steps");

    app.add_option(
            "--save_period",
            params.save_period,
            "Checkpoint every n episodes");

    app.add_option(
            "--test_period",
            params.test_period,
            "Run test episodes every n episodes");

    app.add_option(
            "--relaunch_period",
            params.relaunch_period,
            "Relaunch the simulator every n episodes");

    app.add_option(
            "--interim_test_num",
            params.interim_test_num,
            "Number of episodes per test");

    app.add_option(
            "--seed",
            params.seed,
            "seed");

    app.add_option(
            "--log",
            params.log,
            "Write train.log in the output directory (true/false)");

    app.add_option(
            "--silent",
            params.silent,
            "Suppress the per episode stderr log (true/false)");

    try{
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    if (target_entropy_option->count() > 0) {
        params.target_entropy = target_entropy;
    }

    int status = 0;

    CPPTRACE_TRY {
        train_or_test(params, output_dir, load_from, test, track, device);
    } CPPTRACE_CATCH(const std::exception& e) {
        std::cerr<<"Exception: "<<e.what()<<std::endl;
        cpptrace::from_current_exception().print_with_snippets();
        status = 1;
    }

    return status;
}
