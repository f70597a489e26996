#include "SACUpdater.hpp"
#include "misc.hpp"

#include <stdexcept>
#include <iostream>
#include <string>
#include <vector>

using std::runtime_error;
using std::make_unique;
using std::make_shared;
using std::to_string;
using std::string;
using std::vector;
using std::cerr;


namespace SoftRacer{


SACNetworks SACNetworks::build(int64_t state_dim, int64_t action_dim, const Hyperparameters& hyperparams, const torch::Device& device){
    auto recurrence = hyperparams.recurrent ? Recurrence::recurrent : Recurrence::stateless;
    auto hidden = int64_t(hyperparams.hidden_size);
    auto n_layers = int64_t(hyperparams.n_hidden_layers);
    auto lstm = int64_t(hyperparams.lstm_size);

    SACNetworks n;
    n.actor = make_shared<TanhGaussianPolicy>(state_dim, action_dim, hidden, n_layers, recurrence, lstm);
    n.qf_1 = make_shared<QNet>(state_dim, action_dim, hidden, n_layers, recurrence, lstm);
    n.qf_2 = make_shared<QNet>(state_dim, action_dim, hidden, n_layers, recurrence, lstm);
    n.vf = make_shared<ValueNet>(state_dim, hidden, n_layers, recurrence, lstm);
    n.vf_target = make_shared<ValueNet>(state_dim, hidden, n_layers, recurrence, lstm);

    n.actor->to(device);
    n.qf_1->to(device);
    n.qf_2->to(device);
    n.vf->to(device);
    n.vf_target->to(device);

    hard_update(*n.vf, *n.vf_target);

    return n;
}


Recurrence SACNetworks::get_recurrence() const{
    if (!actor or !qf_1 or !qf_2 or !vf or !vf_target) {
        throw runtime_error("ERROR: SACNetworks contains a null network pointer");
    }

    auto r = actor->is_recurrent();

    if (qf_1->is_recurrent() != r or qf_2->is_recurrent() != r or vf->is_recurrent() != r or vf_target->is_recurrent() != r){
        throw runtime_error("ERROR: SACNetworks cannot mix stateless and recurrent networks");
    }

    return r ? Recurrence::recurrent : Recurrence::stateless;
}


static const Hyperparameters& validated(const Hyperparameters& hyperparams){
    hyperparams.validate();
    return hyperparams;
}


SACUpdater::SACUpdater(const Hyperparameters& hyperparams, const SACNetworks& networks, int64_t action_dim, const torch::Device& device):
        hyperparams(validated(hyperparams)),
        networks(networks),
        recurrence(networks.get_recurrence()),
        device(device),
        optimizer_actor(networks.actor->parameters(), torch::optim::AdamOptions(hyperparams.lr_actor).weight_decay(hyperparams.weight_decay)),
        optimizer_qf_1(networks.qf_1->parameters(), torch::optim::AdamOptions(hyperparams.lr_qf_1).weight_decay(hyperparams.weight_decay)),
        optimizer_qf_2(networks.qf_2->parameters(), torch::optim::AdamOptions(hyperparams.lr_qf_2).weight_decay(hyperparams.weight_decay)),
        optimizer_vf(networks.vf->parameters(), torch::optim::AdamOptions(hyperparams.lr_vf).weight_decay(hyperparams.weight_decay)),
        alpha(hyperparams.w_entropy),
        target_entropy(hyperparams.target_entropy.value_or(-float(action_dim))),
        update_step(0)
{
    if (hyperparams.recurrent != (recurrence == Recurrence::recurrent)){
        throw runtime_error("ERROR: hyperparams.recurrent does not match the recurrence of the networks");
    }

    if (hyperparams.auto_entropy_tuning){
        log_alpha = torch::zeros({1}, torch::TensorOptions().dtype(torch::kFloat32).device(device).requires_grad(true));
        optimizer_alpha = make_unique<torch::optim::Adam>(vector<Tensor>{log_alpha}, torch::optim::AdamOptions(hyperparams.lr_entropy));
        alpha = 1;
    }
}


LSTMState SACUpdater::fresh_hidden(const Approximator& model, int64_t batch_size) const{
    return model.init_hidden(batch_size);
}


SACLosses SACUpdater::update(const TransitionBatch& b){
    update_step++;

    auto batch = b.to(device);
    auto batch_size = batch.get_batch_size();

    auto expected_dims = (recurrence == Recurrence::recurrent) ? 3 : 2;
    if (batch.states.dim() != expected_dims){
        throw runtime_error("ERROR: SACUpdater::update expected states with " + to_string(expected_dims) + " dims, got " + to_string(batch.states.dim()));
    }

    const auto& states = batch.states;
    const auto& actions = batch.actions;
    const auto& next_states = batch.next_states;

    LSTMState hidden;

    // Resample actions from the current policy, used by the entropy, value and policy steps
    hidden = fresh_hidden(*networks.actor, batch_size);
    auto policy = networks.actor->forward(states, hidden);

    // ---- Entropy step ----
    auto alpha_loss = torch::zeros({1});

    if (optimizer_alpha){
        alpha_loss = (-log_alpha * (policy.log_prob + target_entropy).detach()).mean();

        optimizer_alpha->zero_grad();
        alpha_loss.backward();
        optimizer_alpha->step();

        alpha = log_alpha.exp().item<float>();
    }

    // ---- Critic step ----
    auto masks = 1 - batch.dones;

    Tensor v_next;
    {
        torch::NoGradGuard no_grad;
        hidden = fresh_hidden(*networks.vf_target, batch_size);
        v_next = networks.vf_target->forward(next_states, hidden);
    }

    auto q_target = batch.rewards + hyperparams.gamma * v_next * masks;

    hidden = fresh_hidden(*networks.qf_1, batch_size);
    auto q_1_pred = networks.qf_1->forward(states, actions, hidden);
    auto qf_1_loss = torch::mse_loss(q_1_pred, q_target.detach());

    hidden = fresh_hidden(*networks.qf_2, batch_size);
    auto q_2_pred = networks.qf_2->forward(states, actions, hidden);
    auto qf_2_loss = torch::mse_loss(q_2_pred, q_target.detach());

    optimizer_qf_1.zero_grad();
    qf_1_loss.backward();
    optimizer_qf_1.step();

    optimizer_qf_2.zero_grad();
    qf_2_loss.backward();
    optimizer_qf_2.step();

    // ---- Value step ----
    // Evaluated after the critic step, and the critics are not touched again in this update, so the same graph can be
    // reused for the policy step below
    hidden = fresh_hidden(*networks.qf_1, batch_size);
    auto q_1_new = networks.qf_1->forward(states, policy.action, hidden);

    hidden = fresh_hidden(*networks.qf_2, batch_size);
    auto q_2_new = networks.qf_2->forward(states, policy.action, hidden);

    auto q_min = torch::min(q_1_new, q_2_new);

    hidden = fresh_hidden(*networks.vf, batch_size);
    auto v_pred = networks.vf->forward(states, hidden);

    auto v_target = q_min - alpha * policy.log_prob;
    auto vf_loss = torch::mse_loss(v_pred, v_target.detach());

    optimizer_vf.zero_grad();
    vf_loss.backward();
    optimizer_vf.step();

    // ---- Delayed policy step ----
    auto actor_loss = torch::zeros({1});

    if (update_step % hyperparams.policy_update_freq == 0){
        // v_pred was computed before the V step above
        auto advantage = q_min - v_pred.detach();
        actor_loss = (alpha * policy.log_prob - advantage).mean();

        // Keep the pre-squash gaussian away from saturating tanh
        auto mean_reg = hyperparams.w_mean_reg * policy.mu.pow(2).mean();
        auto std_reg = hyperparams.w_std_reg * policy.std.pow(2).mean();
        auto pre_activation_reg = hyperparams.w_pre_activation_reg * policy.pre_tanh.pow(2).sum(-1).mean();

        actor_loss = actor_loss + mean_reg + std_reg + pre_activation_reg;

        optimizer_actor.zero_grad();
        actor_loss.backward();
        optimizer_actor.step();

        soft_update(*networks.vf, *networks.vf_target, hyperparams.tau);
    }

    SACLosses losses;
    losses.actor = actor_loss.item<float>();
    losses.qf_1 = qf_1_loss.item<float>();
    losses.qf_2 = qf_2_loss.item<float>();
    losses.vf = vf_loss.item<float>();
    losses.alpha = alpha_loss.item<float>();

    return losses;
}


void SACUpdater::save(const path& output_path) const{
    torch::serialize::OutputArchive archive;

    auto write_module = [&](const string& key, const torch::nn::Module& module){
        torch::serialize::OutputArchive sub;
        module.save(sub);
        archive.write(key, sub);
    };

    auto write_optimizer = [&](const string& key, const torch::optim::Optimizer& optimizer){
        torch::serialize::OutputArchive sub;
        optimizer.save(sub);
        archive.write(key, sub);
    };

    write_module("actor", *networks.actor);
    write_module("qf_1", *networks.qf_1);
    write_module("qf_2", *networks.qf_2);
    write_module("vf", *networks.vf);
    write_module("vf_target", *networks.vf_target);

    write_optimizer("actor_optim", optimizer_actor);
    write_optimizer("qf_1_optim", optimizer_qf_1);
    write_optimizer("qf_2_optim", optimizer_qf_2);
    write_optimizer("vf_optim", optimizer_vf);

    if (optimizer_alpha){
        write_optimizer("alpha_optim", *optimizer_alpha);
        archive.write("log_alpha", log_alpha.detach());
    }

    archive.save_to(output_path.string());
}


bool SACUpdater::load(const path& input_path){
    if (not std::filesystem::exists(input_path)){
        cerr << "ERROR: the input path does not exist: " << input_path << '\n';
        return false;
    }

    torch::serialize::InputArchive archive;
    archive.load_from(input_path.string(), device);

    vector<string> keys = {"actor", "qf_1", "qf_2", "vf", "vf_target", "actor_optim", "qf_1_optim", "qf_2_optim", "vf_optim"};

    if (optimizer_alpha){
        keys.emplace_back("alpha_optim");
    }

    // Check every key before loading anything, so a malformed checkpoint leaves the agent untouched
    vector<torch::serialize::InputArchive> subs(keys.size());

    for (size_t i=0; i<keys.size(); i++){
        if (not archive.try_read(keys[i], subs[i])){
            throw runtime_error("ERROR: checkpoint " + input_path.string() + " is missing required key: " + keys[i]);
        }
    }

    networks.actor->load(subs[0]);
    networks.qf_1->load(subs[1]);
    networks.qf_2->load(subs[2]);
    networks.vf->load(subs[3]);
    networks.vf_target->load(subs[4]);

    optimizer_actor.load(subs[5]);
    optimizer_qf_1.load(subs[6]);
    optimizer_qf_2.load(subs[7]);
    optimizer_vf.load(subs[8]);

    if (optimizer_alpha){
        optimizer_alpha->load(subs[9]);

        Tensor saved_log_alpha;
        if (archive.try_read("log_alpha", saved_log_alpha)){
            torch::NoGradGuard no_grad;
            log_alpha.copy_(saved_log_alpha);
            alpha = log_alpha.exp().item<float>();
        }
    }

    cerr << "INFO: loaded the model and optimizer from " << input_path << '\n';

    return true;
}


float SACUpdater::get_alpha() const{
    return alpha;
}


float SACUpdater::get_target_entropy() const{
    return target_entropy;
}


size_t SACUpdater::get_update_step() const{
    return update_step;
}


Recurrence SACUpdater::get_recurrence() const{
    return recurrence;
}


const SACNetworks& SACUpdater::get_networks() const{
    return networks;
}


}
