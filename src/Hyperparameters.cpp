#include "Hyperparameters.hpp"

#include <stdexcept>
#include <sstream>

using std::runtime_error;


namespace SoftRacer{


void Hyperparameters::validate() const{
    if (gamma < 0 or gamma >= 1){
        throw runtime_error("ERROR: gamma must be in range [0,1)");
    }
    if (tau <= 0 or tau > 1){
        throw runtime_error("ERROR: tau must be in range (0,1]");
    }
    if (w_entropy < 0){
        throw runtime_error("ERROR: w_entropy must be non-negative");
    }
    if (lr_actor <= 0 or lr_vf <= 0 or lr_qf_1 <= 0 or lr_qf_2 <= 0 or lr_entropy <= 0){
        throw runtime_error("ERROR: learn rates must be positive");
    }
    if (weight_decay < 0){
        throw runtime_error("ERROR: weight_decay must be non-negative");
    }
    if (policy_update_freq == 0){
        throw runtime_error("ERROR: policy_update_freq must be at least 1");
    }
    if (batch_size == 0){
        throw runtime_error("ERROR: batch_size must be at least 1");
    }
    if (recurrent){
        if (episode_size == 0){
            throw runtime_error("ERROR: episode_size must be at least 1");
        }
        if (step_size == 0 or step_size > max_episode_steps){
            throw runtime_error("ERROR: step_size must be in range [1,max_episode_steps], got " + std::to_string(step_size));
        }
        if (lstm_size == 0){
            throw runtime_error("ERROR: lstm_size must be at least 1");
        }
    }
    else if (buffer_size < batch_size){
        throw runtime_error("ERROR: buffer_size " + std::to_string(buffer_size) + " cannot hold one batch of " + std::to_string(batch_size));
    }
    if (multiple_learn == 0){
        throw runtime_error("ERROR: multiple_learn must be at least 1");
    }
    if (brake_enable){
        if (brake_region < 2){
            throw runtime_error("ERROR: brake_region must be at least 2 when braking is enabled");
        }
        if (brake_dist_sigma <= 0){
            throw runtime_error("ERROR: brake_dist_sigma must be positive");
        }
        if (brake_factor < 0 or brake_factor > 1){
            throw runtime_error("ERROR: brake_factor must be in range [0,1]");
        }
    }
    if (hidden_size == 0 or n_hidden_layers == 0){
        throw runtime_error("ERROR: networks need at least one hidden layer of nonzero size");
    }
    if (max_episode_steps == 0){
        throw runtime_error("ERROR: max_episode_steps must be at least 1");
    }
    if (save_period == 0 or test_period == 0 or relaunch_period == 0){
        throw runtime_error("ERROR: save_period, test_period and relaunch_period must be at least 1");
    }
}


string Hyperparameters::to_string() const{
    std::ostringstream oss;

    oss << "gamma=" << gamma
        << " tau=" << tau
        << " w_entropy=" << w_entropy
        << " auto_entropy_tuning=" << auto_entropy_tuning
        << " target_entropy=" << (target_entropy ? std::to_string(*target_entropy) : "auto")
        << " w_mean_reg=" << w_mean_reg
        << " w_std_reg=" << w_std_reg
        << " w_pre_activation_reg=" << w_pre_activation_reg
        << " lr_actor=" << lr_actor
        << " lr_vf=" << lr_vf
        << " lr_qf_1=" << lr_qf_1
        << " lr_qf_2=" << lr_qf_2
        << " lr_entropy=" << lr_entropy
        << " weight_decay=" << weight_decay
        << " policy_update_freq=" << policy_update_freq
        << " batch_size=" << batch_size
        << " buffer_size=" << buffer_size
        << " episode_size=" << episode_size
        << " step_size=" << step_size
        << " initial_random_action=" << initial_random_action
        << " prefill_buffer=" << prefill_buffer
        << " multiple_learn=" << multiple_learn
        << " brake_enable=" << brake_enable
        << " brake_region=" << brake_region
        << " brake_dist_mu=" << brake_dist_mu
        << " brake_dist_sigma=" << brake_dist_sigma
        << " brake_factor=" << brake_factor
        << " hidden_size=" << hidden_size
        << " n_hidden_layers=" << n_hidden_layers
        << " lstm_size=" << lstm_size
        << " recurrent=" << recurrent
        << " n_episodes=" << n_episodes
        << " max_episode_steps=" << max_episode_steps
        << " save_period=" << save_period
        << " test_period=" << test_period
        << " relaunch_period=" << relaunch_period
        << " interim_test_num=" << interim_test_num
        << " seed=" << seed
        << " log=" << log
        << " silent=" << silent;

    return oss.str();
}


}
