#include "TrainingLog.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <vector>

using std::runtime_error;
using std::vector;


namespace SoftRacer{


EpisodeStats::EpisodeStats(){
    clear();
}


void EpisodeStats::clear(){
    score = 0;
    max_speed = 0;
    mean_speed = 0;
    n_steps = 0;

    mean_actor = 0;
    mean_qf_1 = 0;
    mean_qf_2 = 0;
    mean_vf = 0;
    mean_alpha = 0;
    n_updates = 0;
}


void EpisodeStats::add_step(float reward, float speed){
    n_steps++;
    score += reward;
    max_speed = std::max(max_speed, speed);
    mean_speed += (speed - mean_speed)/double(n_steps);
}


void EpisodeStats::add_losses(const SACLosses& losses){
    n_updates++;
    auto n = double(n_updates);

    mean_actor += (losses.actor - mean_actor)/n;
    mean_qf_1 += (losses.qf_1 - mean_qf_1)/n;
    mean_qf_2 += (losses.qf_2 - mean_qf_2)/n;
    mean_vf += (losses.vf - mean_vf)/n;
    mean_alpha += (losses.alpha - mean_alpha)/n;
}


SACLosses EpisodeStats::get_mean_losses() const{
    SACLosses losses;
    losses.actor = float(mean_actor);
    losses.qf_1 = float(mean_qf_1);
    losses.qf_2 = float(mean_qf_2);
    losses.vf = float(mean_vf);
    losses.alpha = float(mean_alpha);

    return losses;
}


bool EpisodeStats::has_losses() const{
    return n_updates > 0;
}


double EpisodeStats::get_score() const{
    return score;
}


float EpisodeStats::get_max_speed() const{
    return max_speed;
}


float EpisodeStats::get_avg_speed() const{
    return float(mean_speed);
}


size_t EpisodeStats::get_n_steps() const{
    return n_steps;
}


size_t EpisodeStats::get_n_updates() const{
    return n_updates;
}


string format_log_record(
        size_t episode,
        size_t episode_step,
        size_t total_step,
        const EpisodeStats& stats,
        size_t policy_update_freq,
        const string& track_name,
        int64_t race_position
){
    auto losses = stats.get_mean_losses();

    auto format = "%zu;%zu;%zu;%lld;%.3f;%.3f;%.3f;%.3f;%.3f;%.3f;%s;%lld;%.2f;%.2f";

    auto args = [&](char* buffer, size_t n){
        return std::snprintf(
            buffer, n, format,
            episode,
            episode_step,
            total_step,
            static_cast<long long>(stats.get_score()),
            double(losses.total()),
            double(losses.actor)*double(policy_update_freq),
            double(losses.qf_1),
            double(losses.qf_2),
            double(losses.vf),
            double(losses.alpha),
            track_name.c_str(),
            static_cast<long long>(race_position),
            double(stats.get_max_speed()),
            double(stats.get_avg_speed())
        );
    };

    // First pass only measures
    auto n = args(nullptr, 0);

    if (n < 0){
        throw runtime_error("ERROR: format_log_record failed to format record for episode " + std::to_string(episode));
    }

    vector<char> buffer(size_t(n) + 1);
    args(buffer.data(), buffer.size());

    return {buffer.data(), size_t(n)};
}


}
