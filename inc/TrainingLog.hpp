#pragma once

#include "SACLosses.hpp"

#include <cstdint>
#include <cstddef>
#include <string>

using std::string;


namespace SoftRacer{


/**
 * Per-episode telemetry: score, speed and the running mean of every loss returned by the updater
 */
class EpisodeStats{
    double score;
    float max_speed;
    double mean_speed;
    size_t n_steps;

    double mean_actor;
    double mean_qf_1;
    double mean_qf_2;
    double mean_vf;
    double mean_alpha;
    size_t n_updates;

public:
    EpisodeStats();

    void add_step(float reward, float speed);
    void add_losses(const SACLosses& losses);
    void clear();

    // All zero if no update happened during the episode
    [[nodiscard]] SACLosses get_mean_losses() const;
    [[nodiscard]] bool has_losses() const;

    [[nodiscard]] double get_score() const;
    [[nodiscard]] float get_max_speed() const;
    [[nodiscard]] float get_avg_speed() const;
    [[nodiscard]] size_t get_n_steps() const;
    [[nodiscard]] size_t get_n_updates() const;
};


/**
 * One semicolon delimited line (no newline):
 * episode;episode_step;total_step;score;total_loss;actor_loss;qf_1_loss;qf_2_loss;vf_loss;alpha_loss;track_name;race_position;max_speed;avg_speed
 *
 * The score is truncated to an integer. The actor loss is scaled by policy_update_freq because it is only nonzero on
 * one in every policy_update_freq updates, the total loss is the unscaled sum.
 */
string format_log_record(
        size_t episode,
        size_t episode_step,
        size_t total_step,
        const EpisodeStats& stats,
        size_t policy_update_freq,
        const string& track_name,
        int64_t race_position
);


}
