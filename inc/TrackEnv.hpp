#pragma once

#include "Environment.hpp"

#include <torch/torch.h>
#include <random>
#include <string>
#include <vector>

using std::vector;
using std::string;


namespace SoftRacer{


// Piece of track centerline with constant curvature (0 for straights, positive turns left)
class TrackSegment{
public:
    float length;
    float curvature;
};


/**
 * Minimal kinematic racing simulator. The car is tracked in curvilinear coordinates along a closed centerline:
 * progress along the track, lateral offset from the centerline and heading relative to the centerline tangent.
 * Three scripted opponents drive at constant speed and only exist to give a race position.
 *
 * Action: [steer, accelerate, brake] each in [-1,1]. Throttle and brake pressure map to [0,1].
 * Observation: [v/v_max, sin ψ, cos ψ, offset/half_width, κ at 5 look-ahead points normalized by max steer curvature]
 */
class TrackEnv: public Environment{
    vector<TrackSegment> segments;
    float track_length;
    string track_name;

    float progress;
    float offset;
    float heading;
    float speed;

    vector<float> opponent_progress;
    vector<float> opponent_speed;

    size_t n_steps;
    size_t max_steps;
    size_t n_stalled;
    bool closed;

    static constexpr float DT = 0.2;
    static constexpr float V_MAX = 80;
    static constexpr float HALF_WIDTH = 6;
    static constexpr float MAX_ACCEL = 8;
    static constexpr float MAX_BRAKE = 20;
    static constexpr float DRAG = MAX_ACCEL/(V_MAX*V_MAX);

    // Tightest turn available at full steering lock
    static constexpr float MAX_STEER_CURVATURE = 0.1;

    static constexpr float LOOKAHEAD = 20;
    static constexpr int64_t N_LOOKAHEAD = 5;

    // Give up on an episode after this many consecutive steps below STALL_SPEED
    static constexpr size_t STALL_PATIENCE = 50;
    static constexpr float STALL_SPEED = 1;

    static constexpr int64_t N_OPPONENTS = 3;

    void load_track(const string& name);
    void initialize_opponents();
    [[nodiscard]] float curvature_at(float s) const;
    [[nodiscard]] Tensor get_observation() const;

public:
    static constexpr int64_t STATE_DIM = 4 + N_LOOKAHEAD;
    static constexpr int64_t ACTION_DIM = 3;

    // oval, speedway, technical
    static vector<string> get_track_names();
    static vector<TrackSegment> build_track(const string& name);

    /**
     * @param max_steps the episode reports done once this many steps have been taken
     * @param seed seeds track sampling, opponents and action sampling
     * @param track_name initial track, used until a reset with sample_track=true
     */
    TrackEnv(size_t max_steps, uint64_t seed, const string& track_name="oval");

    Tensor reset(bool relaunch, bool sample_track, bool render) override;
    StepResult step(const Tensor& action) override;

    [[nodiscard]] string get_track_name() const override;
    [[nodiscard]] float get_last_speed() const override;
    [[nodiscard]] int64_t get_race_position() const override;

    void close() override;

    [[nodiscard]] float get_offset() const;
    [[nodiscard]] float get_progress() const;
};

}
