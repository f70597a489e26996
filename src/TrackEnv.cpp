#include "TrackEnv.hpp"

#include <stdexcept>
#include <algorithm>
#include <numbers>
#include <cmath>

using std::runtime_error;
using std::to_string;
using std::atan2;
using std::fmod;
using std::cos;
using std::sin;
using std::abs;

namespace SoftRacer{


vector<string> TrackEnv::get_track_names(){
    return {"oval", "speedway", "technical"};
}


vector<TrackSegment> TrackEnv::build_track(const string& name){
    constexpr float pi = std::numbers::pi_v<float>;

    // Each closed track turns through exactly 2π in total
    if (name == "oval"){
        return {
            {200, 0},
            {pi*50, 1.0f/50},
            {200, 0},
            {pi*50, 1.0f/50}
        };
    }
    else if (name == "speedway"){
        return {
            {400, 0},
            {pi*80, 1.0f/80},
            {400, 0},
            {pi*80, 1.0f/80}
        };
    }
    else if (name == "technical"){
        return {
            {120, 0},
            {pi/2*30, 1.0f/30},
            {80, 0},
            {pi/2*30, 1.0f/30},
            {60, 0},
            {pi/2*20, -1.0f/20},
            {pi/2*20, 1.0f/20},
            {60, 0},
            {pi/2*30, 1.0f/30},
            {80, 0},
            {pi/2*30, 1.0f/30}
        };
    }
    else{
        throw runtime_error("ERROR: unknown track name: " + name);
    }
}


TrackEnv::TrackEnv(size_t max_steps, uint64_t seed, const string& track_name):
    Environment(STATE_DIM, ACTION_DIM, seed),
    track_length(0),
    progress(0),
    offset(0),
    heading(0),
    speed(0),
    n_steps(0),
    max_steps(max_steps),
    n_stalled(0),
    closed(false)
{
    if (max_steps == 0){
        throw runtime_error("ERROR: TrackEnv max_steps must be at least 1");
    }

    load_track(track_name);
    initialize_opponents();
}


void TrackEnv::load_track(const string& name){
    segments = build_track(name);
    track_name = name;

    track_length = 0;
    for (const auto& segment: segments){
        track_length += segment.length;
    }
}


void TrackEnv::initialize_opponents(){
    std::uniform_real_distribution<float> speed_dist(18, 30);

    opponent_speed.resize(N_OPPONENTS);
    for (auto& v: opponent_speed){
        v = speed_dist(generator);
    }
}


float TrackEnv::curvature_at(float s) const{
    s = fmod(s, track_length);
    if (s < 0){
        s += track_length;
    }

    for (const auto& segment: segments){
        if (s < segment.length){
            return segment.curvature;
        }
        s -= segment.length;
    }

    // Only reachable through float rounding at the very end of the lap
    return segments.back().curvature;
}


Tensor TrackEnv::get_observation() const{
    vector<float> observation = {
        speed/V_MAX,
        sin(heading),
        cos(heading),
        offset/HALF_WIDTH
    };

    for (int64_t i=1; i<=N_LOOKAHEAD; i++){
        observation.emplace_back(curvature_at(progress + float(i)*LOOKAHEAD)/MAX_STEER_CURVATURE);
    }

    return torch::tensor(observation, torch::kFloat32);
}


Tensor TrackEnv::reset(bool relaunch, bool sample_track, bool render){
    if (closed){
        throw runtime_error("ERROR: TrackEnv::reset called after close()");
    }

    if (sample_track){
        auto names = get_track_names();
        std::uniform_int_distribution<size_t> dist(0, names.size() - 1);
        load_track(names[dist(generator)]);
    }

    // There is no separate simulator process, relaunching only redraws the opponent field
    if (relaunch){
        initialize_opponents();
    }

    // Nothing to display, rendering is accepted and ignored
    (void)render;

    progress = 0;
    offset = 0;
    heading = 0;
    speed = 0;
    n_steps = 0;
    n_stalled = 0;

    opponent_progress.resize(N_OPPONENTS);
    for (int64_t i=0; i<N_OPPONENTS; i++){
        opponent_progress[i] = 10*float(i+1);
    }

    return get_observation();
}


StepResult TrackEnv::step(const Tensor& action){
    if (closed){
        throw runtime_error("ERROR: TrackEnv::step called after close()");
    }
    if (opponent_progress.empty()){
        throw runtime_error("ERROR: TrackEnv::step called before reset()");
    }
    if (action.numel() != ACTION_DIM){
        throw runtime_error("ERROR: TrackEnv::step expected action of size " + to_string(ACTION_DIM) + ", got " + to_string(action.numel()));
    }

    auto a = action.detach().to(torch::kCPU, torch::kFloat32).contiguous();
    auto a_1d = a.accessor<float,1>();

    float steer = std::clamp(a_1d[STEER], -1.0f, 1.0f);
    float throttle = (std::clamp(a_1d[ACCELERATE], -1.0f, 1.0f) + 1)/2;
    float brake = (std::clamp(a_1d[BRAKE], -1.0f, 1.0f) + 1)/2;

    speed += DT*(MAX_ACCEL*throttle - MAX_BRAKE*brake - DRAG*speed*speed);
    speed = std::clamp(speed, 0.0f, V_MAX);

    heading += DT*speed*(MAX_STEER_CURVATURE*steer - curvature_at(progress));
    heading = atan2(sin(heading), cos(heading));

    offset += DT*speed*sin(heading);
    progress += DT*speed*cos(heading);

    for (int64_t i=0; i<N_OPPONENTS; i++){
        opponent_progress[i] += DT*opponent_speed[i];
    }

    n_steps++;

    StepResult result;
    result.reward = speed*cos(heading) - speed*abs(sin(heading));
    result.done = false;

    if (speed < STALL_SPEED){
        n_stalled++;
    }
    else{
        n_stalled = 0;
    }

    if (abs(offset) > HALF_WIDTH){
        result.reward = -1;
        result.done = true;
    }
    else if (cos(heading) < 0 or n_stalled >= STALL_PATIENCE or n_steps >= max_steps){
        result.done = true;
    }

    result.next_state = get_observation();

    return result;
}


string TrackEnv::get_track_name() const{
    return track_name;
}


float TrackEnv::get_last_speed() const{
    return speed*3.6f;
}


int64_t TrackEnv::get_race_position() const{
    int64_t position = 1;

    for (auto p: opponent_progress){
        position += int64_t(p > progress);
    }

    return position;
}


void TrackEnv::close(){
    closed = true;
}


float TrackEnv::get_offset() const{
    return offset;
}


float TrackEnv::get_progress() const{
    return progress;
}


}
