#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <vector>

using std::runtime_error;
using std::vector;
using std::cerr;

#include <torch/torch.h>
#include "TrackEnv.hpp"
#include "BrakeSchedule.hpp"

using namespace SoftRacer;


bool test_reset_observation() {
    TrackEnv env(100, 0);

    auto state = env.reset(true, false, false);

    cerr << "state: " << state << '\n';

    // The three opponents start ahead of the car
    return state.sizes() == torch::IntArrayRef({TrackEnv::STATE_DIM}) and
           env.get_state_dim() == 9 and
           env.get_action_dim() == 3 and
           env.get_track_name() == "oval" and
           env.get_race_position() == 4;
}


bool test_step_cap() {
    TrackEnv env(5, 0);
    env.reset(false, false, false);

    // Straight ahead at full throttle stays on the first straight of the oval
    auto action = torch::tensor({0.0f, 1.0f, -1.0f});

    for (size_t i=1; i<=5; i++) {
        auto result = env.step(action);

        if (result.next_state.sizes() != torch::IntArrayRef({9})) {
            cerr << "bad next_state shape\n";
            return false;
        }

        if (result.done != (i == 5)) {
            cerr << "step " << i << " done " << result.done << '\n';
            return false;
        }

        if (result.reward <= 0) {
            cerr << "driving forward should be rewarded, got " << result.reward << '\n';
            return false;
        }
    }

    cerr << "speed after 5 steps: " << env.get_last_speed() << " km/h\n";

    return env.get_last_speed() > 0 and env.get_progress() > 0;
}


bool test_leaving_track_ends_episode() {
    TrackEnv env(1000, 0);
    env.reset(false, false, false);

    auto action = torch::tensor({1.0f, 1.0f, -1.0f});

    for (size_t i=0; i<1000; i++) {
        auto result = env.step(action);

        if (result.done) {
            cerr << "done after " << i + 1 << " steps, offset " << env.get_offset() << " reward " << result.reward << '\n';
            return i + 1 < 1000;
        }
    }

    return false;
}


bool test_try_brake() {
    TrackEnv env(10, 0);

    auto action = torch::tensor({0.3f, 0.5f, -0.2f});
    auto braked = env.try_brake(action);

    auto expected = torch::tensor({0.3f, -1.0f, 1.0f});

    // The original action is left untouched
    return torch::equal(braked, expected) and action[1].item<float>() == 0.5f;
}


bool test_sample_action_bounds() {
    TrackEnv env(10, 3);

    for (size_t i=0; i<100; i++) {
        auto a = env.sample_action();

        if (a.sizes() != torch::IntArrayRef({3}) or a.abs().max().item<float>() > 1) {
            cerr << "bad sample " << a << '\n';
            return false;
        }
    }

    return true;
}


bool test_sample_track() {
    TrackEnv env(10, 11);

    bool success = true;
    auto names = TrackEnv::get_track_names();

    for (size_t i=0; i<20; i++) {
        env.reset(i % 5 == 0, true, false);
        success = success and std::ranges::find(names, env.get_track_name()) != names.end();
    }

    return success;
}


bool test_errors() {
    size_t n_thrown = 0;

    try {
        TrackEnv::build_track("nurburgring");
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
        n_thrown++;
    }

    TrackEnv env(10, 0);

    try {
        env.step(torch::zeros({3}));
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
        n_thrown++;
    }

    env.reset(false, false, false);

    try {
        env.step(torch::zeros({2}));
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
        n_thrown++;
    }

    env.close();

    try {
        env.step(torch::zeros({3}));
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
        n_thrown++;
    }

    return n_thrown == 4;
}


bool test_brake_schedule() {
    BrakeSchedule schedule(101, 50, 10, 0.5);

    auto p_start = schedule.probability(0);
    auto p_peak = schedule.probability(50);
    auto p_late = schedule.probability(90);
    auto p_outside = schedule.probability(101);

    cerr << "p(0) " << p_start << " p(50) " << p_peak << " p(90) " << p_late << " p(101) " << p_outside << '\n';

    bool success = true;
    success = success and p_start < 1e-5;
    success = success and p_peak > 0.49 and p_peak <= 0.5;
    success = success and p_late < p_peak;
    success = success and p_outside == 0;

    try {
        BrakeSchedule bad(100, 50, 0, 0.5);
        success = false;
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
    }

    return success;
}


int main() {
    vector<bool> successes;

    cerr << "-----------------\n";
    cerr << "Test reset observation\n";
    successes.push_back(test_reset_observation());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test step cap\n";
    successes.push_back(test_step_cap());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test leaving track ends episode\n";
    successes.push_back(test_leaving_track_ends_episode());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test try brake\n";
    successes.push_back(test_try_brake());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test sample action bounds\n";
    successes.push_back(test_sample_action_bounds());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test sample track\n";
    successes.push_back(test_sample_track());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test errors\n";
    successes.push_back(test_errors());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test brake schedule\n";
    successes.push_back(test_brake_schedule());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    for (auto success : successes) {
        if (not success) {
            throw runtime_error("FAIL");
        }
    }

    return 0;
}
