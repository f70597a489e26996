#include <iostream>
#include <stdexcept>
#include <algorithm>
#include <set>

using std::runtime_error;
using std::set;
using std::cerr;

#include <torch/torch.h>
#include "ReplayBuffer.hpp"

using namespace SoftRacer;


// Every tensor of the transition carries its label so that any column of a batch can be traced back
Transition labeled_transition(float label, bool done=false) {
    Transition t;
    t.state = torch::full({3}, label);
    t.action = torch::tensor({label, -label});
    t.reward = label;
    t.next_state = torch::full({3}, label + 0.5f);
    t.done = done;
    return t;
}


bool test_size_and_capacity() {
    bool success = true;

    for (size_t capacity: {1, 3, 7}) {
        for (size_t n=0; n<=2*capacity; n++) {
            ReplayBuffer buffer(capacity, 1, 0);

            for (size_t i=0; i<n; i++) {
                buffer.add(labeled_transition(float(i)));
            }

            auto expected = std::min(n, capacity);

            if (buffer.size() != expected or buffer.get_capacity() != capacity) {
                cerr << "capacity " << capacity << " n " << n << " size " << buffer.size() << " expected " << expected << '\n';
                success = false;
            }
        }
    }

    return success;
}


bool test_eviction_order() {
    ReplayBuffer buffer(4, 2, 0);

    for (int i=1; i<=6; i++) {
        buffer.add(labeled_transition(float(i)));
    }

    set<int> labels;
    for (size_t i=0; i<buffer.size(); i++) {
        labels.insert(int(buffer.at(i).reward));
    }

    set<int> expected = {3,4,5,6};

    cerr << "labels:";
    for (auto l: labels) {
        cerr << ' ' << l;
    }
    cerr << '\n';

    return buffer.size() == 4 and labels == expected;
}


bool test_sample_only_written() {
    ReplayBuffer buffer(10, 5, 42);

    for (int i=1; i<=7; i++) {
        buffer.add(labeled_transition(float(i), i == 7));
    }

    for (size_t s=0; s<50; s++) {
        auto batch = buffer.sample();

        if (batch.states.sizes() != torch::IntArrayRef({5,3}) or
            batch.actions.sizes() != torch::IntArrayRef({5,2}) or
            batch.rewards.sizes() != torch::IntArrayRef({5,1}) or
            batch.dones.sizes() != torch::IntArrayRef({5,1})) {
            cerr << "unexpected batch shape " << batch.states.sizes() << ' ' << batch.rewards.sizes() << '\n';
            return false;
        }

        set<int> seen;

        for (int64_t b=0; b<5; b++) {
            auto label = batch.rewards[b][0].item<float>();

            if (label < 1 or label > 7) {
                cerr << "sampled unwritten label " << label << '\n';
                return false;
            }

            // Columns must stay aligned
            if (batch.states[b][0].item<float>() != label or
                batch.actions[b][1].item<float>() != -label or
                batch.next_states[b][2].item<float>() != label + 0.5f or
                batch.dones[b][0].item<float>() != float(label == 7)) {
                cerr << "misaligned columns for label " << label << '\n';
                return false;
            }

            seen.insert(int(label));
        }

        if (seen.size() != 5) {
            cerr << "duplicate transition within one batch\n";
            return false;
        }
    }

    return true;
}


bool test_sample_before_warm_throws() {
    ReplayBuffer buffer(10, 5, 0);

    for (int i=0; i<4; i++) {
        buffer.add(labeled_transition(float(i)));
    }

    try {
        auto batch = buffer.sample();
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
        return true;
    }

    return false;
}


void add_episode(EpisodeBuffer& buffer, int episode_id, int length) {
    for (int s=0; s<length; s++) {
        buffer.add(labeled_transition(float(episode_id*100 + s), s == length - 1));
    }
    buffer.end_episode();
}


bool test_episode_windows_contiguous() {
    EpisodeBuffer buffer(5, 8, 4, 7);

    add_episode(buffer, 1, 10);
    add_episode(buffer, 2, 6);
    add_episode(buffer, 3, 4);

    for (size_t s=0; s<50; s++) {
        auto batch = buffer.sample();

        if (batch.states.sizes() != torch::IntArrayRef({8,4,3}) or
            batch.actions.sizes() != torch::IntArrayRef({8,4,2}) or
            batch.rewards.sizes() != torch::IntArrayRef({8,4,1}) or
            batch.next_states.sizes() != torch::IntArrayRef({8,4,3}) or
            batch.dones.sizes() != torch::IntArrayRef({8,4,1})) {
            cerr << "unexpected window shape " << batch.states.sizes() << ' ' << batch.rewards.sizes() << '\n';
            return false;
        }

        for (int64_t b=0; b<8; b++) {
            for (int64_t i=0; i+1<4; i++) {
                auto a = int(batch.rewards[b][i][0].item<float>());
                auto c = int(batch.rewards[b][i+1][0].item<float>());

                if (c != a + 1 or a/100 != c/100) {
                    cerr << "non contiguous window: " << a << " -> " << c << '\n';
                    return false;
                }

                if (batch.states[b][i+1][0].item<float>() != float(c)) {
                    cerr << "states misaligned with rewards\n";
                    return false;
                }
            }
        }
    }

    return true;
}


bool test_short_episodes_dropped() {
    EpisodeBuffer buffer(5, 2, 4, 0);

    add_episode(buffer, 1, 3);

    if (buffer.get_n_episodes() != 0 or buffer.size() != 0) {
        cerr << "short episode was kept\n";
        return false;
    }

    add_episode(buffer, 2, 4);

    return buffer.get_n_episodes() == 1 and buffer.size() == 4;
}


bool test_episode_eviction() {
    EpisodeBuffer buffer(3, 2, 2, 0);

    add_episode(buffer, 1, 5);
    add_episode(buffer, 2, 6);
    add_episode(buffer, 3, 7);
    add_episode(buffer, 4, 8);

    set<int> ids;
    for (size_t i=0; i<buffer.get_n_episodes(); i++) {
        ids.insert(int(buffer.get_episode(i).front().reward)/100);
    }

    set<int> expected = {2,3,4};

    cerr << "episodes: " << buffer.get_n_episodes() << " transitions: " << buffer.size() << '\n';

    return buffer.get_n_episodes() == 3 and buffer.size() == 6 + 7 + 8 and ids == expected;
}


bool test_episode_sample_before_commit_throws() {
    EpisodeBuffer buffer(3, 2, 2, 0);

    // Still open, not sampleable
    buffer.add(labeled_transition(1));
    buffer.add(labeled_transition(2));
    buffer.add(labeled_transition(3));

    if (buffer.size() != 0) {
        return false;
    }

    try {
        auto batch = buffer.sample();
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
        return true;
    }

    return false;
}


int main() {
    vector<bool> successes;

    cerr << "-----------------\n";
    cerr << "Test size and capacity\n";
    successes.push_back(test_size_and_capacity());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test eviction order\n";
    successes.push_back(test_eviction_order());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test sample only written\n";
    successes.push_back(test_sample_only_written());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test sample before warm throws\n";
    successes.push_back(test_sample_before_warm_throws());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test episode windows contiguous\n";
    successes.push_back(test_episode_windows_contiguous());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test short episodes dropped\n";
    successes.push_back(test_short_episodes_dropped());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test episode eviction\n";
    successes.push_back(test_episode_eviction());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test episode sample before commit throws\n";
    successes.push_back(test_episode_sample_before_commit_throws());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    for (auto success : successes) {
        if (not success) {
            throw runtime_error("FAIL");
        }
    }

    return 0;
}
