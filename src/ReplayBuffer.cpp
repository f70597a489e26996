#include "ReplayBuffer.hpp"

#include <unordered_set>
#include <algorithm>
#include <stdexcept>

using std::unordered_set;
using std::runtime_error;
using std::to_string;


namespace SoftRacer{


int64_t TransitionBatch::get_batch_size() const{
    if (not states.defined()){
        return 0;
    }

    return states.size(0);
}


TransitionBatch TransitionBatch::to(const torch::Device& device) const{
    TransitionBatch b;
    b.states = states.to(device);
    b.actions = actions.to(device);
    b.rewards = rewards.to(device);
    b.next_states = next_states.to(device);
    b.dones = dones.to(device);

    return b;
}


ReplayBuffer::ReplayBuffer(size_t capacity, size_t batch_size, uint64_t seed):
    capacity(capacity),
    batch_size(batch_size),
    n_added(0),
    generator(seed)
{
    if (capacity == 0){
        throw runtime_error("ERROR: ReplayBuffer capacity must be at least 1");
    }
    if (batch_size == 0 or batch_size > capacity){
        throw runtime_error("ERROR: ReplayBuffer batch_size must be in range [1,capacity]");
    }

    transitions.reserve(std::min(capacity, size_t(1'000'000)));
}


void ReplayBuffer::add(const Transition& transition){
    auto i = n_added % capacity;

    if (transitions.size() < capacity){
        transitions.emplace_back(transition);
    }
    else{
        transitions[i] = transition;
    }

    n_added++;
}


void ReplayBuffer::end_episode(){
    // Flat storage has no notion of episodes
}


void ReplayBuffer::sample_indices(vector<size_t>& indices){
    indices.clear();

    size_t n = transitions.size();
    unordered_set<size_t> selected;

    // Floyd's algorithm: batch_size distinct draws from [0,n) in O(batch_size)
    for (size_t j=n-batch_size; j<n; j++){
        std::uniform_int_distribution<size_t> dist(0, j);
        size_t t = dist(generator);

        if (selected.contains(t)){
            t = j;
        }

        selected.insert(t);
        indices.emplace_back(t);
    }

    // Floyd's draw order is biased toward the end of the range
    std::ranges::shuffle(indices, generator);
}


TransitionBatch ReplayBuffer::sample(){
    if (transitions.size() < batch_size){
        throw runtime_error("ERROR: ReplayBuffer::sample called with " + to_string(transitions.size()) + " transitions, need at least " + to_string(batch_size));
    }

    vector<size_t> indices;
    sample_indices(indices);

    vector<Tensor> states;
    vector<Tensor> actions;
    vector<float> rewards;
    vector<Tensor> next_states;
    vector<float> dones;

    for (auto i: indices){
        const auto& t = transitions[i];
        states.emplace_back(t.state);
        actions.emplace_back(t.action);
        rewards.emplace_back(t.reward);
        next_states.emplace_back(t.next_state);
        dones.emplace_back(float(t.done));
    }

    TransitionBatch batch;
    batch.states = torch::stack(states);
    batch.actions = torch::stack(actions);
    batch.rewards = torch::tensor(rewards, torch::kFloat32).unsqueeze(1);
    batch.next_states = torch::stack(next_states);
    batch.dones = torch::tensor(dones, torch::kFloat32).unsqueeze(1);

    return batch;
}


size_t ReplayBuffer::size() const{
    return transitions.size();
}


const Transition& ReplayBuffer::at(size_t i) const{
    if (i >= transitions.size()){
        throw runtime_error("ERROR: ReplayBuffer::at index " + to_string(i) + " out of range " + to_string(transitions.size()));
    }

    return transitions[i];
}


size_t ReplayBuffer::get_capacity() const{
    return capacity;
}


EpisodeBuffer::EpisodeBuffer(size_t capacity, size_t batch_size, size_t step_size, uint64_t seed):
    capacity(capacity),
    batch_size(batch_size),
    step_size(step_size),
    n_committed(0),
    n_transitions(0),
    generator(seed)
{
    if (capacity == 0){
        throw runtime_error("ERROR: EpisodeBuffer capacity must be at least 1");
    }
    if (batch_size == 0){
        throw runtime_error("ERROR: EpisodeBuffer batch_size must be at least 1");
    }
    if (step_size == 0){
        throw runtime_error("ERROR: EpisodeBuffer step_size must be at least 1");
    }
}


void EpisodeBuffer::add(const Transition& transition){
    open_episode.emplace_back(transition);
}


void EpisodeBuffer::end_episode(){
    if (open_episode.size() < step_size){
        open_episode.clear();
        return;
    }

    auto i = n_committed % capacity;

    if (episodes.size() < capacity){
        n_transitions += open_episode.size();
        episodes.emplace_back(std::move(open_episode));
    }
    else{
        n_transitions -= episodes[i].size();
        n_transitions += open_episode.size();
        episodes[i] = std::move(open_episode);
    }

    open_episode = {};
    n_committed++;
}


TransitionBatch EpisodeBuffer::sample(){
    if (episodes.empty()){
        throw runtime_error("ERROR: EpisodeBuffer::sample called before any episode of length >= " + to_string(step_size) + " was committed");
    }

    std::uniform_int_distribution<size_t> episode_dist(0, episodes.size() - 1);

    vector<Tensor> states;
    vector<Tensor> actions;
    vector<float> rewards;
    vector<Tensor> next_states;
    vector<float> dones;

    for (size_t b=0; b<batch_size; b++){
        const auto& episode = episodes[episode_dist(generator)];

        std::uniform_int_distribution<size_t> start_dist(0, episode.size() - step_size);
        auto start = start_dist(generator);

        vector<Tensor> window_states;
        vector<Tensor> window_actions;
        vector<Tensor> window_next_states;

        for (size_t s=start; s<start+step_size; s++){
            const auto& t = episode[s];
            window_states.emplace_back(t.state);
            window_actions.emplace_back(t.action);
            rewards.emplace_back(t.reward);
            window_next_states.emplace_back(t.next_state);
            dones.emplace_back(float(t.done));
        }

        states.emplace_back(torch::stack(window_states));
        actions.emplace_back(torch::stack(window_actions));
        next_states.emplace_back(torch::stack(window_next_states));
    }

    auto b = int64_t(batch_size);
    auto s = int64_t(step_size);

    TransitionBatch batch;
    batch.states = torch::stack(states);
    batch.actions = torch::stack(actions);
    batch.rewards = torch::tensor(rewards, torch::kFloat32).view({b,s,1});
    batch.next_states = torch::stack(next_states);
    batch.dones = torch::tensor(dones, torch::kFloat32).view({b,s,1});

    return batch;
}


size_t EpisodeBuffer::size() const{
    return n_transitions;
}


size_t EpisodeBuffer::get_n_episodes() const{
    return episodes.size();
}


const vector<Transition>& EpisodeBuffer::get_episode(size_t i) const{
    if (i >= episodes.size()){
        throw runtime_error("ERROR: EpisodeBuffer::get_episode index " + to_string(i) + " out of range " + to_string(episodes.size()));
    }

    return episodes[i];
}


}
