#pragma once
#include <torch/torch.h>
#include <stdexcept>
#include <vector>
#include <memory>
#include <string>
#include <tuple>

using std::runtime_error;
using std::shared_ptr;
using std::make_shared;
using std::vector;
using torch::Tensor;

namespace SoftRacer{

// (hidden, cell), each [1,B,lstm_size]. Both undefined for stateless models.
using LSTMState = std::tuple<Tensor,Tensor>;


enum class Recurrence {
    stateless,
    recurrent
};


// Small uniform init on output layers so initial predictions/actions start near zero
inline void init_output_layer(torch::nn::Linear& layer, double bound=3e-3){
    torch::NoGradGuard no_grad;
    layer->weight.uniform_(-bound, bound);
    layer->bias.uniform_(-bound, bound);
}


/**
 * Dense ReLU body shared by every approximator.
 * Stateless: [B,D] -> [B,H]
 * Recurrent: [B,S,D] -> [B,S,H], an LSTM (batch first) sits after the first dense layer and `hidden` is carried
 * forward in place.
 */
class Trunk : public torch::nn::Module {
public:
    int64_t input_size;
    int64_t output_size;
    Recurrence recurrence;

    inline Trunk(int64_t input_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size);

    inline Tensor forward(Tensor x, LSTMState& hidden);

    torch::nn::Linear fc_in{nullptr};
    torch::nn::LSTM lstm{nullptr};
    vector<torch::nn::Linear> fc;
};


Trunk::Trunk(int64_t input_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size):
    input_size(input_size),
    output_size(hidden_size),
    recurrence(recurrence)
{
    if (n_layers < 1){
        throw runtime_error("ERROR: Trunk needs at least one hidden layer");
    }

    fc_in = register_module("fc_in", torch::nn::Linear(input_size, hidden_size));

    int64_t prev_size = hidden_size;

    if (recurrence == Recurrence::recurrent){
        lstm = register_module("lstm", torch::nn::LSTM(torch::nn::LSTMOptions(hidden_size, lstm_size).num_layers(1).batch_first(true)));
        prev_size = lstm_size;
    }

    for (int64_t i=1; i<n_layers; i++){
        fc.emplace_back(register_module("fc" + std::to_string(i), torch::nn::Linear(prev_size, hidden_size)));
        prev_size = hidden_size;
    }

    output_size = prev_size;
}


Tensor Trunk::forward(Tensor x, LSTMState& hidden){
    x = torch::relu(fc_in->forward(x));

    if (recurrence == Recurrence::recurrent){
        if (x.dim() != 3){
            throw runtime_error("ERROR: recurrent Trunk expects input of shape [B,S,D], got " + std::to_string(x.dim()) + " dims");
        }

        auto [y, state] = lstm->forward(x, hidden);
        x = y;
        hidden = state;
    }

    for (auto& layer: fc){
        x = torch::relu(layer->forward(x));
    }

    return x;
}


/**
 * Common base of the actor and the critics: a module that may or may not carry recurrent state between calls.
 */
class Approximator : public torch::nn::Module {
protected:
    Recurrence recurrence;
    int64_t lstm_size;

public:
    inline Approximator(Recurrence recurrence, int64_t lstm_size);

    [[nodiscard]] inline bool is_recurrent() const;

    // Zeroed state for a batch of independent sequences, on the same device as the parameters
    [[nodiscard]] inline LSTMState init_hidden(int64_t batch_size) const;
};


Approximator::Approximator(Recurrence recurrence, int64_t lstm_size):
    recurrence(recurrence),
    lstm_size(lstm_size)
{
    if (recurrence == Recurrence::recurrent and lstm_size < 1){
        throw runtime_error("ERROR: recurrent approximator needs lstm_size >= 1");
    }
}


bool Approximator::is_recurrent() const{
    return recurrence == Recurrence::recurrent;
}


LSTMState Approximator::init_hidden(int64_t batch_size) const{
    if (recurrence == Recurrence::stateless){
        return {Tensor(), Tensor()};
    }

    auto options = parameters().front().options();

    return {torch::zeros({1, batch_size, lstm_size}, options), torch::zeros({1, batch_size, lstm_size}, options)};
}


// V(s)
class ValueNet : public Approximator {
public:
    inline ValueNet(int64_t state_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size=0);

    inline Tensor forward(const Tensor& state, LSTMState& hidden);

    shared_ptr<Trunk> trunk;
    torch::nn::Linear fc_out{nullptr};
};


ValueNet::ValueNet(int64_t state_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size):
    Approximator(recurrence, lstm_size)
{
    trunk = register_module("trunk", make_shared<Trunk>(state_size, hidden_size, n_layers, recurrence, lstm_size));
    fc_out = register_module("fc_out", torch::nn::Linear(trunk->output_size, 1));
    init_output_layer(fc_out);
}


Tensor ValueNet::forward(const Tensor& state, LSTMState& hidden){
    return fc_out->forward(trunk->forward(state, hidden));
}


// Q(s,a), state and action are concatenated on the last dim
class QNet : public Approximator {
public:
    inline QNet(int64_t state_size, int64_t action_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size=0);

    inline Tensor forward(const Tensor& state, const Tensor& action, LSTMState& hidden);

    shared_ptr<Trunk> trunk;
    torch::nn::Linear fc_out{nullptr};
};


QNet::QNet(int64_t state_size, int64_t action_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size):
    Approximator(recurrence, lstm_size)
{
    trunk = register_module("trunk", make_shared<Trunk>(state_size + action_size, hidden_size, n_layers, recurrence, lstm_size));
    fc_out = register_module("fc_out", torch::nn::Linear(trunk->output_size, 1));
    init_output_layer(fc_out);
}


Tensor QNet::forward(const Tensor& state, const Tensor& action, LSTMState& hidden){
    auto x = torch::cat({state, action}, -1);
    return fc_out->forward(trunk->forward(x, hidden));
}


/**
 * Log density of a tanh squashed gaussian sample, summed over action dims with a singleton trailing dim kept so it
 * broadcasts against [B,1] / [B,S,1] critic outputs.
 * logπ(a) = Σ [ logN(z; μ,σ) - log(1 - tanh(z)² + ε) ]
 * @param z pre-tanh sample
 * @param mu gaussian mean
 * @param std gaussian standard deviation
 * @param eps keeps the squashing correction away from log(0) when |tanh(z)| saturates
 */
inline Tensor tanh_gaussian_log_prob(const Tensor& z, const Tensor& mu, const Tensor& std, double eps=1e-6){
    // log(sqrt(2π))
    constexpr double LOG_SQRT_2PI = 0.91893853320467274178;

    auto normal_log_prob = -torch::pow(z - mu, 2) / (2*torch::pow(std, 2)) - torch::log(std) - LOG_SQRT_2PI;
    auto correction = torch::log(1 - torch::pow(torch::tanh(z), 2) + eps);

    return (normal_log_prob - correction).sum(-1, true);
}


class PolicyOutput{
public:
    // tanh(z), bounded in (-1,1)
    Tensor action;
    Tensor log_prob;
    Tensor pre_tanh;
    Tensor mu;
    Tensor std;
};


/**
 * Gaussian policy squashed by tanh. Sampling is reparameterized (z = μ + σ·ε) so that gradients flow from the critics
 * back through the action.
 */
class TanhGaussianPolicy : public Approximator {
public:
    static constexpr double LOG_STD_MIN = -20;
    static constexpr double LOG_STD_MAX = 2;

    int64_t action_size;

    inline TanhGaussianPolicy(int64_t state_size, int64_t action_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size=0);

    inline PolicyOutput forward(const Tensor& state, LSTMState& hidden);

    // Deterministic action tanh(μ), used for evaluation
    inline Tensor mode(const Tensor& state, LSTMState& hidden);

    shared_ptr<Trunk> trunk;
    torch::nn::Linear fc_mu{nullptr};
    torch::nn::Linear fc_log_std{nullptr};
};


TanhGaussianPolicy::TanhGaussianPolicy(int64_t state_size, int64_t action_size, int64_t hidden_size, int64_t n_layers, Recurrence recurrence, int64_t lstm_size):
    Approximator(recurrence, lstm_size),
    action_size(action_size)
{
    trunk = register_module("trunk", make_shared<Trunk>(state_size, hidden_size, n_layers, recurrence, lstm_size));
    fc_mu = register_module("fc_mu", torch::nn::Linear(trunk->output_size, action_size));
    fc_log_std = register_module("fc_log_std", torch::nn::Linear(trunk->output_size, action_size));
    init_output_layer(fc_mu);
    init_output_layer(fc_log_std);
}


PolicyOutput TanhGaussianPolicy::forward(const Tensor& state, LSTMState& hidden){
    auto x = trunk->forward(state, hidden);

    PolicyOutput out;
    out.mu = fc_mu->forward(x);
    out.std = torch::exp(torch::clamp(fc_log_std->forward(x), LOG_STD_MIN, LOG_STD_MAX));

    out.pre_tanh = out.mu + out.std*torch::randn_like(out.mu);
    out.action = torch::tanh(out.pre_tanh);
    out.log_prob = tanh_gaussian_log_prob(out.pre_tanh, out.mu, out.std);

    return out;
}


Tensor TanhGaussianPolicy::mode(const Tensor& state, LSTMState& hidden){
    auto x = trunk->forward(state, hidden);
    return torch::tanh(fc_mu->forward(x));
}


}
