#include <iostream>
#include <stdexcept>
#include <numbers>
#include <vector>
#include <cmath>

using std::runtime_error;
using std::vector;
using std::cerr;

#include <torch/torch.h>
#include "Policy.hpp"

using namespace SoftRacer;


bool test_log_prob_value() {
    vector<double> z = {0.5, -0.3};
    vector<double> mu = {0.1, 0.2};
    vector<double> sigma = {0.5, 1.0};

    double expected = 0;
    for (size_t i=0; i<z.size(); i++) {
        auto normal = -std::pow(z[i] - mu[i], 2)/(2*std::pow(sigma[i], 2)) - std::log(sigma[i]) - 0.5*std::log(2*std::numbers::pi);
        auto correction = std::log(1 - std::pow(std::tanh(z[i]), 2) + 1e-6);
        expected += normal - correction;
    }

    auto result = tanh_gaussian_log_prob(
            torch::tensor({z[0], z[1]}, torch::kFloat64).unsqueeze(0),
            torch::tensor({mu[0], mu[1]}, torch::kFloat64).unsqueeze(0),
            torch::tensor({sigma[0], sigma[1]}, torch::kFloat64).unsqueeze(0));

    cerr << "expected " << expected << " got " << result << '\n';

    return result.sizes() == torch::IntArrayRef({1,1}) and std::abs(result.item<double>() - expected) < 1e-9;
}


bool test_stateless_shapes() {
    torch::manual_seed(0);

    TanhGaussianPolicy actor(9, 3, 16, 2, Recurrence::stateless);
    QNet q(9, 3, 16, 2, Recurrence::stateless);
    ValueNet v(9, 16, 2, Recurrence::stateless);

    auto states = torch::randn({5,9});
    auto hidden = actor.init_hidden(5);

    if (std::get<0>(hidden).defined() or actor.is_recurrent()) {
        cerr << "stateless network produced a hidden state\n";
        return false;
    }

    auto out = actor.forward(states, hidden);
    auto q_value = q.forward(states, out.action, hidden);
    auto value = v.forward(states, hidden);

    bool success = true;
    success = success and out.action.sizes() == torch::IntArrayRef({5,3});
    success = success and out.log_prob.sizes() == torch::IntArrayRef({5,1});
    success = success and out.pre_tanh.sizes() == torch::IntArrayRef({5,3});
    success = success and q_value.sizes() == torch::IntArrayRef({5,1});
    success = success and value.sizes() == torch::IntArrayRef({5,1});
    success = success and out.action.abs().max().item<float>() < 1;
    success = success and torch::all(out.std > 0).item<bool>();

    auto mode = actor.mode(states, hidden);
    success = success and torch::allclose(mode, torch::tanh(out.mu));

    return success;
}


bool test_recurrent_shapes() {
    torch::manual_seed(0);

    int64_t batch = 2;
    int64_t steps = 4;
    int64_t lstm_size = 8;

    TanhGaussianPolicy actor(9, 3, 16, 2, Recurrence::recurrent, lstm_size);
    ValueNet v(9, 16, 2, Recurrence::recurrent, lstm_size);

    auto hidden = actor.init_hidden(batch);
    auto& [h, c] = hidden;

    if (h.sizes() != torch::IntArrayRef({1,batch,lstm_size}) or h.abs().sum().item<float>() != 0) {
        cerr << "bad initial hidden state " << h.sizes() << '\n';
        return false;
    }

    auto states = torch::randn({batch,steps,9});
    auto out = actor.forward(states, hidden);

    bool success = true;
    success = success and out.action.sizes() == torch::IntArrayRef({batch,steps,3});
    success = success and out.log_prob.sizes() == torch::IntArrayRef({batch,steps,1});

    // The hidden state was carried forward past the sequence
    success = success and std::get<0>(hidden).sizes() == torch::IntArrayRef({1,batch,lstm_size});
    success = success and std::get<0>(hidden).abs().sum().item<float>() > 0;

    auto v_hidden = v.init_hidden(batch);
    success = success and v.forward(states, v_hidden).sizes() == torch::IntArrayRef({batch,steps,1});

    return success;
}


bool test_recurrent_rejects_flat_input() {
    ValueNet v(9, 16, 2, Recurrence::recurrent, 8);
    auto hidden = v.init_hidden(5);

    try {
        auto value = v.forward(torch::randn({5,9}), hidden);
    }
    catch (const runtime_error& e) {
        cerr << e.what() << '\n';
        return true;
    }

    return false;
}


bool test_reparameterized_gradient() {
    torch::manual_seed(0);

    TanhGaussianPolicy actor(4, 2, 8, 1, Recurrence::stateless);
    auto hidden = actor.init_hidden(3);

    auto out = actor.forward(torch::randn({3,4}), hidden);
    out.action.sum().backward();

    auto grad = actor.fc_mu->weight.grad();

    return grad.defined() and grad.abs().sum().item<float>() > 0;
}


int main() {
    vector<bool> successes;

    cerr << "-----------------\n";
    cerr << "Test log prob value\n";
    successes.push_back(test_log_prob_value());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test stateless shapes\n";
    successes.push_back(test_stateless_shapes());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test recurrent shapes\n";
    successes.push_back(test_recurrent_shapes());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test recurrent rejects flat input\n";
    successes.push_back(test_recurrent_rejects_flat_input());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    cerr << "-----------------\n";
    cerr << "Test reparameterized gradient\n";
    successes.push_back(test_reparameterized_gradient());
    cerr << (successes.back() ? "PASS" : "FAIL") << '\n' << '\n';

    for (auto success : successes) {
        if (not success) {
            throw runtime_error("FAIL");
        }
    }

    return 0;
}
