#include <cstddef>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <utility>

#include <torch/torch.h>

#include "../include/Hermes.h"

namespace {
    // Three noisy clusters in the plane, labelled 0, 1, 2.
    Hermes::Data::Dataset make_clusters(std::int64_t count)
    {
        const auto centers = torch::tensor({{-2.0, 0.0}, {2.0, 0.0}, {0.0, 2.5}});
        auto labels = torch::randint(0, 3, {count}, torch::kLong);
        auto inputs = centers.index_select(0, labels) + 0.6 * torch::randn({count, 2}, torch::kFloat64);
        return {inputs.to(torch::kFloat32), labels};
    }
}

int main() {
    torch::manual_seed(0);

    const std::int64_t N = 6000;
    const std::int64_t epochs = 5;
    const double learning_rate = 0.2;

    auto chain = Hermes::Network::make_chain({
        Hermes::Layer::FC({2, 16, true}, Hermes::Activation::Tanh, Hermes::Initialization::XavierUniform),
        Hermes::Layer::FC({16, 16, true}, Hermes::Activation::Tanh, Hermes::Initialization::XavierUniform),
        Hermes::Layer::FC({16, 3, true}, Hermes::Activation::Identity, Hermes::Initialization::XavierUniform),
    });

    Hermes::Options options{};
    options.name = "Clusters";
    options.size_minibatch = 60;
    options.seed = 42;
    options.verbose = true;

    Hermes::Model model(std::move(chain), make_clusters(N), make_clusters(N / 5), options, Hermes::Loss::CrossEntropy());
    model.describe(std::cout);
    std::cout << "Initial accuracy: " << model.accuracy() << std::endl;

    Hermes::Training::MinibatchCallback<Hermes::Model> next_minibatch(model);
    auto w = model.meta().x0.clone();
    auto g = torch::zeros_like(w);

    double f = 0.0;
    while (next_minibatch.epochs() < static_cast<std::size_t>(epochs)) {
        f = model.objective_and_gradient(w, g).first;
        w.sub_(g, learning_rate);
        if (next_minibatch()) {
            (void)model.objective(w);
            std::cout << "Epoch " << next_minibatch.epochs()
                      << " | minibatch loss " << std::fixed << std::setprecision(4) << f
                      << " | test accuracy " << model.accuracy() << std::endl;
        }
    }

    // A double-precision parameter vector switches the whole state to Float64.
    const auto w64 = w.to(torch::kFloat64);
    auto hv = torch::zeros_like(w64);
    model.hessian_vector_product(w64, g.to(torch::kFloat64), hv);
    std::cout << "Curvature along the last gradient: " << torch::dot(g.to(torch::kFloat64), hv).item<double>() << std::endl;

    model.describe(std::cout);
    return 0;
}
