#ifndef HERMES_CORE_HPP
#define HERMES_CORE_HPP
/*
 * Model state exposed to nonlinear optimizers.
 * ---------------------------------------------------------------------------
 * Responsibilities:
 *  - Own the structured model (Network::Chain), its flat parameter vector,
 *    the recorded precision, one minibatch cursor per split, the loss and
 *    the evaluation counters.
 *  - Present the optimizer-facing surface: problem dimension, current
 *    vector, objective / gradient / objective+gradient / Hessian /
 *    Hessian-vector evaluation (routed through Evaluation::), minibatch
 *    reset / advance / random selection per split and accuracy.
 *  - Keep vector, model and minibatch tensors in one precision; the
 *    evaluator asks for a conversion whenever a parameter vector arrives in another one.
 *
 * A Model is not safe for concurrent evaluation: the current minibatch and
 * the parameter tensors are shared mutable state. Serialize access or give
 * each worker its own Model.
 */

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "common/error.hpp"
#include "common/precision.hpp"
#include "common/random.hpp"
#include "data/data.hpp"
#include "evaluation/evaluation.hpp"
#include "loss/loss.hpp"
#include "network.hpp"
#include "parameter/codec.hpp"
#include "utils/log.hpp"
#include "utils/terminal.hpp"

namespace Hermes {
    struct Counters {
        std::int64_t neval_obj{0};
        std::int64_t neval_grad{0};
        std::int64_t neval_hess{0};
        std::int64_t neval_hprod{0};

        void reset() noexcept { *this = Counters{}; }

        [[nodiscard]] std::int64_t total() const noexcept
        {
            return neval_obj + neval_grad + neval_hess + neval_hprod;
        }

        void record(Evaluation::Details::Operation operation) noexcept
        {
            using Evaluation::Details::Operation;
            switch (operation) {
                case Operation::Objective:
                    ++neval_obj;
                    break;
                case Operation::Gradient:
                    ++neval_grad;
                    break;
                case Operation::ObjectiveGradient:
                    ++neval_obj;
                    ++neval_grad;
                    break;
                case Operation::Hessian:
                    ++neval_hess;
                    break;
                case Operation::HessianVector:
                    ++neval_hprod;
                    break;
            }
        }
    };

    // Problem metadata handed to optimizers; x0 is the flat vector captured at construction.
    struct Meta {
        std::int64_t nvar{0};
        torch::Tensor x0{};
        std::string name{"Generic"};
        bool minimize{true};
    };

    struct Options {
        std::string name{"Generic"};
        std::int64_t size_minibatch{100};  // number of batches per split; each holds ceil(count / size_minibatch) samples
        bool shuffle_train{true};
        bool shuffle_test{false};
        std::optional<std::uint64_t> seed{};
        std::optional<Data::Batch> current_train{};  // bypasses the random initial train minibatch
        std::optional<Data::Batch> current_test{};
        std::ostream* stream{&std::cout};
        bool verbose{false};
    };

    class Model {
    public:
        Model(Network::Chain chain,
              Data::Dataset train,
              Data::Dataset test,
              Options options = {},
              Loss::Function loss = Loss::make_function(Loss::CrossEntropy()))
            : options_(std::move(options))
            , log_(options_.stream, options_.verbose)
            , source_(Random::Source::from(options_.seed))
            , loss_(checked_loss(std::move(loss)))
            , train_data_(validated(std::move(train), Data::Split::Train))
            , test_data_(validated(std::move(test), Data::Split::Test))
            , chain_(checked_chain(std::move(chain)))
            , precision_(to_precision(chain_->parameters().front().scalar_type()))
            , w_(Parameter::Flatten(*chain_))
            , layout_(Parameter::Layout::of(*chain_))
            , train_(train_data_, cursor_options(Data::Split::Train), source_, log_.scoped("train"))
            , test_(test_data_, cursor_options(Data::Split::Test), source_, log_.scoped("test"))
        {
            if (layout_.total() != w_.numel()) {
                throw std::logic_error("Parameter layout disagrees with the flattened vector length.");
            }
            meta_.nvar = w_.numel();
            meta_.x0 = w_.clone();
            meta_.name = options_.name;

            log_.info("model '" + meta_.name + "': n = " + std::to_string(meta_.nvar)
                      + ", precision = " + to_string(precision_)
                      + ", train batches = " + std::to_string(train_.batch_count())
                      + ", test batches = " + std::to_string(test_.batch_count()));
        }

        Model(Network::Chain chain, Data::Dataset train, Data::Dataset test, Options options, Loss::Descriptor loss)
            : Model(std::move(chain), std::move(train), std::move(test), std::move(options), Loss::make_function(std::move(loss))) {}

        // A copy would share the chain, the vector storage and the random engine; use clone().
        Model(const Model&) = delete;
        Model& operator=(const Model&) = delete;
        Model(Model&&) = default;
        Model& operator=(Model&&) = default;

        /*
         * Independent state for another worker: deep-copied chain and vector,
         * same cursor positions and current minibatches, a random source forked
         * from this one and zeroed counters. Datasets are shared read-only.
         */
        [[nodiscard]] Model clone() { return Model(*this, CloneTag{}); }

        [[nodiscard]] std::int64_t dimension() const noexcept { return meta_.nvar; }
        [[nodiscard]] const Meta& meta() const noexcept { return meta_; }
        [[nodiscard]] const Options& options() const noexcept { return options_; }
        [[nodiscard]] const Counters& counters() const noexcept { return counters_; }
        void reset_counters() noexcept { counters_.reset(); }
        void record(Evaluation::Details::Operation operation) noexcept { counters_.record(operation); }

        [[nodiscard]] Precision precision() const noexcept { return precision_; }
        // Snapshot of the current vector; later evaluations never write into it.
        [[nodiscard]] torch::Tensor parameters() const { return w_.clone(); }
        [[nodiscard]] const Parameter::Layout& layout() const noexcept { return layout_; }
        [[nodiscard]] Network::Chain& chain() noexcept { return chain_; }
        [[nodiscard]] const Network::Chain& chain() const noexcept { return chain_; }
        [[nodiscard]] const Loss::Function& loss() const noexcept { return loss_; }
        [[nodiscard]] std::int64_t size_minibatch() const noexcept { return options_.size_minibatch; }
        [[nodiscard]] Random::Source& random_source() noexcept { return source_; }

        [[nodiscard]] Data::Cursor& cursor(Data::Split split) noexcept { return split == Data::Split::Train ? train_ : test_; }
        [[nodiscard]] const Data::Cursor& cursor(Data::Split split) const noexcept { return split == Data::Split::Train ? train_ : test_; }
        [[nodiscard]] const Data::Batch& current_minibatch(Data::Split split) const noexcept { return cursor(split).current(); }

        void reset_minibatch(Data::Split split) { cursor(split).reset(); }
        [[nodiscard]] bool minibatch_next(Data::Split split) { return cursor(split).advance(); }
        void random_minibatch(Data::Split split) { cursor(split).random_select(); }
        void random_minibatch(Data::Split split, Random::Source& source) { cursor(split).random_select(source); }

        // Both partitions are rebuilt; nothing changes if the divisor is invalid for either split.
        void set_size_minibatch(std::int64_t size_minibatch)
        {
            (void)Data::Details::Partition::batch_size_for(train_data_.size(), size_minibatch);
            (void)Data::Details::Partition::batch_size_for(test_data_.size(), size_minibatch);
            options_.size_minibatch = size_minibatch;
            train_.resize(size_minibatch);
            test_.resize(size_minibatch);
            log_.info("size_minibatch set to " + std::to_string(size_minibatch));
        }

        [[nodiscard]] double objective(const torch::Tensor& w) { return Evaluation::Objective(*this, w); }

        // Loss on the current minibatch of either split; counted as an objective evaluation.
        [[nodiscard]] double objective_on(Data::Split split, const torch::Tensor& w)
        {
            return Evaluation::Details::objective(*this, split, w);
        }

        torch::Tensor& gradient(const torch::Tensor& w, torch::Tensor& g) { return Evaluation::Gradient(*this, w, g); }
        [[nodiscard]] torch::Tensor gradient(const torch::Tensor& w) { return Evaluation::Gradient(*this, w); }

        std::pair<double, torch::Tensor> objective_and_gradient(const torch::Tensor& w, torch::Tensor& g)
        {
            return Evaluation::ObjectiveGradient(*this, w, g);
        }

        torch::Tensor& hessian(const torch::Tensor& w, torch::Tensor& h) { return Evaluation::Hessian(*this, w, h); }
        [[nodiscard]] torch::Tensor hessian(const torch::Tensor& w) { return Evaluation::Hessian(*this, w); }

        torch::Tensor& hessian_vector_product(const torch::Tensor& w, const torch::Tensor& v, torch::Tensor& hv)
        {
            return Evaluation::HessianVectorProduct(*this, w, v, hv);
        }

        [[nodiscard]] double accuracy(Data::Split split = Data::Split::Test) { return Evaluation::Accuracy(*this, split); }
        [[nodiscard]] double accuracy(const Data::Dataset& dataset) { return Evaluation::Accuracy(*this, dataset); }

        // Independent copy of the structured model carrying w; this state is left as is.
        [[nodiscard]] Network::Chain rebuild(const torch::Tensor& w) const { return Parameter::Rebuild(w, chain_); }

        // Casts model parameters, the stored vector and both current minibatches.
        void convert_precision(Precision target)
        {
            if (target == precision_) {
                return;
            }
            const auto dtype = to_scalar_type(target);
            chain_->to(dtype);
            w_ = w_.to(dtype);
            train_.convert(dtype);
            test_.convert(dtype);
            const auto message = "precision " + to_string(precision_) + " -> " + to_string(target);
            if (c10::elementSize(dtype) < c10::elementSize(to_scalar_type(precision_))) {
                log_.warn(message + " (narrowing; the stored vector loses digits)");
            } else {
                log_.info(message);
            }
            precision_ = target;
        }

        void write_parameters(const torch::Tensor& w)
        {
            Parameter::Apply(w, *chain_);
            w_.copy_(w.detach());
        }

        void describe(std::ostream& stream) const
        {
            auto split_line = [](const Data::Cursor& cursor) {
                std::ostringstream line;
                line << cursor.batch_count() << " x " << cursor.batch_size()
                     << (cursor.exhausted() ? " (exhausted)" : "");
                return line.str();
            };
            std::ostringstream evaluations;
            evaluations << "obj " << counters_.neval_obj << ", grad " << counters_.neval_grad
                        << ", hess " << counters_.neval_hess << ", hprod " << counters_.neval_hprod;
            std::string layers;
            for (const auto& layer : chain_->layers()) {
                layers.append(layers.empty() ? "" : " > ").append(layer.name);
            }

            Utils::Terminal::Table(Utils::Terminal::Colors::kGoldenrod)
                .row("Problem", meta_.name)
                .section()
                .row("Dimension", std::to_string(meta_.nvar))
                .row("Precision", to_string(precision_))
                .row("Layers", layers)
                .row("Train batches", split_line(train_))
                .row("Test batches", split_line(test_))
                .row("Evaluations", evaluations.str())
                .print(stream);
        }

    private:
        struct CloneTag {};

        Model(Model& other, CloneTag)
            : options_(other.options_)
            , log_(other.log_)
            , source_(other.source_.fork())
            , loss_(other.loss_)
            , train_data_(other.train_data_)
            , test_data_(other.test_data_)
            , chain_(Parameter::Rebuild(other.w_, other.chain_))
            , precision_(other.precision_)
            , w_(other.w_.clone())
            , layout_(other.layout_)
            , train_(other.train_.with_source(source_))
            , test_(other.test_.with_source(source_))
            , meta_(other.meta_)
        {
            meta_.x0 = other.meta_.x0.clone();
            log_.info("cloned model '" + meta_.name + "'");
        }

        [[nodiscard]] static Data::Dataset validated(Data::Dataset dataset, Data::Split split)
        {
            Data::Details::validate(dataset, split);
            return dataset;
        }

        [[nodiscard]] static Loss::Function checked_loss(Loss::Function loss)
        {
            if (!loss) {
                throw ConfigurationError("A loss function is required.");
            }
            return loss;
        }

        // Parameters are unified to the dtype of the first one.
        [[nodiscard]] static Network::Chain checked_chain(Network::Chain chain)
        {
            if (chain.is_empty()) {
                throw ConfigurationError("A structured model is required.");
            }
            const auto parameters = chain->parameters();
            if (parameters.empty()) {
                throw ConfigurationError("The model has no trainable parameters; the problem dimension would be zero.");
            }
            const auto dtype = parameters.front().scalar_type();
            (void)to_precision(dtype);
            chain->to(dtype);
            return chain;
        }

        [[nodiscard]] Data::CursorOptions cursor_options(Data::Split split) const
        {
            Data::CursorOptions cursor{};
            cursor.size_minibatch = options_.size_minibatch;
            cursor.dtype = to_scalar_type(precision_);
            if (split == Data::Split::Train) {
                cursor.shuffle = options_.shuffle_train;
                cursor.initial = options_.current_train;
            } else {
                cursor.shuffle = options_.shuffle_test;
                cursor.initial = options_.current_test;
            }
            return cursor;
        }

        Options options_{};
        Utils::Log::Sink log_{};
        Random::Source source_;
        Loss::Function loss_{};
        Data::Dataset train_data_{};
        Data::Dataset test_data_{};
        Network::Chain chain_{nullptr};
        Precision precision_{Precision::Float32};
        torch::Tensor w_{};
        Parameter::Layout layout_{};
        Data::Cursor train_;
        Data::Cursor test_;
        Meta meta_{};
        Counters counters_{};
    };
}

#endif // HERMES_CORE_HPP
