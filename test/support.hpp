#ifndef SEQFLOW_TEST_SUPPORT_HPP
#define SEQFLOW_TEST_SUPPORT_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../include/Seqflow.h"

namespace Seqflow::Testing {
    inline CreatorPtr creator()
    {
        static const CreatorPtr instance = Backend::make_creator(torch::TensorOptions().dtype(torch::kFloat64));
        return instance;
    }

    inline Batch step(std::vector<bool> present, std::vector<double> values)
    {
        return Batch{std::move(present), creator()->vector(values)};
    }

    // `lanes` present lanes, every value equal to `value`.
    inline Batch uniform(std::size_t lanes, std::int64_t width, double value)
    {
        return Batch{std::vector<bool>(lanes, true),
                     torch::full({static_cast<std::int64_t>(lanes) * width}, value, creator()->options())};
    }

    inline std::vector<Batch> uniform_steps(std::size_t steps, std::size_t lanes, std::int64_t width, double offset = 0.0)
    {
        std::vector<Batch> out;
        for (std::size_t index = 0; index < steps; ++index) {
            out.push_back(uniform(lanes, width, offset + static_cast<double>(index)));
        }
        return out;
    }

    inline bool same(const Batch& a, const Batch& b)
    {
        if (a.present != b.present) {
            return false;
        }
        const auto a_length = creator()->length(a.packed);
        const auto b_length = creator()->length(b.packed);
        if (a_length != b_length) {
            return false;
        }
        return a_length == 0 || torch::equal(a.packed.reshape({-1}), b.packed.reshape({-1}));
    }

    inline bool same(const std::vector<Batch>& a, const std::vector<Batch>& b)
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t index = 0; index < a.size(); ++index) {
            if (!same(a[index], b[index])) {
                return false;
            }
        }
        return true;
    }

    inline torch::Tensor parameter(std::int64_t width)
    {
        return torch::zeros({width}, creator()->options()).requires_grad_(true);
    }

    /*
     * Lazy sequence driven by its own producer thread, instrumented for tests:
     * it reports when the producer has handed over its last step and keeps
     * every gradient batch it receives. With a variable, each gradient batch
     * is summed over lanes into that variable.
     */
    class ProbeSeq final : public Seq {
    public:
        ProbeSeq(std::vector<Batch> steps, std::optional<torch::Tensor> variable = std::nullopt)
            : variable_(std::move(variable)), produced_(std::make_shared<std::atomic<bool>>(false))
        {
            forward_ = spawn_stream<Batch>([steps = std::move(steps), produced = produced_](BatchSender& out) {
                for (const auto& batch : steps) {
                    if (!out.send(batch)) {
                        return;
                    }
                }
                produced->store(true);
            });
        }

        [[nodiscard]] CreatorPtr creator() const override { return Testing::creator(); }
        BatchStream& forward() override { return forward_; }

        [[nodiscard]] VarSet variables() const override
        {
            VarSet out;
            if (variable_) {
                out.add(*variable_);
            }
            return out;
        }

        void propagate(BatchStream upstream, Grad& grad) override
        {
            forward_.drain();
            propagated_ = true;
            while (auto batch = upstream.receive()) {
                if (variable_) {
                    const auto width = variable_->numel();
                    auto delta = batch->packed.reshape({-1, width}).sum(0);
                    grad.use([&](Gradient& gradient) { gradient.accumulate(*variable_, delta); });
                }
                gradients_.push_back(std::move(*batch));
            }
        }

        [[nodiscard]] bool produced() const { return produced_->load(); }
        [[nodiscard]] bool propagated() const { return propagated_; }
        [[nodiscard]] const std::vector<Batch>& gradients() const { return gradients_; }

    private:
        std::optional<torch::Tensor> variable_;
        std::shared_ptr<std::atomic<bool>> produced_;
        BatchStream forward_{};
        bool propagated_{false};
        std::vector<Batch> gradients_{};
    };

    // Eager sequence with one variable; remembers the gradients it was given.
    class EagerProbe final : public EagerSeq {
    public:
        EagerProbe(std::vector<Batch> steps, torch::Tensor variable)
            : steps_(std::move(steps)), variable_(std::move(variable)) {}

        [[nodiscard]] CreatorPtr creator() const override { return Testing::creator(); }
        [[nodiscard]] const std::vector<Batch>& output() const override { return steps_; }
        [[nodiscard]] VarSet variables() const override { return VarSet{variable_}; }

        void propagate(const std::vector<Batch>& upstream, Gradient& gradient) override
        {
            received_ = upstream;
            for (const auto& batch : upstream) {
                gradient.accumulate(variable_, batch.packed.reshape({-1, variable_.numel()}).sum(0));
            }
        }

        [[nodiscard]] const std::vector<Batch>& received() const { return received_; }

    private:
        std::vector<Batch> steps_;
        torch::Tensor variable_;
        std::vector<Batch> received_{};
    };

    // Gradient batches for `steps`, delivered last step first as propagate expects.
    inline BatchStream backward(std::vector<Batch> steps)
    {
        return stream_of(std::vector<Batch>(steps.rbegin(), steps.rend()));
    }
}

#endif // SEQFLOW_TEST_SUPPORT_HPP
