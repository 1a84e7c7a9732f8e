#ifndef SEQFLOW_PACKS_ENGINE_HPP
#define SEQFLOW_PACKS_ENGINE_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../batch/batch.hpp"
#include "../../common/channel.hpp"
#include "../../common/error.hpp"
#include "../../common/task.hpp"
#include "../../seq/seq.hpp"
#include "../../utils/monitor.hpp"
#include "../../utils/terminal.hpp"
#include "lifecycle.hpp"

namespace Seqflow {
    struct PackOptions {
        std::size_t stream_capacity{1};
        bool strict_upstream{true};  // Gradient streams must carry exactly one batch per packed step.
        MonitorOptions monitor{};
    };
}

namespace Seqflow::Packs::Details {
    /*
     * Shared machinery of Pack and PackRereader.
     *
     * A producer thread, owned by the forward stream, pulls one batch from every
     * input per step, joins them lane-wise and stops once no input has data
     * left. The per-input lane counts and lengths it records are published
     * through the Lifecycle before the forward stream closes.
     */
    class PackEngine {
    public:
        PackEngine(CreatorPtr creator, std::vector<SeqPtr> inputs, PackOptions options)
            : shared_(std::make_shared<Shared>(std::move(creator), std::move(inputs), options))
        {
            if (!shared_->creator) {
                throw std::invalid_argument("Pack requires a creator.");
            }
            for (std::size_t index = 0; index < shared_->inputs.size(); ++index) {
                if (!shared_->inputs[index]) {
                    throw std::invalid_argument("Pack input " + std::to_string(index) + " is null.");
                }
            }
            forward_ = spawn_stream<Batch>(
                [shared = shared_](BatchSender& out) { produce_(*shared, out); },
                options.stream_capacity);
        }

        PackEngine(const PackEngine&) = delete;
        PackEngine& operator=(const PackEngine&) = delete;

        [[nodiscard]] CreatorPtr creator() const { return shared_->creator; }
        BatchStream& forward() { return forward_; }
        [[nodiscard]] const Lifecycle& lifecycle() const { return shared_->lifecycle; }

        [[nodiscard]] VarSet variables() const
        {
            return shared_->lifecycle.require("Pack::variables").variables;
        }

        void propagate(BatchStream upstream, Grad& grad)
        {
            forward_.drain();
            const auto& summary = shared_->lifecycle.require("Pack::propagate");
            const auto& inputs = shared_->inputs;

            std::size_t active = 0;
            std::int64_t delivered = 0;
            std::exception_ptr failure;
            {
                // Declared after the workers so that senders close before the join on unwind.
                TaskGroup workers;
                std::vector<BatchSender> downstreams(inputs.size());
                for (std::size_t index = 0; index < inputs.size(); ++index) {
                    const auto& input = inputs[index];
                    const bool needed = grad.use([&](Gradient& gradient) {
                        return gradient.intersects(input->variables());
                    });
                    if (!needed) {
                        shared_->monitor.info("pack", "input " + std::to_string(index)
                                                      + " shares no variables with the gradient, skipping it");
                        continue;
                    }
                    auto [sender, stream] = make_channel<Batch>(shared_->options.stream_capacity);
                    downstreams[index] = std::move(sender);
                    workers.spawn([input, stream = std::move(stream), &grad]() mutable {
                        input->propagate(std::move(stream), grad);
                    });
                    ++active;
                }

                try {
                    delivered = distribute_(upstream, downstreams, summary);
                } catch (...) {
                    failure = std::current_exception();
                }

                for (auto& downstream : downstreams) {
                    downstream.close();
                }
                try {
                    workers.wait();
                } catch (...) {
                    // Errors the distributor caused downstream are secondary to its own.
                    if (!failure) {
                        failure = std::current_exception();
                    }
                }
            }
            if (failure) {
                std::rethrow_exception(failure);
            }

            shared_->monitor.done("pack", "propagated " + std::to_string(delivered) + " gradient steps into "
                                          + std::to_string(active) + " of " + std::to_string(inputs.size())
                                          + " inputs");
        }

        BatchStream reread(const std::vector<RereaderPtr>& sources, std::int64_t start, std::int64_t end) const
        {
            const auto& summary = shared_->lifecycle.require("Pack::reread");
            if (start < 0 || start > end) {
                ::Seqflow::Details::violation("Pack::reread received the malformed range "
                                              + ::Seqflow::Details::format_range(start, end) + ".");
            }
            std::int64_t longest = 0;
            for (const auto length : summary.lengths) {
                longest = std::max(longest, length);
            }
            if (end > longest) {
                ::Seqflow::Details::violation("Pack::reread requested range " + ::Seqflow::Details::format_range(start, end)
                                              + " beyond the longest input (" + std::to_string(longest) + " steps).");
            }

            std::vector<std::optional<BatchStream>> parts;
            std::vector<std::int64_t> stops;
            parts.reserve(sources.size());
            stops.reserve(sources.size());
            for (std::size_t index = 0; index < sources.size(); ++index) {
                const auto length = summary.lengths[index];
                if (length <= start) {
                    // Data ended before the range; the input only contributes fillers.
                    parts.emplace_back();
                    stops.push_back(start);
                    continue;
                }
                const auto stop = std::min(end, length);
                parts.emplace_back(sources[index]->reread(start, stop));
                stops.push_back(stop);
            }

            return spawn_stream<Batch>(
                [creator = shared_->creator,
                 lanes = summary.lanes_per_seq,
                 parts = std::move(parts),
                 stops = std::move(stops),
                 start,
                 end](BatchSender& out) mutable {
                    for (auto step = start; step < end; ++step) {
                        std::vector<Batch> batches;
                        batches.reserve(parts.size());
                        for (std::size_t index = 0; index < parts.size(); ++index) {
                            if (step >= stops[index]) {
                                batches.push_back(Batches::filler(*creator, lanes[index]));
                                continue;
                            }
                            auto batch = parts[index]->receive();
                            if (!batch) {
                                ::Seqflow::Details::violation("Pack::reread input " + std::to_string(index)
                                                              + " ended before step " + std::to_string(step) + ".");
                            }
                            batches.push_back(std::move(*batch));
                        }
                        if (!out.send(Batches::join(*creator, batches))) {
                            return;
                        }
                    }
                },
                shared_->options.stream_capacity);
        }

    private:
        struct Shared {
            Shared(CreatorPtr pack_creator, std::vector<SeqPtr> pack_inputs, PackOptions pack_options)
                : creator(std::move(pack_creator)),
                  inputs(std::move(pack_inputs)),
                  options(pack_options),
                  monitor(pack_options.monitor) {}

            CreatorPtr creator;
            std::vector<SeqPtr> inputs;
            PackOptions options;
            Utils::Monitor monitor;
            Lifecycle lifecycle{};
        };

        static void produce_(Shared& shared, BatchSender& out)
        {
            const auto& creator = *shared.creator;
            const auto count = shared.inputs.size();
            std::vector<std::size_t> lanes(count, 0);
            std::vector<std::int64_t> lengths(count, 0);
            std::int64_t steps = 0;

            try {
                for (;;) {
                    std::size_t open = 0;
                    std::vector<Batch> batches;
                    batches.reserve(count);
                    for (std::size_t index = 0; index < count; ++index) {
                        auto batch = shared.inputs[index]->forward().receive();
                        if (!batch) {
                            batches.push_back(Batches::filler(creator, lanes[index]));
                            continue;
                        }
                        if (lengths[index] > 0 && batch->lanes() != lanes[index]) {
                            ::Seqflow::Details::violation(
                                "Pack input " + std::to_string(index) + " changed from "
                                + std::to_string(lanes[index]) + " to " + std::to_string(batch->lanes())
                                + " lanes at step " + std::to_string(lengths[index]) + ".");
                        }
                        lanes[index] = batch->lanes();
                        ++lengths[index];
                        ++open;
                        batches.push_back(std::move(*batch));
                    }
                    if (open == 0) {
                        break;
                    }
                    if (!out.send(Batches::join(creator, batches))) {
                        shared.lifecycle.fail(std::make_exception_ptr(
                            ContractViolation("Pack forward stream was released before it was drained.")));
                        return;
                    }
                    ++steps;
                }

                VarSet variables;
                for (const auto& input : shared.inputs) {
                    variables = VarSet::merge(variables, input->variables());
                }
                shared.monitor.done("pack", "finalized after " + std::to_string(steps) + " steps; lengths "
                                            + Utils::Terminal::JoinValues(lengths) + "; lanes "
                                            + Utils::Terminal::JoinValues(lanes));
                shared.lifecycle.finalize(Summary{std::move(lanes), std::move(lengths), std::move(variables), steps});
            } catch (...) {
                shared.lifecycle.fail(std::current_exception());
                throw;
            }
        }

        std::int64_t distribute_(BatchStream& upstream,
                                 std::vector<BatchSender>& downstreams,
                                 const Summary& summary) const
        {
            const auto& creator = *shared_->creator;
            const bool strict = shared_->options.strict_upstream;
            std::int64_t received = 0;
            while (auto batch = upstream.receive()) {
                ++received;
                if (strict && received > summary.steps) {
                    ::Seqflow::Details::violation("Pack::propagate received more than the "
                                                  + std::to_string(summary.steps)
                                                  + " gradient batches matching its packed steps.");
                }
                auto parts = Batches::split(creator, *batch, summary.lanes_per_seq);
                for (std::size_t index = 0; index < parts.size(); ++index) {
                    if (!parts[index] || !downstreams[index]) {
                        continue;
                    }
                    if (!downstreams[index].send(std::move(*parts[index]))) {
                        // The worker stopped reading; its error surfaces from wait().
                        downstreams[index].close();
                    }
                }
            }
            if (strict && received != summary.steps) {
                ::Seqflow::Details::violation("Pack::propagate received " + std::to_string(received)
                                              + " gradient batches for " + std::to_string(summary.steps)
                                              + " packed steps.");
            }
            if (received != summary.steps) {
                shared_->monitor.warn("pack", "received " + std::to_string(received) + " gradient batches for "
                                              + std::to_string(summary.steps) + " packed steps");
            }
            return received;
        }

        std::shared_ptr<Shared> shared_;
        BatchStream forward_{};
    };
}

#endif // SEQFLOW_PACKS_ENGINE_HPP
