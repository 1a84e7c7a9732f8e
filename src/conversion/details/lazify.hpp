#ifndef SEQFLOW_CONVERSION_LAZIFY_HPP
#define SEQFLOW_CONVERSION_LAZIFY_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../common/error.hpp"
#include "../../seq/seq.hpp"

namespace Seqflow::Conversion::Details {
    // Rereader over an eager sequence. The data already exists, so forward()
    // and reread() are pre-filled streams without a producer thread.
    class LazifiedSeq final : public Rereader {
    public:
        explicit LazifiedSeq(EagerSeqPtr seq) : seq_(std::move(seq))
        {
            if (!seq_) {
                throw std::invalid_argument("Lazify requires a non-null eager sequence.");
            }
            forward_ = stream_of(seq_->output());
        }

        [[nodiscard]] CreatorPtr creator() const override { return seq_->creator(); }
        BatchStream& forward() override { return forward_; }
        [[nodiscard]] VarSet variables() const override { return seq_->variables(); }

        void propagate(BatchStream upstream, Grad& grad) override
        {
            forward_.drain();

            const auto steps = seq_->output().size();
            std::vector<Batch> gradients(steps);
            for (std::size_t index = steps; index-- > 0;) {
                auto batch = upstream.receive();
                if (!batch) {
                    ::Seqflow::Details::violation("Lazify::propagate received fewer gradient batches than its "
                                                  + std::to_string(steps) + " output steps.");
                }
                gradients[index] = std::move(*batch);
            }
            if (upstream.receive()) {
                ::Seqflow::Details::violation("Lazify::propagate received more gradient batches than its "
                                              + std::to_string(steps) + " output steps.");
            }

            grad.use([&](Gradient& gradient) { seq_->propagate(gradients, gradient); });
        }

        BatchStream reread(std::int64_t start, std::int64_t end) override
        {
            const auto& output = seq_->output();
            const auto steps = static_cast<std::int64_t>(output.size());
            if (start < 0 || start > end || end > steps) {
                ::Seqflow::Details::violation("Lazify::reread range " + ::Seqflow::Details::format_range(start, end)
                                              + " is outside a sequence of " + std::to_string(steps) + " steps.");
            }
            return stream_of(std::vector<Batch>(output.begin() + start, output.begin() + end));
        }

    private:
        EagerSeqPtr seq_;
        BatchStream forward_{};
    };
}

#endif // SEQFLOW_CONVERSION_LAZIFY_HPP
