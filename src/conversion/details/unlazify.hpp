#ifndef SEQFLOW_CONVERSION_UNLAZIFY_HPP
#define SEQFLOW_CONVERSION_UNLAZIFY_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../common/error.hpp"
#include "../../seq/seq.hpp"

namespace Seqflow::Conversion::Details {
    class UnlazifiedSeq final : public EagerSeq {
    public:
        explicit UnlazifiedSeq(SeqPtr seq) : seq_(std::move(seq))
        {
            if (!seq_) {
                throw std::invalid_argument("Unlazify requires a non-null sequence.");
            }
            auto& forward = seq_->forward();
            if (forward.received() != 0 || forward.exhausted()) {
                ::Seqflow::Details::violation(
                    "Unlazify requires a sequence whose forward stream has not been read or propagated.");
            }
            outputs_ = forward.collect();
            variables_ = seq_->variables();
        }

        [[nodiscard]] CreatorPtr creator() const override { return seq_->creator(); }
        [[nodiscard]] const std::vector<Batch>& output() const override { return outputs_; }
        [[nodiscard]] VarSet variables() const override { return variables_; }

        void propagate(const std::vector<Batch>& upstream, Gradient& gradient) override
        {
            if (upstream.size() != outputs_.size()) {
                ::Seqflow::Details::violation("Unlazify::propagate expected " + std::to_string(outputs_.size())
                                              + " gradient batches but received "
                                              + std::to_string(upstream.size()) + ".");
            }
            // The lazy side expects the last step first.
            std::vector<Batch> reversed(upstream.rbegin(), upstream.rend());
            Grad grad{gradient};
            seq_->propagate(stream_of(std::move(reversed)), grad);
        }

    private:
        SeqPtr seq_;
        std::vector<Batch> outputs_{};
        VarSet variables_{};
    };
}

#endif // SEQFLOW_CONVERSION_UNLAZIFY_HPP
