#ifndef SEQFLOW_SEQ_CONSTANT_HPP
#define SEQFLOW_SEQ_CONSTANT_HPP

#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../seq.hpp"

namespace Seqflow::Eager {
    namespace Details {
        class ConstantSeq final : public EagerSeq {
        public:
            ConstantSeq(CreatorPtr creator, std::vector<Batch> steps)
                : creator_(std::move(creator)), steps_(std::move(steps))
            {
                if (!creator_) {
                    throw std::invalid_argument("Eager::Constant requires a creator.");
                }
            }

            [[nodiscard]] CreatorPtr creator() const override { return creator_; }
            [[nodiscard]] const std::vector<Batch>& output() const override { return steps_; }
            [[nodiscard]] VarSet variables() const override { return {}; }

            void propagate(const std::vector<Batch>&, Gradient&) override {}

        private:
            CreatorPtr creator_;
            std::vector<Batch> steps_;
        };
    }

    // Eager sequence with fixed outputs and no learnable variables.
    inline EagerSeqPtr Constant(CreatorPtr creator, std::vector<Batch> steps)
    {
        return std::make_shared<Details::ConstantSeq>(std::move(creator), std::move(steps));
    }
}

#endif // SEQFLOW_SEQ_CONSTANT_HPP
