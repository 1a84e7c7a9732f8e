#ifndef SEQFLOW_TAPES_TAPE_REREADER_HPP
#define SEQFLOW_TAPES_TAPE_REREADER_HPP

#include <cstdint>
#include <stdexcept>
#include <utility>

#include "../interface.hpp"

namespace Seqflow::Tapes::Details {
    // Constant Rereader over an existing recording.
    class TapeRereader final : public Rereader {
    public:
        explicit TapeRereader(TapePtr tape) : tape_(std::move(tape))
        {
            if (!tape_) {
                throw std::invalid_argument("TapeRereader requires a non-null tape.");
            }
            forward_ = tape_->read(0, kTapeEnd);
        }

        [[nodiscard]] CreatorPtr creator() const override { return tape_->creator(); }
        BatchStream& forward() override { return forward_; }
        [[nodiscard]] VarSet variables() const override { return {}; }

        // Nothing to differentiate; both streams are drained so their
        // producers can finish.
        void propagate(BatchStream upstream, Grad&) override
        {
            forward_.drain();
            upstream.drain();
        }

        BatchStream reread(std::int64_t start, std::int64_t end) override
        {
            return tape_->read(start, end);
        }

    private:
        TapePtr tape_;
        BatchStream forward_{};
    };
}

#endif // SEQFLOW_TAPES_TAPE_REREADER_HPP
