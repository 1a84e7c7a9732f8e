#ifndef SEQFLOW_TAPES_SEQ_REREADER_HPP
#define SEQFLOW_TAPES_SEQ_REREADER_HPP

#include <cstdint>
#include <exception>
#include <stdexcept>
#include <thread>
#include <utility>

#include "../interface.hpp"

namespace Seqflow::Tapes::Details {
    // Records a Seq onto a tape as it is produced. The wrapped forward stream
    // is read exactly once, by the writer thread; every read goes through the
    // tape.
    class SeqRereader final : public Rereader {
    public:
        SeqRereader(SeqPtr seq, TapePtr tape) : seq_(std::move(seq)), tape_(std::move(tape))
        {
            if (!seq_) {
                throw std::invalid_argument("SeqRereader requires a non-null sequence.");
            }
            if (!tape_) {
                throw std::invalid_argument("SeqRereader requires a non-null tape.");
            }
            forward_ = tape_->read(0, kTapeEnd);
            writer_ = std::thread([seq = seq_, tape = tape_] {
                try {
                    auto& source = seq->forward();
                    while (auto batch = source.receive()) {
                        tape->write(std::move(*batch));
                    }
                    tape->close();
                } catch (...) {
                    tape->fail(std::current_exception());
                }
            });
        }

        SeqRereader(const SeqRereader&) = delete;
        SeqRereader& operator=(const SeqRereader&) = delete;

        ~SeqRereader() override
        {
            forward_ = BatchStream{};
            if (writer_.joinable()) {
                writer_.join();
            }
        }

        [[nodiscard]] CreatorPtr creator() const override { return seq_->creator(); }
        BatchStream& forward() override { return forward_; }
        [[nodiscard]] VarSet variables() const override { return seq_->variables(); }

        void propagate(BatchStream upstream, Grad& grad) override
        {
            // Reaching the end of the tape means the writer has consumed the
            // wrapped stream, so seq_ can propagate without racing it.
            forward_.drain();
            seq_->propagate(std::move(upstream), grad);
        }

        BatchStream reread(std::int64_t start, std::int64_t end) override
        {
            return tape_->read(start, end);
        }

    private:
        SeqPtr seq_;
        TapePtr tape_;
        BatchStream forward_{};
        std::thread writer_{};
    };
}

#endif // SEQFLOW_TAPES_SEQ_REREADER_HPP
