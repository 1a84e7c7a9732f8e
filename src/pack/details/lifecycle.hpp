#ifndef SEQFLOW_PACKS_LIFECYCLE_HPP
#define SEQFLOW_PACKS_LIFECYCLE_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "../../autodiff/autodiff.hpp"
#include "../../common/error.hpp"

namespace Seqflow::Packs::Details {
    // Bookkeeping of a pack, complete once its forward stream has ended.
    struct Summary {
        std::vector<std::size_t> lanes_per_seq{};
        std::vector<std::int64_t> lengths{};
        VarSet variables{};
        std::int64_t steps{0};
    };

    // Pending -> Finalized, or Pending -> Failed if the forward pass threw or
    // was abandoned. Only the forward producer moves the state.
    class Lifecycle {
    public:
        enum class State {
            Pending,
            Finalized,
            Failed
        };

        void finalize(Summary summary)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Pending) {
                return;
            }
            summary_ = std::move(summary);
            state_ = State::Finalized;
        }

        void fail(std::exception_ptr error)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_ != State::Pending) {
                return;
            }
            error_ = std::move(error);
            state_ = State::Failed;
        }

        [[nodiscard]] State state() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return state_;
        }

        [[nodiscard]] bool finalized() const { return state() == State::Finalized; }

        // The summary may only be read once finalized; it never changes after that.
        [[nodiscard]] const Summary& require(const std::string& operation) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            switch (state_) {
                case State::Finalized:
                    return summary_;
                case State::Failed:
                    std::rethrow_exception(error_);
                case State::Pending:
                    break;
            }
            ::Seqflow::Details::violation(operation + " requires the pack's forward stream to be fully drained first.");
        }

    private:
        mutable std::mutex mutex_;
        State state_{State::Pending};
        Summary summary_{};
        std::exception_ptr error_{};
    };
}

#endif // SEQFLOW_PACKS_LIFECYCLE_HPP
