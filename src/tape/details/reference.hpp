#ifndef SEQFLOW_TAPES_REFERENCE_HPP
#define SEQFLOW_TAPES_REFERENCE_HPP

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../../common/error.hpp"
#include "../../seq/seq.hpp"
#include "../interface.hpp"

namespace Seqflow::Tapes::Details {
    // Append-only step storage shared between a tape and its readers.
    class Recording {
    public:
        void append(Batch batch)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    ::Seqflow::Details::violation("ReferenceTape::write called after the tape was closed.");
                }
                steps_.push_back(std::move(batch));
            }
            changed_.notify_all();
        }

        void close(std::exception_ptr error = nullptr)
        {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (closed_) {
                    return;
                }
                closed_ = true;
                error_ = std::move(error);
            }
            changed_.notify_all();
        }

        void wake()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            changed_.notify_all();
        }

        // Step `index` once written; std::nullopt if the tape closed before
        // reaching it or the reader went away.
        std::optional<Batch> await(std::size_t index, const BatchSender& reader)
        {
            std::unique_lock<std::mutex> lock(mutex_);
            changed_.wait(lock, [&] { return index < steps_.size() || closed_ || reader.abandoned(); });
            if (index < steps_.size()) {
                return steps_[index];
            }
            return std::nullopt;
        }

        [[nodiscard]] std::exception_ptr error() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return error_;
        }

        [[nodiscard]] std::size_t size() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return steps_.size();
        }

        [[nodiscard]] bool closed() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return closed_;
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable changed_;
        std::vector<Batch> steps_{};
        bool closed_{false};
        std::exception_ptr error_{};
    };

    class ReferenceTape final : public ::Seqflow::Tape {
    public:
        ReferenceTape(CreatorPtr creator, TapeOptions options)
            : creator_(std::move(creator)), options_(options), recording_(std::make_shared<Recording>())
        {
            if (!creator_) {
                throw std::invalid_argument("ReferenceTape requires a creator.");
            }
        }

        ~ReferenceTape() override { recording_->close(); }

        [[nodiscard]] CreatorPtr creator() const override { return creator_; }

        void write(Batch batch) override { recording_->append(std::move(batch)); }
        void close() override { recording_->close(); }
        void fail(std::exception_ptr error) override { recording_->close(std::move(error)); }

        BatchStream read(std::int64_t start, std::int64_t end) override
        {
            validate_range("ReferenceTape::read", start, end);
            auto recording = recording_;
            return spawn_stream<Batch>(
                [recording, start, end](BatchSender& out) {
                    out.on_abandon([recording] { recording->wake(); });
                    for (auto index = start; end == kTapeEnd || index < end; ++index) {
                        auto step = recording->await(static_cast<std::size_t>(index), out);
                        if (!step) {
                            if (out.abandoned()) {
                                return;
                            }
                            if (auto error = recording->error()) {
                                std::rethrow_exception(error);
                            }
                            if (end == kTapeEnd) {
                                return;
                            }
                            ::Seqflow::Details::violation(
                                "ReferenceTape::read range " + ::Seqflow::Details::format_range(start, end)
                                + " extends past the " + std::to_string(recording->size()) + " recorded steps.");
                        }
                        if (!out.send(std::move(*step))) {
                            return;
                        }
                    }
                },
                options_.stream_capacity);
        }

        [[nodiscard]] std::size_t size() const { return recording_->size(); }
        [[nodiscard]] bool closed() const { return recording_->closed(); }

    private:
        CreatorPtr creator_;
        TapeOptions options_;
        std::shared_ptr<Recording> recording_;
    };
}

#endif // SEQFLOW_TAPES_REFERENCE_HPP
