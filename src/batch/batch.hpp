#ifndef SEQFLOW_BATCH_HPP
#define SEQFLOW_BATCH_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../backend/creator.hpp"
#include "../common/error.hpp"

namespace Seqflow {
    // All lanes of a stream at one time step. `packed` holds the feature
    // vectors of the present lanes only, concatenated in lane order.
    struct Batch {
        std::vector<bool> present{};
        torch::Tensor packed{};

        [[nodiscard]] std::size_t lanes() const noexcept { return present.size(); }

        [[nodiscard]] std::size_t num_present() const
        {
            return static_cast<std::size_t>(std::count(present.begin(), present.end(), true));
        }

        [[nodiscard]] bool is_filler() const { return num_present() == 0; }
    };

    namespace Batches {
        // Stand-in for `lanes` lanes whose sequence has already ended.
        inline Batch filler(const Backend::Creator& creator, std::size_t lanes)
        {
            return Batch{std::vector<bool>(lanes, false), creator.empty()};
        }

        inline Batch join(const Backend::Creator& creator, const std::vector<Batch>& batches)
        {
            std::vector<torch::Tensor> packed;
            std::vector<bool> present;
            for (const auto& batch : batches) {
                // Filler batches contribute lanes but no data.
                if (batch.num_present() != 0) {
                    packed.push_back(batch.packed);
                }
                present.insert(present.end(), batch.present.begin(), batch.present.end());
            }
            return Batch{std::move(present), creator.concat(packed)};
        }

        // Inverse of join: one entry per input, std::nullopt where none of the
        // input's lanes are present.
        inline std::vector<std::optional<Batch>> split(const Backend::Creator& creator,
                                                       const Batch& batch,
                                                       const std::vector<std::size_t>& lane_counts)
        {
            std::size_t total_lanes = 0;
            for (const auto count : lane_counts) {
                total_lanes += count;
            }
            if (total_lanes != batch.lanes()) {
                Details::violation("Batches::split expected " + std::to_string(total_lanes)
                                   + " lanes but the batch has " + std::to_string(batch.lanes()) + ".");
            }

            std::vector<std::optional<Batch>> out(lane_counts.size());
            const auto num_present = static_cast<std::int64_t>(batch.num_present());
            if (num_present == 0) {
                return out;
            }

            const auto packed_length = creator.length(batch.packed);
            if (packed_length % num_present != 0) {
                Details::violation("Batches::split cannot divide " + std::to_string(packed_length)
                                   + " packed values between " + std::to_string(num_present) + " present lanes.");
            }
            const auto width = packed_length / num_present;

            std::size_t lane_offset = 0;
            std::int64_t vector_offset = 0;
            for (std::size_t input = 0; input < lane_counts.size(); ++input) {
                const auto lanes = lane_counts[input];
                Batch part{};
                part.present.assign(batch.present.begin() + static_cast<std::ptrdiff_t>(lane_offset),
                                    batch.present.begin() + static_cast<std::ptrdiff_t>(lane_offset + lanes));
                const auto part_present = static_cast<std::int64_t>(part.num_present());
                if (part_present > 0) {
                    part.packed = creator.slice(batch.packed,
                                                vector_offset * width,
                                                (vector_offset + part_present) * width);
                    vector_offset += part_present;
                    out[input] = std::move(part);
                }
                lane_offset += lanes;
            }
            return out;
        }
    }
}

#endif // SEQFLOW_BATCH_HPP
