#ifndef SEQFLOW_BACKEND_CREATOR_HPP
#define SEQFLOW_BACKEND_CREATOR_HPP

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../common/error.hpp"

namespace Seqflow::Backend {
    // Numeric execution context shared by every batch of a stream. Vectors
    // are flat (1-D) tensors created with `options()`.
    class Creator {
    public:
        Creator() : Creator(torch::TensorOptions().dtype(torch::kFloat32)) {}
        explicit Creator(torch::TensorOptions options) : options_(std::move(options)) {}

        [[nodiscard]] const torch::TensorOptions& options() const noexcept { return options_; }

        [[nodiscard]] torch::Tensor empty() const
        {
            return torch::empty({0}, options_);
        }

        [[nodiscard]] torch::Tensor vector(std::initializer_list<double> values) const
        {
            return vector(std::vector<double>(values));
        }

        [[nodiscard]] torch::Tensor vector(const std::vector<double>& values) const
        {
            auto host = torch::tensor(values, torch::TensorOptions().dtype(torch::kFloat64));
            return host.to(options_);
        }

        [[nodiscard]] torch::Tensor concat(const std::vector<torch::Tensor>& vectors) const
        {
            std::vector<torch::Tensor> parts;
            parts.reserve(vectors.size());
            for (const auto& vector : vectors) {
                if (!vector.defined() || vector.numel() == 0) {
                    continue;
                }
                parts.push_back(vector.reshape({-1}));
            }
            if (parts.empty()) {
                return empty();
            }
            if (parts.size() == 1) {
                return parts.front();
            }
            return torch::cat(parts, 0);
        }

        [[nodiscard]] torch::Tensor slice(const torch::Tensor& vector, std::int64_t start, std::int64_t end) const
        {
            const auto size = length(vector);
            if (start < 0 || start > end || end > size) {
                Details::violation("Creator::slice range " + Details::format_range(start, end)
                                   + " is outside a vector of length " + std::to_string(size) + ".");
            }
            if (start == end) {
                return empty();
            }
            return vector.reshape({-1}).slice(0, start, end);
        }

        [[nodiscard]] std::int64_t length(const torch::Tensor& vector) const
        {
            return vector.defined() ? vector.numel() : 0;
        }

    private:
        torch::TensorOptions options_;
    };

    using CreatorPtr = std::shared_ptr<const Creator>;

    inline CreatorPtr make_creator(torch::TensorOptions options = torch::TensorOptions().dtype(torch::kFloat32))
    {
        return std::make_shared<const Creator>(std::move(options));
    }
}

#endif // SEQFLOW_BACKEND_CREATOR_HPP
