#ifndef SEQFLOW_AUTODIFF_GRADIENT_HPP
#define SEQFLOW_AUTODIFF_GRADIENT_HPP

#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

#include <torch/torch.h>

#include "varset.hpp"

namespace Seqflow::Autodiff {
    // Accumulator mapping each tracked variable to the sum of the gradients
    // propagated into it. Entries start at zero.
    class Gradient {
    public:
        Gradient() = default;

        explicit Gradient(const VarSet& variables)
        {
            for (const auto& variable : variables.variables()) {
                track(variable);
            }
        }

        void track(const torch::Tensor& variable)
        {
            torch::NoGradGuard no_grad;
            const auto key = variable_key(variable);
            if (entries_.count(key) == 0) {
                entries_.emplace(key, Entry{variable, torch::zeros_like(variable)});
            }
        }

        [[nodiscard]] bool intersects(const VarSet& variables) const
        {
            for (const auto& [key, entry] : entries_) {
                if (variables.contains(key)) {
                    return true;
                }
            }
            return false;
        }

        // Adds `delta` to the variable's entry; untracked variables are ignored.
        void accumulate(const torch::Tensor& variable, const torch::Tensor& delta)
        {
            const auto it = entries_.find(variable_key(variable));
            if (it == entries_.end()) {
                return;
            }
            if (delta.numel() != it->second.value.numel()) {
                throw std::invalid_argument("Gradient::accumulate received a delta of "
                                            + std::to_string(delta.numel()) + " elements for a variable of "
                                            + std::to_string(it->second.value.numel()) + ".");
            }
            torch::NoGradGuard no_grad;
            it->second.value.add_(delta.detach().reshape_as(it->second.value).to(it->second.value.options()));
        }

        [[nodiscard]] std::optional<torch::Tensor> at(const torch::Tensor& variable) const
        {
            const auto it = entries_.find(variable_key(variable));
            if (it == entries_.end()) {
                return std::nullopt;
            }
            return it->second.value;
        }

    private:
        struct Entry {
            torch::Tensor variable;
            torch::Tensor value;
        };

        std::unordered_map<VariableKey, Entry> entries_{};
    };
}

#endif // SEQFLOW_AUTODIFF_GRADIENT_HPP
