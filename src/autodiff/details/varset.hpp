#ifndef SEQFLOW_AUTODIFF_VARSET_HPP
#define SEQFLOW_AUTODIFF_VARSET_HPP

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include <torch/torch.h>

namespace Seqflow::Autodiff {
    // Variables are learnable parameter tensors. Two handles on the same
    // tensor implementation are the same variable.
    using VariableKey = const c10::TensorImpl*;

    inline VariableKey variable_key(const torch::Tensor& variable)
    {
        if (!variable.defined()) {
            throw std::invalid_argument("Variables must be defined tensors.");
        }
        return variable.unsafeGetTensorImpl();
    }

    class VarSet {
    public:
        VarSet() = default;

        VarSet(std::initializer_list<torch::Tensor> variables)
        {
            for (const auto& variable : variables) {
                add(variable);
            }
        }

        void add(const torch::Tensor& variable)
        {
            entries_.emplace(variable_key(variable), variable);
        }

        [[nodiscard]] bool contains(const torch::Tensor& variable) const
        {
            return entries_.count(variable_key(variable)) != 0;
        }

        [[nodiscard]] bool contains(VariableKey key) const
        {
            return entries_.count(key) != 0;
        }

        [[nodiscard]] bool intersects(const VarSet& other) const
        {
            const auto& smaller = entries_.size() <= other.entries_.size() ? *this : other;
            const auto& larger = entries_.size() <= other.entries_.size() ? other : *this;
            for (const auto& [key, variable] : smaller.entries_) {
                if (larger.contains(key)) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] std::vector<torch::Tensor> variables() const
        {
            std::vector<torch::Tensor> out;
            out.reserve(entries_.size());
            for (const auto& [key, variable] : entries_) {
                out.push_back(variable);
            }
            return out;
        }

        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        // Union of two sets.
        [[nodiscard]] static VarSet merge(const VarSet& a, const VarSet& b)
        {
            VarSet out = a;
            out.entries_.insert(b.entries_.begin(), b.entries_.end());
            return out;
        }

    private:
        std::unordered_map<VariableKey, torch::Tensor> entries_{};
    };
}

#endif // SEQFLOW_AUTODIFF_VARSET_HPP
