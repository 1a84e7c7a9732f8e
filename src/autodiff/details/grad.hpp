#ifndef SEQFLOW_AUTODIFF_GRAD_HPP
#define SEQFLOW_AUTODIFF_GRAD_HPP

#include <mutex>
#include <utility>

#include "gradient.hpp"

namespace Seqflow::Autodiff {
    // Serialised access to a Gradient shared by concurrent propagate workers.
    // The wrapped Gradient must outlive the Grad.
    class Grad {
    public:
        explicit Grad(Gradient& gradient) : gradient_(gradient) {}

        Grad(const Grad&) = delete;
        Grad& operator=(const Grad&) = delete;

        template <class Fn>
        decltype(auto) use(Fn&& fn)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return std::forward<Fn>(fn)(gradient_);
        }

    private:
        Gradient& gradient_;
        std::mutex mutex_{};
    };
}

#endif // SEQFLOW_AUTODIFF_GRAD_HPP
