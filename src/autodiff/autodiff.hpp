#ifndef SEQFLOW_AUTODIFF_HPP
#define SEQFLOW_AUTODIFF_HPP

#include "details/varset.hpp"
#include "details/gradient.hpp"
#include "details/grad.hpp"

namespace Seqflow {
    using Autodiff::VarSet;
    using Autodiff::Gradient;
    using Autodiff::Grad;
}

#endif // SEQFLOW_AUTODIFF_HPP
