#ifndef SEQFLOW_CONVERSION_HPP
#define SEQFLOW_CONVERSION_HPP

#include <memory>
#include <utility>

#include "../seq/seq.hpp"
#include "../seq/details/constant.hpp"
#include "details/lazify.hpp"
#include "details/unlazify.hpp"

namespace Seqflow {
    // Lazy, rereadable view of an eager sequence.
    inline RereaderPtr Lazify(EagerSeqPtr seq)
    {
        return std::make_shared<Conversion::Details::LazifiedSeq>(std::move(seq));
    }

    // Reads `seq` to the end and keeps its outputs in memory. `seq` must not
    // have been read from or propagated through.
    inline EagerSeqPtr Unlazify(SeqPtr seq)
    {
        return std::make_shared<Conversion::Details::UnlazifiedSeq>(std::move(seq));
    }

    // Convenience leaf: a constant lazy sequence over `steps`.
    inline RereaderPtr Constant(CreatorPtr creator, std::vector<Batch> steps)
    {
        return Lazify(Eager::Constant(std::move(creator), std::move(steps)));
    }
}

#endif // SEQFLOW_CONVERSION_HPP
