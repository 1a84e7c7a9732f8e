#ifndef SEQFLOW_PACK_HPP
#define SEQFLOW_PACK_HPP

#include <memory>
#include <utility>
#include <vector>

#include "../seq/seq.hpp"
#include "details/engine.hpp"
#include "details/lifecycle.hpp"
#include "details/packed.hpp"

namespace Seqflow {
    using PackPtr = std::shared_ptr<Packs::Details::PackedSeq>;
    using PackRereaderPtr = std::shared_ptr<Packs::Details::PackedRereader>;

    // Aggregates several sequences into one with wider batches. Lanes are laid
    // out in input order; inputs that end early contribute filler lanes until
    // the longest one ends.
    inline PackPtr Pack(CreatorPtr creator, std::vector<SeqPtr> seqs, PackOptions options = {})
    {
        return std::make_shared<Packs::Details::PackedSeq>(std::move(creator), std::move(seqs), options);
    }

    // Pack over rereaders; reread() becomes available once the forward stream
    // has been drained.
    inline PackRereaderPtr PackRereader(CreatorPtr creator, std::vector<RereaderPtr> rereaders, PackOptions options = {})
    {
        return std::make_shared<Packs::Details::PackedRereader>(std::move(creator), std::move(rereaders), options);
    }
}

#endif // SEQFLOW_PACK_HPP
