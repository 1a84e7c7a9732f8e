#ifndef SEQFLOW_TAPE_HPP
#define SEQFLOW_TAPE_HPP

#include <memory>
#include <stdexcept>
#include <utility>

#include "interface.hpp"
#include "details/reference.hpp"
#include "details/seq_rereader.hpp"
#include "details/tape_rereader.hpp"

namespace Seqflow {
    // In-memory Tape. Useful on its own and as the storage behind SeqRereader.
    inline std::shared_ptr<Tapes::Details::ReferenceTape> ReferenceTape(CreatorPtr creator, TapeOptions options = {})
    {
        return std::make_shared<Tapes::Details::ReferenceTape>(std::move(creator), options);
    }

    // Constant Rereader whose steps come from `tape`.
    inline RereaderPtr TapeRereader(TapePtr tape)
    {
        return std::make_shared<Tapes::Details::TapeRereader>(std::move(tape));
    }

    // Converts `seq` into a Rereader by recording its steps onto `tape`.
    inline RereaderPtr SeqRereader(SeqPtr seq, TapePtr tape)
    {
        return std::make_shared<Tapes::Details::SeqRereader>(std::move(seq), std::move(tape));
    }

    // SeqRereader backed by a fresh ReferenceTape.
    inline RereaderPtr SeqRereader(SeqPtr seq, TapeOptions options = {})
    {
        if (!seq) {
            throw std::invalid_argument("SeqRereader requires a non-null sequence.");
        }
        auto tape = ReferenceTape(seq->creator(), options);
        return SeqRereader(std::move(seq), std::move(tape));
    }
}

#endif // SEQFLOW_TAPE_HPP
