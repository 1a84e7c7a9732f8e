#ifndef SEQFLOW_LIBRARY_H
#define SEQFLOW_LIBRARY_H

#include "../src/common/channel.hpp"
#include "../src/common/error.hpp"
#include "../src/common/task.hpp"
#include "../src/utils/monitor.hpp"

#include "../src/backend/creator.hpp"
#include "../src/autodiff/autodiff.hpp"
#include "../src/batch/batch.hpp"
#include "../src/seq/seq.hpp"
#include "../src/conversion/conversion.hpp"
#include "../src/tape/tape.hpp"
#include "../src/pack/pack.hpp"

// Public umbrella header.
// -----------------------------------------------------------------------------
//  - Sequences are streams of per-step Batches (seq/), produced by eager data
//    (conversion/), tapes (tape/) or other sequences (pack/).
//  - Everything is header-only; link against LibTorch and a threads library.

#endif // SEQFLOW_LIBRARY_H
