#ifndef SEQFLOW_SEQ_HPP
#define SEQFLOW_SEQ_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "../autodiff/autodiff.hpp"
#include "../backend/creator.hpp"
#include "../batch/batch.hpp"
#include "../common/channel.hpp"

namespace Seqflow {
    using Backend::Creator;
    using Backend::CreatorPtr;

    using BatchStream = Stream<Batch>;
    using BatchSender = Sender<Batch>;

    /*
     * A lazily evaluated sequence.
     *
     *  - forward() is the single stream of output steps, in time order. It is
     *    read at most once, possibly by several callers in turn.
     *  - variables() is final once forward() has been read to the end.
     *  - propagate() consumes one gradient batch per output step, last step
     *    first, and accumulates into `grad`. It always drains forward() so the
     *    task producing it can finish, whether or not anyone read it.
     */
    class Seq {
    public:
        virtual ~Seq() = default;

        [[nodiscard]] virtual CreatorPtr creator() const = 0;
        virtual BatchStream& forward() = 0;
        [[nodiscard]] virtual VarSet variables() const = 0;
        virtual void propagate(BatchStream upstream, Grad& grad) = 0;
    };

    // A Seq whose steps can be streamed again, any half-open range at a time.
    class Rereader : public Seq {
    public:
        virtual BatchStream reread(std::int64_t start, std::int64_t end) = 0;
    };

    // A sequence whose whole output already sits in memory.
    // propagate() takes the gradients in step order.
    class EagerSeq {
    public:
        virtual ~EagerSeq() = default;

        [[nodiscard]] virtual CreatorPtr creator() const = 0;
        [[nodiscard]] virtual const std::vector<Batch>& output() const = 0;
        [[nodiscard]] virtual VarSet variables() const = 0;
        virtual void propagate(const std::vector<Batch>& upstream, Gradient& grad) = 0;
    };

    using SeqPtr = std::shared_ptr<Seq>;
    using RereaderPtr = std::shared_ptr<Rereader>;
    using EagerSeqPtr = std::shared_ptr<EagerSeq>;
}

#endif // SEQFLOW_SEQ_HPP
