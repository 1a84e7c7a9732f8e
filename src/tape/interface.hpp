#ifndef SEQFLOW_TAPE_INTERFACE_HPP
#define SEQFLOW_TAPE_INTERFACE_HPP

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <string>

#include "../common/error.hpp"
#include "../seq/seq.hpp"

namespace Seqflow {
    // Passed as `end` to Tape::read to stream through the end of the data.
    inline constexpr std::int64_t kTapeEnd = -1;

    struct TapeOptions {
        std::size_t stream_capacity{1};
    };

    /*
     * Append-only recording of a sequence, addressed by time index.
     *
     *  - write() appends the next step; close() marks the end of the data and
     *    fail() ends it with an error that readers rethrow once they run out
     *    of recorded steps.
     *  - read(start, end) streams [start, end), waiting for steps that are
     *    still being written. Reads are independent of each other and of the
     *    writer, and preserve write order.
     */
    class Tape {
    public:
        virtual ~Tape() = default;

        [[nodiscard]] virtual CreatorPtr creator() const = 0;
        virtual void write(Batch batch) = 0;
        virtual void close() = 0;
        virtual void fail(std::exception_ptr error) = 0;
        virtual BatchStream read(std::int64_t start, std::int64_t end) = 0;
    };

    using TapePtr = std::shared_ptr<Tape>;

    namespace Tapes::Details {
        inline void validate_range(const std::string& operation, std::int64_t start, std::int64_t end)
        {
            if (start < 0 || (end != kTapeEnd && end < start)) {
                ::Seqflow::Details::violation(operation + " received the malformed range "
                                              + ::Seqflow::Details::format_range(start, end) + ".");
            }
        }
    }
}

#endif // SEQFLOW_TAPE_INTERFACE_HPP
