#ifndef SEQFLOW_COMMON_ERROR_HPP
#define SEQFLOW_COMMON_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace Seqflow {
    // Raised when a caller breaks the streaming protocol: malformed ranges,
    // wrong gradient step counts, access before a pack is finalized, ...
    class ContractViolation : public std::logic_error {
    public:
        using std::logic_error::logic_error;
    };

    namespace Details {
        [[noreturn]] inline void violation(const std::string& message)
        {
            throw ContractViolation(message);
        }

        inline std::string format_range(std::int64_t start, std::int64_t end)
        {
            return "[" + std::to_string(start) + ", " + std::to_string(end) + ")";
        }
    }
}

#endif // SEQFLOW_COMMON_ERROR_HPP
