#ifndef SEQFLOW_PACKS_PACKED_HPP
#define SEQFLOW_PACKS_PACKED_HPP

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "engine.hpp"

namespace Seqflow::Packs::Details {
    class PackedSeq final : public Seq {
    public:
        PackedSeq(CreatorPtr creator, std::vector<SeqPtr> inputs, PackOptions options)
            : engine_(std::move(creator), std::move(inputs), options) {}

        [[nodiscard]] CreatorPtr creator() const override { return engine_.creator(); }
        BatchStream& forward() override { return engine_.forward(); }
        [[nodiscard]] VarSet variables() const override { return engine_.variables(); }
        void propagate(BatchStream upstream, Grad& grad) override { engine_.propagate(std::move(upstream), grad); }

        [[nodiscard]] const Lifecycle& lifecycle() const { return engine_.lifecycle(); }

    private:
        PackEngine engine_;
    };

    class PackedRereader final : public Rereader {
    public:
        PackedRereader(CreatorPtr creator, std::vector<RereaderPtr> inputs, PackOptions options)
            : rereaders_(std::move(inputs)), engine_(std::move(creator), as_seqs_(rereaders_), options) {}

        [[nodiscard]] CreatorPtr creator() const override { return engine_.creator(); }
        BatchStream& forward() override { return engine_.forward(); }
        [[nodiscard]] VarSet variables() const override { return engine_.variables(); }
        void propagate(BatchStream upstream, Grad& grad) override { engine_.propagate(std::move(upstream), grad); }

        BatchStream reread(std::int64_t start, std::int64_t end) override
        {
            return engine_.reread(rereaders_, start, end);
        }

        [[nodiscard]] const Lifecycle& lifecycle() const { return engine_.lifecycle(); }

    private:
        static std::vector<SeqPtr> as_seqs_(const std::vector<RereaderPtr>& rereaders)
        {
            return std::vector<SeqPtr>(rereaders.begin(), rereaders.end());
        }

        std::vector<RereaderPtr> rereaders_;
        PackEngine engine_;
    };
}

#endif // SEQFLOW_PACKS_PACKED_HPP
