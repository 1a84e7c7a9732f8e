#include <catch2/catch_test_macros.hpp>

#include <optional>
#include <vector>

#include "support.hpp"

using namespace Seqflow;
using Seqflow::Testing::creator;
using Seqflow::Testing::same;
using Seqflow::Testing::step;

TEST_CASE("join concatenates lanes and skips filler data") {
    const auto a = step({true, false, true}, {1, 2, 3, 4});
    const auto filler = Batches::filler(*creator(), 2);
    const auto b = step({true}, {5, 6});

    const auto joined = Batches::join(*creator(), {a, filler, b});

    CHECK(joined.present == std::vector<bool>{true, false, true, false, false, true});
    CHECK(joined.num_present() == 3);
    CHECK(same(joined, step(joined.present, {1, 2, 3, 4, 5, 6})));
}

TEST_CASE("split recovers exactly what join was given") {
    const std::vector<Batch> parts{
        step({true, true}, {1, 2, 3, 4}),
        step({false, true, true}, {5, 6, 7, 8}),
        step({true}, {9, 10}),
    };
    const auto joined = Batches::join(*creator(), parts);
    const auto recovered = Batches::split(*creator(), joined, {2, 3, 1});

    REQUIRE(recovered.size() == parts.size());
    for (std::size_t index = 0; index < parts.size(); ++index) {
        REQUIRE(recovered[index].has_value());
        CHECK(same(*recovered[index], parts[index]));
    }
}

TEST_CASE("split yields no batch for an all-filler lane range") {
    const auto joined = Batches::join(*creator(), {
        Batches::filler(*creator(), 2),
        step({true}, {1.5, 2.5}),
        Batches::filler(*creator(), 1),
    });
    const auto recovered = Batches::split(*creator(), joined, {2, 1, 1});

    CHECK_FALSE(recovered[0].has_value());
    REQUIRE(recovered[1].has_value());
    CHECK(same(*recovered[1], step({true}, {1.5, 2.5})));
    CHECK_FALSE(recovered[2].has_value());
}

TEST_CASE("an all-filler batch splits into nothing") {
    const auto joined = Batches::join(*creator(), {Batches::filler(*creator(), 2), Batches::filler(*creator(), 3)});
    CHECK(joined.is_filler());
    CHECK(creator()->length(joined.packed) == 0);

    const auto recovered = Batches::split(*creator(), joined, {2, 3});
    CHECK_FALSE(recovered[0].has_value());
    CHECK_FALSE(recovered[1].has_value());
}

TEST_CASE("split rejects lane counts that do not cover the batch") {
    const auto batch = step({true, true, true}, {1, 2, 3});
    CHECK_THROWS_AS(Batches::split(*creator(), batch, {1, 1}), ContractViolation);
    CHECK_THROWS_AS(Batches::split(*creator(), batch, {2, 2}), ContractViolation);
}

TEST_CASE("split rejects packed data that cannot be shared evenly between lanes") {
    const auto batch = step({true, true}, {1, 2, 3});
    CHECK_THROWS_AS(Batches::split(*creator(), batch, {1, 1}), ContractViolation);
}

TEST_CASE("filler has the requested lanes and no data") {
    const auto filler = Batches::filler(*creator(), 4);
    CHECK(filler.lanes() == 4);
    CHECK(filler.is_filler());
    CHECK(creator()->length(filler.packed) == 0);
}

TEST_CASE("Creator slices and concatenates flat vectors") {
    const auto& backend = *creator();
    const auto vector = backend.vector({1, 2, 3, 4});

    CHECK(backend.length(backend.slice(vector, 1, 3)) == 2);
    CHECK(torch::equal(backend.slice(vector, 1, 3), backend.vector({2, 3})));
    CHECK(backend.length(backend.concat({})) == 0);
    CHECK(torch::equal(backend.concat({vector, backend.empty(), backend.vector({5})}), backend.vector({1, 2, 3, 4, 5})));
    CHECK_THROWS_AS(backend.slice(vector, 3, 5), ContractViolation);
    CHECK_THROWS_AS(backend.slice(vector, 2, 1), ContractViolation);
}
