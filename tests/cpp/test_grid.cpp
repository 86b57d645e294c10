#include <catch2/catch_test_macros.hpp>
#include "crossfill/errors.hpp"
#include "crossfill/grid.hpp"
#include <string>
#include <vector>

using namespace crossfill;

namespace {

// '_' = 文字セル、それ以外 = 黒マス
Structure make_structure(const std::vector<std::string>& rows) {
    Structure structure;
    for (const auto& row : rows) {
        std::vector<bool> cells;
        for (char ch : row) {
            cells.push_back(ch == '_');
        }
        structure.push_back(cells);
    }
    return structure;
}

}  // namespace

// ============================================================================
// Topology::from_structure
// ============================================================================

TEST_CASE("Topology of a plus-shaped cross", "[grid]") {
    auto topology = Topology::from_structure(make_structure({
        "#_#",
        "___",
        "#_#",
    }));

    REQUIRE(topology.rows() == 3);
    REQUIRE(topology.cols() == 3);
    REQUIRE(topology.slots().size() == 2);

    SECTION("slots are in row-major scan order") {
        const auto& down = topology.slot(0);
        REQUIRE(down.direction == Direction::Down);
        REQUIRE(down.start == Cell{0, 1});
        REQUIRE(down.length() == 3);

        const auto& across = topology.slot(1);
        REQUIRE(across.direction == Direction::Across);
        REQUIRE(across.start == Cell{1, 0});
        REQUIRE(across.length() == 3);
        REQUIRE(across.cells[2] == Cell{1, 2});
    }

    SECTION("single intersection at the centre") {
        REQUIRE(topology.intersections().size() == 1);
        const auto& x = topology.intersections()[0];
        REQUIRE(x.cell == Cell{1, 1});
        REQUIRE(x.across == 1);
        REQUIRE(x.across_offset == 1);
        REQUIRE(x.down == 0);
        REQUIRE(x.down_offset == 1);
    }

    SECTION("overlap is symmetric") {
        auto ab = topology.overlap(0, 1);
        auto ba = topology.overlap(1, 0);
        REQUIRE(ab.has_value());
        REQUIRE(ba.has_value());
        REQUIRE(ab->first == ba->second);
        REQUIRE(ab->second == ba->first);
    }

    SECTION("neighbors") {
        REQUIRE(topology.neighbors(0) == std::vector<size_t>{1});
        REQUIRE(topology.neighbors(1) == std::vector<size_t>{0});
    }
}

TEST_CASE("Topology of a ring", "[grid]") {
    auto topology = Topology::from_structure(make_structure({
        "___",
        "_#_",
        "___",
    }));

    // (0,0) across, (0,0) down, (0,2) down, (2,0) across
    REQUIRE(topology.slots().size() == 4);
    REQUIRE(topology.slot(0).direction == Direction::Across);
    REQUIRE(topology.slot(1).direction == Direction::Down);
    REQUIRE(topology.slot(1).start == Cell{0, 0});
    REQUIRE(topology.slot(2).start == Cell{0, 2});
    REQUIRE(topology.slot(3).start == Cell{2, 0});

    REQUIRE(topology.intersections().size() == 4);
    REQUIRE(topology.intersections_of(0).size() == 2);

    SECTION("offsets of the corner cells") {
        auto top_right = topology.overlap(0, 2);
        REQUIRE(top_right.has_value());
        REQUIRE(top_right->first == 2);
        REQUIRE(top_right->second == 0);

        auto bottom_left = topology.overlap(3, 1);
        REQUIRE(bottom_left.has_value());
        REQUIRE(bottom_left->first == 0);
        REQUIRE(bottom_left->second == 2);
    }

    SECTION("parallel slots never intersect") {
        REQUIRE(!topology.overlap(0, 3).has_value());
        REQUIRE(!topology.overlap(1, 2).has_value());
    }

    SECTION("slot numbering shares numbers at a common start cell") {
        auto numbers = topology.slot_numbers();
        REQUIRE(numbers == std::vector<size_t>{1, 1, 2, 3});
    }
}

TEST_CASE("Topology rejects ragged rows", "[grid]") {
    auto structure = make_structure({
        "___",
        "__",
        "___",
    });
    REQUIRE_THROWS_AS(Topology::from_structure(structure), MalformedGridError);
}

TEST_CASE("Topology without slots", "[grid]") {
    SECTION("all cells closed") {
        auto topology = Topology::from_structure(make_structure({"###", "###"}));
        REQUIRE(topology.slots().empty());
        REQUIRE(topology.intersections().empty());
    }

    SECTION("empty matrix") {
        auto topology = Topology::from_structure(Structure{});
        REQUIRE(topology.rows() == 0);
        REQUIRE(topology.slots().empty());
    }
}

TEST_CASE("Single open cells", "[grid]") {
    auto isolated = make_structure({
        "_#",
        "##",
    });

    SECTION("ignored by default") {
        auto topology = Topology::from_structure(isolated);
        REQUIRE(topology.slots().empty());
        REQUIRE(topology.is_open(0, 0));
    }

    SECTION("rejected on request") {
        TopologyOptions options;
        options.single_cells = SingleCellPolicy::Reject;
        REQUIRE_THROWS_AS(Topology::from_structure(isolated, options), MalformedGridError);
    }

    SECTION("a length-1 run inside another slot is not an orphan") {
        TopologyOptions options;
        options.single_cells = SingleCellPolicy::Reject;
        auto topology = Topology::from_structure(make_structure({"_#", "_#"}), options);
        REQUIRE(topology.slots().size() == 1);
        REQUIRE(topology.slot(0).direction == Direction::Down);
    }
}

// ============================================================================
// Topology::from_slots
// ============================================================================

TEST_CASE("Topology from explicit slots", "[grid]") {
    SECTION("matches the scanned topology") {
        // 入力順に関係なく走査順の ID になる
        auto topology = Topology::from_slots(3, 3, {
            {{1, 0}, Direction::Across, 3},
            {{0, 1}, Direction::Down, 3},
        });
        auto scanned = Topology::from_structure(make_structure({"#_#", "___", "#_#"}));

        REQUIRE(topology.slots().size() == scanned.slots().size());
        for (size_t i = 0; i < topology.slots().size(); ++i) {
            REQUIRE(topology.slot(i).start == scanned.slot(i).start);
            REQUIRE(topology.slot(i).direction == scanned.slot(i).direction);
        }
        REQUIRE(topology.intersections().size() == 1);
        REQUIRE(topology.is_open(1, 1));
        REQUIRE(!topology.is_open(0, 0));
    }

    SECTION("identical slots are an error") {
        std::vector<SlotSpec> specs = {
            {{0, 0}, Direction::Across, 3},
            {{0, 0}, Direction::Across, 3},
        };
        REQUIRE_THROWS_AS(Topology::from_slots(3, 3, specs), MalformedGridError);
    }

    SECTION("overlapping same-direction slots are an error") {
        std::vector<SlotSpec> specs = {
            {{0, 0}, Direction::Across, 3},
            {{0, 1}, Direction::Across, 2},
        };
        REQUIRE_THROWS_AS(Topology::from_slots(3, 3, specs), MalformedGridError);
    }

    SECTION("too short slots are an error") {
        std::vector<SlotSpec> one = {{{0, 0}, Direction::Down, 1}};
        std::vector<SlotSpec> zero = {{{0, 0}, Direction::Down, 0}};
        REQUIRE_THROWS_AS(Topology::from_slots(3, 3, one), MalformedGridError);
        REQUIRE_THROWS_AS(Topology::from_slots(3, 3, zero), MalformedGridError);
    }

    SECTION("slots leaving the grid are an error") {
        std::vector<SlotSpec> specs = {{{1, 2}, Direction::Across, 2}};
        REQUIRE_THROWS_AS(Topology::from_slots(3, 3, specs), MalformedGridError);
    }
}
