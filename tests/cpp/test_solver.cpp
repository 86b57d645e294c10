#include <catch2/catch_test_macros.hpp>
#include "crossfill/assignment.hpp"
#include "crossfill/errors.hpp"
#include "crossfill/grid.hpp"
#include "crossfill/solver.hpp"
#include "crossfill/word_pool.hpp"
#include <string>
#include <vector>

using namespace crossfill;

namespace {

Topology make_topology(const std::vector<std::string>& rows) {
    Structure structure;
    for (const auto& row : rows) {
        std::vector<bool> cells;
        for (char ch : row) {
            cells.push_back(ch == '_');
        }
        structure.push_back(cells);
    }
    return Topology::from_structure(structure);
}

// 中央で交差する長さ3の Down (slot 0) と Across (slot 1)
Topology cross3() {
    return make_topology({
        "#_#",
        "___",
        "#_#",
    });
}

// 5x3 の梯子型: Across 2本と Down 3本
Topology ladder() {
    return make_topology({
        "_____",
        "_#_#_",
        "_____",
    });
}

std::vector<std::string> ladder_words() {
    return {"DOG", "HOUSE", "CRANE", "BEE", "CAT", "TIGER", "ART", "ACE", "TUTOR", "EAR"};
}

void require_valid(const Topology& topology, const WordPool& pool, const Assignment& assignment) {
    std::string reason;
    bool ok = verify_assignment(topology, pool, assignment, &reason);
    INFO(reason);
    REQUIRE(ok);
}

}  // namespace

// ============================================================================
// Basic scenarios
// ============================================================================

TEST_CASE("Solver with a single slot", "[solver]") {
    auto topology = make_topology({"___"});
    REQUIRE(topology.slots().size() == 1);

    SECTION("the only matching word is used") {
        WordPool pool({"cat", "HOUSE"});
        Solver solver;
        auto assignment = solver.solve(topology, pool);
        REQUIRE(assignment.has_value());
        REQUIRE(assignment->word(0) == "CAT");
        REQUIRE(solver.result() == SearchResult::SAT);
        require_valid(topology, pool, *assignment);
    }

    SECTION("no word of matching length is unsatisfiable") {
        WordPool pool({"DOGS", "HOUSE"});
        Solver solver;
        REQUIRE(!solver.solve(topology, pool).has_value());
        REQUIRE(solver.result() == SearchResult::UNSAT);
        REQUIRE_THROWS_AS(solver.fill(topology, pool), UnsatisfiableError);
        REQUIRE_THROWS_AS(solver.fill(topology, pool), InsufficientPoolError);
    }
}

TEST_CASE("Solver on a two-slot cross", "[solver]") {
    auto topology = cross3();

    SECTION("no pair shares a middle letter") {
        // CAT, DOG, ACE の中央文字は全て異なる
        WordPool pool({"CAT", "DOG", "ACE"});
        Solver solver;
        REQUIRE(!solver.solve(topology, pool).has_value());
        REQUIRE(solver.result() == SearchResult::UNSAT);
        REQUIRE_THROWS_AS(solver.fill(topology, pool), UnsatisfiableError);
    }

    SECTION("a compatible pair is found") {
        WordPool pool({"CAT", "DOG", "ACE", "BAD"});
        Solver solver;
        auto assignment = solver.fill(topology, pool);
        require_valid(topology, pool, assignment);

        // MRV が同点なので slot 0 (Down) から追加順に試す
        REQUIRE(assignment.word(0) == "CAT");
        REQUIRE(assignment.word(1) == "BAD");
        REQUIRE(assignment.letter_grid(topology) == std::vector<std::string>{"#C#", "BAD", "#T#"});
    }

    SECTION("backtracking past a dead end") {
        WordPool pool({"DOG", "CAT", "BAD"});

        Solver fc;
        fc.set_arc_consistency(false);
        auto with_fc = fc.fill(topology, pool);
        REQUIRE(with_fc.word(0) == "CAT");
        REQUIRE(with_fc.word(1) == "BAD");
        REQUIRE(fc.stats().prune_count == 1);  // DOG は前方チェックで棄却

        Solver plain;
        plain.set_arc_consistency(false);
        plain.set_forward_checking(false);
        auto without_fc = plain.fill(topology, pool);
        REQUIRE(without_fc == with_fc);
        REQUIRE(plain.stats().backtracks >= 1);
    }
}

TEST_CASE("Solver on an empty grid", "[solver]") {
    auto topology = make_topology({"###", "###"});
    WordPool pool({"CAT"});
    Solver solver;

    auto assignment = solver.solve(topology, pool);
    REQUIRE(assignment.has_value());
    REQUIRE(assignment->num_slots() == 0);
    REQUIRE(solver.result() == SearchResult::SAT);
    REQUIRE(solver.stats().nodes == 0);
}

TEST_CASE("Solver never reuses a word", "[solver]") {
    // 独立した長さ3のスロットが2つ
    auto topology = make_topology({
        "___",
        "###",
        "___",
    });
    REQUIRE(topology.slots().size() == 2);

    SECTION("duplicates in the pool count once") {
        WordPool pool({"CAT", "cat", "CAT"});
        Solver solver;
        REQUIRE_THROWS_AS(solver.fill(topology, pool), UnsatisfiableError);
    }

    SECTION("a second distinct word is used") {
        WordPool pool({"CAT", "CAT", "DOG"});
        Solver solver;
        auto assignment = solver.fill(topology, pool);
        require_valid(topology, pool, assignment);
        REQUIRE(assignment.word(0) != assignment.word(1));
    }

    SECTION("without eager checks the search itself rejects reuse") {
        // 単語数は足りるが交差で使える単語が1つしかない
        auto crossed = cross3();
        WordPool pool({"TAT", "ONE"});
        Solver solver;
        solver.set_arc_consistency(false);
        REQUIRE_THROWS_AS(solver.fill(crossed, pool), UnsatisfiableError);
    }
}

// ============================================================================
// Search properties
// ============================================================================

TEST_CASE("Solver fills a ladder grid", "[solver]") {
    auto topology = ladder();
    REQUIRE(topology.slots().size() == 5);
    REQUIRE(topology.intersections().size() == 6);

    WordPool pool(ladder_words());
    Solver solver;
    auto assignment = solver.fill(topology, pool);
    require_valid(topology, pool, assignment);

    SECTION("intersection letters agree from both sides") {
        for (const auto& x : topology.intersections()) {
            REQUIRE(assignment.word(x.across)[x.across_offset] ==
                    assignment.word(x.down)[x.down_offset]);
        }
    }

    SECTION("repeated runs return the identical assignment") {
        Solver again;
        REQUIRE(again.fill(topology, pool) == assignment);
    }

    SECTION("forward checking does not change the first solution") {
        Solver plain;
        plain.set_forward_checking(false);
        REQUIRE(plain.fill(topology, pool) == assignment);

        Solver no_ac;
        no_ac.set_arc_consistency(false);
        Solver no_ac_plain;
        no_ac_plain.set_arc_consistency(false);
        no_ac_plain.set_forward_checking(false);
        REQUIRE(no_ac.fill(topology, pool) == no_ac_plain.fill(topology, pool));
    }

    SECTION("least constraining value order also finds a valid fill") {
        Solver lcv;
        lcv.set_value_order(ValueOrder::LeastConstraining);
        auto other = lcv.fill(topology, pool);
        require_valid(topology, pool, other);

        Solver lcv_plain;
        lcv_plain.set_value_order(ValueOrder::LeastConstraining);
        lcv_plain.set_forward_checking(false);
        REQUIRE(lcv_plain.fill(topology, pool) == other);
    }
}

TEST_CASE("Candidate ties prefer slots crossing filled slots", "[solver]") {
    // slot 0: Across (0,0) 長さ3、どこにも交差しない
    // slot 1: Down (1,1) 長さ2
    // slot 2: Across (2,0) 長さ3、slot 1 と (2,1) で交差
    std::vector<SlotSpec> specs = {
        {{0, 0}, Direction::Across, 3},
        {{1, 1}, Direction::Down, 2},
        {{2, 0}, Direction::Across, 3},
    };
    auto topology = Topology::from_slots(3, 3, specs);
    REQUIRE(topology.neighbors(0).empty());
    REQUIRE(topology.neighbors(2) == std::vector<size_t>{1});

    // slot 1 は候補1つで最初に埋まる。その後 slot 0 と slot 2 はともに候補2つ。
    // 割当済み隣接を持つ slot 2 が先に CBD を取り、slot 0 には EBF が残る
    WordPool pool({"CBD", "EBF", "AB"});

    SECTION("with forward checking") {
        Solver solver;
        auto assignment = solver.fill(topology, pool);
        require_valid(topology, pool, assignment);
        REQUIRE(assignment.word(1) == "AB");
        REQUIRE(assignment.word(2) == "CBD");
        REQUIRE(assignment.word(0) == "EBF");
        REQUIRE(solver.stats().nodes == 3);
        REQUIRE(solver.stats().backtracks == 0);
    }

    SECTION("without forward checking") {
        Solver solver;
        solver.set_forward_checking(false);
        solver.set_arc_consistency(false);
        auto assignment = solver.fill(topology, pool);
        REQUIRE(assignment.word(2) == "CBD");
        REQUIRE(assignment.word(0) == "EBF");
    }
}

TEST_CASE("Removing words never makes an unsatisfiable pool satisfiable", "[solver]") {
    auto topology = cross3();
    const std::vector<std::string> words = {"CAT", "DOG", "ACE", "EEL"};

    Solver solver;
    REQUIRE(!solver.solve(topology, WordPool(words)).has_value());

    for (size_t skip = 0; skip < words.size(); ++skip) {
        std::vector<std::string> fewer;
        for (size_t i = 0; i < words.size(); ++i) {
            if (i != skip) fewer.push_back(words[i]);
        }
        WordPool pool(fewer);
        REQUIRE(!solver.solve(topology, pool).has_value());
        REQUIRE(solver.result() == SearchResult::UNSAT);
    }
}

// ============================================================================
// Search budget
// ============================================================================

TEST_CASE("Search budget is distinct from unsatisfiability", "[solver][budget]") {
    auto topology = cross3();
    WordPool pool({"CAT", "BAD"});

    SECTION("step limit") {
        Solver solver;
        solver.set_step_limit(1);
        REQUIRE(!solver.solve(topology, pool).has_value());
        REQUIRE(solver.result() == SearchResult::UNKNOWN);
        REQUIRE_THROWS_AS(solver.fill(topology, pool), SearchBudgetExceededError);

        solver.set_step_limit(2);
        REQUIRE(solver.solve(topology, pool).has_value());
    }

    SECTION("stop request") {
        Solver solver;
        solver.stop();
        REQUIRE(!solver.solve(topology, pool).has_value());
        REQUIRE(solver.result() == SearchResult::UNKNOWN);

        solver.reset_stop();
        REQUIRE(solver.solve(topology, pool).has_value());
    }
}

// ============================================================================
// verify_assignment
// ============================================================================

TEST_CASE("verify_assignment detects violations", "[checker]") {
    auto topology = cross3();
    WordPool pool({"CAT", "BAD", "DOG", "TOOL"});

    Assignment good(2);
    good.assign(0, "CAT");
    good.assign(1, "bad");  // 大文字小文字は区別しない
    REQUIRE(verify_assignment(topology, pool, good));

    std::string reason;

    SECTION("unassigned slot") {
        Assignment partial(2);
        partial.assign(0, "CAT");
        REQUIRE(!partial.is_complete());
        REQUIRE(!verify_assignment(topology, pool, partial, &reason));
        REQUIRE(!reason.empty());
    }

    SECTION("reused word") {
        Assignment reused(2);
        reused.assign(0, "CAT");
        reused.assign(1, "CAT");
        REQUIRE(!verify_assignment(topology, pool, reused, &reason));
    }

    SECTION("letters disagree") {
        Assignment clash(2);
        clash.assign(0, "CAT");
        clash.assign(1, "DOG");
        REQUIRE(!verify_assignment(topology, pool, clash, &reason));
    }

    SECTION("wrong length") {
        Assignment longer(2);
        longer.assign(0, "TOOL");
        longer.assign(1, "BAD");
        REQUIRE(!verify_assignment(topology, pool, longer, &reason));
    }

    SECTION("word outside the pool") {
        Assignment foreign(2);
        foreign.assign(0, "CAT");
        foreign.assign(1, "HAT");
        REQUIRE(!verify_assignment(topology, pool, foreign, &reason));
    }
}
