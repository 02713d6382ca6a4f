// Peg Engine - Journal Tests

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

#include <peg/journal.hpp>

using namespace peg;

TEST_CASE("Journal scope commit and rollback", "[journal]") {
    Journal journal;
    int value = 0;

    auto set = [&](int v) {
        int previous = value;
        value = v;
        journal.record([&value, previous]() { value = previous; });
    };

    SECTION("Outside a scope mutations are final") {
        set(5);
        REQUIRE(value == 5);
        REQUIRE(journal.pending() == 0);
        REQUIRE_FALSE(journal.active());
    }

    SECTION("Commit keeps mutations") {
        {
            Journal::Scope tx(journal);
            set(1);
            set(2);
            REQUIRE(journal.pending() == 2);
            tx.commit();
        }
        REQUIRE(value == 2);
        REQUIRE(journal.pending() == 0);
        REQUIRE(journal.commits() == 1);
        REQUIRE(journal.rollbacks() == 0);
    }

    SECTION("Destruction without commit undoes in reverse order") {
        std::vector<int> seen;
        {
            Journal::Scope tx(journal);
            set(1);
            journal.record([&seen]() { seen.push_back(1); });
            set(2);
            journal.record([&seen]() { seen.push_back(2); });
        }
        REQUIRE(value == 0);
        REQUIRE(seen == std::vector<int>{2, 1});
        REQUIRE(journal.rollbacks() == 1);
        REQUIRE(journal.depth() == 0);
    }

    SECTION("Exception unwinds the scope") {
        auto op = [&]() {
            Journal::Scope tx(journal);
            set(7);
            throw std::runtime_error("boom");
        };
        REQUIRE_THROWS_AS(op(), std::runtime_error);
        REQUIRE(value == 0);
    }
}

TEST_CASE("Journal nesting", "[journal]") {
    Journal journal;
    int value = 0;

    auto set = [&](int v) {
        int previous = value;
        value = v;
        journal.record([&value, previous]() { value = previous; });
    };

    SECTION("Inner commit folds into the outer scope") {
        {
            Journal::Scope outer(journal);
            set(1);
            {
                Journal::Scope inner(journal);
                set(2);
                inner.commit();
            }
            REQUIRE(journal.depth() == 1);
            REQUIRE(journal.pending() == 2);
            // outer rolls back both
        }
        REQUIRE(value == 0);
        REQUIRE(journal.commits() == 0);
        REQUIRE(journal.rollbacks() == 1);
    }

    SECTION("Inner rollback leaves the outer scope intact") {
        {
            Journal::Scope outer(journal);
            set(1);
            {
                Journal::Scope inner(journal);
                set(2);
            }
            REQUIRE(value == 1);
            outer.commit();
        }
        REQUIRE(value == 1);
        REQUIRE(journal.commits() == 1);
        REQUIRE(journal.rollbacks() == 0);
    }
}

TEST_CASE("Journal deferred actions", "[journal]") {
    Journal journal;
    std::vector<int> fired;

    SECTION("Run once the outermost scope commits") {
        {
            Journal::Scope outer(journal);
            journal.defer([&]() { fired.push_back(1); });
            {
                Journal::Scope inner(journal);
                journal.defer([&]() { fired.push_back(2); });
                inner.commit();
            }
            REQUIRE(fired.empty());
            outer.commit();
        }
        REQUIRE(fired == std::vector<int>{1, 2});
    }

    SECTION("Dropped on rollback") {
        {
            Journal::Scope outer(journal);
            journal.defer([&]() { fired.push_back(1); });
            {
                Journal::Scope inner(journal);
                journal.defer([&]() { fired.push_back(2); });
            }
            outer.commit();
        }
        REQUIRE(fired == std::vector<int>{1});
    }

    SECTION("Run immediately with no open scope") {
        journal.defer([&]() { fired.push_back(3); });
        REQUIRE(fired == std::vector<int>{3});
    }
}
