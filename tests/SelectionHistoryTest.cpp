// =================================================================
// tests/SelectionHistoryTest.cpp
// =================================================================
// Unit tests for SelectionHistory.

#include "Sieve/SelectionHistory.hpp"
#include <iostream>
#include <cassert>

using namespace Sieve;

class SelectionHistoryTest {
public:
    void testUndoRedo() {
        std::cout << "Testing undo and redo..." << std::endl;

        SelectionHistory history;
        assert(!history.canUndo() && !history.canRedo());
        assert(!history.undo(SelectionSnapshot{}));

        SelectionSnapshot state0{{"a.ts"}, {}};
        SelectionSnapshot state1{{"a.ts", "b.ts"}, {}};

        history.recordSnapshot(state0.included, state0.excluded);
        assert(history.canUndo());

        auto undone = history.undo(state1);
        assert(undone && *undone == state0);
        assert(history.canRedo() && !history.canUndo());

        auto redone = history.redo(state0);
        assert(redone && *redone == state1);
        assert(history.canUndo() && !history.canRedo());

        std::cout << "✓ Undo and redo test passed" << std::endl;
    }

    void testRecordClearsFuture() {
        std::cout << "Testing new record clears redo..." << std::endl;

        SelectionHistory history;
        history.recordSnapshot({"a"}, {});
        history.undo(SelectionSnapshot{{"b"}, {}});
        assert(history.canRedo());

        history.recordSnapshot({"a"}, {"c"});
        assert(!history.canRedo());
        assert(history.futureSize() == 0);

        std::cout << "✓ Redo clearing test passed" << std::endl;
    }

    void testLimit() {
        std::cout << "Testing history bound..." << std::endl;

        SelectionHistory history(20);
        for (int i = 0; i < 25; ++i) {
            history.recordSnapshot({"file" + std::to_string(i)}, {});
        }

        assert(history.pastSize() == 20);
        // Oldest five dropped, order kept
        assert(history.getPast().front().included[0] == "file5");
        assert(history.getPast().back().included[0] == "file24");

        std::cout << "✓ History bound test passed" << std::endl;
    }

    void testClear() {
        std::cout << "Testing clear..." << std::endl;

        SelectionHistory history(3);
        history.recordSnapshot({"a"}, {});
        history.recordSnapshot({"b"}, {});
        history.undo(SelectionSnapshot{{"c"}, {}});
        history.clear();
        assert(!history.canUndo() && !history.canRedo());
        assert(history.getLimit() == 3);

        std::cout << "✓ Clear test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running SelectionHistory unit tests..." << std::endl;

        testUndoRedo();
        testRecordClearsFuture();
        testLimit();
        testClear();

        std::cout << "All SelectionHistory tests passed!" << std::endl;
    }
};

int main() {
    try {
        SelectionHistoryTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All SelectionHistory component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
