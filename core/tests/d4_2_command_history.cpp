// D4.2: CommandHistory: undo/redo of committed tab moves

#include "dt/commands/CommandHistory.hpp"
#include "dt/tabs/TabStore.hpp"

#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: record + undo + redo flow ----
  {
    dt::CommandHistory hist;
    int value = 10;  // already applied

    hist.record({"set to 10",
      [&]() { value = 10; return true; },
      [&]() { value = 0; return true; }
    });
    requireTrue(hist.undoCount() == 1, "undo stack has 1");
    requireTrue(hist.redoCount() == 0, "redo stack empty");
    requireTrue(hist.undoDescription() == "set to 10", "description");

    requireTrue(hist.undo(), "undo ran");
    requireTrue(value == 0, "undo reverts value");
    requireTrue(hist.redoCount() == 1, "redo stack has 1");
    requireTrue(hist.redoDescription() == "set to 10", "redo description");

    requireTrue(hist.redo(), "redo ran");
    requireTrue(value == 10, "redo restores value");
    requireTrue(hist.undoCount() == 1 && hist.redoCount() == 0, "stacks after redo");
    std::printf("  Test 1 (record + undo + redo): PASS\n");
  }

  // ---- Test 2: redo cleared on new record ----
  {
    dt::CommandHistory hist;
    int value = 2;
    hist.record({"set 1", [&]() { value = 1; return true; }, [&]() { value = 0; return true; }});
    hist.record({"set 2", [&]() { value = 2; return true; }, [&]() { value = 1; return true; }});
    hist.undo();
    requireTrue(value == 1, "undo to 1");
    requireTrue(hist.redoCount() == 1, "1 on redo stack");

    value = 5;
    hist.record({"set 5", [&]() { value = 5; return true; }, [&]() { value = 1; return true; }});
    requireTrue(hist.redoCount() == 0, "redo cleared after new record");
    requireTrue(hist.undoCount() == 2, "set 1 + set 5");
    std::printf("  Test 2 (redo cleared): PASS\n");
  }

  // ---- Test 3: failed undo keeps the action ----
  {
    dt::CommandHistory hist;
    bool allow = false;
    int undos = 0;
    hist.record({"move", [&]() { return true; },
                 [&]() { if (!allow) return false; undos++; return true; }});

    requireTrue(!hist.undo(), "refused");
    requireTrue(hist.undoCount() == 1, "still undoable");
    requireTrue(hist.redoCount() == 0, "nothing to redo");

    allow = true;
    requireTrue(hist.undo(), "retry succeeds");
    requireTrue(undos == 1, "undone once");
    std::printf("  Test 3 (failed undo retained): PASS\n");
  }

  // ---- Test 4: failed redo keeps the action; missing redo drops it ----
  {
    dt::CommandHistory hist;
    bool allow = false;
    hist.record({"a", [&]() { return allow; }, [&]() { return true; }});
    hist.undo();
    requireTrue(!hist.redo(), "redo refused");
    requireTrue(hist.redoCount() == 1, "still redoable");
    allow = true;
    requireTrue(hist.redo(), "redo retried");

    dt::CommandHistory oneWay;
    oneWay.record({"b", nullptr, [&]() { return true; }});
    requireTrue(oneWay.undo(), "undo");
    requireTrue(!oneWay.canRedo(), "no redo without a redo step");
    std::printf("  Test 4 (failed/absent redo): PASS\n");
  }

  // ---- Test 5: undo/redo of a tab reorder ----
  {
    dt::TabStore store("main");
    dt::TabId t1 = store.createTab("one", "");
    dt::TabId t2 = store.createTab("two", "");
    dt::TabId t3 = store.createTab("three", "");
    dt::CommandHistory hist;

    auto moveTo = [&store, t1](int index) {
      int cur = store.indexOf(t1);
      if (cur < 0) return false;
      return store.reorderTabs(static_cast<std::size_t>(cur), static_cast<std::size_t>(index));
    };
    store.reorderTabs(0, 2);
    hist.record({"Moved \"one\"", [moveTo]() { return moveTo(2); },
                 [moveTo]() { return moveTo(0); }});

    requireTrue(store.tabs()[2].id == t1, "applied");
    hist.undo();
    requireTrue(store.tabs()[0].id == t1 && store.tabs()[1].id == t2, "restored");
    hist.redo();
    requireTrue(store.tabs()[2].id == t1 && store.tabs()[1].id == t3, "re-applied");

    store.detachTab(t1);
    requireTrue(!hist.undo(), "tab gone: undo fails");
    requireTrue(hist.canUndo(), "kept for retry");
    std::printf("  Test 5 (tab reorder): PASS\n");
  }

  // ---- Test 6: clear ----
  {
    dt::CommandHistory hist;
    hist.record({"a", [&]() { return true; }, [&]() { return true; }});
    hist.record({"b", [&]() { return true; }, [&]() { return true; }});
    hist.undo();
    hist.clear();
    requireTrue(!hist.canUndo() && !hist.canRedo(), "empty after clear");
    requireTrue(hist.undoDescription().empty(), "no description");
    std::printf("  Test 6 (clear): PASS\n");
  }

  std::printf("D4.2 command_history: ALL PASS\n");
  return 0;
}
