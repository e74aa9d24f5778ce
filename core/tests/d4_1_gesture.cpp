// D4.1: TabDragGesture state machine

#include "dt/geometry/TabStripGeometry.hpp"
#include "dt/gesture/TabDragGesture.hpp"
#include "dt/sched/TimerQueue.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

// Three 100px tabs, bar docked at the top (y 0..32).
struct FixedLayout : dt::TabStripLayoutSource {
  bool available{true};
  bool queryLayout(dt::StripLayout& out) const override {
    if (!available) return false;
    out.tabs = {{0, 100}, {100, 200}, {200, 300}};
    out.barTop = 0;
    out.barBottom = 32;
    out.visibleLeft = 0;
    out.visibleRight = 300;
    return true;
  }
};

struct FakeCapture : dt::PointerCapture {
  bool grant{true};
  int acquired{0};
  int released{0};
  bool acquire(std::int32_t) override { acquired++; return grant; }
  bool release(std::int32_t) override { released++; return true; }
};

struct Recorder {
  std::vector<std::string> reorders;
  std::vector<std::string> dragOuts;
  std::vector<dt::DragMode> modes;
  dt::DragPoint lastOutPoint;
  int moves{0};

  void attach(dt::TabDragGesture& g) {
    g.setOnReorder([this](const dt::TabId& id, int idx) {
      reorders.push_back(id + "@" + std::to_string(idx));
    });
    g.setOnDragOut([this](const dt::TabId& id, const dt::DragPoint& p) {
      dragOuts.push_back(id);
      lastOutPoint = p;
    });
    g.setOnDragMove([this](dt::DragMode, const dt::DragPoint&) { moves++; });
    g.setOnModeChanged([this](dt::DragMode m) { modes.push_back(m); });
  }
};

static dt::PointerEvent at(double x, double y,
                           dt::PointerKind kind = dt::PointerKind::Mouse) {
  dt::PointerEvent ev;
  ev.kind = kind;
  ev.clientX = x;
  ev.clientY = y;
  ev.screenX = 1000 + x;
  ev.screenY = 500 + y;
  return ev;
}

int main() {
  FixedLayout layout;

  // ---- Test 1: movement under the lock threshold is a click ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    Recorder rec;
    rec.attach(g);

    requireTrue(g.onPointerDown("t1", false, at(50, 16)), "down accepted");
    requireTrue(g.mode() == dt::DragMode::Pending, "mouse goes straight to pending");
    g.onPointerMove(at(55, 18));
    requireTrue(g.mode() == dt::DragMode::Pending, "5px stays pending");
    g.onPointerUp(at(55, 18));
    requireTrue(g.mode() == dt::DragMode::Idle, "idle after up");
    requireTrue(rec.reorders.empty() && rec.dragOuts.empty(), "no commit");
    requireTrue(rec.moves == 0, "no drag moves while pending");
    std::printf("  Test 1 (click): PASS\n");
  }

  // ---- Test 2: horizontal drag reorders ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t1", false, at(50, 16));
    g.onPointerMove(at(220, 16));
    requireTrue(g.mode() == dt::DragMode::Reorder, "reorder locked");
    requireTrue(g.view().dropIndex == 2, "slot 2 under x=220");
    requireTrue(g.view().draggedTabId == "t1", "dragged id");
    requireTrue(rec.moves == 1, "drag move reported");

    g.onPointerMove(at(20, 16));
    requireTrue(g.view().dropIndex == 0, "index follows pointer");
    g.onPointerMove(at(220, 16));
    g.onPointerUp(at(220, 16));
    requireTrue(rec.reorders.size() == 1 && rec.reorders[0] == "t1@2", "committed once at 2");
    requireTrue(g.mode() == dt::DragMode::Idle, "idle after commit");
    requireTrue(g.view().dropIndex == -1 && g.view().draggedTabId.empty(), "view cleared");
    std::printf("  Test 2 (reorder): PASS\n");
  }

  // ---- Test 3: leaving the bar band drags out ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t2", false, at(150, 16));
    g.onPointerMove(at(150, 100));
    requireTrue(g.mode() == dt::DragMode::DragOut, "y=100 is past 32+40");
    requireTrue(g.view().dropIndex == -1, "no drop index in dragout");
    g.onPointerMove(at(160, 20));
    requireTrue(g.mode() == dt::DragMode::DragOut, "dragout is sticky");
    g.onPointerUp(at(400, 300));
    requireTrue(rec.dragOuts.size() == 1 && rec.dragOuts[0] == "t2", "drag-out committed");
    requireTrue(rec.lastOutPoint.screenX == 1400 && rec.lastOutPoint.screenY == 800,
                "release point in screen coords");
    requireTrue(rec.reorders.empty(), "no reorder");
    std::printf("  Test 3 (dragout): PASS\n");
  }

  // ---- Test 4: reorder then leave the band ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t1", false, at(50, 16));
    g.onPointerMove(at(150, 16));
    requireTrue(g.mode() == dt::DragMode::Reorder, "reorder");
    g.onPointerMove(at(150, -60));
    requireTrue(g.mode() == dt::DragMode::DragOut, "upwards out of band");
    requireTrue(g.view().dropIndex == -1, "index dropped");
    requireTrue(rec.modes.size() == 3, "pending, reorder, dragout");
    requireTrue(rec.modes[0] == dt::DragMode::Pending && rec.modes[2] == dt::DragMode::DragOut,
                "mode sequence");
    g.onPointerUp(at(150, -60));
    requireTrue(rec.modes.back() == dt::DragMode::Idle, "back to idle");
    std::printf("  Test 4 (reorder -> dragout): PASS\n");
  }

  // ---- Test 5: touch must dwell before dragging ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t1", false, at(50, 16, dt::PointerKind::Touch));
    requireTrue(g.mode() == dt::DragMode::Hold, "touch starts in hold");
    g.onPointerMove(at(53, 18, dt::PointerKind::Touch));
    requireTrue(g.mode() == dt::DragMode::Hold, "jitter inside radius");
    timers.advanceBy(179);
    requireTrue(g.mode() == dt::DragMode::Hold, "dwell not elapsed");
    timers.advanceBy(41);
    requireTrue(g.mode() == dt::DragMode::Pending, "pending after 220ms");
    g.onPointerMove(at(220, 16, dt::PointerKind::Touch));
    requireTrue(g.mode() == dt::DragMode::Reorder, "drag after dwell");
    g.onPointerUp(at(220, 16, dt::PointerKind::Touch));
    requireTrue(rec.reorders.size() == 1, "committed");
    std::printf("  Test 5 (touch hold): PASS\n");
  }

  // ---- Test 6: moving during hold is a tap/scroll ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t1", false, at(50, 16, dt::PointerKind::Pen));
    g.onPointerMove(at(50, 30, dt::PointerKind::Pen));
    requireTrue(g.mode() == dt::DragMode::Idle, "14px during hold resets");
    requireTrue(timers.pending() == 0, "hold timer cancelled");
    timers.advanceBy(500);
    requireTrue(g.mode() == dt::DragMode::Idle, "stays idle");
    requireTrue(rec.reorders.empty() && rec.dragOuts.empty(), "no commit");
    std::printf("  Test 6 (tap cancels hold): PASS\n");
  }

  // ---- Test 7: ignored downs ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);

    requireTrue(!g.onPointerDown("p1", true, at(50, 16)), "pinned ignored");
    dt::PointerEvent right = at(50, 16);
    right.button = 2;
    requireTrue(!g.onPointerDown("t1", false, right), "secondary button ignored");
    requireTrue(!g.onPointerDown("", false, at(50, 16)), "empty id ignored");
    requireTrue(g.mode() == dt::DragMode::Idle, "still idle");

    requireTrue(g.onPointerDown("t1", false, at(50, 16)), "first contact");
    dt::PointerEvent second = at(150, 16);
    second.pointerId = 2;
    requireTrue(!g.onPointerDown("t2", false, second), "second contact ignored");
    requireTrue(g.view().draggedTabId == "t1", "first gesture untouched");

    second.clientX = 250;
    g.onPointerMove(second);
    requireTrue(g.mode() == dt::DragMode::Pending, "foreign pointer moves ignored");
    g.onPointerUp(second);
    requireTrue(g.mode() == dt::DragMode::Pending, "foreign pointer up ignored");
    std::printf("  Test 7 (ignored input): PASS\n");
  }

  // ---- Test 8: unavailable geometry keeps pending ----
  {
    FixedLayout gone;
    gone.available = false;
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&gone);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t1", false, at(50, 16));
    g.onPointerMove(at(250, 16));
    g.onPointerMove(at(250, 400));
    requireTrue(g.mode() == dt::DragMode::Pending, "no transition without geometry");
    g.onPointerUp(at(250, 400));
    requireTrue(rec.reorders.empty() && rec.dragOuts.empty(), "nothing committed");
    std::printf("  Test 8 (no geometry): PASS\n");
  }

  // ---- Test 9: cancel and pointercancel abort without commit ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t1", false, at(50, 16));
    g.onPointerMove(at(220, 16));
    g.cancel();
    requireTrue(g.mode() == dt::DragMode::Idle, "cancelled");
    g.onPointerUp(at(220, 16));
    requireTrue(rec.reorders.empty(), "late up after cancel does nothing");

    g.onPointerDown("t1", false, at(50, 16));
    g.onPointerMove(at(50, 200));
    g.onPointerCancel(at(50, 200));
    requireTrue(g.mode() == dt::DragMode::Idle, "pointercancel resets");
    requireTrue(rec.dragOuts.empty(), "no drag-out");
    std::printf("  Test 9 (cancel): PASS\n");
  }

  // ---- Test 10: pointer capture is best-effort ----
  {
    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&layout);
    FakeCapture cap;
    g.setPointerCapture(&cap);
    Recorder rec;
    rec.attach(g);

    g.onPointerDown("t1", false, at(50, 16));
    requireTrue(cap.acquired == 1, "capture requested");
    g.onPointerUp(at(50, 16));
    requireTrue(cap.released == 1, "released on reset");

    cap.grant = false;
    requireTrue(g.onPointerDown("t1", false, at(50, 16)), "refusal does not block");
    g.onPointerMove(at(220, 16));
    g.onPointerUp(at(220, 16));
    requireTrue(rec.reorders.size() == 1, "gesture still completes");
    requireTrue(cap.released == 1, "nothing to release after refusal");
    std::printf("  Test 10 (capture): PASS\n");
  }

  // ---- Test 11: refreshDropIndex after scrolling ----
  {
    struct ScrolledLayout : FixedLayout {
      double offset{0};
      bool queryLayout(dt::StripLayout& out) const override {
        if (!FixedLayout::queryLayout(out)) return false;
        for (auto& t : out.tabs) { t.left -= offset; t.right -= offset; }
        return true;
      }
    } scrolled;

    dt::TimerQueue timers;
    dt::TabDragGesture g(timers);
    g.setLayoutSource(&scrolled);
    g.onPointerDown("t1", false, at(50, 16));
    g.onPointerMove(at(120, 16));
    requireTrue(g.view().dropIndex == 1, "before scroll");
    scrolled.offset = 100;
    g.refreshDropIndex();
    requireTrue(g.view().dropIndex == 2, "same x, strip moved left");
    std::printf("  Test 11 (refresh after scroll): PASS\n");
  }

  // ---- Test 12: destroying a live gesture releases its capture ----
  {
    dt::TimerQueue timers;
    FakeCapture cap;
    {
      dt::TabDragGesture g(timers);
      g.setLayoutSource(&layout);
      g.setPointerCapture(&cap);
      g.onPointerDown("t1", false, at(50, 16));
      g.onPointerMove(at(220, 16));
      requireTrue(g.mode() == dt::DragMode::Reorder, "mid-drag");
    }
    requireTrue(cap.released == 1, "released on teardown");

    {
      dt::TabDragGesture g(timers);
      g.setPointerCapture(&cap);
      g.onPointerDown("t1", false, at(50, 16, dt::PointerKind::Touch));
      requireTrue(timers.pending() == 1, "hold dwell armed");
    }
    requireTrue(timers.pending() == 0, "hold dwell cancelled");
    requireTrue(cap.released == 2, "released during hold");
    std::printf("  Test 12 (teardown mid-drag): PASS\n");
  }

  std::printf("D4.1 gesture: ALL PASS\n");
  return 0;
}
