// D5.2: Drop target probing, preview broadcast, spring-loaded focus

#include "dt/bus/MessageBus.hpp"
#include "dt/drop/DropPreview.hpp"
#include "dt/drop/DropPreviewBroadcaster.hpp"
#include "dt/drop/DropTargetResolver.hpp"
#include "dt/host/WindowHost.hpp"
#include "dt/sched/TimerQueue.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

// Window "doc-2" occupies screen x >= 1000; everything else is desktop.
struct ProbeHost : dt::WindowHost {
  int probes{0};
  double lastX{0};
  dt::WindowLabel lastExcluded;
  bool failProbe{false};
  std::vector<dt::WindowLabel> focused;

  dt::HostResult findWindowUnderPoint(double sx, double, const dt::WindowLabel& excluding) override {
    probes++;
    lastX = sx;
    lastExcluded = excluding;
    if (failProbe) return dt::hostFail("NATIVE_FAILED", "probe refused");
    return dt::hostOk(sx >= 1000 ? "doc-2" : "");
  }
  dt::HostResult injectTabIntoWindow(const dt::WindowLabel& w, const dt::TransferPayload&) override {
    return dt::hostOk(w);
  }
  dt::HostResult spawnWindowWithTab(const dt::TransferPayload&) override { return dt::hostOk("doc-9"); }
  dt::HostResult removeTabFromWindow(const dt::WindowLabel& w, const dt::TabId&) override {
    return dt::hostOk(w);
  }
  dt::HostResult focusWindow(const dt::WindowLabel& w) override {
    focused.push_back(w);
    return dt::hostOk(w);
  }
  dt::HostResult closeWindow(const dt::WindowLabel& w) override { return dt::hostOk(w); }
};

static dt::DragPoint screenAt(double sx, double sy) {
  dt::DragPoint p;
  p.screenX = sx;
  p.screenY = sy;
  return p;
}

int main() {
  // ---- Test 1: raw moves coalesce into one probe per window ----
  {
    ProbeHost host;
    dt::TimerQueue timers;
    dt::DropTargetResolver resolver(host, timers, "main");
    std::vector<dt::WindowLabel> resolved;
    resolver.setOnResolved([&](const dt::WindowLabel& w) { resolved.push_back(w); });

    for (int i = 0; i < 10; i++) {
      resolver.request(screenAt(900 + i * 20, 300));
      timers.advanceBy(5);
    }
    requireTrue(host.probes == 0, "no probe inside the debounce window");
    requireTrue(resolver.isProbeScheduled(), "one probe scheduled");
    timers.advanceBy(20);
    requireTrue(host.probes == 1, "exactly one probe");
    requireTrue(host.lastX == 1080, "probe uses the latest point");
    requireTrue(host.lastExcluded == "main", "source window excluded");
    requireTrue(resolved.size() == 1 && resolved[0] == "doc-2", "resolved target");
    std::printf("  Test 1 (debounce): PASS\n");
  }

  // ---- Test 2: cancel drops the pending probe ----
  {
    ProbeHost host;
    dt::TimerQueue timers;
    dt::DropTargetResolver resolver(host, timers, "main");
    int calls = 0;
    resolver.setOnResolved([&](const dt::WindowLabel&) { calls++; });
    resolver.request(screenAt(1200, 10));
    resolver.cancel();
    timers.advanceBy(200);
    requireTrue(host.probes == 0 && calls == 0, "no probe after cancel");
    std::printf("  Test 2 (cancel): PASS\n");
  }

  // ---- Test 3: a failed probe reads as "no target" ----
  {
    ProbeHost host;
    host.failProbe = true;
    dt::TimerQueue timers;
    dt::DropTargetResolver resolver(host, timers, "main");
    std::vector<dt::WindowLabel> resolved;
    resolver.setOnResolved([&](const dt::WindowLabel& w) { resolved.push_back(w); });
    resolver.request(screenAt(1200, 10));
    timers.advanceBy(60);
    requireTrue(resolved.size() == 1 && resolved[0].empty(), "empty target");

    dt::HostResult now = resolver.resolveNow(screenAt(1200, 10));
    requireTrue(!now.ok && now.err.code == "NATIVE_FAILED", "resolveNow reports failure");
    std::printf("  Test 3 (probe failure): PASS\n");
  }

  // ---- Test 4: previews reach other windows only ----
  {
    ProbeHost host;
    dt::TimerQueue timers;
    dt::LocalMessageBus bus;
    dt::DropPreviewBroadcaster bc(bus, timers, host, "main");
    dt::DropPreviewListener self(bus, "main");
    dt::DropPreviewListener target(bus, "doc-2");
    dt::DropPreviewListener other(bus, "doc-3");

    bc.update("doc-2");
    bus.dispatchPending();
    requireTrue(target.isDropPreviewTarget(), "target lit");
    requireTrue(!other.isDropPreviewTarget(), "bystander dark");
    requireTrue(!self.isDropPreviewTarget(), "source ignores its own preview");
    requireTrue(target.lastSource() == "main", "source recorded");
    requireTrue(self.lastSource().empty(), "source never records itself");

    bc.update("doc-3");
    bus.dispatchPending();
    requireTrue(!target.isDropPreviewTarget() && other.isDropPreviewTarget(), "moved");

    bc.clear();
    bus.dispatchPending();
    requireTrue(!target.isDropPreviewTarget() && !other.isDropPreviewTarget(), "cleared");

    bus.broadcast(dt::kDropPreviewEvent, "{garbage");
    bus.dispatchPending();
    requireTrue(!other.isDropPreviewTarget(), "malformed message ignored");
    std::printf("  Test 4 (preview listeners): PASS\n");
  }

  // ---- Test 5: spring-load focuses after the dwell, once ----
  {
    ProbeHost host;
    dt::TimerQueue timers;
    dt::LocalMessageBus bus;
    dt::DropPreviewBroadcaster bc(bus, timers, host, "main");

    bc.update("doc-2");
    timers.advanceBy(200);
    bc.update("doc-2");  // repeated probe result keeps the original dwell
    timers.advanceBy(219);
    requireTrue(host.focused.empty(), "not before 420ms");
    timers.advanceBy(1);
    requireTrue(host.focused.size() == 1 && host.focused[0] == "doc-2", "focused at 420ms");
    requireTrue(bc.springFocusedWindow() == "doc-2", "recorded");

    bc.update("doc-2");
    timers.advanceBy(1000);
    requireTrue(host.focused.size() == 1, "no second focus for the same target");
    std::printf("  Test 5 (spring-load once): PASS\n");
  }

  // ---- Test 6: moving away restarts or cancels the dwell ----
  {
    ProbeHost host;
    dt::TimerQueue timers;
    dt::LocalMessageBus bus;
    dt::DropPreviewBroadcaster bc(bus, timers, host, "main");

    bc.update("doc-2");
    timers.advanceBy(300);
    bc.update("doc-3");
    timers.advanceBy(300);
    requireTrue(host.focused.empty(), "dwell restarted for the new target");
    timers.advanceBy(120);
    requireTrue(host.focused.size() == 1 && host.focused[0] == "doc-3", "new target focused");

    bc.update("doc-2");
    timers.advanceBy(100);
    bc.update("");
    requireTrue(!bc.isDwellPending(), "empty target cancels");
    timers.advanceBy(1000);
    requireTrue(host.focused.size() == 1, "no focus after leaving");

    bc.update("doc-2");
    bc.clear();
    timers.advanceBy(1000);
    requireTrue(host.focused.size() == 1, "clear cancels");
    requireTrue(bc.currentTarget().empty(), "no current target");
    std::printf("  Test 6 (dwell restart/cancel): PASS\n");
  }

  // ---- Test 7: spring-load can be switched off ----
  {
    ProbeHost host;
    dt::TimerQueue timers;
    dt::LocalMessageBus bus;
    dt::DropPreviewBroadcaster bc(bus, timers, host, "main");
    dt::SpringLoadConfig cfg;
    cfg.enabled = false;
    bc.setConfig(cfg);
    bc.update("doc-2");
    timers.advanceBy(1000);
    requireTrue(host.focused.empty(), "disabled");
    std::printf("  Test 7 (disabled): PASS\n");
  }

  std::printf("D5.2 drop_target: ALL PASS\n");
  return 0;
}
