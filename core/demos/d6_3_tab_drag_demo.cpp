// D6.3: Tab drag demo
// Two document windows in one host. With GLFW: real windows, drag tabs
// between them (the strip is the top 32px of each window, 120px per tab).
// Without GLFW (or with --script): a scripted session printed to stdout.

#include "dt/bus/MessageBus.hpp"
#include "dt/geometry/TabStripGeometry.hpp"
#include "dt/host/LocalWindowHost.hpp"
#include "dt/sched/TimerQueue.hpp"
#include "dt/session/DocumentWindow.hpp"
#include "dt/session/DragConfig.hpp"

#ifdef DT_HAS_GLFW
#include "dt/host/GlfwWindowPlatform.hpp"
#endif

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

static std::string describe(const dt::DocumentWindow& w) {
  std::string s = w.label() + ": ";
  for (const auto& t : w.tabs().tabs()) {
    s += t.isPinned ? "[*" : "[";
    s += t.title;
    const dt::Document* doc = w.docs().getDocument(t.id);
    if (doc && doc->isDirty) s += " ~";
    s += "] ";
  }
  return s;
}

static void printDesk(const dt::LocalWindowHost& host) {
  for (const auto& label : host.windowLabels()) {
    const dt::DocumentWindow* w = host.window(label);
    if (w) std::printf("  %s\n", describe(*w).c_str());
  }
}

static bool loadConfig(const char* path, dt::DragConfig& cfg) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "[demo] cannot open %s\n", path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!dt::deserializeDragConfig(ss.str(), cfg)) {
    std::fprintf(stderr, "[demo] invalid config in %s\n", path);
    return false;
  }
  return true;
}

static void seed(dt::DocumentWindow& main, dt::DocumentWindow& notes) {
  main.openDocument("README.md", "/work/README.md", "# Project\n", true);
  dt::TabId todo = main.openDocument("todo.md", "/work/todo.md", "- ship\n");
  main.docs().setContent(todo, "- ship\n- test\n");
  main.docs().setWorkspaceRoot(todo, "/work");
  main.openDocument("ideas.md", "/work/ideas.md", "...");
  main.openDocument("Untitled", "", "");
  notes.openDocument("journal.md", "/notes/journal.md", "today");
}

#ifdef DT_HAS_GLFW

static int runInteractive(dt::GlfwWindowPlatform& platform, dt::LocalWindowHost& host,
                          dt::LocalMessageBus& bus, dt::TimerQueue& timers) {
  if (!platform.init()) return 1;
  host.setPlatform(&platform);

  dt::DocumentWindow* main = host.openWindow("main", {80, 80, 600, 240});
  dt::DocumentWindow* notes = host.openWindow("notes", {760, 80, 600, 240});
  if (!main || !notes) return 1;
  seed(*main, *notes);

  platform.setPointerSink([&](const dt::WindowLabel& label, dt::PointerPhase phase,
                              const dt::PointerEvent& ev) {
    dt::DocumentWindow* w = host.window(label);
    if (!w || host.isClosing(label)) return;
    auto& drag = w->drag();
    switch (phase) {
      case dt::PointerPhase::Down: {
        dt::StripLayout layout;
        if (!w->strip().queryLayout(layout)) return;
        int idx = dt::hitTestTab(layout, ev.clientX, ev.clientY);
        if (idx >= 0) drag.handlePointerDown(w->tabs().tabs()[idx].id, ev);
        break;
      }
      case dt::PointerPhase::Move: drag.handlePointerMove(ev); break;
      case dt::PointerPhase::Up: drag.handlePointerUp(ev); break;
      case dt::PointerPhase::FocusLost: drag.handleFocusLost(); break;
    }
  });

  std::printf("Interactive mode: drag tabs in the top strip, close 'main' to quit\n");
  auto start = std::chrono::steady_clock::now();
  std::string lastStatus;

  for (;;) {
    platform.pollEvents();
    auto now = std::chrono::steady_clock::now();
    timers.advanceTo(std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count());
    bus.dispatchPending();

    bool quit = false;
    for (const auto& label : host.windowLabels()) {
      if (!platform.shouldClose(label)) continue;
      dt::DocumentWindow* w = host.window(label);
      if (w && w->isPrimary()) quit = true;
      dt::HostResult r = host.closeWindow(label);
      if (!r.ok) std::fprintf(stderr, "[demo] close: %s\n", r.err.message.c_str());
    }
    host.pump();
    if (quit) break;

    std::string status;
    for (const auto& label : host.windowLabels()) {
      dt::DocumentWindow* w = host.window(label);
      std::string title = describe(*w);
      const auto& drag = w->drag();
      if (drag.mode() != dt::DragMode::Idle) title += " | " + drag.dragHint();
      if (drag.isDropPreviewTarget()) title += " | drop here";
      platform.setTitle(label, title);
      status += title + "\n";
      if (!drag.announcement().empty()) status += "  > " + drag.announcement() + "\n";
    }
    if (status != lastStatus) {
      std::printf("%s\n", status.c_str());
      lastStatus = status;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(8));
  }

  std::printf("D6.3 tab drag demo complete\n");
  return 0;
}

#endif // DT_HAS_GLFW

static dt::PointerEvent at(const dt::DocumentWindow& w, double x, double y) {
  dt::PointerEvent ev;
  ev.clientX = x;
  ev.clientY = y;
  ev.screenX = w.bounds().x + x;
  ev.screenY = w.bounds().y + y;
  return ev;
}

static void settle(dt::LocalWindowHost& host, dt::LocalMessageBus& bus,
                   dt::TimerQueue& timers, int ms) {
  // Step like a 60Hz loop would.
  for (int t = 0; t < ms; t += 16) {
    timers.advanceBy(16);
    bus.dispatchPending();
    host.pump();
  }
}

static int runScripted(dt::LocalWindowHost& host, dt::LocalMessageBus& bus,
                       dt::TimerQueue& timers) {
  dt::DocumentWindow* main = host.openWindow("main", {0, 0, 600, 400});
  dt::DocumentWindow* notes = host.openWindow("notes", {1000, 0, 600, 400});
  if (!main || !notes) return 1;
  seed(*main, *notes);
  dt::HostResult focused = host.focusWindow("main");
  if (!focused.ok) return 1;

  std::printf("Initial:\n");
  printDesk(host);

  auto& drag = main->drag();
  const dt::TabId todo = main->tabs().tabs()[1].id;

  std::printf("\n1. Drag todo.md to the end of the strip\n");
  drag.handlePointerDown(todo, at(*main, 180, 16));
  drag.handlePointerMove(at(*main, 300, 18));
  drag.handlePointerMove(at(*main, 470, 18));
  std::printf("  mode=%s dropIndex=%d hint=\"%s\"\n", dt::dragModeName(drag.mode()),
              drag.view().dropIndex, drag.dragHint().c_str());
  drag.handlePointerUp(at(*main, 470, 18));
  std::printf("  > %s\n", drag.announcement().c_str());
  printDesk(host);

  std::printf("\n2. Drag todo.md onto the notes window\n");
  drag.handlePointerDown(todo, at(*main, 420, 16));
  drag.handlePointerMove(at(*main, 1200, 150));
  settle(host, bus, timers, 64);
  std::printf("  target=%s hint=\"%s\" notes previewing=%s\n",
              drag.dragTargetWindow().c_str(), drag.dragHint().c_str(),
              notes->drag().isDropPreviewTarget() ? "yes" : "no");
  settle(host, bus, timers, 432);
  std::printf("  after dwell, focused=%s\n", host.focusedWindow().c_str());
  drag.handlePointerUp(at(*main, 1200, 150));
  std::printf("  > %s\n", drag.announcement().c_str());
  settle(host, bus, timers, 16);
  printDesk(host);

  std::printf("\n3. Undo the move\n");
  drag.undo();
  std::printf("  > %s\n", drag.announcement().c_str());
  printDesk(host);

  std::printf("\n4. Tear ideas.md off onto the desktop\n");
  const dt::TabId ideas = main->tabs().tabs()[1].id;
  drag.handlePointerDown(ideas, at(*main, 180, 16));
  drag.handlePointerMove(at(*main, 700, 700));
  drag.handlePointerUp(at(*main, 700, 700));
  std::printf("  > %s\n", drag.announcement().c_str());
  settle(host, bus, timers, 16);
  printDesk(host);

  std::printf("\n5. Try to drag the pinned README.md\n");
  const dt::TabId readme = main->tabs().tabs()[0].id;
  bool started = drag.handlePointerDown(readme, at(*main, 60, 16));
  std::printf("  drag started: %s\n", started ? "yes" : "no");

  std::printf("\nD6.3 tab drag demo complete\n");
  return 0;
}

// Usage: d6_3_tab_drag_demo [--script] [config.json]
int main(int argc, char** argv) {
  dt::DragConfig cfg;
  bool scripted = false;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--script") {
      scripted = true;
    } else if (!loadConfig(argv[i], cfg)) {
      return 1;
    }
  }

#ifdef DT_HAS_GLFW
  // Declared before the host: native windows must outlive it.
  dt::GlfwWindowPlatform platform;
#else
  scripted = true;
#endif

  dt::LocalMessageBus bus;
  dt::TimerQueue timers;
  dt::LocalWindowHost host(bus, timers);
  host.setConfig(cfg);

  if (scripted) {
    std::printf("Scripted session\n\n");
    return runScripted(host, bus, timers);
  }
#ifdef DT_HAS_GLFW
  return runInteractive(platform, host, bus, timers);
#else
  return 0;
#endif
}
