#pragma once
#include <functional>
#include <string>
#include <vector>

namespace dt {

// Undo/redo stack for committed tab moves. Steps report success: a move
// whose undo fails (the destination refused to give the tab back) stays on
// the undo stack so the user can retry.

struct UndoableAction {
  std::string description;             // e.g. "Moved \"notes.md\""
  std::function<bool()> redo;          // re-apply; empty = cannot redo
  std::function<bool()> undo;
};

class CommandHistory {
public:
  // Push an action that has already been applied. Clears the redo stack.
  void record(UndoableAction action);

  // Returns true if an action was undone.
  bool undo();

  // Returns true if an action was redone.
  bool redo();

  bool canUndo() const;
  bool canRedo() const;

  std::size_t undoCount() const;
  std::size_t redoCount() const;

  void clear();

  // Empty string if the respective stack is empty.
  const std::string& undoDescription() const;
  const std::string& redoDescription() const;

private:
  std::vector<UndoableAction> undoStack_;
  std::vector<UndoableAction> redoStack_;
  static const std::string empty_;
};

} // namespace dt
