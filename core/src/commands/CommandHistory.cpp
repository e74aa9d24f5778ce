#include "dt/commands/CommandHistory.hpp"

#include <utility>

namespace dt {

const std::string CommandHistory::empty_;

void CommandHistory::record(UndoableAction action) {
  undoStack_.push_back(std::move(action));
  redoStack_.clear();
}

bool CommandHistory::undo() {
  if (undoStack_.empty()) return false;
  if (!undoStack_.back().undo || !undoStack_.back().undo()) return false;

  auto action = std::move(undoStack_.back());
  undoStack_.pop_back();
  if (action.redo) redoStack_.push_back(std::move(action));
  return true;
}

bool CommandHistory::redo() {
  if (redoStack_.empty()) return false;
  if (!redoStack_.back().redo()) return false;

  auto action = std::move(redoStack_.back());
  redoStack_.pop_back();
  undoStack_.push_back(std::move(action));
  return true;
}

bool CommandHistory::canUndo() const { return !undoStack_.empty(); }
bool CommandHistory::canRedo() const { return !redoStack_.empty(); }

std::size_t CommandHistory::undoCount() const { return undoStack_.size(); }
std::size_t CommandHistory::redoCount() const { return redoStack_.size(); }

void CommandHistory::clear() {
  undoStack_.clear();
  redoStack_.clear();
}

const std::string& CommandHistory::undoDescription() const {
  return undoStack_.empty() ? empty_ : undoStack_.back().description;
}

const std::string& CommandHistory::redoDescription() const {
  return redoStack_.empty() ? empty_ : redoStack_.back().description;
}

} // namespace dt
