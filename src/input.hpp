#pragma once
#include <optional>
/*
 * Input
 *
 * Purpose: parse the Ctrl-W prefix chords of the workspace with minimal state.
 * Keys outside a chord are returned as Action::Forward so the caller can pass
 * them to the active pane.
 */

enum class Action {
  Forward,
  SplitRight,
  SplitDown,
  ClosePane,
  FocusLeft,
  FocusDown,
  FocusUp,
  FocusRight,
  FocusNext,
  NewTab,
  CloseTab,
  NextTab,
  PrevTab,
  SelectTab,
  NarrowSplit,
  WidenSplit,
  SplitMenu,
  TabMenu,
  UrlPopover,
  Settings,
  RetrySurface,
  CommandLine,
};

struct KeyAction {
  Action action = Action::Forward;
  int key = 0;   // Forward: key to deliver
  int index = 0; // SelectTab: zero-based tab index
};

inline constexpr int kCtrlW = 0x17;

class Input {
public:
  // nullopt while a chord is incomplete or the chord key is unknown.
  std::optional<KeyAction> feed(int ch);
  bool pending() const { return pending_prefix_; }
  void reset() { pending_prefix_ = false; }
private:
  bool pending_prefix_ = false;
};
