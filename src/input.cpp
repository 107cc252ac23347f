#include "input.hpp"

std::optional<KeyAction> Input::feed(int ch) {
  if (!pending_prefix_) {
    if (ch == kCtrlW) { pending_prefix_ = true; return std::nullopt; }
    return KeyAction{Action::Forward, ch, 0};
  }
  pending_prefix_ = false;
  if (ch >= '1' && ch <= '9') return KeyAction{Action::SelectTab, ch, ch - '1'};
  switch (ch) {
    case kCtrlW: return KeyAction{Action::Forward, kCtrlW, 0};
    case 'v': return KeyAction{Action::SplitRight, ch, 0};
    case 's': return KeyAction{Action::SplitDown, ch, 0};
    case 'c': return KeyAction{Action::ClosePane, ch, 0};
    case 'h': return KeyAction{Action::FocusLeft, ch, 0};
    case 'j': return KeyAction{Action::FocusDown, ch, 0};
    case 'k': return KeyAction{Action::FocusUp, ch, 0};
    case 'l': return KeyAction{Action::FocusRight, ch, 0};
    case 'w': return KeyAction{Action::FocusNext, ch, 0};
    case 't': return KeyAction{Action::NewTab, ch, 0};
    case 'x': return KeyAction{Action::CloseTab, ch, 0};
    case 'n': return KeyAction{Action::NextTab, ch, 0};
    case 'p': return KeyAction{Action::PrevTab, ch, 0};
    case '<': return KeyAction{Action::NarrowSplit, ch, 0};
    case '>': return KeyAction{Action::WidenSplit, ch, 0};
    case 'm': return KeyAction{Action::SplitMenu, ch, 0};
    case 'T': return KeyAction{Action::TabMenu, ch, 0};
    case 'u': return KeyAction{Action::UrlPopover, ch, 0};
    case ',': return KeyAction{Action::Settings, ch, 0};
    case 'r': return KeyAction{Action::RetrySurface, ch, 0};
    case ':': return KeyAction{Action::CommandLine, ch, 0};
    default: return std::nullopt;
  }
}
