#pragma once
/*
 * Signal
 *
 * Purpose: in-process event with any number of listeners (refresh positions,
 * current directory changed, session changed).
 * Design: id → handler list; handlers removed during emit are not called.
 */
#include <algorithm>
#include <functional>
#include <utility>
#include <vector>

template <typename... Args>
class Signal {
public:
  using Handler = std::function<void(Args...)>;

  int connect(Handler h) {
    int id = ++next_id_;
    handlers_.emplace_back(id, std::move(h));
    return id;
  }

  void disconnect(int id) {
    handlers_.erase(std::remove_if(handlers_.begin(), handlers_.end(), [id](const auto& e) { return e.first == id; }),
                    handlers_.end());
  }

  void emit(Args... args) const {
    auto snapshot = handlers_;
    for (const auto& [id, h] : snapshot) {
      if (!connected(id)) continue;
      h(args...);
    }
  }

  bool connected(int id) const {
    return std::any_of(handlers_.begin(), handlers_.end(), [id](const auto& e) { return e.first == id; });
  }
  size_t size() const { return handlers_.size(); }

private:
  std::vector<std::pair<int, Handler>> handlers_;
  int next_id_ = 0;
};
