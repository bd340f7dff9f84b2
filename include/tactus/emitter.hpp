#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

namespace tactus {

/**
 * A minimal listener registry: `on` registers a callback for one kind of event and returns an id which `off` takes
 * back.
 *
 * Listeners may register or unregister listeners (including themselves) while an event is being emitted; the set of
 * listeners which get called is fixed when emit starts.
 * */
template <typename EVENT, typename... ARGS> class Emitter {
public:
  using Listener = std::function<void(ARGS...)>;
  using ListenerId = unsigned long long;

  ListenerId on(EVENT event, Listener listener) {
    auto id = this->next_id++;
    this->entries.push_back({id, event, std::make_shared<Listener>(std::move(listener))});
    return id;
  }

  void off(ListenerId id) {
    this->entries.erase(
        std::remove_if(this->entries.begin(), this->entries.end(), [&](auto &e) { return e.id == id; }),
        this->entries.end());
  }

  void emit(EVENT event, ARGS... args) {
    std::vector<std::shared_ptr<Listener>> to_call;
    for (auto &e : this->entries) {
      if (e.event == event) {
        to_call.push_back(e.listener);
      }
    }
    for (auto &l : to_call) {
      (*l)(args...);
    }
  }

private:
  struct Entry {
    ListenerId id;
    EVENT event;
    std::shared_ptr<Listener> listener;
  };

  std::vector<Entry> entries;
  ListenerId next_id = 1;
};

} // namespace tactus
