#pragma once

#include "tactus/at_scope_exit.hpp"
#include "tactus/config.hpp"

#include <pdqsort.h>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <tuple>
#include <utility>
#include <vector>

namespace tactus {

/**
 * A timeline which works over anything which has a `double getTime() const` method on it, kept sorted by time at all
 * times.
 *
 * Items with the same time keep the order in which they were added.  Lookups which land on a run of equal times
 * resolve to the last item of the run, so that the most recent write "wins" when asking what the value is right now.
 *
 * The timeline may be given a memory bound, in which case it drops its oldest items whenever it grows past that bound.
 * This is deliberate data loss, used by owners which only care about the recent past.
 *
 * All of the `forEach*` functions may be called re-entrantly and the callbacks may mutate the timeline.  Iteration walks
 * a snapshot of the selected range, so adding, cancelling or evicting from inside a callback never invalidates the
 * item being visited.  Items of the snapshot which were removed, cancelled or evicted by an earlier callback are
 * skipped.  `remove` called during an iteration is deferred until the outermost iteration finishes.
 *
 * `remove` and the `forEach*` functions additionally require `T` to be equality comparable.
 * */
template <typename T> class SortedTimeline {
public:
  explicit SortedTimeline(std::size_t memory = config::UNBOUNDED) : memory(memory) {}

  std::size_t size() const { return this->items.size(); }
  bool empty() const { return this->items.empty(); }

  std::size_t getMemory() const { return this->memory; }
  void setMemory(std::size_t new_memory) {
    this->memory = new_memory;
    this->trimToMemory();
  }

  void add(T item);
  /**
   * Add a batch of items.  The batch is sorted first, then merged in; ties inside the batch keep their order and come
   * after items already in the timeline.
   * */
  template <typename IT> void addItems(IT first, IT last);

  /**
   * Remove the first item equal to the given one.  Returns false if there was no such item.  If the timeline is
   * being iterated the removal happens once the iteration completes, and this returns true.
   * */
  bool remove(const T &item);

  /**
   * The last item whose time is at or before the given time.
   * */
  std::optional<const T *> get(double time) const;
  /**
   * The last item strictly before the given time.
   * */
  std::optional<const T *> getBefore(double time) const;
  /**
   * The first item strictly after the given time.
   * */
  std::optional<const T *> getAfter(double time) const;

  std::optional<const T *> peek() const;
  std::optional<T> shift();

  /**
   * Drop all items at or after the given time.
   * */
  void cancel(double after);
  /**
   * Drop all items at or before the given time.
   * */
  void cancelBefore(double time);
  void clear();

  template <typename CB> void forEach(CB &&callback);
  /* Items at or before `time`. */
  template <typename CB> void forEachBefore(double time, CB &&callback);
  /* Items strictly after `time`. */
  template <typename CB> void forEachAfter(double time, CB &&callback);
  /* Items at or after `time`. */
  template <typename CB> void forEachFrom(double time, CB &&callback);
  /* Items at exactly `time`. */
  template <typename CB> void forEachAtTime(double time, CB &&callback);

private:
  /* Index of the first item with a time greater than `time`. */
  std::size_t upperIndex(double time) const;
  /* Index of the first item with a time greater than or equal to `time`. */
  std::size_t lowerIndex(double time) const;

  template <typename CB> void iterate(std::size_t lower, std::size_t upper, CB &&callback);
  /* Still in the timeline, and not waiting on a deferred removal. */
  bool isLive(const T &item) const;
  void endIteration();
  void removeNow(const T &item);
  void trimToMemory();

  std::vector<T> items;
  std::vector<T> pending_removals;
  std::size_t memory;
  unsigned int iteration_depth = 0;
};

template <typename T> std::size_t SortedTimeline<T>::upperIndex(double time) const {
  auto it = std::upper_bound(this->items.begin(), this->items.end(), time,
                             [](double t, const T &item) { return t < item.getTime(); });
  return it - this->items.begin();
}

template <typename T> std::size_t SortedTimeline<T>::lowerIndex(double time) const {
  auto it = std::lower_bound(this->items.begin(), this->items.end(), time,
                             [](const T &item, double t) { return item.getTime() < t; });
  return it - this->items.begin();
}

template <typename T> void SortedTimeline<T>::add(T item) {
  // Fast path: most owners add in time order.
  if (this->items.empty() || this->items.back().getTime() <= item.getTime()) {
    this->items.push_back(std::move(item));
  } else {
    auto index = this->upperIndex(item.getTime());
    this->items.insert(this->items.begin() + index, std::move(item));
  }
  this->trimToMemory();
}

template <typename T> template <typename IT> void SortedTimeline<T>::addItems(IT first, IT last) {
  struct Entry {
    T item;
    unsigned int tie_breaker;
  };
  std::vector<Entry> batch;
  unsigned int insert_counter = 0;
  for (; first != last; ++first) {
    batch.push_back({*first, insert_counter++});
  }
  if (batch.empty()) {
    return;
  }

  // The tie breaker makes pdqsort stable, so equal times keep the order they were given in.
  pdqsort_branchless(batch.begin(), batch.end(), [](const Entry &a, const Entry &b) {
    auto at = a.item.getTime();
    auto bt = b.item.getTime();
    return std::tie(at, a.tie_breaker) < std::tie(bt, b.tie_breaker);
  });

  std::size_t old_size = this->items.size();
  this->items.reserve(old_size + batch.size());
  for (auto &e : batch) {
    this->items.push_back(std::move(e.item));
  }
  // inplace_merge is stable: existing items stay ahead of new ones with the same time.
  std::inplace_merge(this->items.begin(), this->items.begin() + old_size, this->items.end(),
                     [](const T &a, const T &b) { return a.getTime() < b.getTime(); });
  this->trimToMemory();
}

template <typename T> void SortedTimeline<T>::trimToMemory() {
  if (this->items.size() <= this->memory) {
    return;
  }
  auto excess = this->items.size() - this->memory;
  this->items.erase(this->items.begin(), this->items.begin() + excess);
}

template <typename T> bool SortedTimeline<T>::remove(const T &item) {
  auto lower = this->lowerIndex(item.getTime());
  auto upper = this->upperIndex(item.getTime());
  auto found = std::find(this->items.begin() + lower, this->items.begin() + upper, item);
  if (found == this->items.begin() + upper) {
    return false;
  }

  if (this->iteration_depth != 0) {
    this->pending_removals.push_back(item);
  } else {
    this->items.erase(found);
  }
  return true;
}

template <typename T> void SortedTimeline<T>::removeNow(const T &item) {
  auto lower = this->lowerIndex(item.getTime());
  auto upper = this->upperIndex(item.getTime());
  auto found = std::find(this->items.begin() + lower, this->items.begin() + upper, item);
  if (found != this->items.begin() + upper) {
    this->items.erase(found);
  }
}

template <typename T> std::optional<const T *> SortedTimeline<T>::get(double time) const {
  auto index = this->upperIndex(time);
  if (index == 0) {
    return std::nullopt;
  }
  return &this->items[index - 1];
}

template <typename T> std::optional<const T *> SortedTimeline<T>::getBefore(double time) const {
  auto index = this->lowerIndex(time);
  if (index == 0) {
    return std::nullopt;
  }
  return &this->items[index - 1];
}

template <typename T> std::optional<const T *> SortedTimeline<T>::getAfter(double time) const {
  auto index = this->upperIndex(time);
  if (index >= this->items.size()) {
    return std::nullopt;
  }
  return &this->items[index];
}

template <typename T> std::optional<const T *> SortedTimeline<T>::peek() const {
  if (this->items.empty()) {
    return std::nullopt;
  }
  return &this->items.front();
}

template <typename T> std::optional<T> SortedTimeline<T>::shift() {
  if (this->items.empty()) {
    return std::nullopt;
  }
  T ret = std::move(this->items.front());
  this->items.erase(this->items.begin());
  return ret;
}

template <typename T> void SortedTimeline<T>::cancel(double after) {
  // lowerIndex lands on the first item of any run equal to `after`, so the whole run goes.
  auto index = this->lowerIndex(after);
  this->items.erase(this->items.begin() + index, this->items.end());
}

template <typename T> void SortedTimeline<T>::cancelBefore(double time) {
  auto index = this->upperIndex(time);
  this->items.erase(this->items.begin(), this->items.begin() + index);
}

template <typename T> void SortedTimeline<T>::clear() {
  this->items.clear();
  this->pending_removals.clear();
}

template <typename T>
template <typename CB>
void SortedTimeline<T>::iterate(std::size_t lower, std::size_t upper, CB &&callback) {
  if (lower >= upper) {
    return;
  }

  std::vector<T> snapshot(this->items.begin() + lower, this->items.begin() + upper);
  this->iteration_depth++;
  auto end_iteration = AtScopeExit([&]() { this->endIteration(); });
  for (auto &item : snapshot) {
    if (this->isLive(item)) {
      callback(item);
    }
  }
}

template <typename T> bool SortedTimeline<T>::isLive(const T &item) const {
  if (std::find(this->pending_removals.begin(), this->pending_removals.end(), item) != this->pending_removals.end()) {
    return false;
  }
  auto lower = this->items.begin() + this->lowerIndex(item.getTime());
  auto upper = this->items.begin() + this->upperIndex(item.getTime());
  return std::find(lower, upper, item) != upper;
}

template <typename T> void SortedTimeline<T>::endIteration() {
  this->iteration_depth--;
  if (this->iteration_depth == 0 && this->pending_removals.empty() == false) {
    auto removals = std::move(this->pending_removals);
    this->pending_removals.clear();
    for (auto &r : removals) {
      this->removeNow(r);
    }
  }
}

template <typename T> template <typename CB> void SortedTimeline<T>::forEach(CB &&callback) {
  this->iterate(0, this->items.size(), std::forward<CB>(callback));
}

template <typename T> template <typename CB> void SortedTimeline<T>::forEachBefore(double time, CB &&callback) {
  this->iterate(0, this->upperIndex(time), std::forward<CB>(callback));
}

template <typename T> template <typename CB> void SortedTimeline<T>::forEachAfter(double time, CB &&callback) {
  this->iterate(this->upperIndex(time), this->items.size(), std::forward<CB>(callback));
}

template <typename T> template <typename CB> void SortedTimeline<T>::forEachFrom(double time, CB &&callback) {
  this->iterate(this->lowerIndex(time), this->items.size(), std::forward<CB>(callback));
}

template <typename T> template <typename CB> void SortedTimeline<T>::forEachAtTime(double time, CB &&callback) {
  this->iterate(this->lowerIndex(time), this->upperIndex(time), std::forward<CB>(callback));
}

} // namespace tactus
