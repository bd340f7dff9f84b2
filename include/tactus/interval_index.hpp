#pragma once

#include "tactus/at_scope_exit.hpp"
#include "tactus/error.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace tactus {

/**
 * An interval tree over anything which has `double getTime() const` and `double getDuration() const`.  Each item
 * covers the half-open interval `[time, time + duration)`; the duration may be infinite.
 *
 * The tree is an AVL tree keyed by the start of the interval, where every node also knows the largest end of any
 * interval in its subtree.  That lets point queries skip whole subtrees which end before the point.  Items with equal
 * starts are kept in insertion order.
 *
 * As with SortedTimeline, removal requested from inside one of the `forEach*` callbacks is deferred until the
 * outermost iteration finishes; removed items are not visited by the rest of that iteration.  Adding from inside a
 * callback is fine.
 *
 * `remove` requires `T` to be equality comparable.
 * */
template <typename T> class IntervalIndex {
public:
  IntervalIndex() {}
  ~IntervalIndex() { destroySubtree(this->root); }

  IntervalIndex(const IntervalIndex &) = delete;
  IntervalIndex &operator=(const IntervalIndex &) = delete;

  /**
   * Throws EValidation if the item has a non-finite time, or a duration which isn't positive.
   * */
  void add(T item);
  /**
   * Returns false if no equal item was found.
   * */
  bool remove(const T &item);

  /**
   * Of all the intervals containing `point`, the one which started last.
   * */
  std::optional<const T *> get(double point) const;

  /* Every item, ordered by start. */
  template <typename CB> void forEach(CB &&callback);
  /* Every item whose interval contains `point`, ordered by start. */
  template <typename CB> void forEachAtTime(double point, CB &&callback);
  /* Every item which starts at or after `time`, ordered by start. */
  template <typename CB> void forEachAfter(double time, CB &&callback);

  /**
   * Remove every item which starts at or after `after`.
   * */
  void cancel(double after);
  void clear();

  std::size_t size() const { return this->length; }
  bool empty() const { return this->length == 0; }
  unsigned int getHeight() const { return height(this->root); }

  /**
   * Walk the whole tree checking ordering, parent links, heights, the subtree maximum, and AVL balance.  For tests.
   * */
  bool verifyInvariants() const;

private:
  struct Node {
    Node(double low, double high, T item) : low(low), high(high), max(high), item(std::move(item)) {}

    double low;
    double high;
    double max;
    unsigned int height = 1;
    bool removed = false;
    T item;
    Node *left = nullptr;
    Node *right = nullptr;
    Node *parent = nullptr;
  };

  static unsigned int height(const Node *node) { return node ? node->height : 0; }
  static int balance(const Node *node) { return (int)height(node->left) - (int)height(node->right); }
  static void update(Node *node);
  static void destroySubtree(Node *node);

  void replaceChild(Node *parent, Node *old_child, Node *new_child);
  Node *rotateLeft(Node *node);
  Node *rotateRight(Node *node);
  /* Rebalance at node, returning the root of what was node's subtree. */
  Node *rebalance(Node *node);
  /* Update and rebalance from node to the root. */
  void retrace(Node *node);
  void removeNode(Node *node);
  void requestRemoval(Node *node);

  static void searchPoint(Node *node, double point, std::vector<Node *> &out);
  static void searchAfter(Node *node, double time, std::vector<Node *> &out);
  static void collect(Node *node, std::vector<Node *> &out);
  static bool verifySubtree(const Node *node, const Node *parent, unsigned int *height_out);

  template <typename CB> void visit(const std::vector<Node *> &nodes, CB &&callback);
  void endIteration();

  Node *root = nullptr;
  std::size_t length = 0;
  unsigned int iteration_depth = 0;
  std::vector<Node *> pending_removals;
};

template <typename T> void IntervalIndex<T>::update(Node *node) {
  node->height = 1 + std::max(height(node->left), height(node->right));
  node->max = node->high;
  if (node->left) {
    node->max = std::max(node->max, node->left->max);
  }
  if (node->right) {
    node->max = std::max(node->max, node->right->max);
  }
}

template <typename T> void IntervalIndex<T>::destroySubtree(Node *node) {
  if (node == nullptr) {
    return;
  }
  destroySubtree(node->left);
  destroySubtree(node->right);
  delete node;
}

template <typename T> void IntervalIndex<T>::replaceChild(Node *parent, Node *old_child, Node *new_child) {
  if (parent == nullptr) {
    this->root = new_child;
  } else if (parent->left == old_child) {
    parent->left = new_child;
  } else {
    parent->right = new_child;
  }
  if (new_child) {
    new_child->parent = parent;
  }
}

template <typename T> typename IntervalIndex<T>::Node *IntervalIndex<T>::rotateLeft(Node *node) {
  Node *pivot = node->right;
  this->replaceChild(node->parent, node, pivot);
  node->right = pivot->left;
  if (node->right) {
    node->right->parent = node;
  }
  pivot->left = node;
  node->parent = pivot;
  update(node);
  update(pivot);
  return pivot;
}

template <typename T> typename IntervalIndex<T>::Node *IntervalIndex<T>::rotateRight(Node *node) {
  Node *pivot = node->left;
  this->replaceChild(node->parent, node, pivot);
  node->left = pivot->right;
  if (node->left) {
    node->left->parent = node;
  }
  pivot->right = node;
  node->parent = pivot;
  update(node);
  update(pivot);
  return pivot;
}

template <typename T> typename IntervalIndex<T>::Node *IntervalIndex<T>::rebalance(Node *node) {
  int b = balance(node);
  if (b > 1) {
    // Left heavy. If the left child leans right, a single rotation would just move the imbalance.
    if (balance(node->left) < 0) {
      this->rotateLeft(node->left);
    }
    return this->rotateRight(node);
  } else if (b < -1) {
    if (balance(node->right) > 0) {
      this->rotateRight(node->right);
    }
    return this->rotateLeft(node);
  }
  return node;
}

template <typename T> void IntervalIndex<T>::retrace(Node *node) {
  while (node != nullptr) {
    update(node);
    node = this->rebalance(node)->parent;
  }
}

template <typename T> void IntervalIndex<T>::add(T item) {
  double low = item.getTime();
  double duration = item.getDuration();
  if (std::isfinite(low) == false) {
    throw EValidation("Interval events must have a finite time");
  }
  if (std::isnan(duration) || duration <= 0.0) {
    throw EValidation("Interval events must have a positive duration");
  }

  Node *node = new Node(low, low + duration, std::move(item));
  this->length++;

  if (this->root == nullptr) {
    this->root = node;
    return;
  }

  Node *cursor = this->root;
  while (true) {
    // Equal starts go right, so an in-order walk sees them in insertion order.
    if (low < cursor->low) {
      if (cursor->left == nullptr) {
        cursor->left = node;
        break;
      }
      cursor = cursor->left;
    } else {
      if (cursor->right == nullptr) {
        cursor->right = node;
        break;
      }
      cursor = cursor->right;
    }
  }
  node->parent = cursor;
  this->retrace(cursor);
}

template <typename T> void IntervalIndex<T>::removeNode(Node *node) {
  Node *retrace_from;

  if (node->left == nullptr || node->right == nullptr) {
    Node *child = node->left ? node->left : node->right;
    retrace_from = node->parent;
    this->replaceChild(node->parent, node, child);
  } else {
    Node *replacement;
    // Take the replacement from the taller side, so that removing it is less likely to need rotations.
    if (balance(node) > 0) {
      replacement = node->left;
      while (replacement->right) {
        replacement = replacement->right;
      }
      if (replacement->parent == node) {
        retrace_from = replacement;
      } else {
        retrace_from = replacement->parent;
        this->replaceChild(replacement->parent, replacement, replacement->left);
        replacement->left = node->left;
        replacement->left->parent = replacement;
      }
      replacement->right = node->right;
      replacement->right->parent = replacement;
    } else {
      replacement = node->right;
      while (replacement->left) {
        replacement = replacement->left;
      }
      if (replacement->parent == node) {
        retrace_from = replacement;
      } else {
        retrace_from = replacement->parent;
        this->replaceChild(replacement->parent, replacement, replacement->right);
        replacement->right = node->right;
        replacement->right->parent = replacement;
      }
      replacement->left = node->left;
      replacement->left->parent = replacement;
    }
    this->replaceChild(node->parent, node, replacement);
  }

  delete node;
  this->length--;
  this->retrace(retrace_from);
}

template <typename T> void IntervalIndex<T>::requestRemoval(Node *node) {
  if (node->removed) {
    return;
  }
  if (this->iteration_depth != 0) {
    node->removed = true;
    this->pending_removals.push_back(node);
  } else {
    this->removeNode(node);
  }
}

template <typename T> bool IntervalIndex<T>::remove(const T &item) {
  std::vector<Node *> candidates;
  // An interval always contains its own start.
  searchPoint(this->root, item.getTime(), candidates);
  for (auto *n : candidates) {
    if (n->removed == false && n->item == item) {
      this->requestRemoval(n);
      return true;
    }
  }
  return false;
}

template <typename T> void IntervalIndex<T>::searchPoint(Node *node, double point, std::vector<Node *> &out) {
  // Nothing in this subtree is still running at point.
  if (node == nullptr || point >= node->max) {
    return;
  }
  searchPoint(node->left, point, out);
  if (node->low <= point && point < node->high) {
    out.push_back(node);
  }
  // Everything to the right starts after point.
  if (node->low > point) {
    return;
  }
  searchPoint(node->right, point, out);
}

template <typename T> void IntervalIndex<T>::searchAfter(Node *node, double time, std::vector<Node *> &out) {
  if (node == nullptr) {
    return;
  }
  if (node->low >= time) {
    searchAfter(node->left, time, out);
    out.push_back(node);
  }
  searchAfter(node->right, time, out);
}

template <typename T> void IntervalIndex<T>::collect(Node *node, std::vector<Node *> &out) {
  if (node == nullptr) {
    return;
  }
  collect(node->left, out);
  out.push_back(node);
  collect(node->right, out);
}

template <typename T> std::optional<const T *> IntervalIndex<T>::get(double point) const {
  std::vector<Node *> results;
  searchPoint(this->root, point, results);
  const Node *best = nullptr;
  for (auto *n : results) {
    if (n->removed) {
      continue;
    }
    // Results are in order, so >= picks the most recently added of equal starts.
    if (best == nullptr || n->low >= best->low) {
      best = n;
    }
  }
  if (best == nullptr) {
    return std::nullopt;
  }
  return &best->item;
}

template <typename T>
template <typename CB>
void IntervalIndex<T>::visit(const std::vector<Node *> &nodes, CB &&callback) {
  this->iteration_depth++;
  auto end_iteration = AtScopeExit([&]() { this->endIteration(); });
  for (auto *n : nodes) {
    if (n->removed == false) {
      callback(static_cast<const T &>(n->item));
    }
  }
}

template <typename T> void IntervalIndex<T>::endIteration() {
  this->iteration_depth--;
  if (this->iteration_depth == 0 && this->pending_removals.empty() == false) {
    auto removals = std::move(this->pending_removals);
    this->pending_removals.clear();
    for (auto *n : removals) {
      this->removeNode(n);
    }
  }
}

template <typename T> template <typename CB> void IntervalIndex<T>::forEach(CB &&callback) {
  std::vector<Node *> nodes;
  collect(this->root, nodes);
  this->visit(nodes, std::forward<CB>(callback));
}

template <typename T> template <typename CB> void IntervalIndex<T>::forEachAtTime(double point, CB &&callback) {
  std::vector<Node *> nodes;
  searchPoint(this->root, point, nodes);
  this->visit(nodes, std::forward<CB>(callback));
}

template <typename T> template <typename CB> void IntervalIndex<T>::forEachAfter(double time, CB &&callback) {
  std::vector<Node *> nodes;
  searchAfter(this->root, time, nodes);
  this->visit(nodes, std::forward<CB>(callback));
}

template <typename T> void IntervalIndex<T>::cancel(double after) {
  std::vector<Node *> nodes;
  searchAfter(this->root, after, nodes);
  for (auto *n : nodes) {
    this->requestRemoval(n);
  }
}

template <typename T> void IntervalIndex<T>::clear() {
  if (this->iteration_depth != 0) {
    std::vector<Node *> nodes;
    collect(this->root, nodes);
    for (auto *n : nodes) {
      this->requestRemoval(n);
    }
    return;
  }
  destroySubtree(this->root);
  this->root = nullptr;
  this->length = 0;
}

template <typename T>
bool IntervalIndex<T>::verifySubtree(const Node *node, const Node *parent, unsigned int *height_out) {
  if (node == nullptr) {
    *height_out = 0;
    return true;
  }
  if (node->parent != parent) {
    return false;
  }
  if (node->left && node->left->low > node->low) {
    return false;
  }
  if (node->right && node->right->low < node->low) {
    return false;
  }

  unsigned int lh, rh;
  if (verifySubtree(node->left, node, &lh) == false || verifySubtree(node->right, node, &rh) == false) {
    return false;
  }
  if (node->height != 1 + std::max(lh, rh)) {
    return false;
  }
  if ((int)lh - (int)rh > 1 || (int)rh - (int)lh > 1) {
    return false;
  }

  double expected_max = node->high;
  if (node->left) {
    expected_max = std::max(expected_max, node->left->max);
  }
  if (node->right) {
    expected_max = std::max(expected_max, node->right->max);
  }
  if (node->max != expected_max) {
    return false;
  }

  *height_out = node->height;
  return true;
}

template <typename T> bool IntervalIndex<T>::verifyInvariants() const {
  unsigned int h;
  if (verifySubtree(this->root, nullptr, &h) == false) {
    return false;
  }
  std::vector<Node *> nodes;
  collect(this->root, nodes);
  if (nodes.size() != this->length) {
    return false;
  }
  // The children checks above are local; make sure the whole in-order walk is sorted too.
  for (std::size_t i = 1; i < nodes.size(); i++) {
    if (nodes[i - 1]->low > nodes[i]->low) {
      return false;
    }
  }
  return true;
}

} // namespace tactus
