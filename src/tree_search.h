/********************************************************************
 * linelookup -- tree_search.h
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#ifndef LINELOOKUP_TREE_SEARCH_H
#define LINELOOKUP_TREE_SEARCH_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

// A node of a rooted, ordered tree. Each node owns its children.
class tree_node {
public:
    explicit tree_node(const std::string &value) : value_(value) {}
    ~tree_node();

    const std::string &value() const { return value_; }

    // Appends a new last child and returns it.
    tree_node *add_child(const std::string &value);

    // A snapshot of the children, left to right. Empty for a leaf.
    std::vector<const tree_node*> children() const;

    size_t num_children() const { return children_.size(); }

private:
    std::string value_;
    std::vector<std::unique_ptr<tree_node>> children_;

    tree_node(const tree_node&);
    void operator=(const tree_node&);
};

// Called once for every node a search examines, in visiting order.
typedef std::function<void (const tree_node*)> visit_func;

// Pre-order depth-first search, children left to right. Returns the
// first node whose value equals `target', or NULL. Uses an explicit
// stack, so depth is bounded only by memory.
const tree_node *tree_dfs(const tree_node *root, const std::string &target,
                          const visit_func &visit = visit_func());

// Breadth-first search. Returns the shallowest, then leftmost, node whose
// value equals `target', or NULL.
const tree_node *tree_bfs(const tree_node *root, const std::string &target,
                          const visit_func &visit = visit_func());

#endif /* LINELOOKUP_TREE_SEARCH_H */
