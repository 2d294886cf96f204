/********************************************************************
 * linelookup -- tree_search.cc
 * Copyright (c) 2011-2013 Nelson Elhage
 *
 * This program is free software. You may use, redistribute, and/or
 * modify it under the terms listed in the COPYING file.
 ********************************************************************/
#include "src/tree_search.h"

#include <deque>
#include <utility>
#include <vector>

using std::string;
using std::vector;

// Tears the subtree down iteratively so that very deep trees do not
// recurse through unique_ptr destructors.
tree_node::~tree_node() {
    vector<std::unique_ptr<tree_node>> pending;
    pending.swap(children_);
    while (!pending.empty()) {
        std::unique_ptr<tree_node> node = std::move(pending.back());
        pending.pop_back();
        for (auto &child : node->children_)
            pending.push_back(std::move(child));
        node->children_.clear();
    }
}

tree_node *tree_node::add_child(const string &value) {
    children_.push_back(std::unique_ptr<tree_node>(new tree_node(value)));
    return children_.back().get();
}

vector<const tree_node*> tree_node::children() const {
    vector<const tree_node*> out;
    out.reserve(children_.size());
    for (auto &child : children_)
        out.push_back(child.get());
    return out;
}

const tree_node *tree_dfs(const tree_node *root, const string &target,
                          const visit_func &visit) {
    if (root == nullptr)
        return nullptr;

    vector<const tree_node*> stack;
    stack.push_back(root);
    while (!stack.empty()) {
        const tree_node *node = stack.back();
        stack.pop_back();
        if (visit)
            visit(node);
        if (node->value() == target)
            return node;

        // Push in reverse so the leftmost child is popped first.
        vector<const tree_node*> children = node->children();
        stack.insert(stack.end(), children.rbegin(), children.rend());
    }
    return nullptr;
}

const tree_node *tree_bfs(const tree_node *root, const string &target,
                          const visit_func &visit) {
    if (root == nullptr)
        return nullptr;

    std::deque<const tree_node*> queue;
    queue.push_back(root);
    while (!queue.empty()) {
        const tree_node *node = queue.front();
        queue.pop_front();
        if (visit)
            visit(node);
        if (node->value() == target)
            return node;

        vector<const tree_node*> children = node->children();
        if (!children.empty())
            queue.insert(queue.end(), children.begin(), children.end());
    }
    return nullptr;
}
