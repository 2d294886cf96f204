#include <string>
#include <vector>
#include "gtest/gtest.h"

#include "src/tree_search.h"

using std::string;
using std::vector;

class tree_search_test : public ::testing::Test {
protected:
    tree_search_test() : root_("root") {
        a_ = root_.add_child("a");
        b_ = root_.add_child("b");
        c_ = root_.add_child("c");
        a_->add_child("a1");
        a_->add_child("a2");
        b_->add_child("b1")->add_child("b1x");
        c_->add_child("c1");
    }

    vector<string> visited_by_dfs(const string &target) {
        vector<string> seen;
        tree_dfs(&root_, target,
                 [&](const tree_node *n) { seen.push_back(n->value()); });
        return seen;
    }

    vector<string> visited_by_bfs(const string &target) {
        vector<string> seen;
        tree_bfs(&root_, target,
                 [&](const tree_node *n) { seen.push_back(n->value()); });
        return seen;
    }

    tree_node root_;
    tree_node *a_, *b_, *c_;
};

TEST_F(tree_search_test, DfsStopsAtFirstChild) {
    int visits = 0;
    const tree_node *found = tree_dfs(&root_, "a",
                                      [&](const tree_node *) { ++visits; });
    EXPECT_EQ(a_, found);
    EXPECT_EQ(2, visits);
}

TEST_F(tree_search_test, DfsOrder) {
    vector<string> want = {"root", "a", "a1", "a2", "b", "b1", "b1x", "c", "c1"};
    EXPECT_EQ(want, visited_by_dfs("missing"));
    EXPECT_EQ(nullptr, tree_dfs(&root_, "missing"));
}

TEST_F(tree_search_test, BfsOrder) {
    vector<string> want = {"root", "a", "b", "c", "a1", "a2", "b1", "c1", "b1x"};
    EXPECT_EQ(want, visited_by_bfs("missing"));
    EXPECT_EQ(nullptr, tree_bfs(&root_, "missing"));
}

TEST_F(tree_search_test, DfsReachesDeepMatchAfterEarlierSubtrees) {
    vector<string> seen = visited_by_dfs("c1");
    vector<string> want = {"root", "a", "a1", "a2", "b", "b1", "b1x", "c", "c1"};
    EXPECT_EQ(want, seen);
}

TEST_F(tree_search_test, BfsAndDfsAgreeOnUniqueValues) {
    const char *targets[] = {"root", "a", "a2", "b1x", "c", "c1"};
    for (auto t : targets) {
        const tree_node *d = tree_dfs(&root_, t);
        const tree_node *b = tree_bfs(&root_, t);
        ASSERT_TRUE(d != nullptr) << t;
        EXPECT_EQ(d, b) << t;
        EXPECT_EQ(t, d->value());
    }
    EXPECT_LT(visited_by_bfs("c").size(), visited_by_dfs("c").size());
    EXPECT_LT(visited_by_dfs("a1").size(), visited_by_bfs("a1").size());
}

TEST(TreeSearchTest, BfsPrefersShallowerDuplicate) {
    tree_node root("root");
    // Left branch hides the target nine levels down...
    tree_node *deep = root.add_child("left");
    for (int depth = 2; depth < 9; ++depth)
        deep = deep->add_child("left" + std::to_string(depth));
    const tree_node *deep_target = deep->add_child("target");
    // ...the right branch has it at depth 2.
    const tree_node *shallow_target = root.add_child("right")->add_child("target");

    EXPECT_EQ(shallow_target, tree_bfs(&root, "target"));
    EXPECT_EQ(deep_target, tree_dfs(&root, "target"));
}

TEST(TreeSearchTest, SingleNode) {
    tree_node root("only");
    EXPECT_TRUE(root.children().empty());
    EXPECT_EQ(0u, root.num_children());

    EXPECT_EQ(nullptr, tree_dfs(&root, ""));
    EXPECT_EQ(nullptr, tree_bfs(&root, ""));
    EXPECT_EQ(&root, tree_dfs(&root, "only"));
    EXPECT_EQ(&root, tree_bfs(&root, "only"));

    tree_node empty("");
    EXPECT_EQ(&empty, tree_dfs(&empty, ""));
    EXPECT_EQ(&empty, tree_bfs(&empty, ""));
}

TEST(TreeSearchTest, NullRoot) {
    EXPECT_EQ(nullptr, tree_dfs(nullptr, "x"));
    EXPECT_EQ(nullptr, tree_bfs(nullptr, "x"));
}

TEST(TreeSearchTest, ChildrenIsASnapshot) {
    tree_node root("root");
    root.add_child("a");
    vector<const tree_node*> snapshot = root.children();
    root.add_child("b");
    EXPECT_EQ(1u, snapshot.size());
    EXPECT_EQ(2u, root.children().size());
    EXPECT_EQ("a", snapshot[0]->value());
}

TEST(TreeSearchTest, VeryDeepTree) {
    tree_node root("n0");
    tree_node *tip = &root;
    const int kDepth = 200000;
    for (int i = 1; i <= kDepth; ++i)
        tip = tip->add_child("n" + std::to_string(i));

    EXPECT_EQ(tip, tree_dfs(&root, "n200000"));
    EXPECT_EQ(tip, tree_bfs(&root, "n200000"));
    EXPECT_EQ(nullptr, tree_dfs(&root, "absent"));
}

TEST(TreeSearchTest, WideTree) {
    tree_node root("root");
    vector<tree_node*> level = {&root};
    int counter = 1;
    const tree_node *last = nullptr;
    for (int depth = 1; depth < 8; ++depth) {
        vector<tree_node*> next;
        for (auto parent : level) {
            for (int i = 0; i < 3; ++i) {
                tree_node *child = parent->add_child("node_" + std::to_string(counter++));
                next.push_back(child);
                last = child;
            }
        }
        level = next;
    }

    int dfs_visits = 0, bfs_visits = 0;
    EXPECT_EQ(last, tree_dfs(&root, last->value(),
                             [&](const tree_node *) { ++dfs_visits; }));
    EXPECT_EQ(last, tree_bfs(&root, last->value(),
                             [&](const tree_node *) { ++bfs_visits; }));
    EXPECT_EQ(counter, bfs_visits);
    EXPECT_EQ(counter, dfs_visits);
}
