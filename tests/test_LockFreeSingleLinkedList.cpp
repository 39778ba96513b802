#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <atomic>

#include "EBRManager/LockFreeSingleLinkedList.hpp"

class LockFreeSingleLinkedListTest : public ::testing::Test {
protected:
    LockFreeSingleLinkedList list;

    // 辅助函数：遍历链表计算节点数量
    size_t CountNodes(RetiredNode* head) {
        size_t count = 0;
        while (head) {
            count++;
            head = head->next;
        }
        return count;
    }

    std::vector<uint32_t> ListToIds(RetiredNode* head) {
        std::vector<uint32_t> ids;
        while (head) {
            ids.push_back(head->block_id);
            head = head->next;
        }
        return ids;
    }
};

// 1. 基础功能测试：单个 Push 和 Steal
TEST_F(LockFreeSingleLinkedListTest, BasicPushAndSteal) {
    RetiredNode node;
    node.block_id = 100;

    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.steal_all(), nullptr);

    list.push(&node);
    EXPECT_FALSE(list.empty());

    RetiredNode* stolen = list.steal_all();
    EXPECT_EQ(stolen, &node);
    EXPECT_TRUE(list.empty());
    EXPECT_EQ(list.steal_all(), nullptr);
}

// 2. 顺序测试：LIFO
TEST_F(LockFreeSingleLinkedListTest, LIFOOrder) {
    RetiredNode n1, n2, n3;
    n1.block_id = 1;
    n2.block_id = 2;
    n3.block_id = 3;

    list.push(&n1);
    list.push(&n2);
    list.push(&n3);

    std::vector<uint32_t> result = ListToIds(list.steal_all());
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], 3u);
    EXPECT_EQ(result[1], 2u);
    EXPECT_EQ(result[2], 1u);
}

// 3. 边界测试：Push nullptr 被忽略
TEST_F(LockFreeSingleLinkedListTest, PushNullptrSafe) {
    list.push(nullptr);
    EXPECT_EQ(list.steal_all(), nullptr);

    RetiredNode n1;
    list.push(&n1);
    list.push(nullptr);

    RetiredNode* head = list.steal_all();
    EXPECT_EQ(head, &n1);
    EXPECT_EQ(head->next, nullptr);
}

// 4. 并发测试：多生产者 Push，不丢节点、不成环
TEST_F(LockFreeSingleLinkedListTest, MultiThreadedPush) {
    const int kThreads = 8;
    const int kItemsPerThread = 10000;
    const int kTotalItems = kThreads * kItemsPerThread;

    std::vector<RetiredNode> all_nodes(kTotalItems);
    std::vector<std::thread> threads;
    std::atomic<bool> start_flag{false};

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            while (!start_flag.load(std::memory_order_relaxed));

            int start_idx = i * kItemsPerThread;
            for (int j = start_idx; j < start_idx + kItemsPerThread; ++j) {
                all_nodes[j].block_id = static_cast<uint32_t>(j);
                list.push(&all_nodes[j]);
            }
        });
    }

    start_flag.store(true);
    for (auto& t : threads) {
        t.join();
    }

    RetiredNode* head = list.steal_all();
    EXPECT_EQ(CountNodes(head), static_cast<size_t>(kTotalItems)) << "Lost nodes during concurrent push!";

    std::vector<bool> id_check(kTotalItems, false);
    int nodes_traversed = 0;
    for (RetiredNode* node = head; node; node = node->next) {
        ASSERT_LT(node->block_id, static_cast<uint32_t>(kTotalItems));
        EXPECT_FALSE(id_check[node->block_id]) << "Duplicate ID found: " << node->block_id;
        id_check[node->block_id] = true;

        if (++nodes_traversed > kTotalItems) {
            FAIL() << "Infinite loop detected in linked list!";
        }
    }
}
