#include <gtest/gtest.h>
#include <ThreadSafeMap.hpp>
#include "domain/Account.hpp"

#include <atomic>
#include <thread>
#include <vector>

using ledger::domain::Account;
using ledger::domain::AccountType;

namespace {

std::shared_ptr<Account> makeAccount(const std::string& id, const std::string& name,
                                     const std::string& category = "Trading") {
    auto account = std::make_shared<Account>();
    account->id = id;
    account->name = name;
    account->accountType = AccountType::EXCHANGE;
    account->category = category;
    return account;
}

} // namespace

class ThreadSafeMapTest : public ::testing::Test {
protected:
    ThreadSafeMap<std::string, Account> map;
};

// ============================================================================
// Базовые операции
// ============================================================================

TEST_F(ThreadSafeMapTest, InsertAndFind) {
    map.insert("acc-1", makeAccount("acc-1", "Coinbase"));

    auto found = map.find("acc-1");
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->name, "Coinbase");
    EXPECT_EQ(found->category, "Trading");
}

TEST_F(ThreadSafeMapTest, FindNonExistent) {
    EXPECT_EQ(map.find("missing"), nullptr);
    EXPECT_FALSE(map.contains("missing"));
}

TEST_F(ThreadSafeMapTest, Insert_Overwrites) {
    map.insert("acc-1", makeAccount("acc-1", "Coinbase"));
    map.insert("acc-1", makeAccount("acc-1", "Coinbase Pro"));

    EXPECT_EQ(map.find("acc-1")->name, "Coinbase Pro");
    EXPECT_EQ(map.size(), 1u);
}

TEST_F(ThreadSafeMapTest, InsertIfAbsent_KeepsFirst) {
    EXPECT_TRUE(map.insertIfAbsent("acc-1", makeAccount("acc-1", "Kraken")));
    EXPECT_FALSE(map.insertIfAbsent("acc-1", makeAccount("acc-1", "Other")));

    EXPECT_EQ(map.find("acc-1")->name, "Kraken");
}

TEST_F(ThreadSafeMapTest, FindIf_MatchesPredicate) {
    map.insert("acc-1", makeAccount("acc-1", "Coinbase"));
    map.insert("acc-2", makeAccount("acc-2", "Ledger", "Cold Storage"));

    auto found = map.findIf([](const Account& a) { return a.category == "Cold Storage"; });
    ASSERT_NE(found, nullptr);
    EXPECT_EQ(found->id, "acc-2");

    EXPECT_EQ(map.findIf([](const Account& a) { return a.name == "Bank"; }), nullptr);
}

TEST_F(ThreadSafeMapTest, Erase_RemovesOnce) {
    map.insert("acc-1", makeAccount("acc-1", "Coinbase"));

    EXPECT_TRUE(map.erase("acc-1"));
    EXPECT_FALSE(map.erase("acc-1"));
    EXPECT_EQ(map.size(), 0u);
}

TEST_F(ThreadSafeMapTest, Values_ReturnsAll) {
    map.insert("acc-1", makeAccount("acc-1", "Coinbase"));
    map.insert("acc-2", makeAccount("acc-2", "Kraken"));

    EXPECT_EQ(map.values().size(), 2u);
}

// ============================================================================
// Многопоточность
// ============================================================================

TEST_F(ThreadSafeMapTest, MultipleWriters_AllValuesPresent) {
    const int NUM_WRITERS = 5;
    const int VALUES_PER_WRITER = 100;

    std::vector<std::thread> threads;
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        threads.emplace_back([this, writer]() {
            for (int i = 0; i < VALUES_PER_WRITER; ++i) {
                std::string id = "w" + std::to_string(writer) + "_" + std::to_string(i);
                map.insert(id, makeAccount(id, "Account " + id));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(map.size(), static_cast<size_t>(NUM_WRITERS * VALUES_PER_WRITER));
    for (int writer = 0; writer < NUM_WRITERS; ++writer) {
        for (int i = 0; i < VALUES_PER_WRITER; ++i) {
            std::string id = "w" + std::to_string(writer) + "_" + std::to_string(i);
            auto found = map.find(id);
            ASSERT_NE(found, nullptr) << "Missing key: " << id;
            EXPECT_EQ(found->name, "Account " + id);
        }
    }
}

TEST_F(ThreadSafeMapTest, ConcurrentInsertIfAbsent_SingleWinner) {
    std::atomic<int> winners(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this, &winners, t]() {
            if (map.insertIfAbsent("shared", makeAccount("shared", "Writer " + std::to_string(t)))) {
                winners++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(map.size(), 1u);
}
