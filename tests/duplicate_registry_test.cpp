#include <gtest/gtest.h>
#include "core/duplicate_registry.hpp"
#include <atomic>
#include <thread>
#include <vector>

TEST(DuplicateRegistryTest, FirstIsOriginalLaterAreDuplicates)
{
    DuplicateRegistry registry;
    Fingerprint fp(DuplicateStrategy::EXACT, "abcd");

    EXPECT_EQ(registry.classify(fp), Classification::ORIGINAL);
    EXPECT_EQ(registry.classify(fp), Classification::DUPLICATE);
    EXPECT_EQ(registry.classify(fp), Classification::DUPLICATE);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(DuplicateRegistryTest, StrategyIsPartOfIdentity)
{
    DuplicateRegistry registry;

    EXPECT_EQ(registry.classify(Fingerprint(DuplicateStrategy::EXACT, "abcd")), Classification::ORIGINAL);
    EXPECT_EQ(registry.classify(Fingerprint(DuplicateStrategy::PERCEPTUAL, "abcd")), Classification::ORIGINAL);
    EXPECT_TRUE(registry.contains(Fingerprint(DuplicateStrategy::PERCEPTUAL, "abcd")));
    EXPECT_FALSE(registry.contains(Fingerprint(DuplicateStrategy::EXACT, "ffff")));
}

TEST(DuplicateRegistryTest, ClearStartsANewRun)
{
    DuplicateRegistry registry;
    Fingerprint fp(DuplicateStrategy::EXACT, "abcd");
    registry.classify(fp);

    registry.clear();

    EXPECT_EQ(registry.size(), 0u);
    EXPECT_EQ(registry.classify(fp), Classification::ORIGINAL);
}

TEST(DuplicateRegistryTest, ConcurrentClassifyYieldsSingleOriginal)
{
    DuplicateRegistry registry;
    Fingerprint fp(DuplicateStrategy::EXACT, "same-content");
    std::atomic<int> originals{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&]()
                             {
            for (int j = 0; j < 100; ++j)
            {
                if (registry.classify(fp) == Classification::ORIGINAL)
                    originals++;
            } });
    }
    for (auto &t : threads)
        t.join();

    EXPECT_EQ(originals.load(), 1);
}
