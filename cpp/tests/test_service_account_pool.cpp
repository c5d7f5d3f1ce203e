#include "gtest/gtest.h"
#include "sapool/pool/PoolError.hpp"
#include "sapool/pool/ServiceAccountPool.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <random>
#include <set>
#include <stdexcept>
#include <string>

using namespace sapool::pool;
namespace fs = std::filesystem;

class ServiceAccountPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937_64 rng{std::random_device{}()};
        dir_ = fs::temp_directory_path() / ("sapool_pool_" + std::to_string(rng()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string touch(const std::string& name) {
        auto path = dir_ / name;
        std::ofstream(path) << "{}";
        return pathOf(name);
    }

    std::string pathOf(const std::string& name) const {
        return (dir_ / name).string();
    }

    fs::path dir_;
    BlacklistRegistry blacklist;
};

// ============= Load =============

TEST_F(ServiceAccountPoolTest, LoadFiltersByExtensionAndExcludesActive) {
    auto sa1 = touch("sa1.json");
    auto sa2 = touch("sa2.json");
    auto sa3 = touch("sa3.json");
    touch("notes.txt");
    touch("sa4.json.bak");

    ServiceAccountPool pool(10, blacklist);
    auto files = pool.load(dir_, sa2);

    EXPECT_EQ(files, (std::set<std::string>{sa1, sa3}));
    EXPECT_EQ(pool.available(), files);
    EXPECT_EQ(pool.activeCredential(), sa2);
}

TEST_F(ServiceAccountPoolTest, LoadKeepsFileNamedOnlyByExtension) {
    auto hidden = touch(".json");
    auto sa1 = touch("sa1.json");

    ServiceAccountPool pool(10, blacklist);
    auto files = pool.load(dir_, sa1);

    EXPECT_EQ(files, (std::set<std::string>{hidden}));
}

TEST_F(ServiceAccountPoolTest, LoadBuildsPathsWithSeparator) {
    touch("a.json");
    ServiceAccountPool pool(10, blacklist);

    auto withSlash = dir_.string() + "/";
    auto files = pool.load(withSlash, "/elsewhere/active.json");
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(*files.begin(), withSlash + "a.json");

    auto files2 = pool.load(dir_, "/elsewhere/active.json");
    EXPECT_EQ(*files2.begin(), withSlash + "a.json");
}

TEST_F(ServiceAccountPoolTest, LoadAppendsActiveMissingFromDirectory) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    ServiceAccountPool pool(10, blacklist);

    pool.load(dir_, "/other/active.json");
    EXPECT_EQ(pool.activeCredential(), "/other/active.json");
    EXPECT_EQ(pool.available().size(), 2u);
    // 追加在末尾，回绕后从第一个开始
    EXPECT_EQ(pool.rollover(), a);
}

TEST_F(ServiceAccountPoolTest, LoadOrdersRotationByName) {
    auto c = touch("c.json");
    auto a = touch("a.json");
    auto b = touch("b.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, a);

    EXPECT_EQ(pool.advance(), b);
    EXPECT_EQ(pool.advance(), c);
    EXPECT_EQ(pool.advance(), a);
    EXPECT_EQ(pool.activeCredential(), a);
}

TEST_F(ServiceAccountPoolTest, LoadMissingDirectoryIsIoFailure) {
    ServiceAccountPool pool(10, blacklist);
    try {
        pool.load(dir_ / "missing", "x");
        FAIL() << "expected PoolError";
    } catch (const PoolError& err) {
        EXPECT_EQ(err.type(), PoolError::Type::io_failure);
    }
}

TEST_F(ServiceAccountPoolTest, LoadEmptyDirectoryPathIsNoop) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, a);

    auto files = pool.load(fs::path{}, "ignored");
    EXPECT_EQ(files, (std::set<std::string>{b}));
    EXPECT_EQ(pool.activeCredential(), a);
}

TEST_F(ServiceAccountPoolTest, LoadFromConfig) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    PoolConfig config;
    config.credentialDirectory = dir_;
    config.activeCredential = b;

    ServiceAccountPool pool(config.maxCached, blacklist);
    EXPECT_EQ(pool.load(config), (std::set<std::string>{a}));
    EXPECT_EQ(pool.maxCached(), 100u);
}

// ============= Rotation through the facade =============

TEST_F(ServiceAccountPoolTest, RollingScenario) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    auto c = touch("c.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, a);

    auto next = pool.rollover();
    EXPECT_EQ(next, b);
    pool.setActive(next);
    next = pool.rollover();
    EXPECT_EQ(next, c);
    pool.setActive(next);
    next = pool.rollover();
    EXPECT_EQ(next, a);

    pool.setActive("/not/loaded.json");
    EXPECT_EQ(pool.activeCredential(), c);
}

TEST_F(ServiceAccountPoolTest, StaleUntilExhausted) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, a);

    auto result = pool.markStale();
    EXPECT_FALSE(result.exhausted);
    EXPECT_EQ(result.next, b);
    EXPECT_FALSE(pool.exhausted());

    result = pool.markStale();
    EXPECT_TRUE(result.exhausted);
    EXPECT_EQ(result.next, "");
    EXPECT_TRUE(pool.exhausted());
    EXPECT_EQ(pool.rollover(), "");
    EXPECT_EQ(pool.advance(), "");
    EXPECT_FALSE(pool.randomPick().has_value());

    pool.revertStale(a);
    pool.revertStale("/unknown.json");
    EXPECT_FALSE(pool.exhausted());
    EXPECT_EQ(pool.randomPick(), 0u);
}

// ============= Reactive selection =============

TEST_F(ServiceAccountPoolTest, SelectExcludingBlacklistsFailingCredential) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    auto c = touch("c.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, a);

    auto next = pool.selectExcluding(b);
    EXPECT_EQ(next, c);
    EXPECT_TRUE(blacklist.isBlacklisted(b));
    EXPECT_EQ(pool.available(), (std::set<std::string>{c}));

    try {
        pool.selectExcluding(c);
        FAIL() << "expected PoolError";
    } catch (const PoolError& err) {
        EXPECT_EQ(err.type(), PoolError::Type::no_candidates);
    }
}

TEST_F(ServiceAccountPoolTest, BlacklistSharedAcrossPools) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    auto c = touch("c.json");
    ServiceAccountPool first(10, blacklist);
    ServiceAccountPool second(10, blacklist);
    first.load(dir_, a);
    second.load(dir_, a);

    first.selectExcluding(b);
    for (int i = 0; i < 20; ++i) {
        EXPECT_EQ(second.selectExcluding(""), c);
    }
}

TEST_F(ServiceAccountPoolTest, DefaultRegistryIsGlobal) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    touch("c.json");
    ServiceAccountPool pool(10);
    pool.load(dir_, a);

    pool.selectExcluding(b);
    EXPECT_TRUE(BlacklistRegistry::global().isBlacklisted(b));
    BlacklistRegistry::global().erase(b);
}

// ============= Client cache =============

TEST_F(ServiceAccountPoolTest, PreloadSkipsFailures) {
    auto a = touch("a.json");
    auto b = touch("b.json");
    auto c = touch("c.json");
    auto d = touch("d.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, a);

    std::atomic<int> calls{0};
    ClientFactory factory = [&](const std::string& path) {
        ++calls;
        if (path == c) {
            throw PoolError(PoolError::Type::io_failure, "cannot read " + path);
        }
        return ServiceClient{path, nullptr, nullptr};
    };

    auto loaded = pool.preload(5, factory);
    EXPECT_EQ(loaded, 2u);
    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(pool.cachedCount(), 2u);

    std::set<std::string> taken{pool.take().credential, pool.take().credential};
    EXPECT_EQ(taken, (std::set<std::string>{b, d}));
}

TEST_F(ServiceAccountPoolTest, PreloadStopsAtCountAndPrepends) {
    touch("a.json");
    touch("b.json");
    touch("c.json");
    touch("d.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, "/active.json");
    pool.offer(ServiceClient{"existing", nullptr, nullptr});

    auto loaded = pool.preload(2, [](const std::string& path) {
        return ServiceClient{path, nullptr, nullptr};
    });
    EXPECT_EQ(loaded, 2u);
    EXPECT_EQ(pool.cachedCount(), 3u);

    EXPECT_NE(pool.take().credential, "existing");
    EXPECT_NE(pool.take().credential, "existing");
    EXPECT_EQ(pool.take().credential, "existing");
}

TEST_F(ServiceAccountPoolTest, PreloadNothingWithoutFactoryOrCount) {
    touch("a.json");
    ServiceAccountPool pool(10, blacklist);
    pool.load(dir_, "/active.json");

    EXPECT_EQ(pool.preload(0, [](const std::string& path) { return ServiceClient{path, nullptr, nullptr}; }), 0u);
    EXPECT_EQ(pool.preload(3, ClientFactory{}), 0u);
    EXPECT_EQ(pool.cachedCount(), 0u);
}

TEST_F(ServiceAccountPoolTest, OfferTakeAndCap) {
    ServiceAccountPool pool(2, blacklist);
    EXPECT_THROW(pool.take(), PoolError);

    pool.offer(ServiceClient{"one", nullptr, nullptr});
    pool.offer(ServiceClient{"two", nullptr, nullptr});
    pool.offer(ServiceClient{"three", nullptr, nullptr});
    EXPECT_EQ(pool.cachedCount(), 2u);
    EXPECT_EQ(pool.take().credential, "three");
    EXPECT_EQ(pool.cachedCount(), 2u);

    pool.setMaxCached(1);
    EXPECT_EQ(pool.cachedCount(), 1u);
    EXPECT_EQ(pool.maxCached(), 1u);
}

// ============= Concurrency =============

TEST_F(ServiceAccountPoolTest, ConcurrentCallers) {
    std::string active;
    for (int i = 0; i < 20; ++i) {
        auto path = touch("sa" + std::to_string(i) + ".json");
        if (i == 0) {
            active = path;
        }
    }
    ServiceAccountPool pool(4, blacklist);
    pool.load(dir_, active);

    std::atomic<int> failures{0};
    boost::asio::thread_pool workers(8);
    for (int i = 0; i < 200; ++i) {
        boost::asio::post(workers, [&pool, &failures, i]() {
            try {
                switch (i % 5) {
                case 0:
                    (void)pool.selectExcluding("");
                    break;
                case 1:
                    (void)pool.advance();
                    break;
                case 2:
                    pool.offer(ServiceClient{"c" + std::to_string(i), nullptr, nullptr});
                    break;
                case 3:
                    (void)pool.take();
                    break;
                default:
                    pool.setActive(pool.rollover());
                    break;
                }
            } catch (const PoolError&) {
                ++failures;
            }
        });
    }
    workers.join();

    EXPECT_LE(pool.cachedCount(), 4u);
    EXPECT_EQ(pool.available().size(), 19u);
    EXPECT_FALSE(pool.activeCredential().empty());
}

TEST_F(ServiceAccountPoolTest, ConfigureLoadsAndPreloads) {
    auto a = touch("a.json");
    touch("b.json");
    touch("c.json");
    touch("d.json");

    PoolConfig config;
    config.credentialDirectory = dir_;
    config.activeCredential = a;
    config.maxCached = 2;
    config.preloadCount = 3;

    ServiceAccountPool pool(50, blacklist);
    auto loaded = pool.configure(config, [](const std::string& path) {
        return ServiceClient{path, nullptr, nullptr};
    });

    EXPECT_EQ(loaded, 3u);
    EXPECT_EQ(pool.maxCached(), 2u);
    EXPECT_EQ(pool.cachedCount(), 2u);
    EXPECT_EQ(pool.activeCredential(), a);
    EXPECT_EQ(pool.availableCount(), 3u);
}
