#include "loom/WorkerPool.hpp"

#include "loom/Hash.hpp"
#include "loom/OperationPersister.hpp"

#include "doctest/doctest.h"

#include <atomic>
#include <future>
#include <memory>
#include <thread>
#include <variant>

namespace loom {

TEST_CASE("WorkerPool") {
    WorkerPool pool;

    SUBCASE("runs inline when not started") {
        auto caller = std::this_thread::get_id();
        std::thread::id ranOn;
        pool.enqueue([&ranOn]() { ranOn = std::this_thread::get_id(); });
        CHECK(ranOn == caller);
        CHECK(pool.numberOfThreads() == 0);
    }
    SUBCASE("runs every job on worker threads") {
        REQUIRE(pool.start(3));
        CHECK(pool.numberOfThreads() == 3);
        CHECK(!pool.start(2));

        std::atomic<int> count{0};
        std::promise<void> done;
        auto finished = done.get_future();
        constexpr int kJobs = 100;
        for (int i = 0; i < kJobs; ++i) {
            pool.enqueue([&count, &done]() {
                if (++count == kJobs) { done.set_value(); }
            });
        }
        finished.wait();
        CHECK(count == kJobs);
        pool.stop();
        CHECK(pool.numberOfThreads() == 0);
    }
    SUBCASE("stop runs jobs still queued") {
        REQUIRE(pool.start(1));
        std::promise<void> release;
        auto released = release.get_future().share();
        std::atomic<int> count{0};
        // Blocks the only worker until the other jobs are queued.
        pool.enqueue([released, &count]() { released.wait(); ++count; });
        for (int i = 0; i < 10; ++i) {
            pool.enqueue([&count]() { ++count; });
        }
        release.set_value();
        pool.stop();
        CHECK(count == 11);
    }
    SUBCASE("default thread count") {
        REQUIRE(pool.start());
        CHECK(pool.numberOfThreads() >= 1);
        pool.stop();
    }
}

TEST_CASE("LocalPersister") {
    auto pool = std::make_shared<WorkerPool>();
    REQUIRE(pool->start(2));
    LocalPersister persister(pool);

    SUBCASE("id is the hash of the text") {
        std::promise<PersistResult> promise;
        auto future = promise.get_future();
        persister.persist("query A { a }", [&promise](PersistResult result) { promise.set_value(std::move(result)); });
        auto result = future.get();
        REQUIRE(std::holds_alternative<std::string>(result));
        CHECK(std::get<std::string>(result) == hashToString(hash("query A { a }")));
        CHECK(std::get<std::string>(result).size() == 16);
    }
    SUBCASE("empty text is refused") {
        std::promise<PersistResult> promise;
        auto future = promise.get_future();
        persister.persist("", [&promise](PersistResult result) { promise.set_value(std::move(result)); });
        auto result = future.get();
        REQUIRE(std::holds_alternative<PersistError>(result));
        CHECK(std::get<PersistError>(result).message == "Refusing to persist empty operation text");
    }

    pool->stop();
}

TEST_CASE("Hash") {
    CHECK(hash("abc") == hash(std::string("abc")));
    CHECK(hash("abc") != hash("abd"));
    CHECK(hash("abc", 3, 1) != hash("abc", 3, 0));
    CHECK(hashToString(0) == "0000000000000000");
    CHECK(hashToString(0xdeadbeefull) == "00000000deadbeef");
    // Reference value of XXH64 with seed 0 for the empty input.
    CHECK(hash("") == 0xef46db3751d8e999ull);
}

} // namespace loom
