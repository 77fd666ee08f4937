#include <catch2/catch.hpp>

#include "SingleFlight/SingleFlight.hpp"
#include "TestUtils.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

TEST_CASE("doCall runs the function and returns its value", "[singleflight]") {
    SingleFlight<std::string, std::string> group(2);
    CancellationSource source;
    CancellationToken token = source.getToken();

    bool same_token = false;
    auto result = group.doCall(token, "key", [&](const CancellationToken& passed) {
        same_token = passed == token;
        return std::string("bar");
    });

    REQUIRE(same_token);
    REQUIRE(result.ok());
    REQUIRE(result.value == "bar");
    REQUIRE_FALSE(result.shared);
    REQUIRE(group.getStats().in_flight == 0);
}

TEST_CASE("doCall reports the function's exception", "[singleflight]") {
    SingleFlight<std::string, std::shared_ptr<std::string>> group(2);

    auto result = group.doCall(CancellationToken(), "key",
        [](const CancellationToken&) -> std::shared_ptr<std::string> {
            throw std::runtime_error("some error");
        });

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.value == nullptr);
    REQUIRE_FALSE(result.shared);
    REQUIRE_THROWS_WITH(result.get(), "some error");
}

TEST_CASE("a failed call does not poison the key", "[singleflight]") {
    SingleFlight<std::string, int> group(2);
    int calls = 0;

    auto failed = group.doCall(CancellationToken(), "key", [&](const CancellationToken&) -> int {
        calls++;
        throw std::runtime_error("backend down");
    });
    REQUIRE_FALSE(failed.ok());

    auto retried = group.doCall(CancellationToken(), "key", [&](const CancellationToken&) {
        calls++;
        return 7;
    });
    REQUIRE(retried.ok());
    REQUIRE(retried.value == 7);
    REQUIRE(calls == 2);
}

TEST_CASE("concurrent doCalls for one key run the function once", "[singleflight]") {
    SingleFlight<std::string, std::string> group(2);
    test::Gate release;
    std::atomic<int> calls{0};
    auto fn = [&](const CancellationToken&) {
        calls++;
        release.wait();
        return std::string("bar");
    };

    const int n = 10;
    std::vector<Result<std::string>> results(n);
    std::vector<std::thread> threads;

    threads.emplace_back([&] { results[0] = group.doCall(CancellationToken(), "key", fn); });
    REQUIRE(test::waitUntil([&] { return calls.load() == 1; }));

    for (int i = 1; i < n; i++) {
        threads.emplace_back([&, i] { results[i] = group.doCall(CancellationToken(), "key", fn); });
    }
    REQUIRE(test::waitUntil([&] { return group.getStats().joins == n - 1; }));

    release.open();
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(calls.load() == 1);
    for (const auto& result : results) {
        REQUIRE(result.ok());
        REQUIRE(result.value == "bar");
        REQUIRE(result.shared);
    }
    REQUIRE(group.getStats().in_flight == 0);
}

TEST_CASE("ungated concurrent doCalls share at least one result", "[singleflight]") {
    SingleFlight<std::string, std::string> group(2);
    std::atomic<int> calls{0};
    test::Gate first_started;
    test::Gate value_ready;

    auto fn = [&](const CancellationToken&) {
        if (calls.fetch_add(1) == 0) {
            first_started.open();
        }
        value_ready.wait();
        std::this_thread::sleep_for(10ms);
        return std::string("bar");
    };

    const int n = 10;
    std::atomic<int> arrived{0};
    std::atomic<int> shared{0};
    std::atomic<int> wrong{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < n; i++) {
        threads.emplace_back([&] {
            arrived++;
            auto result = group.doCall(CancellationToken(), "key", fn);
            if (!result.ok() || result.value != "bar") {
                wrong++;
            }
            if (result.shared) {
                shared++;
            }
        });
    }

    first_started.wait();
    REQUIRE(test::waitUntil([&] { return arrived.load() == n; }));
    value_ready.open();
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(wrong.load() == 0);
    REQUIRE(calls.load() > 0);
    REQUIRE(calls.load() < n);
    REQUIRE(shared.load() >= 1);
}

TEST_CASE("the originator sees shared once a duplicate joined", "[singleflight]") {
    SingleFlight<int, int> group(2);
    test::Gate release;
    std::atomic<bool> started{false};

    Result<int> originator;
    std::thread first([&] {
        originator = group.doCall(CancellationToken(), 1, [&](const CancellationToken&) {
            started = true;
            release.wait();
            return 42;
        });
    });
    REQUIRE(test::waitUntil([&] { return started.load(); }));

    Result<int> joiner;
    std::thread second([&] {
        joiner = group.doCall(CancellationToken(), 1, [](const CancellationToken&) { return -1; });
    });
    REQUIRE(test::waitUntil([&] { return group.getStats().joins == 1; }));

    release.open();
    first.join();
    second.join();

    REQUIRE(originator.value == 42);
    REQUIRE(originator.shared);
    REQUIRE(joiner.value == 42);
    REQUIRE(joiner.shared);
}

TEST_CASE("different keys do not coalesce", "[singleflight]") {
    SingleFlight<int, int> group(2);
    test::Gate release;
    std::atomic<int> running{0};

    auto fn = [&](int value) {
        return [&, value](const CancellationToken&) {
            running++;
            release.wait();
            return value;
        };
    };

    Result<int> a;
    Result<int> b;
    std::thread ta([&] { a = group.doCall(CancellationToken(), 1, fn(1)); });
    std::thread tb([&] { b = group.doCall(CancellationToken(), 2, fn(2)); });
    REQUIRE(test::waitUntil([&] { return running.load() == 2; }));
    REQUIRE(group.getStats().in_flight == 2);

    release.open();
    ta.join();
    tb.join();

    REQUIRE(a.value == 1);
    REQUIRE(b.value == 2);
    REQUIRE_FALSE(a.shared);
    REQUIRE_FALSE(b.shared);
}

TEST_CASE("forgetUnshared on an unknown key succeeds", "[singleflight]") {
    SingleFlight<std::string, int> group(2);
    REQUIRE(group.forgetUnshared("missing"));
    REQUIRE(group.getStats().forgotten == 0);
}

TEST_CASE("forgetUnshared lets a new call start and refuses once shared", "[singleflight]") {
    SingleFlight<std::string, int> group(2);
    const std::string key = "key";

    test::Gate first_release;
    std::atomic<bool> first_started{false};
    std::thread first([&] {
        group.doCall(CancellationToken(), key, [&](const CancellationToken&) {
            first_started = true;
            first_release.wait();
            return 1;
        });
    });
    REQUIRE(test::waitUntil([&] { return first_started.load(); }));

    // Sole caller: the record can be dropped.
    REQUIRE(group.forgetUnshared(key));
    REQUIRE(group.getStats().in_flight == 0);

    test::Gate second_release;
    std::atomic<bool> second_started{false};
    Result<int> second_result;
    std::thread second([&] {
        second_result = group.doCall(CancellationToken(), key, [&](const CancellationToken&) {
            second_started = true;
            second_release.wait();
            return 2;
        });
    });
    REQUIRE(test::waitUntil([&] { return second_started.load(); }));

    std::atomic<bool> third_ran{false};
    auto channel = group.doAsync(CancellationToken(), key, [&](const CancellationToken&) {
        third_ran = true;
        return 3;
    });

    REQUIRE_FALSE(group.forgetUnshared(key));

    // Completing the forgotten call must not remove the newer record.
    first_release.open();
    first.join();
    REQUIRE_FALSE(group.forgetUnshared(key));
    REQUIRE(group.getStats().in_flight == 1);

    second_release.open();
    auto received = channel.get();
    second.join();

    REQUIRE_FALSE(third_ran.load());
    REQUIRE(received.value == 2);
    REQUIRE(received.shared);
    REQUIRE(second_result.value == 2);
    REQUIRE(second_result.shared);

    auto stats = group.getStats();
    REQUIRE(stats.executions == 2);
    REQUIRE(stats.joins == 1);
    REQUIRE(stats.forgotten == 1);
    REQUIRE(stats.in_flight == 0);
}

TEST_CASE("forgetUnshared after a fully shared call finds nothing to keep", "[singleflight]") {
    SingleFlight<std::string, long> group(4);
    auto delay = 1ms;

    // Retries with a longer delay until every caller parked on the first call.
    for (int attempt = 0; attempt < 10; attempt++) {
        std::atomic<long> calls{0};
        std::atomic<int> refused{0};
        const int n = 100;

        std::vector<std::thread> threads;
        for (int i = 0; i < n; i++) {
            threads.emplace_back([&] {
                group.doCall(CancellationToken(), "key", [&](const CancellationToken&) {
                    std::this_thread::sleep_for(delay);
                    return ++calls;
                });
                if (!group.forgetUnshared("key")) {
                    refused++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }

        if (calls.load() != 1) {
            delay *= 2;
            continue;
        }

        REQUIRE(refused.load() == 0);
        return;
    }
    FAIL("callers never coalesced onto a single call");
}

TEST_CASE("doAsync delivers one result to every subscriber", "[singleflight][async]") {
    SingleFlight<std::string, std::string> group(2);
    test::Gate release;
    std::atomic<int> calls{0};
    auto fn = [&](const CancellationToken&) {
        calls++;
        release.wait();
        return std::string("value");
    };

    std::vector<ResultChannel<std::string>> channels;
    for (int i = 0; i < 5; i++) {
        channels.push_back(group.doAsync(CancellationToken(), "key", fn));
    }
    for (const auto& channel : channels) {
        REQUIRE_FALSE(channel.ready());
    }

    release.open();
    for (const auto& channel : channels) {
        auto result = channel.get();
        REQUIRE(result.ok());
        REQUIRE(result.value == "value");
        REQUIRE(result.shared);
    }
    REQUIRE(calls.load() == 1);
}

TEST_CASE("doAsync with a single subscriber is unshared", "[singleflight][async]") {
    SingleFlight<std::string, int> group(1);
    auto channel = group.doAsync(CancellationToken(), "key", [](const CancellationToken&) { return 5; });

    auto result = channel.waitFor(5s);
    REQUIRE(result.has_value());
    REQUIRE(result->value == 5);
    REQUIRE_FALSE(result->shared);
}

TEST_CASE("doAsync propagates the exception to every subscriber", "[singleflight][async]") {
    SingleFlight<std::string, int> group(1);
    test::Gate release;
    auto fn = [&](const CancellationToken&) -> int {
        release.wait();
        throw std::runtime_error("fetch failed");
    };

    auto first = group.doAsync(CancellationToken(), "key", fn);
    auto second = group.doAsync(CancellationToken(), "key", fn);
    release.open();

    auto a = first.get();
    auto b = second.get();
    REQUIRE(a.error == b.error);
    REQUIRE_THROWS_WITH(a.get(), "fetch failed");
    REQUIRE(a.shared);
    REQUIRE(b.shared);
}

TEST_CASE("doCall joins a call started by doAsync", "[singleflight][async]") {
    SingleFlight<std::string, int> group(2);
    test::Gate release;
    std::atomic<bool> started{false};

    auto channel = group.doAsync(CancellationToken(), "key", [&](const CancellationToken&) {
        started = true;
        release.wait();
        return 9;
    });
    REQUIRE(test::waitUntil([&] { return started.load(); }));

    Result<int> joined;
    std::thread waiter([&] {
        joined = group.doCall(CancellationToken(), "key", [](const CancellationToken&) { return -1; });
    });
    REQUIRE(test::waitUntil([&] { return group.getStats().joins == 1; }));

    release.open();
    waiter.join();

    REQUIRE(joined.value == 9);
    REQUIRE(joined.shared);
    REQUIRE(channel.get().shared);
}

TEST_CASE("a throwing subscriber callback does not cut delivery short", "[singleflight][async]") {
    SingleFlight<std::string, int> group(2);
    test::Gate release;
    std::atomic<bool> started{false};

    Result<int> originator;
    std::thread caller([&] {
        originator = group.doCall(CancellationToken(), "key", [&](const CancellationToken&) {
            started = true;
            release.wait();
            return 11;
        });
    });
    REQUIRE(test::waitUntil([&] { return started.load(); }));

    auto noisy = group.doAsync(CancellationToken(), "key", [](const CancellationToken&) { return -1; });
    auto quiet = group.doAsync(CancellationToken(), "key", [](const CancellationToken&) { return -1; });
    noisy.onReady([](const Result<int>&) { throw 42; });

    release.open();
    caller.join();

    REQUIRE(originator.ok());
    REQUIRE(originator.value == 11);
    REQUIRE(originator.shared);

    auto delivered = quiet.waitFor(5s);
    REQUIRE(delivered);
    REQUIRE(delivered->value == 11);
    REQUIRE(delivered->shared);
    REQUIRE(noisy.ready());
    REQUIRE(group.getStats().in_flight == 0);
}

TEST_CASE("destroying the group waits for async calls", "[singleflight][async]") {
    ResultChannel<int> channel;
    {
        SingleFlight<std::string, int> group(1);
        channel = group.doAsync(CancellationToken(), "key", [](const CancellationToken&) {
            std::this_thread::sleep_for(20ms);
            return 1;
        });
    }
    REQUIRE(channel.ready());
    REQUIRE(channel.get().value == 1);
}

TEST_CASE("doAsync runs on a caller-supplied executor", "[singleflight][async]") {
    boost::asio::thread_pool pool(1);
    {
        SingleFlight<std::string, int> group(pool.get_executor());
        auto channel = group.doAsync(CancellationToken(), "key", [](const CancellationToken&) { return 3; });
        REQUIRE(channel.get().value == 3);
    }
    pool.join();
}

TEST_CASE("a cancelled joiner stops waiting without stopping the call", "[singleflight][cancel]") {
    SingleFlight<std::string, int> group(2);
    test::Gate release;
    std::atomic<bool> started{false};

    Result<int> originator;
    std::thread first([&] {
        originator = group.doCallCancellable(CancellationToken(), "key", [&](const CancellationToken&) {
            started = true;
            release.wait();
            return 11;
        });
    });
    REQUIRE(test::waitUntil([&] { return started.load(); }));

    CancellationSource impatient;
    std::atomic<bool> impatient_done{false};
    Result<int> cancelled;
    std::thread second([&] {
        cancelled = group.doCallCancellable(impatient.getToken(), "key",
                                            [](const CancellationToken&) { return -1; });
        impatient_done = true;
    });

    Result<int> patient;
    std::thread third([&] {
        patient = group.doCallCancellable(CancellationSource().getToken(), "key",
                                          [](const CancellationToken&) { return -1; });
    });
    REQUIRE(test::waitUntil([&] { return group.getStats().joins == 2; }));

    impatient.cancel();
    REQUIRE(test::waitUntil([&] { return impatient_done.load(); }));
    second.join();
    REQUIRE_THROWS_AS(cancelled.get(), CallerCancelled);
    REQUIRE(cancelled.shared);
    REQUIRE(group.getStats().in_flight == 1);

    release.open();
    first.join();
    third.join();

    REQUIRE(originator.value == 11);
    REQUIRE(originator.shared);
    REQUIRE(patient.value == 11);
    REQUIRE(patient.shared);
}

TEST_CASE("an already cancelled joiner returns immediately", "[singleflight][cancel]") {
    SingleFlight<std::string, int> group(2);
    test::Gate release;
    std::atomic<bool> started{false};

    std::thread first([&] {
        group.doCall(CancellationToken(), "key", [&](const CancellationToken&) {
            started = true;
            release.wait();
            return 1;
        });
    });
    REQUIRE(test::waitUntil([&] { return started.load(); }));

    CancellationSource source;
    source.cancel();
    auto result = group.doCallCancellable(source.getToken(), "key",
                                          [](const CancellationToken&) { return -1; });
    REQUIRE_THROWS_AS(result.get(), CallerCancelled);

    release.open();
    first.join();
}

TEST_CASE("no key ever has two computations running at once", "[singleflight][stress]") {
    SingleFlight<int, int> group(4);
    const int threads_count = 32;
    const int iterations = 200;
    const int keys = 4;

    std::mutex mutex;
    std::map<int, int> running;
    std::atomic<int> overlaps{0};
    std::atomic<int> mismatches{0};
    std::atomic<int> executions{0};

    auto fn_for = [&](int key) {
        return [&, key](const CancellationToken&) {
            {
                std::lock_guard<std::mutex> lock(mutex);
                if (++running[key] > 1) {
                    overlaps++;
                }
            }
            executions++;
            std::this_thread::sleep_for(std::chrono::microseconds(50));
            {
                std::lock_guard<std::mutex> lock(mutex);
                --running[key];
            }
            return key * 10;
        };
    };

    std::vector<std::thread> threads;
    for (int t = 0; t < threads_count; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < iterations; i++) {
                int key = (t + i) % keys;
                Result<int> result;
                if (i % 2 == 0) {
                    result = group.doCall(CancellationToken(), key, fn_for(key));
                } else {
                    result = group.doAsync(CancellationToken(), key, fn_for(key)).get();
                }
                if (!result.ok() || result.value != key * 10) {
                    mismatches++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    auto stats = group.getStats();
    REQUIRE(overlaps.load() == 0);
    REQUIRE(mismatches.load() == 0);
    REQUIRE(stats.in_flight == 0);
    REQUIRE(stats.executions == static_cast<size_t>(executions.load()));
    REQUIRE(stats.executions + stats.joins == static_cast<size_t>(threads_count * iterations));
}
