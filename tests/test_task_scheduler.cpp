#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include "sync/backoff_policy.hpp"
#include "sync/task_scheduler.hpp"

using engage::ConflictPolicy;
using engage::TaskRequest;
using engage::TaskResult;
using engage::TaskState;
using namespace std::chrono_literals;

class TaskSchedulerTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testBackoffGrowsToCeiling();
    void testBackoffHint();
    void testRunsLauncherOnce();
    void testNeverRunsConcurrently();
    void testKeepWhileQueued();
    void testReplaceWhileRunningCancels();
    void testRetryBacksOff();
    void testRetryHintLengthensDelay();
    void testFailureReportedOnce();
    void testMaxAttemptsGivesUp();
    void testLauncherExceptionIsRetried();
    void testMissingLauncherFails();
    void testParksWithoutNetwork();
    void testLongestPrefixWins();
    void testShutdownCancelsRunning();
    void testIdleSlotsAreReleased();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

namespace {

constexpr int kWaitMs = 5000;

engage::EngageConfig testConfig()
{
    engage::EngageConfig config;
    config.workerCount = 4;
    config.minBackoff = 20ms;
    config.maxBackoff = 80ms;
    config.maxPollInterval = std::chrono::minutes(10);
    config.maxAttempts = 0;
    return config;
}

TaskRequest request(const std::string &taskId,
                    ConflictPolicy policy = ConflictPolicy::Replace,
                    std::chrono::milliseconds delay = 0ms)
{
    TaskRequest task;
    task.taskId = taskId;
    task.conflictPolicy = policy;
    task.initialDelay = delay;
    return task;
}

// Blocks until the token is cancelled or the bound elapses.
bool waitForCancel(const engage::CancellationToken &token)
{
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!token.isCancelled() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    return token.isCancelled();
}

} // namespace

void TaskSchedulerTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void TaskSchedulerTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void TaskSchedulerTests::testBackoffGrowsToCeiling()
{
    const engage::BackoffPolicy policy(100ms, 1000ms);

    QVERIFY(policy.baseDelay(1) == 100ms);
    QVERIFY(policy.baseDelay(2) == 200ms);
    QVERIFY(policy.baseDelay(4) == 800ms);
    QVERIFY(policy.baseDelay(5) == 1000ms);
    QVERIFY(policy.baseDelay(500) == 1000ms);

    for (int round = 0; round < 50; ++round) {
        std::chrono::milliseconds previous{0};
        for (int attempt = 1; attempt <= 8; ++attempt) {
            const auto delay = policy.delayForAttempt(attempt);
            const auto base = policy.baseDelay(attempt);
            QVERIFY(delay >= base);
            QVERIFY(delay <= policy.maximum());
            QVERIFY(delay < base + base / 4 || delay == policy.maximum());
            if (previous < policy.maximum()) {
                QVERIFY(delay > previous);
            } else {
                QVERIFY(delay == policy.maximum());
            }
            previous = delay;
        }
    }
}

void TaskSchedulerTests::testBackoffHint()
{
    const engage::BackoffPolicy policy(100ms, 1000ms);

    QVERIFY(policy.withHint(100ms, std::nullopt) == 100ms);
    QVERIFY(policy.withHint(100ms, 50ms) == 100ms);
    QVERIFY(policy.withHint(100ms, 500ms) == 500ms);
    QVERIFY(policy.withHint(100ms, 5000ms) == 1000ms);
}

void TaskSchedulerTests::testRunsLauncherOnce()
{
    std::atomic<int> runs{0};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        ++runs;
        return TaskResult::success();
    });

    QVERIFY(scheduler.state("job:1") == TaskState::Idle);
    scheduler.enqueue(request("job:1"));

    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), 1, kWaitMs);
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:1") == TaskState::Idle, kWaitMs);
    QTest::qWait(50);
    QCOMPARE(runs.load(), 1);
}

void TaskSchedulerTests::testNeverRunsConcurrently()
{
    std::atomic<int> runs{0};
    std::atomic<int> active{0};
    std::atomic<int> maxActive{0};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.registerLauncher("job:", [&](const TaskRequest &, const engage::CancellationToken &) {
        const int now = ++active;
        int seen = maxActive.load();
        while (now > seen && !maxActive.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(15ms);
        --active;
        ++runs;
        return TaskResult::success();
    });

    std::vector<std::thread> producers;
    for (int t = 0; t < 3; ++t) {
        producers.emplace_back([&scheduler]() {
            for (int i = 0; i < 15; ++i) {
                scheduler.enqueue(request("job:shared", ConflictPolicy::Keep));
                std::this_thread::sleep_for(3ms);
            }
        });
    }
    for (auto &producer : producers) {
        producer.join();
    }

    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:shared") == TaskState::Idle, kWaitMs);
    QVERIFY(runs.load() >= 2);
    QCOMPARE(maxActive.load(), 1);
}

void TaskSchedulerTests::testKeepWhileQueued()
{
    std::atomic<int> runs{0};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        ++runs;
        return TaskResult::success();
    });

    scheduler.enqueue(request("job:1", ConflictPolicy::Keep, 60s));
    scheduler.enqueue(request("job:1", ConflictPolicy::Keep, 0ms));
    QTest::qWait(150);
    QCOMPARE(runs.load(), 0);
    QVERIFY(scheduler.state("job:1") == TaskState::Queued);

    scheduler.enqueue(request("job:1", ConflictPolicy::Replace, 0ms));
    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), 1, kWaitMs);
}

void TaskSchedulerTests::testReplaceWhileRunningCancels()
{
    std::atomic<int> runs{0};
    std::atomic<int> retries{0};
    std::atomic<bool> firstCancelled{false};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.setRetryListener([&retries](const std::string &, int, std::chrono::milliseconds) {
        ++retries;
    });
    scheduler.registerLauncher("job:", [&](const TaskRequest &, const engage::CancellationToken &token) {
        if (++runs == 1) {
            firstCancelled = waitForCancel(token);
            return TaskResult::retry();
        }
        return TaskResult::success();
    });

    scheduler.enqueue(request("job:1"));
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:1") == TaskState::Running, kWaitMs);

    scheduler.enqueue(request("job:1", ConflictPolicy::Replace));

    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), 2, kWaitMs);
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:1") == TaskState::Idle, kWaitMs);
    QVERIFY(firstCancelled.load());
    QCOMPARE(retries.load(), 0);
}

void TaskSchedulerTests::testRetryBacksOff()
{
    std::atomic<int> runs{0};
    std::mutex mutex;
    std::vector<std::pair<int, std::chrono::milliseconds>> retries;
    engage::TaskScheduler scheduler(testConfig());
    scheduler.setRetryListener([&](const std::string &, int attempt, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex);
        retries.emplace_back(attempt, delay);
    });
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        if (++runs <= 3) {
            return TaskResult::retry(std::nullopt, "busy");
        }
        return TaskResult::success();
    });

    scheduler.enqueue(request("job:1"));
    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), 4, kWaitMs);
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:1") == TaskState::Idle, kWaitMs);

    std::lock_guard<std::mutex> lock(mutex);
    QCOMPARE(retries.size(), size_t(3));
    for (size_t i = 0; i < retries.size(); ++i) {
        QCOMPARE(retries[i].first, int(i + 1));
        QVERIFY(retries[i].second >= 20ms);
        QVERIFY(retries[i].second <= 80ms);
        if (i > 0) {
            QVERIFY(retries[i].second > retries[i - 1].second
                    || retries[i].second == 80ms);
        }
    }
}

void TaskSchedulerTests::testRetryHintLengthensDelay()
{
    engage::EngageConfig config = testConfig();
    config.maxBackoff = 1000ms;

    std::atomic<int> runs{0};
    std::mutex mutex;
    std::vector<std::chrono::milliseconds> delays;
    engage::TaskScheduler scheduler(config);
    scheduler.setRetryListener([&](const std::string &, int, std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex);
        delays.push_back(delay);
    });
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        if (++runs == 1) {
            return TaskResult::retry(300ms, "throttled");
        }
        return TaskResult::success();
    });

    const auto start = std::chrono::steady_clock::now();
    scheduler.enqueue(request("job:1"));
    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), 2, kWaitMs);
    QVERIFY(std::chrono::steady_clock::now() - start >= 300ms);

    std::lock_guard<std::mutex> lock(mutex);
    QCOMPARE(delays.size(), size_t(1));
    QVERIFY(delays[0] == 300ms);
}

void TaskSchedulerTests::testFailureReportedOnce()
{
    std::atomic<int> runs{0};
    std::atomic<int> failures{0};
    std::mutex mutex;
    std::string reason;
    engage::TaskScheduler scheduler(testConfig());
    scheduler.setFailureListener([&](const std::string &, const std::string &why) {
        std::lock_guard<std::mutex> lock(mutex);
        reason = why;
        ++failures;
    });
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        ++runs;
        return TaskResult::failure("rejected");
    });

    scheduler.enqueue(request("job:1"));
    QTRY_COMPARE_WITH_TIMEOUT(failures.load(), 1, kWaitMs);
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:1") == TaskState::Idle, kWaitMs);
    QTest::qWait(100);
    QCOMPARE(failures.load(), 1);
    QCOMPARE(runs.load(), 1);

    std::lock_guard<std::mutex> lock(mutex);
    QCOMPARE(QString::fromStdString(reason), QStringLiteral("rejected"));
}

void TaskSchedulerTests::testMaxAttemptsGivesUp()
{
    engage::EngageConfig config = testConfig();
    config.maxAttempts = 2;

    std::atomic<int> runs{0};
    std::atomic<int> failures{0};
    engage::TaskScheduler scheduler(config);
    scheduler.setFailureListener([&failures](const std::string &, const std::string &) {
        ++failures;
    });
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        ++runs;
        return TaskResult::retry();
    });

    scheduler.enqueue(request("job:1"));
    QTRY_COMPARE_WITH_TIMEOUT(failures.load(), 1, kWaitMs);
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:1") == TaskState::Idle, kWaitMs);
    QTest::qWait(200);
    QCOMPARE(runs.load(), 2);
    QCOMPARE(failures.load(), 1);
}

void TaskSchedulerTests::testLauncherExceptionIsRetried()
{
    std::atomic<int> runs{0};
    std::atomic<int> retries{0};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.setRetryListener([&retries](const std::string &, int, std::chrono::milliseconds) {
        ++retries;
    });
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        if (++runs == 1) {
            throw std::runtime_error("disk hiccup");
        }
        return TaskResult::success();
    });

    scheduler.enqueue(request("job:1"));
    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), 2, kWaitMs);
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("job:1") == TaskState::Idle, kWaitMs);
    QCOMPARE(retries.load(), 1);
}

void TaskSchedulerTests::testMissingLauncherFails()
{
    std::mutex mutex;
    std::string reason;
    std::atomic<int> failures{0};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.setFailureListener([&](const std::string &, const std::string &why) {
        std::lock_guard<std::mutex> lock(mutex);
        reason = why;
        ++failures;
    });

    scheduler.enqueue(request("unknown:1"));
    QTRY_COMPARE_WITH_TIMEOUT(failures.load(), 1, kWaitMs);

    std::lock_guard<std::mutex> lock(mutex);
    QVERIFY(reason.find("no launcher") != std::string::npos);
}

void TaskSchedulerTests::testParksWithoutNetwork()
{
    std::atomic<int> networkRuns{0};
    std::atomic<int> localRuns{0};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.registerLauncher("net:", [&networkRuns](const TaskRequest &, const engage::CancellationToken &) {
        ++networkRuns;
        return TaskResult::success();
    });
    scheduler.registerLauncher("local:", [&localRuns](const TaskRequest &, const engage::CancellationToken &) {
        ++localRuns;
        return TaskResult::success();
    });

    scheduler.setNetworkAvailable(false);
    QVERIFY(!scheduler.isNetworkAvailable());

    scheduler.enqueue(request("net:1"));
    TaskRequest local = request("local:1");
    local.requiresNetwork = false;
    scheduler.enqueue(local);

    QTRY_COMPARE_WITH_TIMEOUT(localRuns.load(), 1, kWaitMs);
    QTest::qWait(150);
    QCOMPARE(networkRuns.load(), 0);
    QVERIFY(scheduler.state("net:1") == TaskState::Queued);

    scheduler.setNetworkAvailable(true);
    QTRY_COMPARE_WITH_TIMEOUT(networkRuns.load(), 1, kWaitMs);
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("net:1") == TaskState::Idle, kWaitMs);
}

void TaskSchedulerTests::testLongestPrefixWins()
{
    std::atomic<int> generic{0};
    std::atomic<int> special{0};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.registerLauncher("sync:", [&generic](const TaskRequest &, const engage::CancellationToken &) {
        ++generic;
        return TaskResult::success();
    });
    scheduler.registerLauncher("sync:special:", [&special](const TaskRequest &, const engage::CancellationToken &) {
        ++special;
        return TaskResult::success();
    });

    scheduler.enqueue(request("sync:special:1"));
    scheduler.enqueue(request("sync:plain"));
    QTRY_COMPARE_WITH_TIMEOUT(special.load(), 1, kWaitMs);
    QTRY_COMPARE_WITH_TIMEOUT(generic.load(), 1, kWaitMs);
}

void TaskSchedulerTests::testShutdownCancelsRunning()
{
    std::atomic<bool> cancelled{false};
    std::atomic<bool> started{false};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.registerLauncher("job:", [&](const TaskRequest &, const engage::CancellationToken &token) {
        started = true;
        cancelled = waitForCancel(token);
        return TaskResult::retry();
    });

    scheduler.enqueue(request("job:1"));
    QTRY_VERIFY_WITH_TIMEOUT(started.load(), kWaitMs);

    scheduler.shutdown();
    QVERIFY(cancelled.load());

    // Idempotent, and later enqueues are not dispatched.
    scheduler.shutdown();
    scheduler.enqueue(request("job:2"));
    QTest::qWait(50);
    QVERIFY(scheduler.state("job:2") != TaskState::Running);
}

void TaskSchedulerTests::testIdleSlotsAreReleased()
{
    std::atomic<int> runs{0};
    std::atomic<bool> release{false};
    engage::TaskScheduler scheduler(testConfig());
    scheduler.registerLauncher("job:", [&runs](const TaskRequest &, const engage::CancellationToken &) {
        ++runs;
        return TaskResult::success();
    });
    scheduler.registerLauncher("bad:", [](const TaskRequest &, const engage::CancellationToken &) {
        return TaskResult::failure("rejected");
    });
    scheduler.registerLauncher("slow:", [&release](const TaskRequest &, const engage::CancellationToken &) {
        while (!release.load()) {
            std::this_thread::sleep_for(5ms);
        }
        return TaskResult::success();
    });

    constexpr int kIds = 50;
    for (int i = 0; i < kIds; ++i) {
        scheduler.enqueue(request("job:" + std::to_string(i)));
    }
    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), kIds, kWaitMs);
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.trackedTaskCount(), size_t(0), kWaitMs);

    scheduler.enqueue(request("bad:1"));
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.trackedTaskCount(), size_t(0), kWaitMs);
    QVERIFY(scheduler.state("bad:1") == TaskState::Idle);

    scheduler.enqueue(request("slow:1"));
    QTRY_VERIFY_WITH_TIMEOUT(scheduler.state("slow:1") == TaskState::Running, kWaitMs);
    QCOMPARE(scheduler.trackedTaskCount(), size_t(1));
    release = true;
    QTRY_COMPARE_WITH_TIMEOUT(scheduler.trackedTaskCount(), size_t(0), kWaitMs);

    // A released id starts over with a fresh slot.
    scheduler.enqueue(request("job:0"));
    QTRY_COMPARE_WITH_TIMEOUT(runs.load(), kIds + 1, kWaitMs);
}

QTEST_MAIN(TaskSchedulerTests)
#include "test_task_scheduler.moc"
