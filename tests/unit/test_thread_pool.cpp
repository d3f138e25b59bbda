// Tests for GenerationalThreadPool: generation gating, drain waits,
// cancellation of stale work and shutdown

#include <QtTest>

#include <atomic>
#include <thread>

#include <segmented_stream_platform/ssp_thread_pool.h>

using ssp::GenerationalThreadPool;

class TestThreadPool : public QObject
{
    Q_OBJECT

private slots:
    void test_submit_runs_work_of_active_generation() {
        GenerationalThreadPool pool(2);
        std::atomic<int> runs{0};
        for (int i = 0; i < 10; ++i) {
            QVERIFY(pool.Submit([&runs] { ++runs; }, 0).is_ok());
        }
        QVERIFY(pool.WaitDrained(0, std::chrono::milliseconds(2000)));
        QCOMPARE(runs.load(), 10);
        QCOMPARE(pool.Outstanding(0), int64_t(0));
    }

    void test_submit_to_inactive_generation_rejected() {
        GenerationalThreadPool pool(1);
        auto r = pool.Submit([] {}, 5);
        QVERIFY(r.is_error());
        QCOMPARE(r.error().code, ssp::ErrorCode::WorkRejected);

        QVERIFY(pool.SetActiveGeneration(1, false));
        QCOMPARE(pool.ActiveGeneration(), int64_t(1));
        QCOMPARE(pool.PreviousGeneration(), int64_t(0));
        QVERIFY(pool.Submit([] {}, 0).is_error());
        QVERIFY(pool.Submit([] {}, 1).is_ok());
    }

    void test_stale_work_observes_generation_change() {
        GenerationalThreadPool pool(1);
        std::atomic<bool> started{false};
        std::atomic<bool> saw_stale{false};

        QVERIFY(pool.Submit([&] {
            started = true;
            while (pool.IsCurrent(0)) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            saw_stale = true;
        }, 0).is_ok());

        while (!started.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        QCOMPARE(pool.Outstanding(0), int64_t(1));

        // Advancing with wait_drain returns once the stale item bailed out
        QVERIFY(pool.SetActiveGeneration(1, true, std::chrono::milliseconds(2000)));
        QVERIFY(saw_stale.load());
        QCOMPARE(pool.Outstanding(0), int64_t(0));
    }

    void test_wait_drain_times_out_while_work_runs() {
        GenerationalThreadPool pool(1);
        std::atomic<bool> release{false};
        QVERIFY(pool.Submit([&release] {
            while (!release.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
        }, 0).is_ok());

        QVERIFY(!pool.SetActiveGeneration(1, true, std::chrono::milliseconds(100)));
        release = true;
        QVERIFY(pool.WaitDrained(0, std::chrono::milliseconds(2000)));
    }

    void test_wait_drained_unknown_group_returns_immediately() {
        GenerationalThreadPool pool(1);
        QVERIFY(pool.WaitDrained(42, std::chrono::milliseconds(10)));
    }

    void test_queued_items_of_old_generation_still_decrement() {
        GenerationalThreadPool pool(1);
        std::atomic<bool> release{false};
        std::atomic<int> stale_runs{0};

        QVERIFY(pool.Submit([&release] {
            while (!release.load()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }, 0).is_ok());
        for (int i = 0; i < 5; ++i) {
            QVERIFY(pool.Submit([&pool, &stale_runs] {
                if (!pool.IsCurrent(0)) ++stale_runs;
            }, 0).is_ok());
        }
        QCOMPARE(pool.Outstanding(0), int64_t(6));

        QVERIFY(pool.SetActiveGeneration(1, false));
        release = true;
        QVERIFY(pool.WaitDrained(0, std::chrono::milliseconds(2000)));
        QCOMPARE(stale_runs.load(), 5);
    }

    void test_shutdown_rejects_and_joins() {
        GenerationalThreadPool pool(3);
        QCOMPARE(pool.ThreadCount(), 3);
        std::atomic<int> runs{0};
        for (int i = 0; i < 20; ++i) {
            QVERIFY(pool.Submit([&runs] { ++runs; }, 0).is_ok());
        }
        pool.Shutdown();
        QCOMPARE(runs.load(), 20);
        QCOMPARE(pool.ActiveGeneration(), GenerationalThreadPool::kShutdownGeneration);

        auto r = pool.Submit([] {}, GenerationalThreadPool::kShutdownGeneration);
        QVERIFY(r.is_error());
        QCOMPARE(r.error().code, ssp::ErrorCode::WorkRejected);
        QVERIFY(!pool.SetActiveGeneration(7, false));
        pool.Shutdown();  // idempotent
    }
};

QTEST_MAIN(TestThreadPool)
#include "test_thread_pool.moc"
