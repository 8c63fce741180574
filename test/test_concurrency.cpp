#include "engine_fixture.hpp"

#include <surety/common/lock_table.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace surety;

namespace {

    EngineConfig patientConfig() {
        EngineConfig config;
        config.lock_timeout_ms = 5000;
        return config;
    }

    template <typename Fn> void runThreads(int count, Fn &&fn) {
        std::vector<std::thread> threads;
        threads.reserve(count);
        for (int i = 0; i < count; ++i)
            threads.emplace_back([&fn, i]() { fn(i); });
        for (auto &t : threads)
            t.join();
    }

} // namespace

TEST_SUITE("Concurrency") {

    TEST_CASE("Racing releases post exactly one entry") {
        EngineFixture f(patientConfig());
        auto c = f.activeContract(10000);
        auto acct = f.fundContract(c.id, 10000);
        auto o = f.addObligation(c.id);
        auto ms = f.addMilestone(c.id, "A", 4000);
        f.link(ms, o);
        REQUIRE(f.engine->satisfyObligation(f.tenant, o).is_ok());

        std::atomic<int> fresh{0};
        std::atomic<int> replayed{0};
        std::atomic<int> failed{0};
        runThreads(8, [&](int) {
            auto r = f.engine->releaseMilestone(f.tenant, ms, "user:u-ops");
            if (!r.is_ok())
                failed++;
            else if (r.value().already_processed)
                replayed++;
            else
                fresh++;
        });

        CHECK(failed.load() == 0);
        CHECK(fresh.load() == 1);
        CHECK(replayed.load() == 7);
        CHECK(f.account(acct).held() == 6000);
        CHECK(f.contract(c.id).released_amount == 4000);
        CHECK(f.engine->ledger().entries(f.tenant, acct).size() == 2);
    }

    TEST_CASE("Funding with one idempotency key lands once") {
        EngineFixture f(patientConfig());
        auto c = f.activeContract(10000);
        auto acct = f.fundContract(c.id, 0);

        std::atomic<int> fresh{0};
        std::atomic<int> failed{0};
        runThreads(8, [&](int) {
            FundingSource source;
            source.external_transaction_id = "txn-42";
            source.idempotency_key = "txn-42";
            auto r = f.engine->fundAccount(f.tenant, acct, 1500, source);
            if (!r.is_ok())
                failed++;
            else if (!r.value().already_processed)
                fresh++;
        });

        CHECK(failed.load() == 0);
        CHECK(fresh.load() == 1);
        CHECK(f.account(acct).balance() == 1500);
        CHECK(f.account(acct).held() == 1500);
    }

    TEST_CASE("Concurrent forfeits never exceed the commitment") {
        EngineFixture f(patientConfig());
        auto c = f.activeContract(1000);
        auto acct = f.fundContract(c.id, 5000);

        std::atomic<int> ok{0};
        std::atomic<int> over_budget{0};
        std::atomic<int> other{0};
        runThreads(20, [&](int) {
            HeldAdjustment forfeit;
            forfeit.amount = 100;
            auto r = f.engine->forfeitHeld(f.tenant, c.id, forfeit);
            if (r.is_ok())
                ok++;
            else if (r.error().code == ERR_INVARIANT_VIOLATION)
                over_budget++;
            else
                other++;
        });

        CHECK(ok.load() == 10);
        CHECK(over_budget.load() == 10);
        CHECK(other.load() == 0);
        CHECK(f.contract(c.id).forfeited_amount == 1000);
        CHECK(f.account(acct).held() == 4000);
        CHECK(f.engine->verifyAccount(f.tenant, acct).value());
    }

    TEST_CASE("Independent contracts proceed in parallel") {
        EngineFixture f(patientConfig());
        std::vector<std::string> contracts;
        std::vector<std::string> accounts;
        for (int i = 0; i < 4; ++i) {
            auto c = f.activeContract(10000);
            contracts.push_back(c.id);
            accounts.push_back(f.fundContract(c.id, 0));
        }

        std::atomic<int> failed{0};
        runThreads(4, [&](int i) {
            for (int n = 0; n < 25; ++n) {
                if (!f.engine->fundAccount(f.tenant, accounts[i], 10).is_ok())
                    failed++;
            }
        });

        CHECK(failed.load() == 0);
        for (const auto &acct : accounts) {
            CHECK(f.account(acct).balance() == 250);
            CHECK(f.engine->verifyAccount(f.tenant, acct).value());
            CHECK(f.engine->ledger().entries(f.tenant, acct).size() == 25);
        }
    }

    TEST_CASE("Lock acquisition times out") {
        LockTable locks;
        auto held = locks.tryAcquire("acct-1", std::chrono::milliseconds(10));
        REQUIRE(held.owns_lock());

        bool acquired = true;
        std::thread contender([&]() {
            auto lock = locks.tryAcquire("acct-1", std::chrono::milliseconds(20));
            acquired = lock.owns_lock();
        });
        contender.join();
        CHECK_FALSE(acquired);

        // Other keys are unaffected
        CHECK(locks.tryAcquire("acct-2", std::chrono::milliseconds(10)).owns_lock());
    }
}
