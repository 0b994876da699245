#include "os/rtos.hpp"
#include <iostream>
#include <mutex>

static int g_failures = 0;

static void check(const char* name, bool ok) {
    std::cout << "  " << name << ": " << (ok ? "OK" : "FAIL") << "\n";
    if (!ok) ++g_failures;
}

struct Shared {
    Rtos::Mutex mtx;
    uint32_t counter = 0;
};

static constexpr uint32_t INCREMENTS = 100000;

void Worker(void* arg) {
    auto* s = static_cast<Shared*>(arg);
    for (uint32_t i = 0; i < INCREMENTS; ++i) {
        std::lock_guard<Rtos::Mutex> lk(s->mtx);
        s->counter++;
    }
}

void Sleeper(void*) {
    Rtos::SleepMs(50);
}

int main() {
    std::cout << "=== rtos_task_test ===\n";

    {
        std::cout << "\n[Test 0] Monotonic clock and sleep\n";
        const uint64_t t0 = Rtos::NowUs();
        Rtos::SleepMs(20);
        const uint64_t t1 = Rtos::NowUs();
        std::cout << "  slept " << (t1 - t0) << " us\n";
        check("clock advanced >= 20 ms", t1 - t0 >= 20000);
        Rtos::SleepMs(0);
        Rtos::SleepMs(-5);
        std::cout << "  non-positive sleeps return: OK\n";
    }

    {
        std::cout << "\n[Test 1] Mutex guards a shared counter\n";
        Shared s;
        Rtos::Task a;
        Rtos::Task b;
        check("Create(A)", a.Create("WorkerA", Worker, &s));
        check("Create(B)", b.Create("WorkerB", Worker, &s));
        a.Join();
        b.Join();
        std::cout << "  counter= " << s.counter << "\n";
        check("no lost increments", s.counter == 2 * INCREMENTS);
    }

    {
        std::cout << "\n[Test 2] Task state\n";
        Rtos::Task t;
        check("not running before Create()", !t.Running());
        check("Create()", t.Create("Sleeper", Sleeper, nullptr));
        check("running after Create()", t.Running());
        check("second Create() while running is refused", !t.Create("Sleeper2", Sleeper, nullptr));
        t.Join();
        check("not running after Join()", !t.Running());
        t.Join();
        check("Create() again after Join()", t.Create("Sleeper3", Sleeper, nullptr));
        t.Join();
    }

    if (g_failures) {
        std::cout << "\nrtos_task_test: FAIL (" << g_failures << ")\n";
        return 1;
    }
    std::cout << "\nrtos_task_test: PASS\n";
    return 0;
}
