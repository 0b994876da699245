#pragma once
#include <cstddef> // Required for size_t
#include <cstdint>

namespace Rtos {

void SleepMs(int ms);

// Monotonic clock in microseconds
uint64_t NowUs();

//== Task abstraction ==//
// This class provides a simple task wrapper
class Task {
public:
    Task();
    ~Task();

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    // Returns false if the underlying thread could not be created.
    bool Create(const char* name, void (*fn)(void*), void* arg);
    void Join();

    bool Running() const;

private:
    struct TaskHandle;
    TaskHandle* handle_;
};

//== Mutex abstraction ==//
// This class provides a simple mutex wrapper.
// lock()/unlock() are lower case so std::lock_guard<Rtos::Mutex> works.

class Mutex {
public:
    Mutex();
    ~Mutex();

    Mutex(const Mutex&) = delete;
    Mutex& operator=(const Mutex&) = delete;

    void lock();
    void unlock();

private:
    struct MutexHandle;
    MutexHandle* handle_;
};

} // namespace Rtos
