// tests/mocks/FakeClock.hpp
#pragma once

#include "domain/Timestamp.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>

namespace ledger::tests {

/**
 * @brief Управляемые часы для InMemoryLedgerStore
 *
 * Время стоит на месте, пока тест не сдвинет его явно.
 */
class FakeClock {
public:
    explicit FakeClock(int64_t startSeconds = 1700000000)
        : micros_(startSeconds * 1000000) {}

    domain::Timestamp now() const {
        return domain::Timestamp::fromMicros(micros_.load());
    }

    void set(const domain::Timestamp& t) { micros_ = t.toMicros(); }

    void advance(std::chrono::microseconds delta) { micros_ += delta.count(); }

    /**
     * @brief Адаптер под InMemoryLedgerStore::Clock
     */
    auto asFunction() {
        return [this]() { return now(); };
    }

private:
    std::atomic<int64_t> micros_;
};

} // namespace ledger::tests
