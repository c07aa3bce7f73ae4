#pragma once

#include <chrono>
#include <cstdint>

namespace execdb::domain {

/**
 * @brief Момент времени в наносекундах Unix-эпохи
 *
 * Хранится тем же целым, что пишется в журнал, поэтому
 * восстановленный объект сравнивается с исходным точно.
 */
struct Timestamp {
    int64_t unixNanos = 0;

    Timestamp() = default;

    static Timestamp now() {
        auto sinceEpoch = std::chrono::system_clock::now().time_since_epoch();
        return fromUnixNanos(
            std::chrono::duration_cast<std::chrono::nanoseconds>(sinceEpoch).count());
    }

    static Timestamp fromUnixNanos(int64_t nanos) {
        Timestamp ts;
        ts.unixNanos = nanos;
        return ts;
    }

    static Timestamp fromUnixSeconds(int64_t seconds) {
        return fromUnixNanos(seconds * 1000000000LL);
    }

    int64_t toUnixNanos() const { return unixNanos; }

    bool operator==(const Timestamp& other) const { return unixNanos == other.unixNanos; }
    bool operator!=(const Timestamp& other) const { return unixNanos != other.unixNanos; }
    bool operator<(const Timestamp& other) const { return unixNanos < other.unixNanos; }
};

} // namespace execdb::domain
