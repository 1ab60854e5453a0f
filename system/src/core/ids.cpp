// ============= src/core/ids.cpp =============
#include "core/ids.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

namespace {

std::atomic<int64_t> last_timestamp{0};

std::mutex rng_mutex;

std::mt19937_64& rng() {
    static std::mt19937_64 gen(std::random_device{}());
    return gen;
}

}  // namespace

int64_t now_us() {
    int64_t wall = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    int64_t prev = last_timestamp.load();
    int64_t next;
    do {
        next = wall > prev ? wall : prev + 1;
    } while (!last_timestamp.compare_exchange_weak(prev, next));

    return next;
}

std::string generate_id() {
    uint64_t hi;
    uint64_t lo;
    {
        std::lock_guard<std::mutex> lock(rng_mutex);
        hi = rng()();
        lo = rng()();
    }

    // version 4, variant 10xx
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (hi >> 32) << '-'
       << std::setw(4) << ((hi >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (hi & 0xFFFF) << '-'
       << std::setw(4) << (lo >> 48) << '-'
       << std::setw(12) << (lo & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

std::string format_timestamp(int64_t micros) {
    std::time_t secs = static_cast<std::time_t>(micros / 1000000);
    int64_t frac = micros % 1000000;
    if (frac < 0) {
        frac += 1000000;
        secs -= 1;
    }

    std::tm tm{};
    gmtime_r(&secs, &tm);

    std::stringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(6) << std::setfill('0') << frac << 'Z';
    return ss.str();
}
