// POLITY - Shared Test Helpers
// Copyright (c) 2024 POLITY Developers
// MIT License

#ifndef POLITY_TESTS_TEST_HELPERS_H
#define POLITY_TESTS_TEST_HELPERS_H

#include "polity/core/types.h"
#include "polity/crypto/keys.h"
#include "polity/db/leveldb.h"
#include "polity/db/recordstore.h"

#include <array>
#include <atomic>
#include <memory>

namespace polity {
namespace test {

/// Deterministic private key: 31 zero bytes followed by seed + 1
inline PrivateKey TestKey(uint8_t seed) {
    std::array<uint8_t, PrivateKey::SIZE> bytes{};
    bytes[PrivateKey::SIZE - 1] = static_cast<uint8_t>(seed + 1);
    bytes[0] = 0x01;
    return PrivateKey(bytes);
}

inline PublicKey TestPubKey(uint8_t seed) {
    return TestKey(seed).GetPublicKey();
}

/// Settable clock shared with the components under test
class ManualClock {
public:
    explicit ManualClock(Timestamp start = 1700000000) : now_(start) {}

    Timestamp Now() const { return now_.load(); }
    void Set(Timestamp t) { now_.store(t); }
    void Advance(int64_t seconds) { now_.fetch_add(seconds); }

    ClockFn Fn() {
        return [this]() { return now_.load(); };
    }

private:
    std::atomic<Timestamp> now_;
};

/// In-memory database plus record store
struct MemoryStore {
    std::unique_ptr<db::MemoryDatabase> database{std::make_unique<db::MemoryDatabase>()};
    db::RecordStore store{database.get()};
};

} // namespace test
} // namespace polity

#endif // POLITY_TESTS_TEST_HELPERS_H
