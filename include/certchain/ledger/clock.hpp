#pragma once

#include <atomic>
#include <chrono>
#include <datapod/datapod.hpp>

namespace certchain::ledger {

    /// Time source for block and transaction timestamps (Unix epoch seconds)
    class Clock {
      public:
        virtual ~Clock() = default;
        virtual dp::i64 now() const = 0;
    };

    class SystemClock : public Clock {
      public:
        inline dp::i64 now() const override {
            return std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                .count();
        }
    };

    /// Clock that only moves when told to
    class ManualClock : public Clock {
      public:
        inline explicit ManualClock(dp::i64 start = 1700000000) : now_(start) {}

        inline dp::i64 now() const override { return now_.load(); }
        inline void set(dp::i64 seconds) { now_.store(seconds); }
        inline void advance(dp::i64 seconds = 1) { now_.fetch_add(seconds); }

      private:
        std::atomic<dp::i64> now_;
    };

} // namespace certchain::ledger
