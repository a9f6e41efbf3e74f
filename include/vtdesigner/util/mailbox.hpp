#pragma once

#include <datapod/datapod.hpp>
#include <mutex>
#include <utility>

namespace vtdesigner {
    namespace util {

        // ─── Single-slot channel ──────────────────────────────────────────────────
        // A background producer posts, the tick loop polls. A newer value replaces
        // one that was never picked up.
        template <typename T> class Mailbox {
            mutable std::mutex mutex_;
            dp::Optional<T> slot_;

          public:
            void send(T value) {
                std::lock_guard<std::mutex> lock(mutex_);
                slot_ = std::move(value);
            }

            dp::Optional<T> try_receive() {
                std::lock_guard<std::mutex> lock(mutex_);
                dp::Optional<T> out = std::move(slot_);
                slot_ = dp::nullopt;
                return out;
            }

            bool empty() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return !slot_.has_value();
            }

            void clear() {
                std::lock_guard<std::mutex> lock(mutex_);
                slot_ = dp::nullopt;
            }
        };

    } // namespace util
    using namespace util;
} // namespace vtdesigner
