#pragma once

#include "common/util/util.hpp"

#include <vesper/status.h>

#include <atomic>
#include <memory>
#include <new>
#include <type_traits>

#include <stddef.h>
#include <stdint.h>

namespace sm {
    /// @brief A fixed size, multi-producer, single-consumer atomic ringbuffer.
    template<typename T>
    class AtomicRingQueue {
        static_assert(std::is_nothrow_move_assignable_v<T>
                   && std::is_nothrow_destructible_v<T>
                   && std::is_nothrow_default_constructible_v<T>);

        std::unique_ptr<T[]> mStorage;
        uint32_t mCapacity{0};
        std::atomic<uint32_t> mProducerHead{0};
        std::atomic<uint32_t> mConsumerTail{0};
        std::atomic<uint32_t> mProducerTail{0};
        std::atomic<uint32_t> mConsumerHead{0};

    public:
        constexpr AtomicRingQueue() noexcept = default;
        UTIL_NOCOPY(AtomicRingQueue);
        UTIL_NOMOVE(AtomicRingQueue);

        /// @brief Try to push a value onto the queue.
        ///
        /// @return true if the value was pushed, false if the queue was full or not setup.
        bool tryPush(const T& value) noexcept {
            if (mCapacity == 0) {
                return false;
            }

            uint32_t producerHead;
            uint32_t producerTail;
            uint32_t producerNext;

            do {
                producerHead = mProducerHead.load();
                uint32_t consumerTail = mConsumerTail.load();

                producerNext = (producerHead + 1) % mCapacity;
                if (producerNext == consumerTail) {
                    return false;
                }
            } while (!mProducerHead.compare_exchange_strong(producerHead, producerNext));

            mStorage[producerHead] = value;

            // Publish in order, a later producer waits for the earlier slots to be committed.
            producerTail = producerHead;
            while (!mProducerTail.compare_exchange_weak(producerTail, producerNext)) {
                producerTail = producerHead;
            }

            return true;
        }

        /// @brief Try to pop a value from the queue.
        ///
        /// @return true if a value was popped, false if the queue was empty.
        bool tryPop(T& value) noexcept {
            if (mCapacity == 0) {
                return false;
            }

            uint32_t consumerHead = mConsumerHead.load();
            uint32_t producerTail = mProducerTail.load();

            if (consumerHead == producerTail) {
                return false;
            }

            uint32_t consumerNext = (consumerHead + 1) % mCapacity;

            mConsumerHead.store(consumerNext);
            value = std::move(mStorage[consumerHead]);
            mConsumerTail.store(consumerNext);
            return true;
        }

        uint32_t count() const noexcept {
            if (mCapacity == 0) {
                return 0;
            }

            uint32_t producerTail = mProducerTail.load();
            uint32_t consumerTail = mConsumerTail.load();
            return (mCapacity + producerTail - consumerTail) % mCapacity;
        }

        uint32_t capacity() const noexcept {
            return mCapacity == 0 ? 0 : mCapacity - 1;
        }

        bool isSetup() const noexcept {
            return mStorage != nullptr;
        }

        /// @brief Reset the queue to an empty state, taking ownership of @p storage.
        ///
        /// The storage must be at least capacity + 1 elements in size.
        void reset(T *storage, uint32_t capacity) noexcept {
            mStorage.reset(storage);
            mCapacity = capacity + 1;
            mProducerHead.store(0);
            mProducerTail.store(0);
            mConsumerHead.store(0);
            mConsumerTail.store(0);
        }

        /// @brief Create a new queue with the given capacity.
        ///
        /// @retval OsStatusSuccess The queue was created successfully.
        /// @retval OsStatusInvalidInput The capacity was zero.
        /// @retval OsStatusOutOfMemory There was not enough memory to create the queue.
        [[nodiscard]]
        static OsStatus create(uint32_t capacity, AtomicRingQueue<T> *queue) noexcept {
            if (capacity == 0) {
                return OsStatusInvalidInput;
            }

            if (T *storage = new (std::nothrow) T[capacity + 1]) {
                queue->reset(storage, capacity);
                return OsStatusSuccess;
            }

            return OsStatusOutOfMemory;
        }
    };
}
