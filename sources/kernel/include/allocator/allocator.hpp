#pragma once

#include "std/spinlock.hpp"

#include <algorithm>
#include <concepts>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

#include <cstring>
#include <cstddef>

namespace mem {
    /// @brief Interface for the kernel heaps.
    ///
    /// Allocation failure is reported by returning nullptr.
    class IAllocator {
    public:
        virtual ~IAllocator() = default;

        virtual void *allocate(size_t size) {
            return allocateAligned(size, alignof(std::max_align_t));
        }

        virtual void *allocateAligned(size_t size, size_t align) = 0;
        virtual void deallocate(void *ptr, size_t size) noexcept = 0;

        virtual void *reallocate(void *old, size_t oldSize, size_t newSize) {
            void *ptr = allocate(newSize);
            if (ptr && old) {
                std::memcpy(ptr, old, std::min(oldSize, newSize));
                deallocate(old, oldSize);
            }

            return ptr;
        }

        template<typename T, typename... A>
        T *construct(A&&... args) {
            if (void *ptr = allocateAligned(sizeof(T), alignof(T))) {
                return new (ptr) T(std::forward<A>(args)...);
            }

            return nullptr;
        }

        template<typename T>
        void destroy(T *ptr) noexcept {
            if (ptr != nullptr) {
                std::destroy_at(ptr);
                deallocate(ptr, sizeof(T));
            }
        }

        template<typename T>
        T *allocateArray(size_t count) {
            if (void *ptr = allocateAligned(sizeof(T) * count, alignof(T))) {
                return new (ptr) T[count]();
            }

            return nullptr;
        }

        /// @brief Resize an array, on failure @p old is left untouched and nullptr is returned.
        template<typename T> requires (std::is_trivially_copyable_v<T>)
        T *reallocateArray(T *old, size_t oldCount, size_t newCount) {
            return static_cast<T*>(reallocate(old, sizeof(T) * oldCount, sizeof(T) * newCount));
        }

        template<typename T>
        void deallocateArray(T *ptr, size_t count) noexcept {
            if (ptr != nullptr) {
                std::destroy_n(ptr, count);
                deallocate(ptr, sizeof(T) * count);
            }
        }
    };

    /// @brief Standard allocator over an @a IAllocator.
    ///
    /// Containers see exhaustion as std::bad_alloc, callers translate it back to a status.
    template<typename T>
    class AllocatorPointer {
        template<typename U>
        friend class AllocatorPointer;

        mem::IAllocator *mAllocator;

    public:
        using value_type = T;

        AllocatorPointer() = delete;

        AllocatorPointer(mem::IAllocator *allocator) noexcept
            : mAllocator(allocator)
        { }

        template<typename U>
        AllocatorPointer(const AllocatorPointer<U>& other) noexcept
            : mAllocator(other.mAllocator)
        { }

        T *allocate(size_t n) {
            if (void *ptr = mAllocator->allocateAligned(n * sizeof(T), alignof(T))) {
                return static_cast<T*>(ptr);
            }

            throw std::bad_alloc();
        }

        void deallocate(T *ptr, size_t n) noexcept {
            mAllocator->deallocate(ptr, n * sizeof(T));
        }

        mem::IAllocator *allocator() const noexcept {
            return mAllocator;
        }

        template<typename U>
        bool operator==(const AllocatorPointer<U>& other) const noexcept {
            return mAllocator == other.mAllocator;
        }
    };

    /// @brief Serializes the heap primitives of @p T behind a spin lock.
    ///
    /// @p T must implement allocate and reallocate in terms of allocateAligned and deallocate.
    template<std::derived_from<mem::IAllocator> T>
    class SynchronizedAllocator : public T {
        stdx::SpinLock mLock;

    public:
        using T::T;

        void *allocateAligned(size_t size, size_t align) override {
            stdx::LockGuard guard(mLock);
            return T::allocateAligned(size, align);
        }

        void deallocate(void *ptr, size_t size) noexcept override {
            stdx::LockGuard guard(mLock);
            T::deallocate(ptr, size);
        }
    };
}
