#ifndef INTEROP_RC_HANDLE_HPP
#define INTEROP_RC_HANDLE_HPP

#include "option.hpp"  // For Option<RCHandle<T>> return types
#include "traits.hpp"

// RCHandle<T> - A non-owning, never-null pointer to a struct owned elsewhere
//
// Typical use: the struct lives in memory a native library allocated and
// will free. The handle gives it the same access syntax as Handle<T>.
//
// The name is kept for source compatibility with existing bindings. There is
// no reference count: copying an RCHandle copies the pointer, and destroying
// one does nothing to the pointee.
//
// Contract (NOT checked):
// - The pointee outlives this handle and every copy made from it
// - Copies alias one instance; writes through any copy are visible through
//   all of them, with no synchronization added here
// - Not Send/Sync unless built with INTEROP_SEND_SYNC (see traits.hpp)

// @safe
namespace interop {

template<typename T>
class RCHandle {
private:
    T* ptr_;  // never null

    struct unchecked_t {};

    // @unsafe - caller guarantees ptr != nullptr
    RCHandle(T* ptr, unchecked_t) : ptr_(ptr) {}

public:
    RCHandle() = delete;

    // @lifetime: (&'a mut) -> 'a
    explicit RCHandle(T& instance) : ptr_(&instance) {}

    // Alias an existing instance. Does not copy or take ownership of it.
    // @lifetime: (&'a mut) -> 'a
    static RCHandle<T> from_ref(T& instance) {
        return RCHandle<T>(instance);
    }

    // Alias the object a native pointer points to.
    // Returns None if the pointer is null.
    // @unsafe
    static Option<RCHandle<T>> from_ptr(T* ptr) {
        if (ptr == nullptr) {
            return None;
        }
        return Some(RCHandle<T>(ptr, unchecked_t{}));
    }

    // Same as from_ptr(). Kept for bindings that distinguish pointers they
    // were handed from pointers they borrowed; there is no count to adjust.
    // @unsafe
    static Option<RCHandle<T>> from_unshared_ptr(T* ptr) {
        return from_ptr(ptr);
    }

    // Copying duplicates the pointer, never the pointee
    RCHandle(const RCHandle& other) = default;
    RCHandle& operator=(const RCHandle& other) = default;

    ~RCHandle() = default;

    // @safe - Clone creates another handle to the same instance
    RCHandle clone() const {
        return RCHandle(*this);
    }

    // @lifetime: (&'a) -> &'a
    T* as_ptr() const {
        return ptr_;
    }

    // @lifetime: (&'a) -> &'a
    const T& as_ref() const {
        return *ptr_;
    }

    // @lifetime: (&'a mut) -> &'a mut
    T& as_mut() {
        return *ptr_;
    }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const {
        return *ptr_;
    }

    // @lifetime: (&'a mut) -> &'a mut
    T& operator*() {
        return *ptr_;
    }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const {
        return ptr_;
    }

    // @lifetime: (&'a mut) -> &'a mut
    T* operator->() {
        return ptr_;
    }

    // True if both handles point at the same storage
    bool ptr_eq(const RCHandle& other) const {
        return ptr_ == other.ptr_;
    }

    // Consumes the wrapper and returns the pointer to the wrapped value
    // @unsafe
    T* into_ptr() && {
        return ptr_;
    }
};

// RCHandles compare by the value they point to, not by address.
// Use ptr_eq() for identity.
template<typename T>
bool operator==(const RCHandle<T>& lhs, const RCHandle<T>& rhs) {
    return lhs.as_ref() == rhs.as_ref();
}

template<typename T>
bool operator!=(const RCHandle<T>& lhs, const RCHandle<T>& rhs) {
    return !(lhs == rhs);
}

template<typename T>
using AliasingHandle = RCHandle<T>;

} // namespace interop

#endif // INTEROP_RC_HANDLE_HPP
