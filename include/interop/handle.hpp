#ifndef INTEROP_HANDLE_HPP
#define INTEROP_HANDLE_HPP

#include <type_traits>  // for std::enable_if_t, std::is_copy_constructible_v
#include <utility>  // for std::move, std::forward, std::swap

#include "traits.hpp"

// Handle<T> - A wrapper that owns a native struct by value
//
// Gives code that binds a native library one way to hold "a struct I own"
// with the same access syntax as RCHandle<T> ("a struct native code owns").
//
// Guarantees:
// - Exclusive ownership: no two Handles ever share a T
// - T is destroyed when the Handle goes out of scope
// - clone() deep-copies T and exists only if T is copy constructible
// - Implicit copying is disabled; moves are allowed
// - Not Send/Sync unless built with INTEROP_SEND_SYNC (see traits.hpp)

// @safe
namespace interop {

template<typename T>
class Handle {
private:
    T instance_;

public:
    // No default constructor - a Handle always wraps a value
    Handle() = delete;

    // @lifetime: owned
    explicit Handle(T instance) : instance_(std::move(instance)) {}

    // Wrap a struct instance into a handle
    // @lifetime: owned
    static Handle<T> from_instance(T instance) {
        return Handle<T>(std::move(instance));
    }

    // Duplication goes through clone() so that it is always visible
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    Handle(Handle&&) = default;
    Handle& operator=(Handle&&) = default;

    ~Handle() = default;

    // Independent copy of the wrapped value
    // @lifetime: owned
    template<typename U = T,
             typename = std::enable_if_t<std::is_copy_constructible_v<U>>>
    Handle clone() const {
        return Handle(static_cast<const U&>(instance_));
    }

    // @lifetime: (&'a) -> &'a
    const T& instance() const {
        return instance_;
    }

    // @lifetime: (&'a mut) -> &'a mut
    T& instance_mut() {
        return instance_;
    }

    // @lifetime: (&'a) -> &'a
    const T& operator*() const {
        return instance_;
    }

    // @lifetime: (&'a mut) -> &'a mut
    T& operator*() {
        return instance_;
    }

    // @lifetime: (&'a) -> &'a
    const T* operator->() const {
        return &instance_;
    }

    // @lifetime: (&'a mut) -> &'a mut
    T* operator->() {
        return &instance_;
    }

    // Swaps the wrapped instance with t and returns the handle, which now
    // holds the previous contents of t. Neither value is destroyed.
    // @lifetime: owned
    Handle replace(T& t) && {
        using std::swap;
        swap(instance_, t);
        return std::move(*this);
    }

    // Consumes the wrapper and returns the wrapped value
    // @lifetime: owned
    T into_instance() && {
        return std::move(instance_);
    }
};

// Factory function following the C++ make_* convention
template<typename T, typename... Args>
// @lifetime: owned
Handle<T> make_handle(Args&&... args) {
    return Handle<T>(T(std::forward<Args>(args)...));
}

// Handles compare by the value they own
template<typename T>
bool operator==(const Handle<T>& lhs, const Handle<T>& rhs) {
    return lhs.instance() == rhs.instance();
}

template<typename T>
bool operator!=(const Handle<T>& lhs, const Handle<T>& rhs) {
    return !(lhs == rhs);
}

template<typename T>
using OwningHandle = Handle<T>;

} // namespace interop

#endif // INTEROP_HANDLE_HPP
