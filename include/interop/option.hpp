#ifndef INTEROP_OPTION_HPP
#define INTEROP_OPTION_HPP

#include <new>
#include <stdexcept>
#include <utility>

// Option<T> - an optional value, used where a native pointer may be null
//
// Guarantees:
// - Explicit handling of absence
// - unwrap()/expect() throw std::runtime_error on None

// @safe
namespace interop {

// @safe
struct None_t {
    constexpr None_t() noexcept = default;
};
inline constexpr None_t None{};

// @safe
template<typename T>
class Option {
private:
    bool has_value;
    union {
        T value;
        char dummy;
    };

    void reset() {
        if (has_value) {
            value.~T();
            has_value = false;
        }
    }

public:
    Option() : has_value(false), dummy(0) {}

    Option(None_t) : has_value(false), dummy(0) {}

    Option(T val) : has_value(true), value(std::move(val)) {}

    Option(const Option& other) : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(other.value);
        }
    }

    Option(Option&& other) noexcept : has_value(other.has_value) {
        if (has_value) {
            new (&value) T(std::move(other.value));
            other.reset();
        }
    }

    Option& operator=(const Option& other) {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(other.value);
                has_value = true;
            }
        }
        return *this;
    }

    Option& operator=(Option&& other) noexcept {
        if (this != &other) {
            reset();
            if (other.has_value) {
                new (&value) T(std::move(other.value));
                has_value = true;
                other.reset();
            }
        }
        return *this;
    }

    ~Option() {
        reset();
    }

    bool is_some() const { return has_value; }
    bool is_none() const { return !has_value; }

    explicit operator bool() const { return has_value; }

    // Take the value out, leaving None (throws if None)
    // @lifetime: owned
    T unwrap() {
        if (!has_value) {
            throw std::runtime_error("Called unwrap on None");
        }
        T result = std::move(value);
        reset();
        return result;
    }

    // @lifetime: owned
    T expect(const char* msg) {
        if (!has_value) {
            throw std::runtime_error(msg);
        }
        return unwrap();
    }

    // @lifetime: owned
    T unwrap_or(T default_value) {
        if (has_value) {
            return unwrap();
        }
        return default_value;
    }

    // Borrow the contained value; nullptr if None
    // @lifetime: (&'a) -> &'a
    const T* get() const {
        return has_value ? &value : nullptr;
    }

    // @lifetime: (&'a mut) -> &'a mut
    T* get_mut() {
        return has_value ? &value : nullptr;
    }
};

// @safe
template<typename T>
// @lifetime: owned
Option<T> Some(T value) {
    return Option<T>(std::move(value));
}

} // namespace interop

#endif // INTEROP_OPTION_HPP
