#pragma once

#include <type_traits>

// INTEROP_SEND_SYNC: define it empty or non-zero to enable, 0 or leave it
// undefined to disable. INTEROP_SEND_SYNC_ENABLED is the normalized 0/1 form.
#if defined(INTEROP_SEND_SYNC)
#  if (INTEROP_SEND_SYNC + 0) != 0 || (0 - INTEROP_SEND_SYNC - 1) == 1
#    define INTEROP_SEND_SYNC_ENABLED 1
#  else
#    define INTEROP_SEND_SYNC_ENABLED 0
#  endif
#else
#  define INTEROP_SEND_SYNC_ENABLED 0
#endif

namespace interop {

// Forward declarations for handle types
template<typename T> class Handle;
template<typename T> class RCHandle;

// Forward declare is_sync for circular dependency with is_send
template<typename T, typename = void>
struct is_sync;

// ============================================================================
// Send Trait - Can transfer ownership across thread boundaries
// ============================================================================

// Default: types are NOT Send
template<typename T, typename = void>
struct is_send : std::false_type {};

// Primitives are Send
template<typename T>
struct is_send<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

// const T& is Send if T is Sync
template<typename T>
struct is_send<const T&> : is_sync<T> {};

// T& (mutable ref) is Send if T is Send
template<typename T>
struct is_send<T&> : is_send<T> {};

template<typename T>
struct is_send<T&&> : is_send<T> {};

// Raw pointers are not Send
template<typename T>
struct is_send<T*> : std::false_type {};

// ============================================================================
// Sync Trait - Can safely share &T across threads
// ============================================================================

// Default: types are NOT Sync
template<typename T, typename>
struct is_sync : std::false_type {};

// Primitives are Sync
template<typename T>
struct is_sync<T, std::enable_if_t<std::is_arithmetic_v<T>>> : std::true_type {};

template<typename T>
struct is_sync<const T&> : is_sync<T> {};

// T& (mutable ref) is never Sync
template<typename T>
struct is_sync<T&> : std::false_type {};

template<typename T>
struct is_sync<T&&> : std::false_type {};

template<typename T>
struct is_sync<T*> : std::false_type {};

// ============================================================================
// Handle markers
//
// Without INTEROP_SEND_SYNC neither handle is Send or Sync, even when T is:
// the wrapped value may be shared with native code the compiler cannot see.
//
// With INTEROP_SEND_SYNC=1 both handles are Send and Sync for every T. This
// is an unchecked assertion made by whoever enables the option. Several
// RCHandle copies may mutate one instance, and nothing here synchronizes them.
// ============================================================================

#if INTEROP_SEND_SYNC_ENABLED

template<typename T>
struct is_send<Handle<T>> : std::true_type {};

template<typename T>
struct is_sync<Handle<T>> : std::true_type {};

template<typename T>
struct is_send<RCHandle<T>> : std::true_type {};

template<typename T>
struct is_sync<RCHandle<T>> : std::true_type {};

#else

template<typename T>
struct is_send<Handle<T>> : std::false_type {};

template<typename T>
struct is_sync<Handle<T>> : std::false_type {};

template<typename T>
struct is_send<RCHandle<T>> : std::false_type {};

template<typename T>
struct is_sync<RCHandle<T>> : std::false_type {};

#endif

// ============================================================================
// Helper constexpr variables
// ============================================================================

template<typename T>
inline constexpr bool Send = is_send<T>::value;

template<typename T>
inline constexpr bool Sync = is_sync<T>::value;

template<typename T>
inline constexpr bool ThreadSafe = Send<T> && Sync<T>;

// True when the build asserts thread safety for both handle types
#if INTEROP_SEND_SYNC_ENABLED
inline constexpr bool send_sync_enabled = true;
#else
inline constexpr bool send_sync_enabled = false;
#endif

} // namespace interop

// Mark a user type as Send
// Usage: INTEROP_MARK_SEND(MyType)
#define INTEROP_MARK_SEND(Type) \
    namespace interop { \
        template<> struct is_send<Type> : std::true_type {}; \
    }

// Mark a user type as Sync
// Usage: INTEROP_MARK_SYNC(MyType)
#define INTEROP_MARK_SYNC(Type) \
    namespace interop { \
        template<> struct is_sync<Type> : std::true_type {}; \
    }
