#ifndef INTEROP_HPP
#define INTEROP_HPP

// Interop - handle wrappers for values shared with native libraries
//
// - Handle<T>   owns a native struct by value; clone() deep-copies it
// - RCHandle<T> points at a native struct owned elsewhere; clone() aliases it
//
// Both forward member access through operator-> and operator*. Both are
// marked Send/Sync, unconditionally, when built with INTEROP_SEND_SYNC=1.

#include "interop/traits.hpp"
#include "interop/option.hpp"
#include "interop/handle.hpp"
#include "interop/rc_handle.hpp"

#endif // INTEROP_HPP
