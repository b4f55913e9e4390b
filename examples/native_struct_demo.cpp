// Wrapping structs that belong to a native (C) library
//
// native_* functions stand in for an extern "C" API: the library allocates
// and frees its own context, and hands out plain structs by value.

#include <interop/interop.hpp>
#include <cstdio>
#include <cstring>
#include <utility>

using namespace interop;

extern "C" {

struct native_color {
    unsigned char r, g, b, a;
};

struct native_context {
    native_color clear_color;
    int frame;
    bool dirty;
};

static native_context* native_context_create() {
    auto* ctx = new native_context;
    std::memset(ctx, 0, sizeof(*ctx));
    return ctx;
}

static void native_context_destroy(native_context* ctx) {
    delete ctx;
}

// No context is ever bound in this demo
static native_context* native_context_current() {
    return nullptr;
}

static native_color native_default_color() {
    return native_color{0x20, 0x40, 0x80, 0xff};
}

}  // extern "C"

using Color = Handle<native_color>;
using Context = RCHandle<native_context>;

static void present(Context ctx, const Color& color) {
    ctx->clear_color = *color;
    ctx->frame += 1;
    ctx->dirty = true;
}

int main() {
    std::printf("=== Owned native values ===\n");
    Color base = Color::from_instance(native_default_color());
    Color tinted = base.clone();
    tinted->r = 0xff;
    std::printf("base.r = 0x%02x, tinted.r = 0x%02x\n", base->r, tinted->r);

    std::printf("\n=== Borrowed native context ===\n");
    native_context* raw = native_context_create();
    Context ctx = Context::from_ptr(raw).expect("native_context_create returned null");
    Context alias = ctx.clone();

    present(alias, tinted);
    std::printf("frame = %d, dirty = %s, clear.r = 0x%02x\n",
                ctx->frame, ctx->dirty ? "true" : "false", ctx->clear_color.r);

    native_context_destroy(std::move(ctx).into_ptr());

    std::printf("\n=== Null native pointers ===\n");
    auto missing = Context::from_ptr(native_context_current());
    std::printf("current() -> %s\n", missing.is_none() ? "None" : "Some");

    std::printf("\nsend_sync: %s\n", send_sync_enabled ? "enabled" : "disabled");
    return 0;
}
