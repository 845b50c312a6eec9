#pragma once

#include <stddef.h>
#include <stdint.h>

#if defined(__GNUC__) || defined(__clang__)
#define V6BOOT_HOOK_API __attribute__((visibility("default")))
#else
#define V6BOOT_HOOK_API
#endif

#ifdef __cplusplus
extern "C" {
#endif

#define V6BOOT_HOOK_ABI_VERSION 1

#define V6BOOT_HOOK_OK 0
#define V6BOOT_HOOK_ERR_INVALID -1
#define V6BOOT_HOOK_ERR_FAILED -2

/* Named points a hook may attach to, in the order they run */
#define V6BOOT_HOOK_AFTER_SETUP 0
#define V6BOOT_HOOK_BEFORE_LAUNCH 1

#define V6BOOT_LOG_DEBUG 0
#define V6BOOT_LOG_INFO 1
#define V6BOOT_LOG_WARN 2
#define V6BOOT_LOG_ERROR 3

/*
 * View of the pending launch. Strings returned by the getters stay valid until
 * the next mutating call on the same table.
 */
typedef struct v6boot_launch_v1 {
    void* impl;
    const char* (*role)(void* impl);
    const char* (*config_path)(void* impl);
    const char* (*program)(void* impl);
    void (*set_program)(void* impl, const char* program);
    size_t (*arg_count)(void* impl);
    const char* (*arg)(void* impl, size_t index);
    void (*clear_args)(void* impl);
    void (*add_arg)(void* impl, const char* arg);
    void (*set_env)(void* impl, const char* name, const char* value);
} v6boot_launch_v1;

/* Return V6BOOT_HOOK_OK to continue; anything else aborts the bootstrap */
typedef int (*v6boot_hook_fn)(v6boot_launch_v1* launch, void* user);

typedef struct v6boot_hook_host_v1 {
    uint32_t abi_version;
    void* impl;
    int (*register_hook)(void* impl, int point, const char* name, v6boot_hook_fn fn, void* user);
    void (*log)(void* impl, int level, const char* message);
} v6boot_hook_host_v1;

/* Exported by the hook shared object */
V6BOOT_HOOK_API int v6boot_hook_get_abi_version(void);
V6BOOT_HOOK_API int v6boot_hook_init(const v6boot_hook_host_v1* host);

#ifdef __cplusplus
}
#endif
