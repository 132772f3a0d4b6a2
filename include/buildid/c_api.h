/*
 * buildid/c_api.h: Stable C ABI for reading the build identifier from any
 * language.
 *
 * OWNERSHIP CONTRACT:
 *   - buildid_get_bytes() and buildid_get_string() write into caller-owned
 *     buffers.
 *   - buildid_report_json() and buildid_manifest_json() return heap-allocated
 *     C strings. Caller MUST free them via buildid_free_string(), never with
 *     free() or delete[].
 *
 * THREAD SAFETY:
 *   All functions are thread-safe. The first call into any of them may block
 *   while the identifier is computed; every later call is a load.
 *
 * ABI VERSIONING:
 *   BUILDID_ABI_VERSION is the current ABI version. Callers compare it with
 *   buildid_abi_version() before relying on the layout of anything here.
 *
 * EXAMPLE (C):
 *   char id[BUILDID_STRING_BUFFER_SIZE];
 *   if (buildid_get_string(id, sizeof(id)) == 0) printf("%s\n", id);
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/* Current C ABI version. Bump on any breaking change. */
#define BUILDID_ABI_VERSION 1

/* Identifier size in bytes, and the buffer size for its string form
 * (36 chars + NUL). */
#define BUILDID_BYTES 16
#define BUILDID_STRING_BUFFER_SIZE 37

uint32_t buildid_abi_version(void);

/*
 * buildid_get_bytes: Copy the 16 identifier bytes into out.
 * Returns 0 on success, -1 if out is NULL.
 */
int buildid_get_bytes(uint8_t out[BUILDID_BYTES]);

/*
 * buildid_get_string: Write the canonical NUL-terminated string form.
 * Returns 0 on success, -1 if out is NULL or out_len < BUILDID_STRING_BUFFER_SIZE.
 */
int buildid_get_string(char* out, size_t out_len);

/*
 * buildid_report_json: Calculation report of the memoized identifier.
 * Returns a heap string (free with buildid_free_string) or NULL on allocation
 * failure.
 */
char* buildid_report_json(void);

/*
 * buildid_manifest_json: Version manifest including the identifier.
 * Returns a heap string (free with buildid_free_string) or NULL on allocation
 * failure.
 */
char* buildid_manifest_json(void);

void buildid_free_string(char* s);

#ifdef __cplusplus
}
#endif
