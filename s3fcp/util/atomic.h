/**
 * This file is part of s3fcp.
 *
 * Wrapper functions for atomic integer operations on top of the GCC
 * __sync builtins.  Used for the abort flag of the pipeline and the byte
 * counters of the progress reporter.
 */

#ifndef S3FCP_UTIL_ATOMIC_H_
#define S3FCP_UTIL_ATOMIC_H_

#include <stdint.h>

typedef int32_t atomic_int32;
typedef int64_t atomic_int64;


static void inline __attribute__((used)) atomic_init32(atomic_int32 *a) {
  *a = 0;
}


static void inline __attribute__((used)) atomic_init64(atomic_int64 *a) {
  *a = 0;
}


static int32_t inline __attribute__((used)) atomic_read32(atomic_int32 *a) {
  return __sync_fetch_and_add(a, 0);
}


static int64_t inline __attribute__((used)) atomic_read64(atomic_int64 *a) {
  return __sync_fetch_and_add(a, 0);
}


static void inline __attribute__((used)) atomic_write32(
  atomic_int32 *a,
  int32_t value)
{
  while (!__sync_bool_compare_and_swap(a, atomic_read32(a), value)) {
  }
}


static void inline __attribute__((used)) atomic_inc32(atomic_int32 *a) {
  (void) __sync_fetch_and_add(a, 1);
}


static int64_t inline __attribute__((used)) atomic_xadd64(
  atomic_int64 *a,
  int64_t offset)
{
  if (offset < 0)
    return __sync_fetch_and_sub(a, -offset);
  return __sync_fetch_and_add(a, offset);
}


/**
 * Returns true if the value was swapped, i.e. *a was equal to cmp.
 */
static bool inline __attribute__((used)) atomic_cas32(
  atomic_int32 *a,
  int32_t cmp,
  int32_t newval)
{
  return __sync_bool_compare_and_swap(a, cmp, newval);
}


static bool inline __attribute__((used)) atomic_cas64(
  atomic_int64 *a,
  int64_t cmp,
  int64_t newval)
{
  return __sync_bool_compare_and_swap(a, cmp, newval);
}

#endif  // S3FCP_UTIL_ATOMIC_H_
