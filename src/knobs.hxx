#ifndef _3ca44309_b667_40fd_8619_7355bb01c4aa
#define _3ca44309_b667_40fd_8619_7355bb01c4aa

// Compile-time configuration. Every knob may be overridden from the
// command line, e.g. -DKNOB_LAZY_TRACE=1.

// Enables DEV_ASSERT checks.
# ifndef KNOB_DEV_ASSERT
#  define KNOB_DEV_ASSERT 1
# endif

// Say() a line whenever a lazy cell runs its producer or a cyclic
// list steps.
# ifndef KNOB_LAZY_TRACE
#  define KNOB_LAZY_TRACE 0
# endif

// Default for the `concurrent` parameter of Lazy<T> and LazyList<T>.
// 0: plain counters, one thread at a time.
// 1: atomic counters and call_once, cells may be forced from many threads.
# ifndef KNOB_LAZY_CONCURRENT
#  define KNOB_LAZY_CONCURRENT 0
# endif

#endif
