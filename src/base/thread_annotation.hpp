#ifndef _BASE_THREAD_ANNOTATION_H_
#define _BASE_THREAD_ANNOTATION_H_

// Clang thread-safety analysis, no-op on other compilers.
// See https://clang.llvm.org/docs/ThreadSafetyAnalysis.html
#if defined(__clang__) && (!defined(SWIG))
#define XFER_THREAD_ANNOTATION_ATTRIBUTE__(x) __attribute__((x))
#else
#define XFER_THREAD_ANNOTATION_ATTRIBUTE__(x)  // no-op
#endif

// Document if a shared variable/field needs to be protected by a lock.
// GUARDED_BY allows the user to specify a particular lock that should be
// held when accessing the annotated variable.
#define XFER_GUARDED_BY(x) XFER_THREAD_ANNOTATION_ATTRIBUTE__(guarded_by(x))

// Document if the memory location pointed to by a pointer should be guarded
// by a lock when dereferencing the pointer.
#define XFER_PT_GUARDED_BY(x) XFER_THREAD_ANNOTATION_ATTRIBUTE__(pt_guarded_by(x))

// Document if a function expects certain locks to be held before it is called
#define XFER_EXCLUSIVE_LOCKS_REQUIRED(...) \
  XFER_THREAD_ANNOTATION_ATTRIBUTE__(exclusive_locks_required(__VA_ARGS__))

// Document the locks acquired in the body of the function. These locks
// cannot be held when calling this function (as the locks are non-reentrant).
#define XFER_LOCKS_EXCLUDED(...) \
  XFER_THREAD_ANNOTATION_ATTRIBUTE__(locks_excluded(__VA_ARGS__))

#endif
