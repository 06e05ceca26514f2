#ifndef MORK_UTILS_EXPECT_H
#define MORK_UTILS_EXPECT_H

#include "mork/status.h"
#include <cstdio>
#include <cstdlib>

#ifdef NDEBUG
#  define MORK_EXPECT_(cc, file, line)
#else
#  define MORK_EXPECT_(cc, file, line) Mork::Impl::handle_expect(cc, #cc, file, line)
#endif // NDEBUG

#define MORK_EXPECT_TRUE(cc) MORK_EXPECT_(cc, __FILE__, __LINE__)
#define MORK_EXPECT_FALSE(cc) MORK_EXPECT_TRUE(!(cc))
#define MORK_EXPECT_EQ(t1, t2) MORK_EXPECT_TRUE((t1) == (t2))
#define MORK_EXPECT_NE(t1, t2) MORK_EXPECT_TRUE((t1) != (t2))
#define MORK_EXPECT_LT(t1, t2) MORK_EXPECT_TRUE((t1) < (t2))
#define MORK_EXPECT_LE(t1, t2) MORK_EXPECT_TRUE((t1) <= (t2))
#define MORK_EXPECT_GT(t1, t2) MORK_EXPECT_TRUE((t1) > (t2))
#define MORK_EXPECT_GE(t1, t2) MORK_EXPECT_TRUE((t1) >= (t2))

#define MORK_TRY_S(expr) \
    do { \
        if (auto mork_try_status = (expr); !mork_try_status.is_ok()) \
            return mork_try_status; \
    } while (0)

namespace Mork::Impl {

inline auto handle_expect(bool expectation, const char *repr, const char *file, int line) noexcept -> void
{
    if (!expectation) {
        std::fprintf(stderr, "expectation `%s` failed at %s:%d\n", repr, file, line);
        std::abort();
    }
}

} // namespace Mork::Impl

#endif // MORK_UTILS_EXPECT_H
