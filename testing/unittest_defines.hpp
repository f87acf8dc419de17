#ifndef _XFERSTAT_UNITTEST_DEFINES_H_
#define _XFERSTAT_UNITTEST_DEFINES_H_

// Test suites compiled with ENABLE_UNIT_TESTS set to 0 are prefixed with
// `DISABLED_`, which makes gtest skip them unless
// --gtest_also_run_disabled_tests is given.
#if ENABLE_UNIT_TESTS
#define T(x)            x
#define MY_TEST(x, y)   TEST(x, y)
#define MY_TEST_P(x, y) TEST_P(x, y)
#define MY_TEST_F(x, y) TEST_F(x, y)
#define MY_INSTANTIATE_TEST_SUITE_P(x, y, ...) INSTANTIATE_TEST_SUITE_P(x, y, __VA_ARGS__)
#else
#define T(x)            DISABLED_##x
#define MY_TEST(x, y)   TEST(DISABLED_##x, y)
#define MY_TEST_P(x, y) TEST_P(DISABLED_##x, y)
#define MY_TEST_F(x, y) TEST_F(DISABLED_##x, y)
#define MY_INSTANTIATE_TEST_SUITE_P(x, y, ...) INSTANTIATE_TEST_SUITE_P(x, DISABLED_##y, __VA_ARGS__)
#endif

#endif
