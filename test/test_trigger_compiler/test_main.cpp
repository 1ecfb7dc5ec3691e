#include <unity.h>

#include "fakes.hpp"
#include "trigger_compiler.hpp"

void setUp() {}
void tearDown() {}

static DaySet mon_wed_fri() {
    DaySet d;
    d.set(Mon, true);
    d.set(Wed, true);
    d.set(Fri, true);
    return d;
}

void test_fixed_18_00_mon_wed_fri()
{
    auto t = compile_trigger(stamp_from_local(monday(18, 0)), mon_wed_fri());
    TEST_ASSERT_TRUE(t.has_value());
    TEST_ASSERT_EQUAL_INT(0, t->minute);
    TEST_ASSERT_EQUAL_INT(18, t->hour);
    TEST_ASSERT_EQUAL_HEX8(0x2A, t->days.mask());
    TEST_ASSERT_EQUAL_STRING("0 0 18 ? * MON,WED,FRI *", t->cron().c_str());
}

void test_seconds_are_truncated()
{
    Stamp st = *parse_stamp("9999-99-99T06:59:59.999");
    auto t = compile_trigger(st, DaySet::all());
    TEST_ASSERT_EQUAL_INT(6, t->hour);
    TEST_ASSERT_EQUAL_INT(59, t->minute);
}

void test_date_only_fires_at_midnight()
{
    Stamp st = *parse_stamp("2024-03-09");
    auto t = compile_trigger(st, DaySet::all());
    TEST_ASSERT_EQUAL_INT(0, t->hour);
    TEST_ASSERT_EQUAL_INT(0, t->minute);
}

void test_empty_days_yield_nothing()
{
    TEST_ASSERT_FALSE(compile_trigger(stamp_from_local(monday(18, 0)), DaySet()).has_value());
}

void test_compile_is_idempotent()
{
    Stamp st = *parse_stamp("2024-01-01T21:15:00.000");
    for (uint8_t mask : {uint8_t(0x01), uint8_t(0x2A), uint8_t(0x7F)}) {
        auto a = compile_trigger(st, DaySet(mask));
        auto b = compile_trigger(st, DaySet(mask));
        TEST_ASSERT_TRUE(*a == *b);
        TEST_ASSERT_EQUAL_STRING(a->cron().c_str(), b->cron().c_str());
    }
}

int main()
{
    use_utc();
    UNITY_BEGIN();
    RUN_TEST(test_fixed_18_00_mon_wed_fri);
    RUN_TEST(test_seconds_are_truncated);
    RUN_TEST(test_date_only_fires_at_midnight);
    RUN_TEST(test_empty_days_yield_nothing);
    RUN_TEST(test_compile_is_idempotent);
    return UNITY_END();
}
