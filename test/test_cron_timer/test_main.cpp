#include <unity.h>

#include "cron_timer.hpp"
#include "fakes.hpp"

void setUp() {}
void tearDown() {}

static RecurringTrigger mon_18() {
    DaySet d;
    d.set(Mon, true);
    return RecurringTrigger{0, 18, d};
}

void test_fires_once_per_matching_minute()
{
    CronTimer timer;
    int hits = 0;
    timer.add(mon_18(), [&]{ ++hits; }, "k", true);

    timer.tick(monday(17, 59));
    TEST_ASSERT_EQUAL_INT(0, hits);
    timer.tick(monday(18, 0));
    timer.tick(monday(18, 0) + 30);
    TEST_ASSERT_EQUAL_INT(1, hits);
    timer.tick(at(2024, 1, 2, 18, 0));       // вторник
    TEST_ASSERT_EQUAL_INT(1, hits);
    timer.tick(at(2024, 1, 8, 18, 0));
    TEST_ASSERT_EQUAL_INT(2, hits);
}

void test_key_overwrite_and_cancel()
{
    CronTimer timer;
    int a = 0, b = 0;
    timer.add(mon_18(), [&]{ ++a; }, "k", true);
    timer.add(mon_18(), [&]{ ++b; }, "k", true);
    TEST_ASSERT_EQUAL_INT(1, (int)timer.size());

    timer.add(mon_18(), [&]{ ++a; }, "k", false);
    timer.tick(monday(18, 0));
    TEST_ASSERT_EQUAL_INT(0, a);
    TEST_ASSERT_EQUAL_INT(1, b);

    timer.cancel_all();
    TEST_ASSERT_EQUAL_INT(0, (int)timer.size());
}

void test_one_shot_delay()
{
    CronTimer timer;
    int hits = 0;
    timer.after(5, [&]{ ++hits; });
    std::time_t t0 = monday(10, 0);
    timer.tick(t0);
    timer.tick(t0 + 4);
    TEST_ASSERT_EQUAL_INT(0, hits);
    timer.tick(t0 + 5);
    timer.tick(t0 + 6);
    TEST_ASSERT_EQUAL_INT(1, hits);
}

void test_reregistering_inside_callback_does_not_refire()
{
    CronTimer timer;
    int hits = 0;
    std::function<void()> cb;
    cb = [&]{
        ++hits;
        timer.cancel_all();
        timer.add(mon_18(), cb, "k", true);
    };
    timer.add(mon_18(), cb, "k", true);

    timer.tick(monday(18, 0));
    timer.tick(monday(18, 0) + 1);
    timer.tick(monday(18, 0) + 59);
    TEST_ASSERT_EQUAL_INT(1, hits);
    timer.tick(at(2024, 1, 8, 18, 0));
    TEST_ASSERT_EQUAL_INT(2, hits);
}

int main()
{
    use_utc();
    UNITY_BEGIN();
    RUN_TEST(test_fires_once_per_matching_minute);
    RUN_TEST(test_key_overwrite_and_cancel);
    RUN_TEST(test_one_shot_delay);
    RUN_TEST(test_reregistering_inside_callback_does_not_refire);
    return UNITY_END();
}
