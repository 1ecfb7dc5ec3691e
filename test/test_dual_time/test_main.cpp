#include <unity.h>

#include "dual_time.hpp"
#include "fakes.hpp"
#include "trigger_compiler.hpp"

static VariableStore vars;
static FakeSolar solar;

void setUp() {}
void tearDown() {}

static ResolveContext ctx() { return ResolveContext{monday(1, 0), &solar, &vars}; }

static TimeSpec fixed(int h, int m) {
    TimeSpec t;
    t.clock_min = h*60 + m;
    return t;
}

static TimeSpec variable(const std::string& name) {
    TimeSpec t;
    t.source = TimeSource::Variable;
    t.variable = name;
    return t;
}

void test_no_policy_always_primary()
{
    TimeSpec p = fixed(7, 30), s = fixed(6, 0);
    auto sel = select_time(p, &s, DualPolicy::None, ctx());
    TEST_ASSERT_FALSE(sel.is_secondary);
    TEST_ASSERT_TRUE(sel.effective == &p);

    sel = select_time(p, nullptr, DualPolicy::Earlier, ctx());
    TEST_ASSERT_FALSE(sel.is_secondary);
}

void test_earlier_picks_smaller_instant()
{
    TimeSpec p = fixed(7, 30), s = fixed(7, 10);
    auto sel = select_time(p, &s, DualPolicy::Earlier, ctx());
    TEST_ASSERT_TRUE(sel.is_secondary);
    TEST_ASSERT_EQUAL_INT64(monday(7, 10), sel.time->instant);

    sel = select_time(s, &p, DualPolicy::Earlier, ctx());
    TEST_ASSERT_FALSE(sel.is_secondary);
}

void test_later_picks_larger_instant()
{
    TimeSpec p = fixed(7, 30), s = fixed(7, 10);
    auto sel = select_time(p, &s, DualPolicy::Later, ctx());
    TEST_ASSERT_FALSE(sel.is_secondary);
    TEST_ASSERT_EQUAL_INT64(monday(7, 30), sel.time->instant);

    solar.times = SunTimes{monday(7, 45), monday(16, 10)};
    TimeSpec sun;
    sun.source = TimeSource::Solar;
    sun.sunset = false;
    sel = select_time(p, &sun, DualPolicy::Later, ctx());
    TEST_ASSERT_TRUE(sel.is_secondary);
    TEST_ASSERT_EQUAL_INT64(monday(7, 45), sel.time->instant);
}

void test_tie_goes_to_primary()
{
    vars.set("same", "2024-01-01T07:30:00.000");
    TimeSpec p = fixed(7, 30), s = variable("same");
    TEST_ASSERT_FALSE(select_time(p, &s, DualPolicy::Earlier, ctx()).is_secondary);
    TEST_ASSERT_FALSE(select_time(p, &s, DualPolicy::Later, ctx()).is_secondary);
}

void test_unresolved_side_loses()
{
    TimeSpec p = fixed(7, 30), missing = variable("not_there");
    auto sel = select_time(p, &missing, DualPolicy::Earlier, ctx());
    TEST_ASSERT_FALSE(sel.is_secondary);
    TEST_ASSERT_TRUE(sel.time.has_value());

    TimeSpec unset;   // fixed without a time
    TimeSpec s = fixed(22, 0);
    sel = select_time(unset, &s, DualPolicy::Earlier, ctx());
    TEST_ASSERT_TRUE(sel.is_secondary);
    TEST_ASSERT_EQUAL_INT64(monday(22, 0), sel.time->instant);
}

void test_schedule_overload_uses_schedule_fields()
{
    vars.set("alarm", "9999-99-99T07:10:00.000");
    Schedule s;
    s.primary = fixed(7, 30);
    s.secondary = variable("alarm");
    s.earlier_later = DualPolicy::Earlier;
    auto sel = select_time(s, ctx());
    TEST_ASSERT_TRUE(sel.is_secondary);
    TEST_ASSERT_TRUE(sel.effective == &s.secondary);
    TEST_ASSERT_EQUAL_INT(7, sel.time->wall.hour);
    TEST_ASSERT_EQUAL_INT(10, sel.time->wall.minute);
}

// 06:00 at -0500 is 11:00 here (UTC): later than 08:00, and the trigger fires at 11:00
void test_offset_variable_compares_and_compiles_in_local_time()
{
    vars.set("remote", "2024-01-01T06:00:00.000-0500");
    Schedule s;
    s.primary = fixed(8, 0);
    s.secondary = variable("remote");
    s.earlier_later = DualPolicy::Later;
    auto sel = select_time(s, ctx());
    TEST_ASSERT_TRUE(sel.is_secondary);
    TEST_ASSERT_EQUAL_INT64(monday(11, 0), sel.time->instant);

    auto trig = compile_trigger(*sel.time, DaySet::all());
    TEST_ASSERT_TRUE(trig.has_value());
    TEST_ASSERT_EQUAL_INT(11, trig->hour);
    TEST_ASSERT_EQUAL_INT(0, trig->minute);
    TEST_ASSERT_EQUAL_INT(20240101, sel.time->wall.date_key());

    s.earlier_later = DualPolicy::Earlier;
    TEST_ASSERT_FALSE(select_time(s, ctx()).is_secondary);
}

int main()
{
    use_utc();
    UNITY_BEGIN();
    RUN_TEST(test_no_policy_always_primary);
    RUN_TEST(test_earlier_picks_smaller_instant);
    RUN_TEST(test_later_picks_larger_instant);
    RUN_TEST(test_tie_goes_to_primary);
    RUN_TEST(test_unresolved_side_loses);
    RUN_TEST(test_schedule_overload_uses_schedule_fields);
    RUN_TEST(test_offset_variable_compares_and_compiles_in_local_time);
    return UNITY_END();
}
