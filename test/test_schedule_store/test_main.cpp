#include <unity.h>

#include "fakes.hpp"
#include "loader.hpp"
#include "schedule_store.hpp"
#include <sstream>
#include <stdexcept>

void setUp() {}
void tearDown() {}

static ScheduleStore two_devices() {
    ScheduleStore store;
    store.select_devices({
        DeviceInfo{"D1", "Porch light", {Capability::Switch}},
        DeviceInfo{"D2", "Hall dimmer", {Capability::Dimmer, Capability::Switch}},
    });
    return store;
}

static bool throws_edit(ScheduleStore& st, const std::string& d, const std::string& s,
                        const std::string& f, const std::string& v) {
    try { st.edit(d, s, f, v); }
    catch (const std::runtime_error&) { return true; }
    return false;
}

void test_new_device_gets_default_schedule()
{
    auto store = two_devices();
    const Device* d = store.find_device("D1");
    TEST_ASSERT_NOT_NULL(d);
    TEST_ASSERT_EQUAL_size_t(1, d->schedules.size());

    const Schedule& s = d->schedules.front();
    TEST_ASSERT_EQUAL_HEX8(0x7F, s.days.mask());
    TEST_ASSERT_TRUE(s.primary.source == TimeSource::Fixed);
    TEST_ASSERT_TRUE(s.primary.sunset);
    TEST_ASSERT_EQUAL_INT(0, s.primary.offset_min);
    TEST_ASSERT_TRUE(s.desired_on);
    TEST_ASSERT_EQUAL_INT(100, s.desired_level);
    TEST_ASSERT_TRUE(s.restore);
    TEST_ASSERT_EQUAL_size_t(36, s.id.size());
    TEST_ASSERT_TRUE(s.id[14] == '4');
}

void test_deselect_cascades()
{
    auto store = two_devices();
    store.select_devices({DeviceInfo{"D2", "Hall dimmer", {Capability::Dimmer}}});
    TEST_ASSERT_NULL(store.find_device("D1"));
    TEST_ASSERT_EQUAL_size_t(1, store.devices().size());
}

void test_removing_last_schedule_regenerates_default()
{
    auto store = two_devices();
    std::string first = store.find_device("D1")->schedules.front().id;
    std::string second = store.add_run("D1").id;
    store.remove_run("D1", first);
    TEST_ASSERT_EQUAL_size_t(1, store.find_device("D1")->schedules.size());
    store.remove_run("D1", second);

    const Device* d = store.find_device("D1");
    TEST_ASSERT_EQUAL_size_t(1, d->schedules.size());
    TEST_ASSERT_TRUE(d->schedules.front().id != second);
}

void test_edit_returns_display_value()
{
    auto store = two_devices();
    std::string sid = store.find_device("D1")->schedules.front().id;

    TEST_ASSERT_EQUAL_STRING("MON,WED,FRI", store.edit("D1", sid, "days", "mon,wed,fri").c_str());
    TEST_ASSERT_EQUAL_STRING("true", store.edit("D1", sid, "sun", "yes").c_str());
    TEST_ASSERT_EQUAL_STRING("SUN,MON,WED,FRI", field_value(*store.find_schedule("D1", sid), "days").c_str());
    TEST_ASSERT_EQUAL_STRING("18:00", store.edit("D1", sid, "time", "18:00").c_str());
    TEST_ASSERT_EQUAL_STRING("earlier", store.edit("D1", sid, "earlier_later", "earlier").c_str());
    TEST_ASSERT_EQUAL_STRING("off", store.edit("D1", sid, "state", "off").c_str());
    TEST_ASSERT_EQUAL_STRING("-30", store.edit("D1", sid, "sec_offset", "-30").c_str());
}

void test_sun_and_variable_sources_exclude_each_other()
{
    auto store = two_devices();
    std::string sid = store.find_device("D1")->schedules.front().id;

    store.edit("D1", sid, "sun_time", "true");
    store.edit("D1", sid, "use_variable", "true");
    const Schedule* s = store.find_schedule("D1", sid);
    TEST_ASSERT_TRUE(s->primary.source == TimeSource::Variable);
    TEST_ASSERT_EQUAL_STRING("false", field_value(*s, "sun_time").c_str());

    store.edit("D1", sid, "sun_time", "true");
    TEST_ASSERT_EQUAL_STRING("false", field_value(*s, "use_variable").c_str());
}

void test_edit_rejects_bad_input()
{
    auto store = two_devices();
    std::string sid = store.find_device("D1")->schedules.front().id;

    TEST_ASSERT_TRUE(throws_edit(store, "D9", sid, "time", "18:00"));
    TEST_ASSERT_TRUE(throws_edit(store, "D1", "nope", "time", "18:00"));
    TEST_ASSERT_TRUE(throws_edit(store, "D1", sid, "colour", "red"));
    TEST_ASSERT_TRUE(throws_edit(store, "D1", sid, "time", "25:00"));
    TEST_ASSERT_TRUE(throws_edit(store, "D1", sid, "level", "101"));
    TEST_ASSERT_TRUE(throws_edit(store, "D1", sid, "days", "mon,funday"));
    TEST_ASSERT_TRUE(throws_edit(store, "D1", sid, "variable", "a;b"));
    // неудачная правка не меняет расписание
    TEST_ASSERT_EQUAL_INT(100, store.find_schedule("D1", sid)->desired_level);
}

void test_capability_must_be_supported()
{
    auto store = two_devices();
    store.set_capability("D2", Capability::Switch);
    TEST_ASSERT_TRUE(store.find_device("D2")->capability == Capability::Switch);

    bool threw = false;
    try { store.set_capability("D1", Capability::Dimmer); }
    catch (const std::runtime_error&) { threw = true; }
    TEST_ASSERT_TRUE(threw);
}

void test_rename_variable_rewrites_both_sides()
{
    auto store = two_devices();
    std::string a = store.find_device("D1")->schedules.front().id;
    std::string b = store.find_device("D2")->schedules.front().id;
    store.edit("D1", a, "variable", "wake");
    store.edit("D2", b, "sec_variable", "wake");
    store.edit("D2", b, "variable", "other");

    TEST_ASSERT_EQUAL_INT(2, store.rename_variable("wake", "alarm"));
    TEST_ASSERT_EQUAL_STRING("alarm", store.find_schedule("D1", a)->primary.variable.c_str());
    TEST_ASSERT_EQUAL_STRING("alarm", store.find_schedule("D2", b)->secondary.variable.c_str());
    TEST_ASSERT_EQUAL_STRING("other", store.find_schedule("D2", b)->primary.variable.c_str());
}

void test_zones_follow_name_order()
{
    auto store = two_devices();
    store.assign_zones();
    TEST_ASSERT_EQUAL_INT(1, store.find_device("D2")->zone);   // "Hall dimmer"
    TEST_ASSERT_EQUAL_INT(2, store.find_device("D1")->zone);   // "Porch light"
}

void test_old_shape_is_upgraded_on_load()
{
    std::istringstream in(
        "[Devices]\n"
        "D1 = name=Porch;capability=switch\n"
        "[Schedule]\n"
        "s1 = device=D1;id=a;time=18:00;earlier_later=earlier\n");
    auto devices = parse_devices(parse_ini(in));
    const Schedule& s = devices.front().schedules.front();
    TEST_ASSERT_TRUE(s.earlier_later == DualPolicy::None);
    TEST_ASSERT_TRUE(s.secondary == TimeSpec{});
    TEST_ASSERT_EQUAL_INT(18*60, *s.primary.clock_min);
}

void test_state_file_round_trip()
{
    auto store = two_devices();
    std::string a = store.find_device("D1")->schedules.front().id;
    store.edit("D1", a, "days", "MON,WED,FRI");
    store.edit("D1", a, "time", "18:00");
    store.edit("D1", a, "restore", "false");
    std::string b = store.add_run("D1").id;
    store.edit("D1", b, "sun_time", "true");
    store.edit("D1", b, "sunset", "false");
    store.edit("D1", b, "offset", "-20");
    store.edit("D1", b, "earlier_later", "later");
    store.edit("D1", b, "sec_use_variable", "true");
    store.edit("D1", b, "sec_variable", "wake");
    std::string c = store.find_device("D2")->schedules.front().id;
    store.edit("D2", c, "level", "40");
    store.edit("D2", c, "pause", "true");
    store.edit("D2", c, "days", "");

    std::ostringstream out;
    write_ini(out, state_to_ini(store.devices()));
    std::istringstream in(out.str());
    auto back = parse_devices(parse_ini(in));

    const auto& orig = store.devices();
    TEST_ASSERT_EQUAL_size_t(orig.size(), back.size());
    for (size_t i=0; i<orig.size(); ++i) {
        TEST_ASSERT_EQUAL_STRING(orig[i].id.c_str(), back[i].id.c_str());
        TEST_ASSERT_EQUAL_STRING(orig[i].name.c_str(), back[i].name.c_str());
        TEST_ASSERT_TRUE(orig[i].capability == back[i].capability);
        TEST_ASSERT_TRUE(orig[i].supported == back[i].supported);
        TEST_ASSERT_EQUAL_size_t(orig[i].schedules.size(), back[i].schedules.size());
        for (size_t j=0; j<orig[i].schedules.size(); ++j) {
            const Schedule& x = orig[i].schedules[j];
            const Schedule& y = back[i].schedules[j];
            TEST_ASSERT_EQUAL_STRING(x.id.c_str(), y.id.c_str());
            for (auto& f : kScheduleFields)
                TEST_ASSERT_EQUAL_STRING_MESSAGE(field_value(x, f).c_str(), field_value(y, f).c_str(), f.c_str());
            TEST_ASSERT_TRUE(x.primary == y.primary);
            TEST_ASSERT_TRUE(x.secondary == y.secondary);
        }
    }
}

int main()
{
    use_utc();
    UNITY_BEGIN();
    RUN_TEST(test_new_device_gets_default_schedule);
    RUN_TEST(test_deselect_cascades);
    RUN_TEST(test_removing_last_schedule_regenerates_default);
    RUN_TEST(test_edit_returns_display_value);
    RUN_TEST(test_sun_and_variable_sources_exclude_each_other);
    RUN_TEST(test_edit_rejects_bad_input);
    RUN_TEST(test_capability_must_be_supported);
    RUN_TEST(test_rename_variable_rewrites_both_sides);
    RUN_TEST(test_zones_follow_name_order);
    RUN_TEST(test_old_shape_is_upgraded_on_load);
    RUN_TEST(test_state_file_round_trip);
    return UNITY_END();
}
