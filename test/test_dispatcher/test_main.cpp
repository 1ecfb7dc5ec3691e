#include <unity.h>
#include <memory>

#include "dispatcher.hpp"
#include "fakes.hpp"

static std::unique_ptr<FakeDirectory> dir;
static std::unique_ptr<Dispatcher> dispatcher;

void setUp()
{
    dir = std::make_unique<FakeDirectory>();
    dispatcher = std::make_unique<Dispatcher>(*dir);
}

void tearDown()
{
    dispatcher.reset();
    dir.reset();
}

static Device device(const std::string& id, Capability cap) {
    Device d;
    d.id = id;
    d.capability = cap;
    d.supported = {cap};
    return d;
}

void test_switch_on_and_off()
{
    dir->add("D1");
    Device d = device("D1", Capability::Switch);
    Schedule s;
    Options o;

    TEST_ASSERT_TRUE(dispatcher->execute(d, s, o));
    s.desired_on = false;
    TEST_ASSERT_TRUE(dispatcher->execute(d, s, o));

    std::vector<std::string> expected{"D1:on", "D1:off"};
    TEST_ASSERT_TRUE(dir->journal == expected);
}

void test_dimmer_on_before_level()
{
    dir->add("D2");
    Device d = device("D2", Capability::Dimmer);
    Schedule s;
    s.desired_level = 40;
    Options o;
    o.on_before_level = true;

    TEST_ASSERT_TRUE(dispatcher->execute(d, s, o));
    std::vector<std::string> expected{"D2:on", "D2:level=40"};
    TEST_ASSERT_TRUE(dir->journal == expected);
}

void test_dimmer_level_only_without_option()
{
    dir->add("D2");
    Device d = device("D2", Capability::Dimmer);
    Schedule s;
    s.desired_level = 65;
    Options o;

    TEST_ASSERT_TRUE(dispatcher->execute(d, s, o));
    std::vector<std::string> expected{"D2:level=65"};
    TEST_ASSERT_TRUE(dir->journal == expected);
}

void test_dimmer_off_is_plain_off()
{
    dir->add("D2");
    Device d = device("D2", Capability::Dimmer);
    Schedule s;
    s.desired_on = false;
    Options o;
    o.on_before_level = true;

    TEST_ASSERT_TRUE(dispatcher->execute(d, s, o));
    std::vector<std::string> expected{"D2:off"};
    TEST_ASSERT_TRUE(dir->journal == expected);
}

void test_button_invokes_action()
{
    FakeDevice& b = dir->add("B1");
    b.buttons = {ButtonAction::Push, ButtonAction::Hold};
    Device d = device("B1", Capability::Button);
    Schedule s;
    s.button_number = 2;
    s.button_action = ButtonAction::Hold;

    TEST_ASSERT_TRUE(dispatcher->execute(d, s, Options{}));
    std::vector<std::string> expected{"B1:hold#2"};
    TEST_ASSERT_TRUE(dir->journal == expected);
}

void test_button_not_configured_or_unsupported()
{
    LogCapture log;
    dir->add("B1");
    Device d = device("B1", Capability::Button);
    Schedule s;

    TEST_ASSERT_FALSE(dispatcher->execute(d, s, Options{}));

    s.button_number = 1;
    s.button_action = ButtonAction::DoubleTap;
    TEST_ASSERT_FALSE(dispatcher->execute(d, s, Options{}));

    TEST_ASSERT_TRUE(dir->journal.empty());
    TEST_ASSERT_EQUAL_INT(1, log.count("has no button/action set"));
    TEST_ASSERT_EQUAL_INT(1, log.count("does not support doubleTap"));
}

void test_failure_is_reported_not_retried()
{
    LogCapture log;
    FakeDevice& dev = dir->add("D1");
    dev.fail = true;
    Device d = device("D1", Capability::Switch);

    TEST_ASSERT_FALSE(dispatcher->execute(d, Schedule{}, Options{}));
    TEST_ASSERT_EQUAL_size_t(1, dir->journal.size());
    TEST_ASSERT_EQUAL_INT(1, log.count("FAILED"));
}

void test_unknown_device()
{
    Device d = device("ghost", Capability::Switch);
    TEST_ASSERT_FALSE(dispatcher->execute(d, Schedule{}, Options{}));
}

int main()
{
    use_utc();
    UNITY_BEGIN();
    RUN_TEST(test_switch_on_and_off);
    RUN_TEST(test_dimmer_on_before_level);
    RUN_TEST(test_dimmer_level_only_without_option);
    RUN_TEST(test_dimmer_off_is_plain_off);
    RUN_TEST(test_button_invokes_action);
    RUN_TEST(test_button_not_configured_or_unsupported);
    RUN_TEST(test_failure_is_reported_not_retried);
    RUN_TEST(test_unknown_device);
    return UNITY_END();
}
