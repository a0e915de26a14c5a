#include <exact-core/assert-handler.hh>
#include <exact-core/assert.hh>
#include <exact-core/u128.hh>

#include <nexus/test.hh>

#include <optional>
#include <string>
#include <vector>


TEST("assertions - failing assertion calls handler with correct payload")
{
    std::optional<ec::impl::assertion_info> captured;
    // CAREFUL: this is a bit brittle wrt. formatting but it should be fine
    int const test_line = __LINE__ + 11; // line where EC_ASSERT_ALWAYS is called

    {
        auto handler = ec::impl::scoped_assertion_handler(
            [&](ec::impl::assertion_info const& info)
            {
                captured = info;
                throw 0; // Must throw to prevent abort
            });
        try
        {
            EC_ASSERT_ALWAYS(false, "hello 42");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    REQUIRE(captured.has_value());

    CHECK(captured->expression.find("false") != std::string::npos);
    CHECK(captured->message == "hello 42");

    auto file_name = std::string(captured->location.file_name());
    CHECK(file_name.ends_with("assert-test.cc"));
    CHECK(captured->location.line() == test_line);
    CHECK(!std::string(captured->location.function_name()).empty());
}

TEST("assertions - passing assertion does not call handler")
{
    bool handler_called = false;

    {
        auto handler
            = ec::impl::scoped_assertion_handler([&](ec::impl::assertion_info const&) { handler_called = true; });
        EC_ASSERT_ALWAYS(true, "should not matter");
        EC_ASSERT(1 < 2, "should not matter either");
    }

    CHECK(!handler_called);
}

TEST("assertions - handler stack is LIFO and nesting works")
{
    std::vector<int> events;

    auto handler_a = ec::impl::scoped_assertion_handler(
        [&](ec::impl::assertion_info const&)
        {
            events.push_back(1);
            throw 0;
        });

    {
        auto handler_b = ec::impl::scoped_assertion_handler(
            [&](ec::impl::assertion_info const&)
            {
                events.push_back(2);
                throw 0;
            });

        try
        {
            EC_ASSERT_ALWAYS(false, "first failure");
        }
        catch (int) // NOLINT(bugprone-empty-catch)
        {
        }
    }

    try
    {
        EC_ASSERT_ALWAYS(false, "second failure");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(events.size() == 2);
    CHECK(events[0] == 2); // first failure hit handler B
    CHECK(events[1] == 1); // second failure hit handler A
}

TEST("assertions - contract violations report through the handler")
{
    std::vector<std::string> messages;

    auto handler = ec::impl::scoped_assertion_handler(
        [&](ec::impl::assertion_info const& info)
        {
            messages.push_back(info.message);
            throw 0;
        });

    auto const v = ec::u128(0, 10);

    try
    {
        (void)v.quo(ec::u128());
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    try
    {
        (void)v.bit(200);
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    REQUIRE(messages.size() == 2);
    CHECK(messages[0] == "division by zero");
    CHECK(messages[1] == "bit index must be in [0, 128)");
}

TEST("assertions - scoped_assertion_handler pops on scope exit even when handler throws")
{
    std::vector<int> events;
    bool outer_handler_works = false;

    auto outer = ec::impl::scoped_assertion_handler(
        [&](ec::impl::assertion_info const&)
        {
            events.push_back(1);
            outer_handler_works = true;
            throw 0;
        });

    struct sentinel_exception
    {
    };

    try
    {
        auto inner = ec::impl::scoped_assertion_handler(
            [&](ec::impl::assertion_info const&)
            {
                events.push_back(2);
                throw sentinel_exception{};
            });

        EC_ASSERT_ALWAYS(false, "trigger inner");
        CHECK(false); // should not reach here
    }
    catch (sentinel_exception const&)
    {
        // Expected: inner handler threw
    }

    REQUIRE(events.size() == 1);
    CHECK(events[0] == 2);

    outer_handler_works = false;
    try
    {
        EC_ASSERT_ALWAYS(false, "trigger outer");
    }
    catch (int) // NOLINT(bugprone-empty-catch)
    {
    }

    CHECK(outer_handler_works);
    REQUIRE(events.size() == 2);
    CHECK(events[1] == 1);
}
