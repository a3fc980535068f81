#include <gtest/gtest.h>
#include "feedweave/engine/action_dispatcher.hpp"
#include "common/test_sources.hpp"

using namespace feedweave;
using namespace feedweave::test_support;

// =============================================================================
// Test Fixture
// =============================================================================

class ActionDispatcherTests : public ::testing::Test
{
protected:
    SourceRegistry registry;
    ActionDispatcher dispatcher{registry};
    ScriptedSourcePtr calendar;

    void SetUp() override
    {
        calendar = make_scripted_source("calendar", {},
            SourceCapability::FetchItems | SourceCapability::Actions);
        calendar->actions.emplace("dismiss-event", ActionDefinition{
            "dismiss-event",
            "Hide an event from the feed",
            [](const Datum& params)
            {
                if (!params.has_type<std::string>())
                {
                    throw std::invalid_argument("expected an event id");
                }
            }});
        calendar->actions.emplace("snooze", ActionDefinition{"snooze", "", nullptr});
        calendar->execute_fn = [](const std::string& action_id, const Datum& params) -> Datum
        {
            if (action_id == "dismiss-event")
            {
                return Datum::of("dismissed " + params.as<std::string>());
            }
            if (action_id == "snooze")
            {
                return Datum{};
            }
            throw UnknownActionError(action_id);
        };
        registry.insert(calendar);
    }

    static FeedErrorCode code_of(const std::function<void()>& fn)
    {
        try
        {
            fn();
        }
        catch (const FeedError& e)
        {
            return e.code();
        }
        ADD_FAILURE() << "Expected FeedError";
        return FeedErrorCode::UnknownAction;
    }
};

// =============================================================================
// list_actions
// =============================================================================

TEST_F(ActionDispatcherTests, ListActions_ReturnsSourceActions)
{
    ActionMap actions = dispatcher.list_actions("calendar");
    EXPECT_EQ(actions.size(), 2u);
    EXPECT_EQ(actions.at("dismiss-event").description, "Hide an event from the feed");
}

TEST_F(ActionDispatcherTests, ListActions_UnknownSource_ThrowsSourceNotFound)
{
    EXPECT_EQ(code_of([this] { dispatcher.list_actions("nope"); }), FeedErrorCode::SourceNotFound);
}

TEST_F(ActionDispatcherTests, ListActions_KeyIdMismatch_Throws)
{
    calendar->actions.emplace("rename", ActionDefinition{"rename-event", "", nullptr});

    try
    {
        dispatcher.list_actions("calendar");
        FAIL() << "Expected FeedError";
    }
    catch (const FeedError& e)
    {
        EXPECT_EQ(e.code(), FeedErrorCode::ActionIdMismatch);
        EXPECT_NE(std::string(e.what()).find("key \"rename\""), std::string::npos) << e.what();
        EXPECT_NE(std::string(e.what()).find("\"rename-event\""), std::string::npos) << e.what();
    }
}

TEST_F(ActionDispatcherTests, ListActions_WithoutActionsCapability_IsEmpty)
{
    auto weather = make_scripted_source("weather", {}, SourceCapability::FetchItems);
    weather->actions.emplace("refresh", ActionDefinition{"refresh", "", nullptr});
    registry.insert(weather);

    EXPECT_TRUE(dispatcher.list_actions("weather").empty());
}

// =============================================================================
// execute_action
// =============================================================================

TEST_F(ActionDispatcherTests, Execute_RoutesToSourceAndReturnsResult)
{
    Datum result = dispatcher.execute_action("calendar", "dismiss-event", Datum::of(std::string("e42")));

    EXPECT_EQ(result.as<std::string>(), "dismissed e42");
    EXPECT_EQ(calendar->execute_calls.load(), 1);
}

TEST_F(ActionDispatcherTests, Execute_WithoutValidator_PassesAnyInput)
{
    Datum result = dispatcher.execute_action("calendar", "snooze", Datum::of(5));

    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(calendar->execute_calls.load(), 1);
}

TEST_F(ActionDispatcherTests, Execute_UnknownSource_DoesNotTouchAnySource)
{
    EXPECT_EQ(code_of([this] { dispatcher.execute_action("nope", "dismiss-event", {}); }),
              FeedErrorCode::SourceNotFound);
    EXPECT_EQ(calendar->execute_calls.load(), 0);
}

TEST_F(ActionDispatcherTests, Execute_UnknownAction_DoesNotTouchSource)
{
    try
    {
        dispatcher.execute_action("calendar", "teleport", {});
        FAIL() << "Expected FeedError";
    }
    catch (const FeedError& e)
    {
        EXPECT_EQ(e.code(), FeedErrorCode::ActionNotFound);
        EXPECT_STREQ(e.what(), "Action \"teleport\" not found on source \"calendar\"");
    }
    EXPECT_EQ(calendar->execute_calls.load(), 0);
}

TEST_F(ActionDispatcherTests, Execute_RejectedInput_DoesNotTouchSource)
{
    EXPECT_EQ(code_of([this] { dispatcher.execute_action("calendar", "dismiss-event", Datum::of(7)); }),
              FeedErrorCode::InvalidActionInput);
    EXPECT_EQ(calendar->execute_calls.load(), 0);
}

TEST_F(ActionDispatcherTests, Execute_SourceFailure_Propagates)
{
    calendar->execute_fn = [](const std::string&, const Datum&) -> Datum
    {
        throw std::runtime_error("calendar backend offline");
    };

    EXPECT_THROW(dispatcher.execute_action("calendar", "snooze", {}), std::runtime_error);
}

TEST_F(ActionDispatcherTests, Execute_ActionsCapabilityMissing_IsActionNotFound)
{
    auto weather = make_scripted_source("weather", {}, SourceCapability::FetchItems);
    registry.insert(weather);

    EXPECT_EQ(code_of([this] { dispatcher.execute_action("weather", "refresh", {}); }),
              FeedErrorCode::ActionNotFound);
    EXPECT_EQ(weather->execute_calls.load(), 0);
}

// =============================================================================
// Source Defaults
// =============================================================================

TEST(FeedSourceDefaultsTests, ExecuteAction_DefaultThrowsUnknownActionError)
{
    auto source = make_scripted_source("plain", {}, SourceCapability::Actions);
    try
    {
        source->execute_action("anything", {});
        FAIL() << "Expected UnknownActionError";
    }
    catch (const UnknownActionError& e)
    {
        EXPECT_EQ(e.action_id(), "anything");
        EXPECT_EQ(e.code(), FeedErrorCode::UnknownAction);
    }
}

TEST(FeedSourceDefaultsTests, UndeclaredCapability_DefaultThrowsCapabilityNotSupported)
{
    class ContextOnly : public IFeedSource
    {
    public:
        const std::string& id() const override { return m_id; }
        SourceCapability capabilities() const override { return SourceCapability::FetchContext; }

    private:
        std::string m_id{"context-only"};
    };

    ContextOnly source;
    try
    {
        source.fetch_items(Context{});
        FAIL() << "Expected FeedError";
    }
    catch (const FeedError& e)
    {
        EXPECT_EQ(e.code(), FeedErrorCode::CapabilityNotSupported);
    }
}

// =============================================================================
// Registry
// =============================================================================

TEST(SourceRegistryTests, Insert_RejectsInvalidSources)
{
    SourceRegistry registry;
    EXPECT_THROW(registry.insert(nullptr), FeedError);
    EXPECT_THROW(registry.insert(make_scripted_source("", {}, SourceCapability::FetchItems)), FeedError);
    EXPECT_THROW(registry.insert(make_scripted_source("idle", {}, SourceCapability::None)), FeedError);
    EXPECT_EQ(registry.size(), 0u);
}

TEST(SourceRegistryTests, Insert_SameId_ReplacesInPlace)
{
    SourceRegistry registry;
    registry.insert(make_scripted_source("a", {}, SourceCapability::FetchItems));
    registry.insert(make_scripted_source("b", {}, SourceCapability::FetchItems));
    auto replacement = make_scripted_source("a", {}, SourceCapability::FetchContext);

    SourcePtr replaced = registry.insert(replacement);

    EXPECT_NE(replaced, nullptr);
    ASSERT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.sources()[0], replacement);
    EXPECT_EQ(registry.sources()[1]->id(), "b");
}

TEST(SourceRegistryTests, Version_ChangesOnEveryMutation)
{
    SourceRegistry registry;
    uint64_t v0 = registry.version();
    registry.insert(make_scripted_source("a", {}, SourceCapability::FetchItems));
    uint64_t v1 = registry.version();
    EXPECT_EQ(registry.remove("missing"), nullptr);
    EXPECT_EQ(registry.version(), v1);
    EXPECT_NE(registry.remove("a"), nullptr);

    EXPECT_NE(v0, v1);
    EXPECT_NE(registry.version(), v1);
}
