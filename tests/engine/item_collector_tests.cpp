#include <gtest/gtest.h>
#include "feedweave/engine/item_collector.hpp"
#include "feedweave/graph/source_graph_builder.hpp"
#include "common/test_sources.hpp"
#include <thread>

using namespace feedweave;
using namespace feedweave::test_support;
using namespace std::chrono_literals;

// =============================================================================
// Test Fixture
// =============================================================================

/**
 * @brief Builds graphs of item producers with scripted delays.
 *
 * @details
 * A timed-out call keeps its worker until it returns; the runner joins it when
 * the fixture is torn down.
 */
class ItemCollectorTests : public ::testing::Test
{
protected:
    SourceCallRunner runner;
    SourceGraphBuilder builder;
    Context context{TimePoint{std::chrono::seconds(1000)}};

    ScriptedSourcePtr add_producer(const std::string& id,
                                   std::vector<std::string> item_ids,
                                   std::chrono::milliseconds delay = 0ms,
                                   std::vector<std::string> deps = {})
    {
        auto source = make_scripted_source(id, std::move(deps), SourceCapability::FetchItems);
        source->fetch_items_fn = [item_ids, delay](const Context&)
        {
            if (delay > 0ms)
            {
                std::this_thread::sleep_for(delay);
            }
            std::vector<FeedItem> items;
            for (const auto& item_id : item_ids)
            {
                items.push_back(make_item(item_id));
            }
            return items;
        };
        builder.add_source(source);
        return source;
    }

    ScriptedSourcePtr add_failing(const std::string& id)
    {
        auto source = make_scripted_source(id, {}, SourceCapability::FetchItems);
        source->fetch_items_fn = [](const Context&) -> std::vector<FeedItem>
        {
            throw std::runtime_error("upstream unavailable");
        };
        builder.add_source(source);
        return source;
    }
};

// =============================================================================
// Sequential Collection
// =============================================================================

TEST_F(ItemCollectorTests, Sequential_ConcatenatesInTopologicalOrder)
{
    add_producer("calendar", {"c1", "c2"}, 0ms, {"location"});
    add_producer("location", {"l1"});
    auto graph = builder.build();

    SequentialItemCollector collector{runner};
    CollectionResult result = collector.collect(*graph, context);

    EXPECT_EQ(item_ids(result.items), (std::vector<std::string>{"l1", "c1", "c2"}));
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ItemCollectorTests, Sequential_SkipsSourcesWithoutFetchItems)
{
    auto context_only = make_scripted_source("location", {}, SourceCapability::FetchContext);
    builder.add_source(context_only);
    add_producer("weather", {"w1"});
    auto graph = builder.build();

    SequentialItemCollector collector{runner};
    CollectionResult result = collector.collect(*graph, context);

    EXPECT_EQ(context_only->fetch_items_calls.load(), 0);
    EXPECT_EQ(item_ids(result.items), (std::vector<std::string>{"w1"}));
}

TEST_F(ItemCollectorTests, Sequential_FailureIsolatedToOneSource)
{
    add_producer("weather", {"w1"});
    add_failing("transit");
    add_producer("calendar", {"c1"});
    auto graph = builder.build();

    SequentialItemCollector collector{runner};
    CollectionResult result = collector.collect(*graph, context);

    EXPECT_EQ(item_ids(result.items), (std::vector<std::string>{"w1", "c1"}));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].source_id, "transit");
    EXPECT_EQ(result.errors[0].message, "upstream unavailable");
}

TEST_F(ItemCollectorTests, Sequential_PassesFinalContextToEveryProducer)
{
    auto source = make_scripted_source("weather", {}, SourceCapability::FetchItems);
    TimePoint seen{};
    source->fetch_items_fn = [&seen](const Context& ctx)
    {
        seen = ctx.time();
        return std::vector<FeedItem>{};
    };
    builder.add_source(source);
    auto graph = builder.build();

    SequentialItemCollector collector{runner};
    collector.collect(*graph, context);

    EXPECT_EQ(seen, context.time());
}

TEST_F(ItemCollectorTests, Sequential_Timeout_RecordsSourceTimeout)
{
    add_producer("slow", {"s1"}, 500ms);
    add_producer("fast", {"f1"});
    auto graph = builder.build();

    SequentialItemCollector collector{runner, CollectorConfig{50ms, false}};
    CollectionResult result = collector.collect(*graph, context);

    EXPECT_EQ(item_ids(result.items), (std::vector<std::string>{"f1"}));
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].source_id, "slow");
    EXPECT_EQ(result.errors[0].message, "Source \"slow\" timed out after 50ms");
    try
    {
        std::rethrow_exception(result.errors[0].error);
    }
    catch (const FeedError& e)
    {
        EXPECT_EQ(e.code(), FeedErrorCode::SourceTimeout);
    }
}

// =============================================================================
// Concurrent Collection
// =============================================================================

TEST_F(ItemCollectorTests, Concurrent_OrderIndependentOfCompletion)
{
    add_producer("first", {"a1", "a2"}, 120ms);
    add_producer("second", {"b1"}, 10ms);
    add_producer("third", {"c1"});
    auto graph = builder.build();

    ConcurrentItemCollector collector{runner, CollectorConfig{2000ms, true}};
    CollectionResult result = collector.collect(*graph, context);

    EXPECT_EQ(item_ids(result.items), (std::vector<std::string>{"a1", "a2", "b1", "c1"}));
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(ItemCollectorTests, Concurrent_RunsProducersInParallel)
{
    add_producer("one", {"1"}, 200ms);
    add_producer("two", {"2"}, 200ms);
    add_producer("three", {"3"}, 200ms);
    auto graph = builder.build();

    ConcurrentItemCollector collector{runner, CollectorConfig{0ms, true}};
    auto start = std::chrono::steady_clock::now();
    CollectionResult result = collector.collect(*graph, context);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.items.size(), 3u);
    EXPECT_LT(elapsed, 550ms);
}

TEST_F(ItemCollectorTests, Concurrent_TimeoutOnlyAffectsSlowSource)
{
    add_producer("fast", {"f1"});
    add_producer("slow", {"s1"}, 1000ms);
    add_failing("broken");
    auto graph = builder.build();

    ConcurrentItemCollector collector{runner, CollectorConfig{100ms, true}};
    CollectionResult result = collector.collect(*graph, context);

    EXPECT_EQ(item_ids(result.items), (std::vector<std::string>{"f1"}));
    ASSERT_EQ(result.errors.size(), 2u);
    EXPECT_EQ(result.errors[0].source_id, "slow");
    EXPECT_EQ(result.errors[0].message, "Source \"slow\" timed out after 100ms");
    EXPECT_EQ(result.errors[1].source_id, "broken");
}

TEST_F(ItemCollectorTests, Concurrent_SourceStillRunning_IsNotCalledAgain)
{
    auto slow = add_producer("slow", {"s1"}, 400ms);
    add_producer("fast", {"f1"});
    auto graph = builder.build();

    ConcurrentItemCollector collector{runner, CollectorConfig{50ms, true}};
    collector.collect(*graph, context);
    CollectionResult second = collector.collect(*graph, context);

    EXPECT_EQ(slow->fetch_items_calls.load(), 1);
    EXPECT_EQ(item_ids(second.items), (std::vector<std::string>{"f1"}));
    ASSERT_EQ(second.errors.size(), 1u);
    EXPECT_EQ(second.errors[0].message, "Source \"slow\" is still running a previous call");
}

// =============================================================================
// Factory
// =============================================================================

TEST(MakeItemCollectorTests, PicksImplementationFromConfig)
{
    SourceCallRunner runner;
    auto sequential = make_item_collector(runner, CollectorConfig{});
    auto concurrent = make_item_collector(runner, CollectorConfig{0ms, true});

    EXPECT_NE(dynamic_cast<SequentialItemCollector*>(sequential.get()), nullptr);
    EXPECT_NE(dynamic_cast<ConcurrentItemCollector*>(concurrent.get()), nullptr);
}
