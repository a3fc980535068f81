#include <gtest/gtest.h>
#include "feedweave/graph/source_graph_builder.hpp"
#include "common/test_sources.hpp"

using namespace feedweave;
using namespace feedweave::test_support;

// =============================================================================
// Test Fixture
// =============================================================================

class SourceGraphBuilderTests : public ::testing::Test
{
protected:
    SourceGraphBuilder builder;

    ScriptedSourcePtr add(const std::string& id, std::vector<std::string> deps = {})
    {
        auto source = make_scripted_source(id, std::move(deps), SourceCapability::FetchContext);
        builder.add_source(source);
        return source;
    }

    static std::vector<std::string> sorted_ids(const SourceGraph& graph)
    {
        std::vector<std::string> ids;
        for (const auto& source : graph.sorted)
        {
            ids.push_back(source->id());
        }
        return ids;
    }

    /**
     * @brief Run build() and return the thrown error's message.
     */
    std::string build_error_message()
    {
        try
        {
            builder.build();
        }
        catch (const GraphValidationError& e)
        {
            return e.what();
        }
        return {};
    }
};

// =============================================================================
// Registration
// =============================================================================

TEST_F(SourceGraphBuilderTests, AddSource_Null_Throws)
{
    EXPECT_THROW(builder.add_source(nullptr), FeedError);
}

TEST_F(SourceGraphBuilderTests, AddSource_DuplicateId_Throws)
{
    add("location");
    try
    {
        add("location");
        FAIL() << "Expected FeedError";
    }
    catch (const FeedError& e)
    {
        EXPECT_EQ(e.code(), FeedErrorCode::InvalidSource);
    }
}

TEST_F(SourceGraphBuilderTests, EmptyBuilder_BuildsEmptyGraph)
{
    SourceGraphPtr graph = builder.build();
    ASSERT_NE(graph, nullptr);
    EXPECT_EQ(graph->source_count(), 0u);
}

// =============================================================================
// Topological Order
// =============================================================================

TEST_F(SourceGraphBuilderTests, Build_PlacesDependenciesBeforeDependents)
{
    add("alert", {"weather"});
    add("weather", {"location"});
    add("location");

    SourceGraphPtr graph = builder.build();

    EXPECT_EQ(sorted_ids(*graph), (std::vector<std::string>{"location", "weather", "alert"}));
    for (const auto& source : graph->sorted)
    {
        for (const auto& dep : source->dependencies())
        {
            EXPECT_LT(graph->position.at(dep), graph->position.at(source->id()))
                << dep << " must precede " << source->id();
        }
    }
}

TEST_F(SourceGraphBuilderTests, Build_IndependentSources_KeepRegistrationOrder)
{
    add("c");
    add("a");
    add("b");

    EXPECT_EQ(sorted_ids(*builder.build()), (std::vector<std::string>{"c", "a", "b"}));
}

TEST_F(SourceGraphBuilderTests, Build_Diamond_EverySourceOnce)
{
    add("top", {"left", "right"});
    add("left", {"root"});
    add("right", {"root"});
    add("root");

    SourceGraphPtr graph = builder.build();

    EXPECT_EQ(sorted_ids(*graph), (std::vector<std::string>{"root", "left", "right", "top"}));
    EXPECT_EQ(graph->by_id.size(), 4u);
}

TEST_F(SourceGraphBuilderTests, Build_ReverseIndexListsDirectDependents)
{
    add("location");
    add("weather", {"location"});
    add("transit", {"location"});

    SourceGraphPtr graph = builder.build();

    EXPECT_EQ(graph->direct_dependents("location"), (std::vector<std::string>{"weather", "transit"}));
    EXPECT_TRUE(graph->direct_dependents("weather").empty());
    EXPECT_TRUE(graph->direct_dependents("unknown").empty());
}

// =============================================================================
// Transitive Dependents
// =============================================================================

TEST_F(SourceGraphBuilderTests, TransitiveDependents_InTopologicalOrder)
{
    add("location");
    add("alert", {"weather", "location"});
    add("weather", {"location"});
    add("calendar");

    SourceGraphPtr graph = builder.build();

    EXPECT_EQ(graph->transitive_dependents("location"), (std::vector<std::string>{"weather", "alert"}));
    EXPECT_EQ(graph->transitive_dependents("weather"), (std::vector<std::string>{"alert"}));
    EXPECT_TRUE(graph->transitive_dependents("calendar").empty());
}

// =============================================================================
// Validation Errors
// =============================================================================

TEST_F(SourceGraphBuilderTests, Build_MissingDependency_NamesBothSources)
{
    add("weather", {"location"});

    std::string message = build_error_message();

    EXPECT_NE(message.find("Source \"weather\" depends on \"location\" which is not registered"),
              std::string::npos) << message;
}

TEST_F(SourceGraphBuilderTests, Build_MissingDependency_CarriesCodeAndDiagnostics)
{
    add("weather", {"location"});

    try
    {
        builder.build();
        FAIL() << "Expected GraphValidationError";
    }
    catch (const GraphValidationError& e)
    {
        EXPECT_EQ(e.code(), FeedErrorCode::MissingDependency);
        ASSERT_NE(e.diagnostics(), nullptr);
        EXPECT_TRUE(e.diagnostics()->has_error(DiagnosticCategory::MissingDependency));
        EXPECT_EQ(e.diagnostics()->errors().front().involved_sources,
                  (std::vector<std::string>{"weather", "location"}));
    }
}

TEST_F(SourceGraphBuilderTests, Build_TwoCycle_ReportsPath)
{
    add("a", {"b"});
    add("b", {"a"});

    std::string message = build_error_message();

    EXPECT_NE(message.find("Circular dependency detected: a → b → a"), std::string::npos) << message;
}

TEST_F(SourceGraphBuilderTests, Build_ThreeCycle_ReportsPathInTraversalOrder)
{
    add("a", {"b"});
    add("b", {"c"});
    add("c", {"a"});

    try
    {
        builder.build();
        FAIL() << "Expected GraphValidationError";
    }
    catch (const GraphValidationError& e)
    {
        EXPECT_EQ(e.code(), FeedErrorCode::CycleDetected);
        EXPECT_NE(std::string(e.what()).find("Circular dependency detected: a → b → c → a"),
                  std::string::npos) << e.what();
        EXPECT_EQ(e.diagnostics()->errors().front().involved_sources,
                  (std::vector<std::string>{"a", "b", "c", "a"}));
    }
}

TEST_F(SourceGraphBuilderTests, Build_SelfDependency_IsCycle)
{
    add("loop", {"loop"});

    std::string message = build_error_message();

    EXPECT_NE(message.find("Circular dependency detected: loop → loop"), std::string::npos) << message;
}

TEST_F(SourceGraphBuilderTests, Build_CycleBehindValidSources_IsStillFound)
{
    add("location");
    add("x", {"location", "y"});
    add("y", {"x"});

    std::string message = build_error_message();

    EXPECT_NE(message.find("Circular dependency detected: x → y → x"), std::string::npos) << message;
}

// =============================================================================
// Diagnostics Without Throwing
// =============================================================================

TEST_F(SourceGraphBuilderTests, GetDiagnostics_ValidGraph_IsValid)
{
    add("location");
    add("weather", {"location"});

    auto diagnostics = builder.get_diagnostics();

    EXPECT_TRUE(diagnostics->is_valid());
    EXPECT_FALSE(diagnostics->has_warnings());
}

TEST_F(SourceGraphBuilderTests, GetDiagnostics_ReportsAllMissingDependencies)
{
    add("weather", {"location"});
    add("alert", {"weather", "calendar"});

    auto diagnostics = builder.get_diagnostics();

    EXPECT_FALSE(diagnostics->is_valid());
    EXPECT_EQ(diagnostics->errors().size(), 2u);
}

TEST_F(SourceGraphBuilderTests, GetDiagnostics_DuplicateDependency_IsWarningOnly)
{
    add("location");
    add("weather", {"location", "location"});

    auto diagnostics = builder.get_diagnostics();

    EXPECT_TRUE(diagnostics->is_valid());
    ASSERT_EQ(diagnostics->warnings().size(), 1u);
    EXPECT_EQ(diagnostics->warnings()[0].category, DiagnosticCategory::DuplicateDependency);
    EXPECT_NO_THROW(builder.build());
}
