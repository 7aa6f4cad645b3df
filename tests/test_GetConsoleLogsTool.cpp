#include <gtest/gtest.h>
#include <stdexcept>
#include "services/ConsoleLogsService.h"
#include "tools/GetConsoleLogsTool.h"
#include "tools/ToolRegistry.h"
#include "tools/ToolResponse.h"

namespace {
    // Records the arguments it was called with and answers with canned counts
    class FakeLogsService : public IConsoleLogsService {
    public:
        std::optional<std::string> lastType;
        int lastOffset = -1;
        int lastLimit = -1;
        bool lastIncludeStackTrace = false;
        int calls = 0;

        int total = 0;
        int filtered = 0;
        int returned = 0;
        bool fail = false;

        nlohmann::json getLogsAsJson(const std::optional<std::string>& logType,
                                     int offset, int limit, bool includeStackTrace) override {
            ++calls;
            lastType = logType;
            lastOffset = offset;
            lastLimit = limit;
            lastIncludeStackTrace = includeStackTrace;
            if (fail) throw std::runtime_error("log buffer unavailable");

            nlohmann::json logs = nlohmann::json::array();
            for (int i = 0; i < returned; ++i) {
                logs.push_back({{"message", "entry " + std::to_string(i)}, {"type", logType.value_or("info")}});
            }
            return {
                {"logs", logs},
                {"_totalCount", total},
                {"_filteredCount", filtered},
                {"_returnedCount", returned}
            };
        }
    };
}

TEST(GetConsoleLogsToolTest, DefaultsWhenParamsMissing) {
    FakeLogsService service;
    GetConsoleLogsTool tool(service);

    auto result = tool.execute(nlohmann::json::object());
    EXPECT_TRUE(ToolResponse::isSuccess(result));
    EXPECT_FALSE(service.lastType.has_value());
    EXPECT_EQ(service.lastOffset, 0);
    EXPECT_EQ(service.lastLimit, 50);
    EXPECT_TRUE(service.lastIncludeStackTrace);
    EXPECT_EQ(result["message"],
              "Retrieved 0 of 0 log entries (offset: 0, limit: 50, includeStackTrace: true, total: 0)");
}

TEST(GetConsoleLogsToolTest, ClampsOffsetAndLimit) {
    FakeLogsService service;
    GetConsoleLogsTool tool(service);

    tool.execute({{"offset", -5}, {"limit", 10000}});
    EXPECT_EQ(service.lastOffset, 0);
    EXPECT_EQ(service.lastLimit, 500);

    tool.execute({{"limit", 0}});
    EXPECT_EQ(service.lastLimit, 1);

    tool.execute({{"limit", -20}, {"offset", "7"}});
    EXPECT_EQ(service.lastLimit, 1);
    EXPECT_EQ(service.lastOffset, 7);
}

TEST(GetConsoleLogsToolTest, UnparsableValuesFallBackToDefaults) {
    FakeLogsService service;
    GetConsoleLogsTool tool(service);

    tool.execute({{"offset", "abc"}, {"limit", 2.5}, {"includeStackTrace", "maybe"}, {"logType", "  "}});
    EXPECT_EQ(service.lastOffset, 0);
    EXPECT_EQ(service.lastLimit, 50);
    EXPECT_TRUE(service.lastIncludeStackTrace);
    EXPECT_FALSE(service.lastType.has_value());
}

TEST(GetConsoleLogsToolTest, FilteredPageMessageAndShape) {
    FakeLogsService service;
    service.total = 50;
    service.filtered = 3;
    service.returned = 3;
    GetConsoleLogsTool tool(service);

    auto result = tool.execute({{"logType", "error"}, {"limit", 10}});

    EXPECT_EQ(service.lastType, std::optional<std::string>("error"));
    EXPECT_EQ(result["success"], true);
    EXPECT_EQ(result["logs"].size(), 3u);
    EXPECT_EQ(result["message"],
              "Retrieved 3 of 3 log entries of type 'error' (offset: 0, limit: 10, includeStackTrace: true, total: 50)");
    EXPECT_FALSE(result.contains("_totalCount"));
    EXPECT_FALSE(result.contains("_filteredCount"));
    EXPECT_FALSE(result.contains("_returnedCount"));
}

TEST(GetConsoleLogsToolTest, StackTraceFlagIsForwardedAndReported) {
    FakeLogsService service;
    GetConsoleLogsTool tool(service);

    auto result = tool.execute({{"includeStackTrace", "False"}, {"offset", 20}, {"limit", 5}});
    EXPECT_FALSE(service.lastIncludeStackTrace);
    EXPECT_EQ(result["message"],
              "Retrieved 0 of 0 log entries (offset: 20, limit: 5, includeStackTrace: false, total: 0)");
}

TEST(GetConsoleLogsToolTest, ServiceFailureBecomesErrorResponse) {
    FakeLogsService service;
    service.fail = true;
    GetConsoleLogsTool tool(service);

    auto result = tool.execute(nlohmann::json::object());
    EXPECT_EQ(result["success"], false);
    EXPECT_EQ(result["errorCode"], ToolResponse::kToolExecutionError);
    EXPECT_EQ(result["errorMessage"], "Failed to get console logs: log buffer unavailable");
}

TEST(GetConsoleLogsToolTest, WorksThroughRegistryWithRealService) {
    ConsoleLogsService service;
    service.record("error", "NullReferenceException", "at Player.Update()");
    service.record("info", "Domain reload");
    service.record("error", "Missing script");

    ToolRegistry registry;
    registry.registerTool(std::make_unique<GetConsoleLogsTool>(service));

    auto result = registry.dispatch({
        {"method", "get_console_logs"},
        {"params", {{"logType", "error"}, {"limit", 1}, {"includeStackTrace", false}}}
    });

    ASSERT_TRUE(ToolResponse::isSuccess(result));
    ASSERT_EQ(result["logs"].size(), 1u);
    EXPECT_EQ(result["logs"][0]["message"], "Missing script");
    EXPECT_FALSE(result["logs"][0].contains("stackTrace"));
    EXPECT_EQ(result["message"],
              "Retrieved 1 of 2 log entries of type 'error' (offset: 0, limit: 1, includeStackTrace: false, total: 3)");
}
