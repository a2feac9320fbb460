#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include "core/advisor_prompts.h"

using namespace advisor;

TEST(AdvisorPromptsTest, StockRequestPutsSystemPromptFirst) {
    nlohmann::json stock = {{"code", "7203"}, {"name", "トヨタ自動車"}, {"per", 9.8}};

    auto request = buildStockAnalysisRequest(stock);

    ASSERT_EQ(request.messages.size(), 2u);
    EXPECT_EQ(request.messages[0].role, "system");
    EXPECT_EQ(request.messages[0].content, kStockAnalystSystemPrompt);
    EXPECT_EQ(request.messages[1].role, "user");
}

TEST(AdvisorPromptsTest, StockDataIsPrettyPrintedWithoutEscaping) {
    nlohmann::json stock = {{"name", "トヨタ自動車"}};

    auto request = buildStockAnalysisRequest(stock);
    const std::string& user = request.messages[1].content;

    EXPECT_EQ(user.rfind("以下の銘柄データを分析し、投資家向けのサマリーを作成してください:\n\n", 0), 0u);
    EXPECT_NE(user.find("\"name\": \"トヨタ自動車\""), std::string::npos);
    EXPECT_EQ(user.find("\\u"), std::string::npos);
    EXPECT_NE(user.find("{\n  \"name\""), std::string::npos);
}

TEST(AdvisorPromptsTest, StockSystemPromptNamesThreeSections) {
    const std::string prompt = kStockAnalystSystemPrompt;
    EXPECT_NE(prompt.find("### 投資判断サマリー"), std::string::npos);
    EXPECT_NE(prompt.find("### リスク要因"), std::string::npos);
    EXPECT_NE(prompt.find("### 注目ポイント"), std::string::npos);
}

TEST(AdvisorPromptsTest, PortfolioRequestUsesPortfolioPrompt) {
    nlohmann::json portfolio = {{"holdings", nlohmann::json::array({{{"code", "6758"}, {"weight", 0.4}}})}};

    InferenceParams params;
    params.temperature = 0.0f;
    auto request = buildPortfolioSummaryRequest(portfolio, params);

    ASSERT_EQ(request.messages.size(), 2u);
    EXPECT_EQ(request.messages[0].content, kPortfolioSystemPrompt);
    EXPECT_EQ(request.messages[1].content.rfind(
                  "以下のポートフォリオデータを分析し、リスク評価と改善提案を作成してください:\n\n", 0),
              0u);
    EXPECT_FLOAT_EQ(request.params.temperature, 0.0f);
}
