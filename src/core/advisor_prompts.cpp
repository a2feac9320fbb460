#include "core/advisor_prompts.h"

#include <string>
#include <utility>

namespace advisor {

const char* const kStockAnalystSystemPrompt =
    "あなたは株式投資のアナリストです。\n"
    "提供された財務データに基づいて、投資判断に役立つサマリーを日本語で作成してください。\n"
    "\n"
    "出力形式（必ず以下の3つの見出しを ### で始めること）:\n"
    "### 投資判断サマリー\n"
    "### リスク要因\n"
    "### 注目ポイント\n"
    "\n"
    "ルール:\n"
    "- 提供されたデータのみに基づいて分析すること\n"
    "- 投資助言ではなく、情報提供であることを明示すること\n"
    "- ポジティブ/ネガティブ両面をバランスよく記述すること\n"
    "- 専門用語を使う場合は簡潔な説明を添えること";

const char* const kPortfolioSystemPrompt =
    "あなたは資産運用の専門家です。\n"
    "提供されたポートフォリオデータに基づき、リスクと分散の観点からサマリーを日本語で作成してください。\n"
    "投資助言ではなく情報提供であることを明示してください。";

namespace {

// 非ASCIIはエスケープせずそのまま（不正なUTF-8は置換）
std::string prettyJson(const nlohmann::json& data) {
    return data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

GenerationRequest makeRequest(const char* system, std::string prompt, const InferenceParams& params) {
    GenerationRequest request;
    request.params = params;
    request.messages.push_back({"system", system});
    request.messages.push_back({"user", std::move(prompt)});
    return request;
}

}  // namespace

GenerationRequest buildStockAnalysisRequest(const nlohmann::json& stock, const InferenceParams& params) {
    return makeRequest(kStockAnalystSystemPrompt,
                       "以下の銘柄データを分析し、投資家向けのサマリーを作成してください:\n\n" +
                           prettyJson(stock),
                       params);
}

GenerationRequest buildPortfolioSummaryRequest(const nlohmann::json& portfolio, const InferenceParams& params) {
    return makeRequest(kPortfolioSystemPrompt,
                       "以下のポートフォリオデータを分析し、リスク評価と改善提案を作成してください:\n\n" +
                           prettyJson(portfolio),
                       params);
}

}  // namespace advisor
