#pragma once

#include <nlohmann/json.hpp>

#include "core/engine_types.h"

namespace advisor {

extern const char* const kStockAnalystSystemPrompt;
extern const char* const kPortfolioSystemPrompt;

/// 銘柄データ（取得済みのもの）から分析サマリー用のリクエストを組み立てる
GenerationRequest buildStockAnalysisRequest(const nlohmann::json& stock,
                                            const InferenceParams& params = {});

/// ポートフォリオのリスク評価/改善提案用
GenerationRequest buildPortfolioSummaryRequest(const nlohmann::json& portfolio,
                                               const InferenceParams& params = {});

}  // namespace advisor
