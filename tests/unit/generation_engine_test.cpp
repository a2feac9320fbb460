#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "core/engine_error.h"
#include "core/generation_engine.h"
#include "utils/utf8.h"

using namespace advisor;
using namespace std::chrono_literals;

namespace {

struct ScriptState {
    std::vector<std::string> pieces;
    std::chrono::milliseconds delay_before_last{0};
    bool throw_after_first{false};
    std::atomic<bool> finished{false};
    std::atomic<int> pieces_offered{0};
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};
};

class ScriptedHandle : public ModelHandle {
public:
    explicit ScriptedHandle(std::shared_ptr<ScriptState> state) : state_(std::move(state)) {}

    const ModelIdentifier& modelId() const override { return id_; }
    uint64_t deviceMemoryBytes() const override { return 0; }

    void generate(const std::vector<ChatMessage>&,
                  const InferenceParams&,
                  const PieceCallback& on_piece) override {
        struct Done {
            ScriptState& s;
            ~Done() {
                --s.active;
                s.finished = true;
            }
        } done{*state_};
        const int now_active = ++state_->active;
        int seen = state_->max_active.load();
        while (now_active > seen && !state_->max_active.compare_exchange_weak(seen, now_active)) {
        }

        for (size_t i = 0; i < state_->pieces.size(); ++i) {
            if (i + 1 == state_->pieces.size() && state_->delay_before_last.count() > 0) {
                std::this_thread::sleep_for(state_->delay_before_last);
            }
            ++state_->pieces_offered;
            if (!on_piece(state_->pieces[i])) return;
            if (state_->throw_after_first) {
                throw GenerationError("decode failed");
            }
        }
    }

private:
    std::string id_{"scripted"};
    std::shared_ptr<ScriptState> state_;
};

std::shared_ptr<ScriptState> script(std::vector<std::string> pieces) {
    auto s = std::make_shared<ScriptState>();
    s->pieces = std::move(pieces);
    return s;
}

bool isValidUtf8(const std::string& text) {
    return sanitize_utf8_lossy(text) == text;
}

bool waitFinished(const ScriptState& s) {
    for (int i = 0; i < 500 && !s.finished.load(); ++i) std::this_thread::sleep_for(5ms);
    return s.finished.load();
}

GenerationRequest request() {
    GenerationRequest req;
    req.messages.push_back({"user", "hi"});
    return req;
}

}  // namespace

TEST(PostProcessTest, StripsThinkBlocksControlTokensAndWhitespace) {
    EXPECT_EQ(postProcessGeneratedText("<think>\nplan\n</think>\n\nAnswer<|im_end|>"), "Answer");
    EXPECT_EQ(postProcessGeneratedText("  plain text \n"), "plain text");
    EXPECT_EQ(postProcessGeneratedText("A<think>hidden</think>B"), "AB");
}

TEST(PostProcessTest, HidesUnclosedThinkingAndLeadingCloseTag) {
    EXPECT_EQ(postProcessGeneratedText("Visible <think>still thinking"), "Visible");
    EXPECT_EQ(postProcessGeneratedText("reasoning</think>\n\nFinal"), "Final");
}

TEST(GenerationEngineTest, BlockingGenerateConcatenatesAndPostProcesses) {
    GenerationEngine engine;
    ScriptedHandle handle(script({"<think>", "</think>", "\n\n", "株価", "は", "上昇"}));
    EXPECT_EQ(engine.generate(handle, request()), "株価は上昇");
}

TEST(GenerationEngineTest, BlockingGenerateConvertsExceptionToEmpty) {
    GenerationEngine engine;
    auto s = script({"partial", "more"});
    s->throw_after_first = true;
    ScriptedHandle handle(s);
    EXPECT_EQ(engine.generate(handle, request()), "");
}

TEST(GenerationEngineTest, StreamSnapshotsAreCumulativeAndFinalMatchesBlocking) {
    GenerationEngine engine;
    auto pieces = std::vector<std::string>{"<think>", "\n", "</think>", "\n\n", "Rev", "enue", " grew", "."};
    auto handle = std::make_shared<ScriptedHandle>(script(pieces));

    auto snapshots = engine.streamGenerate(handle, request());
    ASSERT_FALSE(snapshots.empty());
    for (size_t i = 1; i < snapshots.size(); ++i) {
        EXPECT_GT(snapshots[i].size(), snapshots[i - 1].size());
        EXPECT_EQ(snapshots[i].compare(0, snapshots[i - 1].size(), snapshots[i - 1]), 0);
    }
    ScriptedHandle blocking(script(pieces));
    EXPECT_EQ(snapshots.back(), engine.generate(blocking, request()));
    EXPECT_EQ(snapshots.back(), "Revenue grew.");
}

TEST(GenerationEngineTest, BlockingGenerateReplacesInvalidUtf8) {
    GenerationEngine engine;
    ScriptedHandle handle(script({"ok", "\xFF", "!"}));
    EXPECT_EQ(engine.generate(handle, request()), "ok\xEF\xBF\xBD!");
}

TEST(GenerationEngineTest, StreamHoldsBackMultibyteCharactersSplitAcrossPieces) {
    GenerationEngine engine;
    const std::string text = "株価は上昇";
    std::vector<std::string> pieces;
    for (char byte : text) {
        pieces.emplace_back(1, byte);
    }
    auto handle = std::make_shared<ScriptedHandle>(script(pieces));

    auto snapshots = engine.streamGenerate(handle, request());
    ASSERT_EQ(snapshots.size(), 5u);
    for (const auto& snapshot : snapshots) {
        EXPECT_TRUE(isValidUtf8(snapshot));
        EXPECT_EQ(snapshot.find("\xEF\xBF\xBD"), std::string::npos);
    }
    EXPECT_EQ(snapshots.front(), "株");
    EXPECT_EQ(snapshots[1], "株価");
    EXPECT_EQ(snapshots.back(), text);
}

TEST(GenerationEngineTest, StreamDoesNotExposeTagFragments) {
    GenerationEngine engine;
    auto pieces = std::vector<std::string>{"Hello ", "<th", "ink>", "plan", "</think>", " world"};
    auto handle = std::make_shared<ScriptedHandle>(script(pieces));

    auto snapshots = engine.streamGenerate(handle, request());
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots.front(), "Hello");
    for (const auto& snapshot : snapshots) {
        EXPECT_EQ(snapshot.find('<'), std::string::npos);
    }
    ScriptedHandle blocking(script(pieces));
    EXPECT_EQ(snapshots.back(), engine.generate(blocking, request()));
}

TEST(GenerationEngineTest, FinalSnapshotWinsWhenLateCloseTagHidesEarlierText) {
    GenerationEngine engine;
    // 開始タグなしの閉じタグで、先に流した暫定テキストが思考だったと分かる
    auto pieces = std::vector<std::string>{"draft text", "</think>", "Ok"};
    auto handle = std::make_shared<ScriptedHandle>(script(pieces));

    auto snapshots = engine.streamGenerate(handle, request());
    ASSERT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots.front(), "draft text");
    ScriptedHandle blocking(script(pieces));
    EXPECT_EQ(engine.generate(blocking, request()), "Ok");
    EXPECT_EQ(snapshots.back(), "Ok");
}

TEST(GenerationEngineTest, StreamWithNoVisibleTextYieldsNothing) {
    GenerationEngine engine;
    auto handle = std::make_shared<ScriptedHandle>(script({"<think>", "only thoughts"}));
    EXPECT_TRUE(engine.streamGenerate(handle, request()).empty());
}

TEST(GenerationEngineTest, StreamFailureStopsWithoutFurtherSnapshots) {
    GenerationEngine engine;
    auto s = script({"first", " second"});
    s->throw_after_first = true;
    auto handle = std::make_shared<ScriptedHandle>(s);

    auto snapshots = engine.streamGenerate(handle, request());
    ASSERT_LE(snapshots.size(), 1u);
    if (!snapshots.empty()) {
        EXPECT_EQ(snapshots.front(), "first");
    }
}

TEST(GenerationEngineTest, ConsumerCanStopEarly) {
    GenerationEngine engine;
    auto s = script({"a", "b", "c", "d", "e"});
    auto handle = std::make_shared<ScriptedHandle>(s);

    int seen = 0;
    auto snapshots = engine.streamGenerate(handle, request(), [&](const std::string&) {
        return ++seen < 2;
    });
    EXPECT_EQ(snapshots.size(), 2u);
    EXPECT_EQ(snapshots.back(), "ab");
    // 生産者はキャンセルを検知して終了する
    ASSERT_TRUE(waitFinished(*s));
}

TEST(GenerationEngineTest, StalledProducerIsAbandonedAfterTimeout) {
    GenerationEngineOptions options;
    options.abandon_timeout = 100ms;
    GenerationEngine engine(options);

    auto s = script({"quick", " stalled"});
    s->delay_before_last = 600ms;
    auto handle = std::make_shared<ScriptedHandle>(s);

    auto start = std::chrono::steady_clock::now();
    auto snapshots = engine.streamGenerate(handle, request());
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, 500ms);
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots.front(), "quick");

    // 放棄された生産者は次の増分で停止し、ハンドルは共有所有で生きている
    EXPECT_TRUE(waitFinished(*s));
    EXPECT_EQ(s->pieces_offered.load(), 2);
}

TEST(GenerationEngineTest, GenerateWaitsForAbandonedProducerToRelease) {
    GenerationEngineOptions options;
    options.abandon_timeout = 50ms;
    GenerationEngine engine(options);

    auto s = script({"quick", " stalled"});
    s->delay_before_last = 300ms;
    auto handle = std::make_shared<ScriptedHandle>(s);

    auto snapshots = engine.streamGenerate(handle, request());
    ASSERT_EQ(snapshots.size(), 1u);

    // 放棄された生産者が停止するまで次の推論は始まらない
    EXPECT_EQ(engine.generate(*handle, request()), "quick stalled");
    EXPECT_EQ(s->max_active.load(), 1);
}

TEST(GenerationEngineTest, GenerateGivesUpWhenHandleStaysBusy) {
    GenerationEngineOptions options;
    options.abandon_timeout = 50ms;
    options.busy_timeout = 50ms;
    GenerationEngine engine(options);

    auto s = script({"quick", " stalled"});
    s->delay_before_last = 400ms;
    auto handle = std::make_shared<ScriptedHandle>(s);

    ASSERT_EQ(engine.streamGenerate(handle, request()).size(), 1u);
    EXPECT_EQ(engine.generate(*handle, request()), "");
    EXPECT_EQ(s->max_active.load(), 1);
    EXPECT_TRUE(waitFinished(*s));
}

TEST(GenerationEngineTest, SmallChannelCapacityStillDeliversEverything) {
    GenerationEngineOptions options;
    options.channel_capacity = 1;
    GenerationEngine engine(options);

    std::vector<std::string> pieces;
    std::string expected;
    for (int i = 0; i < 50; ++i) {
        pieces.push_back(std::to_string(i % 10));
        expected += std::to_string(i % 10);
    }
    auto handle = std::make_shared<ScriptedHandle>(script(pieces));
    auto snapshots = engine.streamGenerate(handle, request());
    ASSERT_FALSE(snapshots.empty());
    EXPECT_EQ(snapshots.back(), expected);
}

TEST(GenerationEngineTest, NullHandleYieldsNothing) {
    GenerationEngine engine;
    EXPECT_TRUE(engine.streamGenerate(nullptr, request()).empty());
}
