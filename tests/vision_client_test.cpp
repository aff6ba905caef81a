#include "vision_client.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace {

using vision::AttemptResult;
using vision::BackendList;
using vision::VisionOutcome;
using vision::VisionRequest;

// Возвращает заранее заданный результат и считает вызовы.
class FakeBackend : public vision::VisionBackend {
public:
    FakeBackend(std::string name, AttemptResult result)
        : name_(std::move(name)), result_(std::move(result)) {}

    std::string name() const override { return name_; }

    AttemptResult analyze(const VisionRequest&, std::chrono::seconds timeout) override {
        ++calls;
        lastTimeout = timeout;
        return result_;
    }

    int calls = 0;
    std::chrono::seconds lastTimeout{0};

private:
    std::string name_;
    AttemptResult result_;
};

// Выставляет флаг отмены во время своей попытки.
class CancellingBackend : public vision::VisionBackend {
public:
    explicit CancellingBackend(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::string name() const override { return "cancelling"; }

    AttemptResult analyze(const VisionRequest&, std::chrono::seconds) override {
        flag_->store(true);
        return {AttemptResult::Status::Failed, "", "timeout"};
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

std::shared_ptr<FakeBackend> fake(const std::string& name, AttemptResult::Status status,
                                  const std::string& text = "") {
    return std::make_shared<FakeBackend>(name, AttemptResult{status, text, name + " detail"});
}

const VisionRequest kRequest{"\x89PNG", "image/png"};

TEST(AnalyzeImageTest, FallsThroughUnsupportedAndFailed) {
    auto a = fake("model-a", AttemptResult::Status::Unsupported);
    auto b = fake("model-b", AttemptResult::Status::Failed);
    auto c = fake("model-c", AttemptResult::Status::Ok, "REGISTER_NUMBERS:\nTVE20CS001");
    auto d = fake("model-d", AttemptResult::Status::Ok, "unused");

    VisionOutcome out = vision::analyzeImage({a, b, c, d}, kRequest, std::chrono::seconds(7));

    EXPECT_EQ(out.status, VisionOutcome::Status::Ok);
    EXPECT_EQ(out.backend, "model-c");
    EXPECT_EQ(out.text, "REGISTER_NUMBERS:\nTVE20CS001");
    EXPECT_EQ(out.attempts.size(), 2u);
    EXPECT_EQ(a->calls, 1);
    EXPECT_EQ(b->calls, 1);
    EXPECT_EQ(c->calls, 1);
    EXPECT_EQ(d->calls, 0);
    EXPECT_EQ(c->lastTimeout, std::chrono::seconds(7));
}

TEST(AnalyzeImageTest, ExhaustedListIsUnavailable) {
    auto a = fake("model-a", AttemptResult::Status::Failed);
    auto b = fake("model-b", AttemptResult::Status::Unsupported);

    VisionOutcome out = vision::analyzeImage({a, b}, kRequest, std::chrono::seconds(1));

    EXPECT_EQ(out.status, VisionOutcome::Status::Unavailable);
    EXPECT_TRUE(out.text.empty());
    EXPECT_EQ(out.attempts, (std::vector<std::string>{"model-a: model-a detail", "model-b: model-b detail"}));
}

TEST(AnalyzeImageTest, EmptyBackendList) {
    VisionOutcome out = vision::analyzeImage({}, kRequest, std::chrono::seconds(1));
    EXPECT_EQ(out.status, VisionOutcome::Status::Unavailable);
}

TEST(AnalyzeImageTest, CancelledBeforeFirstAttempt) {
    auto a = fake("model-a", AttemptResult::Status::Ok, "text");
    std::atomic<bool> cancel{true};

    VisionOutcome out = vision::analyzeImage({a}, kRequest, std::chrono::seconds(1), &cancel);

    EXPECT_EQ(out.status, VisionOutcome::Status::Cancelled);
    EXPECT_EQ(a->calls, 0);
}

TEST(AnalyzeImageTest, CancelStopsBetweenAttempts) {
    auto flag = std::make_shared<std::atomic<bool>>(false);
    auto next = fake("model-b", AttemptResult::Status::Ok, "text");

    BackendList backends = {std::make_shared<CancellingBackend>(flag), next};
    VisionOutcome out = vision::analyzeImageAsync(backends, kRequest, std::chrono::seconds(1), flag).get();

    EXPECT_EQ(out.status, VisionOutcome::Status::Cancelled);
    EXPECT_EQ(next->calls, 0);
}

TEST(AnalyzeImageTest, AsyncDeliversResult) {
    auto a = fake("model-a", AttemptResult::Status::Ok, "EXAM_NAME: x");
    VisionOutcome out = vision::analyzeImageAsync({a}, kRequest, std::chrono::seconds(1)).get();
    EXPECT_EQ(out.status, VisionOutcome::Status::Ok);
    EXPECT_EQ(out.text, "EXAM_NAME: x");
}

TEST(InterpretChatResponseTest, OkExtractsContent) {
    AttemptResult r = vision::interpretChatResponse(
        200, R"({"choices":[{"message":{"role":"assistant","content":"DATES:\n05-09-25"}}]})");
    EXPECT_EQ(r.status, AttemptResult::Status::Ok);
    EXPECT_EQ(r.text, "DATES:\n05-09-25");
}

TEST(InterpretChatResponseTest, MalformedOkBodyFails) {
    AttemptResult r = vision::interpretChatResponse(200, R"({"choices":[]})");
    EXPECT_EQ(r.status, AttemptResult::Status::Failed);

    r = vision::interpretChatResponse(200, "not json");
    EXPECT_EQ(r.status, AttemptResult::Status::Failed);
}

TEST(InterpretChatResponseTest, BadRequestAboutModelIsUnsupported) {
    AttemptResult r = vision::interpretChatResponse(
        400, R"({"error":{"message":"The Model `x` does not exist"}})");
    EXPECT_EQ(r.status, AttemptResult::Status::Unsupported);
}

TEST(InterpretChatResponseTest, OtherErrorsFail) {
    EXPECT_EQ(vision::interpretChatResponse(400, "image too large").status, AttemptResult::Status::Failed);
    EXPECT_EQ(vision::interpretChatResponse(500, "").status, AttemptResult::Status::Failed);
    EXPECT_EQ(vision::interpretChatResponse(429, "rate limited").status, AttemptResult::Status::Failed);
}

TEST(VisionRequestBodyTest, EmbedsImageAsDataUrl) {
    nlohmann::json body = nlohmann::json::parse(
        vision::buildChatRequestBody("model-x", VisionRequest{"abc", "image/jpeg"}, 1024));

    EXPECT_EQ(body["model"], "model-x");
    EXPECT_EQ(body["max_tokens"], 1024);
    const nlohmann::json& content = body["messages"][0]["content"];
    EXPECT_EQ(content[0]["type"], "text");
    EXPECT_EQ(content[1]["image_url"]["url"], "data:image/jpeg;base64,YWJj");
}

TEST(Base64Test, KnownVectors) {
    EXPECT_EQ(vision::base64Encode(""), "");
    EXPECT_EQ(vision::base64Encode("f"), "Zg==");
    EXPECT_EQ(vision::base64Encode("fo"), "Zm8=");
    EXPECT_EQ(vision::base64Encode("foobar"), "Zm9vYmFy");
}

TEST(DefaultBackendsTest, OnePerModelInOrder) {
    VisionConfig cfg;
    cfg.apiKey = "key";
    BackendList backends = vision::makeDefaultBackends(cfg);
    ASSERT_EQ(backends.size(), vision::defaultModels().size());
    for (size_t i = 0; i < backends.size(); ++i) {
        EXPECT_EQ(backends[i]->name(), vision::defaultModels()[i]);
    }
}

}  // namespace
