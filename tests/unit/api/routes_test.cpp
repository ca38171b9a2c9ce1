#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/mocks_test.hpp"
#include "common/utilities_test.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_core/services/qa_service.hpp"

namespace docqa_tests {

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class RoutesTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fetcher_ = std::make_shared<NiceMock<MockDocumentFetcher>>();
    embedder_ = std::make_shared<NiceMock<MockEmbedder>>(64);
    generator_ = std::make_shared<NiceMock<MockAnswerGenerator>>();
    ON_CALL(*fetcher_, fetch("https://example.com/policy.pdf"))
        .WillByDefault(Return(TestUtilities::create_test_pdf(
            {"Clause 4.2 A grace period of thirty days applies", "Clause 5.1 Waiting period"})));

    auto indexer = std::make_shared<docqa_core::DocumentIndexer>(
        fetcher_, std::make_shared<docqa_core::ContentExtractorFactory>(),
        std::make_shared<docqa_core::Utf8WordTokenizer>(), embedder_);
    auto qa_service = std::make_shared<docqa_core::QaService>(
        std::make_shared<docqa_core::DocumentCache>(), indexer,
        std::make_shared<docqa_core::RetrievalEngine>(embedder_), generator_);

    routes_ = std::make_unique<docqa_api::Routes>(qa_service, std::string("secret"));
    routes_->register_routes(server_);
    server_.get_app().validate();
  }

  crow::response post(const std::string& url, const nlohmann::json& body,
                      const std::string& token = "secret") {
    crow::request req;
    req.url = url;
    req.method = crow::HTTPMethod::POST;
    req.body = body.dump();
    req.add_header("Content-Type", "application/json");
    req.add_header("Authorization", "Bearer " + token);
    crow::response res;
    server_.get_app().handle_full(req, res);
    return res;
  }

  docqa_api::Server server_{"127.0.0.1", 0};
  std::unique_ptr<docqa_api::Routes> routes_;
  std::shared_ptr<NiceMock<MockDocumentFetcher>> fetcher_;
  std::shared_ptr<NiceMock<MockEmbedder>> embedder_;
  std::shared_ptr<NiceMock<MockAnswerGenerator>> generator_;
};

TEST_F(RoutesTest, ProcessPdfAnswersLikeProcessDocument) {
  EXPECT_CALL(*generator_, generate(_, "What is the grace period?", _))
      .Times(2)
      .WillRepeatedly(Return("Thirty days."));
  const nlohmann::json body = {{"documents", "https://example.com/policy.pdf"},
                               {"questions", {"What is the grace period?"}}};

  auto legacy = post("/process-pdf", body);
  auto current = post("/process-document", body);

  ASSERT_EQ(legacy.code, 200);
  ASSERT_EQ(current.code, 200);
  auto answers = nlohmann::json::parse(legacy.body)["answers"];
  ASSERT_EQ(answers.size(), 1u);
  EXPECT_EQ(answers[0]["question"], "What is the grace period?");
  EXPECT_EQ(answers[0]["answer"], "Thirty days.");
  EXPECT_EQ(nlohmann::json::parse(current.body), nlohmann::json::parse(legacy.body));
}

TEST_F(RoutesTest, ProcessPdfRequiresBearerToken) {
  auto res = post("/process-pdf",
                  {{"documents", "https://example.com/policy.pdf"}, {"questions", {"q"}}}, "wrong");
  EXPECT_EQ(res.code, 401);
}

TEST_F(RoutesTest, ProcessPdfRejectsMissingQuestions) {
  auto res = post("/process-pdf", {{"documents", "https://example.com/policy.pdf"}});
  EXPECT_EQ(res.code, 400);
}

}  // namespace docqa_tests
