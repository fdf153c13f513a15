/// @file test_notifier.cpp
/// Unit tests for notifier.hpp: Slack Block Kit payloads.

#include "errors.hpp"
#include "notifier.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

using namespace shop_harvest;
using json = nlohmann::json;

namespace {

SlackNotifier::Options webhook(const std::string& channel = {}) {
    SlackNotifier::Options opts;
    opts.webhookUrl = "https://hooks.example.test/services/T000/B000/XXXX";
    opts.channel    = channel;
    return opts;
}

std::string headerText(const json& payload) {
    return payload["blocks"][0]["text"]["text"].get<std::string>();
}

/// Concatenated text of every field of every section block.
std::string allFieldText(const json& payload) {
    std::string out;
    for (const auto& block : payload["blocks"]) {
        if (block.contains("fields")) {
            for (const auto& f : block["fields"]) {
                out += f["text"].get<std::string>() + "\n";
            }
        }
    }
    return out;
}

} // namespace

TEST(SlackNotifier, EmptyWebhookIsConfigError) {
    HttpClient http;
    EXPECT_THROW(SlackNotifier(http, SlackNotifier::Options{}), ConfigError);
}

TEST(SlackNotifier, StartPayload) {
    HttpClient http;
    SlackNotifier notifier(http, webhook());

    const auto payload = notifier.startPayload("08", "Ibaraki");
    EXPECT_EQ(payload["username"], "shop_harvest");
    EXPECT_FALSE(payload.contains("channel"));
    EXPECT_EQ(headerText(payload), ":rocket: Harvest started");
    EXPECT_NE(payload["text"].get<std::string>().find("Ibaraki"), std::string::npos);

    const auto& blocks = payload["blocks"];
    ASSERT_EQ(blocks.size(), 4u);
    EXPECT_EQ(blocks[0]["type"], "header");
    EXPECT_EQ(blocks[1]["type"], "section");
    EXPECT_EQ(blocks[3]["type"], "context");
    EXPECT_NE(allFieldText(payload).find("08"), std::string::npos);
}

TEST(SlackNotifier, ChannelIsIncludedWhenConfigured) {
    HttpClient http;
    SlackNotifier notifier(http, webhook("#harvest"));
    EXPECT_EQ(notifier.startPayload("08", "Ibaraki")["channel"], "#harvest");
}

TEST(SlackNotifier, SuccessfulRunLooksClean) {
    HttpClient http;
    SlackNotifier notifier(http, webhook());

    CrawlRunResult r;
    r.sourceId        = "08";
    r.sourceName      = "Ibaraki";
    r.status          = RunStatus::Success;
    r.totalRecords    = 120;
    r.newRecords      = 100;
    r.updatedRecords  = 20;
    r.durationSeconds = 12.34;

    const auto payload = notifier.completePayload(r);
    EXPECT_EQ(headerText(payload), ":white_check_mark: Harvest complete");

    const auto fields = allFieldText(payload);
    EXPECT_NE(fields.find("*Total records:*\n120"), std::string::npos);
    EXPECT_NE(fields.find("*New records:*\n100"), std::string::npos);
    EXPECT_NE(fields.find("*Duration:*\n12.3s"), std::string::npos);
    EXPECT_NE(fields.find("success"), std::string::npos);
}

TEST(SlackNotifier, PartialRunIsFlagged) {
    HttpClient http;
    SlackNotifier notifier(http, webhook());

    CrawlRunResult r;
    r.sourceName = "Ibaraki";
    r.status     = RunStatus::Partial;
    r.errors     = {"Geocoding halted", "Cancelled after page 3"};

    const auto payload = notifier.completePayload(r);
    EXPECT_EQ(headerText(payload), ":warning: Harvest finished with problems");
    EXPECT_NE(payload["blocks"][1]["text"]["text"].get<std::string>().find("2 error(s)"),
              std::string::npos);
}

TEST(SlackNotifier, ErrorPayloadQuotesMessage) {
    HttpClient http;
    SlackNotifier notifier(http, webhook());

    const auto payload = notifier.errorPayload("08", "Ibaraki", "token endpoint refused");
    EXPECT_EQ(headerText(payload), ":x: Harvest failed");
    EXPECT_NE(payload["blocks"][1]["text"]["text"].get<std::string>().find(
                  "```token endpoint refused```"),
              std::string::npos);
}
