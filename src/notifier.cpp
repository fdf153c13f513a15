#include "notifier.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "util.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace shop_harvest {

namespace {

constexpr const char* kTag = "SlackNotifier";

nlohmann::json field(const std::string& label, const std::string& value) {
    return {{"type", "mrkdwn"}, {"text", "*" + label + ":*\n" + value}};
}

std::string formatSeconds(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << seconds << "s";
    return out.str();
}

} // namespace

SlackNotifier::SlackNotifier(HttpClient& http, Options options)
    : mHttp(http)
    , mOptions(std::move(options))
{
    if (mOptions.webhookUrl.empty()) {
        throw ConfigError("Slack notifier requires a webhook URL");
    }
}

// ---------------------------------------------------------------------------
// Payloads
// ---------------------------------------------------------------------------

nlohmann::json SlackNotifier::buildPayload(const std::string& emoji,
                                           const std::string& title,
                                           const std::string& message,
                                           const nlohmann::json& fields) const {
    auto blocks = nlohmann::json::array();
    blocks.push_back({{"type", "header"},
                      {"text", {{"type", "plain_text"}, {"text", emoji + " " + title}}}});
    blocks.push_back({{"type", "section"},
                      {"text", {{"type", "mrkdwn"}, {"text", message}}}});
    if (!fields.empty()) {
        blocks.push_back({{"type", "section"}, {"fields", fields}});
    }
    blocks.push_back({{"type", "context"},
                      {"elements", nlohmann::json::array(
                           {{{"type", "mrkdwn"}, {"text", formatIsoTime(Clock::now())}}})}});

    nlohmann::json payload = {
        {"username", mOptions.username},
        {"blocks", blocks},
        {"text", emoji + " " + title + ": " + message},
    };
    if (!mOptions.channel.empty()) {
        payload["channel"] = mOptions.channel;
    }
    return payload;
}

nlohmann::json SlackNotifier::startPayload(const std::string& sourceId,
                                           const std::string& sourceName) const {
    auto fields = nlohmann::json::array({field("Source", sourceName), field("Source ID", sourceId)});
    return buildPayload(":rocket:", "Harvest started",
                        "Started harvesting listings from " + sourceName + ".", fields);
}

nlohmann::json SlackNotifier::completePayload(const CrawlRunResult& result) const {
    auto fields = nlohmann::json::array({
        field("Source", result.sourceName),
        field("Source ID", result.sourceId),
        field("Status", toString(result.status)),
        field("Total records", std::to_string(result.totalRecords)),
        field("New records", std::to_string(result.newRecords)),
        field("Updated records", std::to_string(result.updatedRecords)),
        field("Geocoded", std::to_string(result.geocodedRecords)),
        field("Duration", formatSeconds(result.durationSeconds.value_or(0.0))),
    });

    std::string message = "Finished harvesting listings from " + result.sourceName + ".";
    if (!result.errors.empty()) {
        message += " " + std::to_string(result.errors.size()) + " error(s) recorded.";
    }

    const bool clean = (result.status == RunStatus::Success);
    return buildPayload(clean ? ":white_check_mark:" : ":warning:",
                        clean ? "Harvest complete" : "Harvest finished with problems",
                        message, fields);
}

nlohmann::json SlackNotifier::errorPayload(const std::string& sourceId,
                                           const std::string& sourceName,
                                           const std::string& message) const {
    auto fields = nlohmann::json::array({field("Source", sourceName), field("Source ID", sourceId)});
    return buildPayload(":x:", "Harvest failed",
                        "Harvesting " + sourceName + " failed.\n\n```" + message + "```", fields);
}

// ---------------------------------------------------------------------------
// Delivery
// ---------------------------------------------------------------------------

void SlackNotifier::notifyStart(const std::string& sourceId, const std::string& sourceName) {
    post(startPayload(sourceId, sourceName), "start");
}

void SlackNotifier::notifyComplete(const CrawlRunResult& result) {
    post(completePayload(result), "complete");
}

void SlackNotifier::notifyError(const std::string& sourceId, const std::string& sourceName,
                                const std::string& message) {
    post(errorPayload(sourceId, sourceName, message), "error");
}

void SlackNotifier::post(const nlohmann::json& payload, const std::string& what) {
    try {
        mHttp.postJson(mOptions.webhookUrl, payload);
    } catch (const TransportError& e) {
        throw NotificationError("Failed to send Slack " + what + " notification: " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw NotificationError("Cannot encode Slack " + what + " notification: " + e.what());
    }
    SH_LOG_INFO(kTag, "Slack " << what << " notification sent");
}

} // namespace shop_harvest
