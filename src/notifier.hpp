#pragma once

#include "http_client.hpp"
#include "models.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace shop_harvest {

/// Run lifecycle notifications.  Implementations throw NotificationError;
/// callers log and carry on.
class Notifier {
public:
    virtual ~Notifier() = default;

    virtual void notifyStart(const std::string& sourceId, const std::string& sourceName) = 0;
    virtual void notifyComplete(const CrawlRunResult& result) = 0;
    virtual void notifyError(const std::string& sourceId, const std::string& sourceName,
                             const std::string& message) = 0;
};

/// Posts Block Kit messages to a Slack incoming webhook.
class SlackNotifier : public Notifier {
public:
    struct Options {
        std::string webhookUrl;
        std::string channel;                       // empty: webhook default
        std::string username = "shop_harvest";
    };

    /// @throws ConfigError if the webhook URL is empty.
    SlackNotifier(HttpClient& http, Options options);

    void notifyStart(const std::string& sourceId, const std::string& sourceName) override;
    void notifyComplete(const CrawlRunResult& result) override;
    void notifyError(const std::string& sourceId, const std::string& sourceName,
                     const std::string& message) override;

    nlohmann::json startPayload(const std::string& sourceId,
                                const std::string& sourceName) const;
    nlohmann::json completePayload(const CrawlRunResult& result) const;
    nlohmann::json errorPayload(const std::string& sourceId, const std::string& sourceName,
                                const std::string& message) const;

private:
    HttpClient& mHttp;
    Options     mOptions;

    /// Header, message, optional fields and a timestamp context block.
    nlohmann::json buildPayload(const std::string& emoji,
                                const std::string& title,
                                const std::string& message,
                                const nlohmann::json& fields) const;

    void post(const nlohmann::json& payload, const std::string& what);
};

} // namespace shop_harvest
