#pragma once

#include <stdexcept>
#include <string>

namespace shop_harvest {

/// Base class of every error the harvester reports.
class HarvestError : public std::runtime_error {
public:
    explicit HarvestError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Fetch-level failure.  Retried inside HttpClient before it surfaces.
class TransportError : public HarvestError {
public:
    explicit TransportError(const std::string& what, unsigned int httpStatus = 0)
        : HarvestError(what)
        , mHttpStatus(httpStatus) {}

    /// 0 when no HTTP response was received (DNS, connect, timeout).
    unsigned int httpStatus() const { return mHttpStatus; }

private:
    unsigned int mHttpStatus;
};

/// A page or record could not be parsed.  Skipped and logged.
class ExtractionError : public HarvestError {
public:
    using HarvestError::HarvestError;
};

/// A source-wide precondition failed (e.g. no access token).  Aborts the run.
class SessionError : public HarvestError {
public:
    using HarvestError::HarvestError;
};

/// Geocoding failed.  Fatal errors (quota, rejected key) degrade the run to
/// Partial; non-fatal ones only count as a per-record failure.
class EnrichmentError : public HarvestError {
public:
    explicit EnrichmentError(const std::string& what, bool fatal = false)
        : HarvestError(what)
        , mFatal(fatal) {}

    bool fatal() const { return mFatal; }

private:
    bool mFatal;
};

/// Writing to a store failed.
class PersistenceError : public HarvestError {
public:
    using HarvestError::HarvestError;
};

/// Delivering a notification failed.  Always swallowed by callers.
class NotificationError : public HarvestError {
public:
    using HarvestError::HarvestError;
};

/// Invalid or incomplete configuration.
class ConfigError : public HarvestError {
public:
    using HarvestError::HarvestError;
};

} // namespace shop_harvest
