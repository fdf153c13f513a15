#include "util.hpp"

#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace shop_harvest {

namespace {

std::mt19937& rng() {
    static thread_local std::mt19937 engine{std::random_device{}()};
    return engine;
}

bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // namespace

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;

    // --- scheme ---
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("Invalid URL (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw std::invalid_argument("Invalid URL (unsupported scheme): " + url);
    }

    // --- authority (host[:port]) ---
    auto hostStart = schemeEnd + 3;
    auto pathStart = url.find_first_of("/?", hostStart);

    std::string authority;
    if (pathStart == std::string::npos) {
        authority    = url.substr(hostStart);
        parts.target = "/";
    } else {
        authority    = url.substr(hostStart, pathStart - hostStart);
        parts.target = url.substr(pathStart);
        if (parts.target.front() == '?') {
            parts.target.insert(parts.target.begin(), '/');
        }
    }

    // --- host / port ---
    auto colon = authority.find(':');
    if (colon == std::string::npos) {
        parts.host = authority;
        parts.port = (parts.scheme == "https") ? "443" : "80";
    } else {
        parts.host = authority.substr(0, colon);
        parts.port = authority.substr(colon + 1);
    }

    if (parts.host.empty()) {
        throw std::invalid_argument("Invalid URL (empty host): " + url);
    }
    return parts;
}

std::string resolveUrl(const std::string& baseUrl, const std::string& href) {
    if (href.find("://") != std::string::npos) {
        return href;
    }

    const auto base = parseUrl(baseUrl);
    const bool defaultPort = (base.scheme == "http" && base.port == "80") ||
                             (base.scheme == "https" && base.port == "443");
    std::string origin = base.scheme + "://" + base.host;
    if (!defaultPort) {
        origin += ":" + base.port;
    }

    if (!href.empty() && href.front() == '/') {
        return origin + href;
    }

    std::string path = base.target.substr(0, base.target.find('?'));
    path = path.substr(0, path.rfind('/') + 1);
    return origin + path + href;
}

std::string urlEncode(const std::string& text) {
    static const char* kHex = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size() * 3);
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(kHex[c >> 4]);
            out.push_back(kHex[c & 0x0F]);
        }
    }
    return out;
}

std::chrono::milliseconds computeBackoffMs(int attempt, int64_t baseMs, int64_t maxMs) {
    // Exponential: base * 2^attempt, clamped to maxMs.
    const int shift = std::min(attempt, 30);
    int64_t backoff = baseMs * (int64_t{1} << shift);
    backoff = std::min(backoff, maxMs);

    // Jitter: uniform random in [0, 100] ms.
    std::uniform_int_distribution<int64_t> jitter(0, 100);
    backoff += jitter(rng());

    return std::chrono::milliseconds(backoff);
}

std::string sha256Hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (unsigned char byte : digest) {
        out << std::setw(2) << static_cast<int>(byte);
    }
    return out.str();
}

std::string makeNaturalKey(const std::string& sourceId, const std::string& link) {
    return sourceId + "_" + sha256Hex(link).substr(0, 8);
}

std::string generateRunId(const std::string& sourceId) {
    std::uniform_int_distribution<uint32_t> dist;
    std::ostringstream out;
    out << sourceId << '_' << std::hex << std::setw(8) << std::setfill('0') << dist(rng());
    return out.str();
}

std::string normalizeAddress(const std::string& address) {
    // U+3000 IDEOGRAPHIC SPACE in UTF-8.
    static const std::string kFullWidthSpace = "\xE3\x80\x80";

    std::string text = address;
    for (auto pos = text.find(kFullWidthSpace); pos != std::string::npos;
         pos = text.find(kFullWidthSpace, pos + 1)) {
        text.replace(pos, kFullWidthSpace.size(), " ");
    }

    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    for (char c : text) {
        if (isAsciiSpace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

std::string expandPageTemplate(const std::string& urlTemplate, int page) {
    static const std::string kPlaceholder = "{page}";

    std::string out = urlTemplate;
    const std::string value = std::to_string(page);
    for (auto pos = out.find(kPlaceholder); pos != std::string::npos;
         pos = out.find(kPlaceholder, pos + value.size())) {
        out.replace(pos, kPlaceholder.size(), value);
    }
    return out;
}

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), isAsciiSpace);
    auto end   = std::find_if_not(text.rbegin(), text.rend(), isAsciiSpace).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::vector<std::string> splitCommaList(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string item;
    while (std::getline(in, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            out.push_back(item);
        }
    }
    return out;
}

std::string formatIsoTime(TimePoint tp) {
    const auto tt = Clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&tt, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

TimePoint parseIsoTime(const std::string& text) {
    std::tm utc{};
    std::istringstream in(text);
    in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        throw std::invalid_argument("Invalid ISO-8601 timestamp: " + text);
    }
    return Clock::from_time_t(timegm(&utc));
}

} // namespace shop_harvest
