/**
 * HttpTransport.cpp
 */

#include "HttpTransport.hpp"
#include "../Logger.hpp"
#include "../../utils/StringUtils.hpp"

#include <cpr/cpr.h>

#include <chrono>
#include <string_view>

namespace surge::core::downloader {

namespace {

// Response headers of the final hop (reset on every status line, so
// redirect hops are forgotten)
struct ResponseHead {
    long statusCode{0};
    uint64_t contentLength{0};
    bool hasContentLength{false};
    uint64_t rangeTotal{0};
    bool hasContentRange{false};

    void reset() { *this = ResponseHead{}; }
};

uint64_t parseUnsigned(const std::string& text) {
    try {
        return std::stoull(text);
    } catch (const std::exception&) {
        return 0;
    }
}

} // namespace

HttpTransport::HttpTransport(std::string userAgent)
    : m_userAgent(std::move(userAgent)) {
}

uint64_t HttpTransport::parseContentRangeTotal(const std::string& value) {
    std::string trimmed = utils::StringUtils::trim(value);
    if (!utils::StringUtils::startsWith(utils::StringUtils::toLower(trimmed), "bytes")) {
        return 0;
    }

    auto slash = trimmed.rfind('/');
    if (slash == std::string::npos) {
        return 0;
    }

    std::string total = utils::StringUtils::trim(trimmed.substr(slash + 1));
    if (total.empty() || total == "*") {
        return 0;
    }
    return parseUnsigned(total);
}

TransferOutcome HttpTransport::fetch(const TransferRequest& request, TransferSink& sink) {
    ResponseHead head;
    bool responded = false;
    bool rejected = false;
    bool stalled = false;

    auto lastProgressAt = std::chrono::steady_clock::now();
    cpr::cpr_off_t lastProgressBytes = 0;

    cpr::Header headers;
    if (request.offset > 0) {
        headers["Range"] = "bytes=" + std::to_string(request.offset) + "-";
    }

    auto respond = [&]() -> bool {
        responded = true;

        bool resumed = false;
        uint64_t total = 0;

        if (head.statusCode == 206) {
            resumed = true;
            total = head.hasContentRange
                ? head.rangeTotal
                : (head.hasContentLength ? request.offset + head.contentLength : 0);
        } else if (head.statusCode == 416) {
            // Range starts at the end of the resource: nothing left to fetch
            resumed = true;
            total = head.rangeTotal;
        } else {
            total = head.hasContentLength ? head.contentLength : 0;
        }

        if (!sink.onResponse(total, resumed)) {
            rejected = true;
            return false;
        }
        return true;
    };

    cpr::Response response = cpr::Get(
        cpr::Url{request.url},
        headers,
        cpr::UserAgent{m_userAgent},
        cpr::ConnectTimeout{std::chrono::milliseconds(request.connectTimeout > 0 ? request.connectTimeout : 10000)},
        cpr::HeaderCallback([&](std::string_view line, intptr_t) -> bool {
            std::string header(line);

            if (utils::StringUtils::startsWith(header, "HTTP/")) {
                head.reset();
                auto parts = utils::StringUtils::split(header, ' ');
                if (parts.size() >= 2) {
                    head.statusCode = static_cast<long>(parseUnsigned(parts[1]));
                }
                return true;
            }

            auto colon = header.find(':');
            if (colon == std::string::npos) {
                return true;
            }

            std::string name = utils::StringUtils::toLower(utils::StringUtils::trim(header.substr(0, colon)));
            std::string value = utils::StringUtils::trim(header.substr(colon + 1));

            if (name == "content-length") {
                head.contentLength = parseUnsigned(value);
                head.hasContentLength = true;
            } else if (name == "content-range") {
                head.rangeTotal = parseContentRangeTotal(value);
                head.hasContentRange = true;
            }
            return true;
        }),
        cpr::WriteCallback([&](std::string_view data, intptr_t) -> bool {
            if (head.statusCode >= 400) {
                return false;
            }
            if (!responded && !respond()) {
                return false;
            }
            if (!sink.onData(data.data(), data.size())) {
                rejected = true;
                return false;
            }
            return true;
        }),
        cpr::ProgressCallback([&](cpr::cpr_off_t /*downloadTotal*/, cpr::cpr_off_t downloadNow,
                                  cpr::cpr_off_t /*uploadTotal*/, cpr::cpr_off_t /*uploadNow*/,
                                  intptr_t) -> bool {
            if (sink.isStopRequested()) {
                return false;
            }

            auto now = std::chrono::steady_clock::now();
            if (downloadNow != lastProgressBytes) {
                lastProgressBytes = downloadNow;
                lastProgressAt = now;
                return true;
            }

            if (request.stallTimeout > 0) {
                auto idle = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastProgressAt).count();
                if (idle >= static_cast<long long>(request.stallTimeout)) {
                    stalled = true;
                    return false;
                }
            }
            return true;
        })
    );

    TransferOutcome outcome;
    outcome.statusCode = response.status_code;

    if (sink.isStopRequested() || rejected) {
        outcome.result = TransferResult::Aborted;
        return outcome;
    }

    if (stalled) {
        outcome.result = TransferResult::Failed;
        outcome.error = "No data received for " + std::to_string(request.stallTimeout) + " ms";
        return outcome;
    }

    if (response.error.code != cpr::ErrorCode::OK && response.status_code == 0) {
        outcome.result = TransferResult::Failed;
        outcome.error = response.error.message.empty() ? "Network error" : response.error.message;
        return outcome;
    }

    if (response.status_code == 416 && request.offset > 0 && head.rangeTotal == request.offset) {
        if (!responded && !respond()) {
            outcome.result = TransferResult::Aborted;
            return outcome;
        }
        outcome.result = TransferResult::Completed;
        return outcome;
    }

    if (response.status_code >= 400 || response.status_code == 0) {
        outcome.result = TransferResult::Failed;
        outcome.error = "HTTP " + std::to_string(response.status_code);
        return outcome;
    }

    if (response.error.code != cpr::ErrorCode::OK) {
        outcome.result = TransferResult::Failed;
        outcome.error = response.error.message;
        return outcome;
    }

    // Empty body: the write callback never ran
    if (!responded && !respond()) {
        outcome.result = TransferResult::Aborted;
        return outcome;
    }

    Logger::instance().trace("GET {} finished with HTTP {}", request.url, response.status_code);
    outcome.result = TransferResult::Completed;
    return outcome;
}

} // namespace surge::core::downloader
