#pragma once

/**
 * HttpTransport.hpp
 *
 * HTTP(S) transport built on cpr (libcurl).
 */

#include "Transport.hpp"

#include <string>

namespace surge::core::downloader {

/**
 * HttpTransport - ranged GET streaming into a TransferSink
 *
 * Features:
 * - Range requests from the resume cursor
 * - Total size from Content-Range or Content-Length
 * - Redirects followed
 * - Connect timeout and stall detection
 * - Cooperative abort through the progress callback
 */
class HttpTransport : public Transport {
public:
    explicit HttpTransport(std::string userAgent = "surge/1.0");

    TransferOutcome fetch(const TransferRequest& request, TransferSink& sink) override;

    /**
     * Parse "bytes <first>-<last>/<total>", or the unsatisfied-range form
     * where the range is "*"
     * @return total, 0 if absent or unknown ("*")
     */
    static uint64_t parseContentRangeTotal(const std::string& value);

private:
    std::string m_userAgent;
};

} // namespace surge::core::downloader
