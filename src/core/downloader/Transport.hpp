#pragma once

/**
 * Transport.hpp
 *
 * Byte-stream source used by the transfer executor. Implementations fetch
 * a url from a byte offset and push what they receive into a TransferSink.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace surge::core::downloader {

struct TransferRequest {
    std::string url;
    uint64_t offset{0};          // resume cursor, 0 = from the start
    uint32_t connectTimeout{0};  // ms, 0 = transport default
    uint32_t stallTimeout{0};    // ms without data before giving up, 0 = never
};

/**
 * Receiver side of a transfer
 *
 * Returning false from a callback aborts the transfer.
 */
class TransferSink {
public:
    virtual ~TransferSink() = default;

    /**
     * Called once before the first byte
     * @param totalSize Full size of the resource, 0 if unknown
     * @param resumed true if the data starts at the requested offset,
     *                false if it starts at byte zero
     */
    virtual bool onResponse(uint64_t totalSize, bool resumed) = 0;

    virtual bool onData(const char* data, size_t length) = 0;

    /**
     * Polled by the transport to cancel cooperatively
     */
    virtual bool isStopRequested() const = 0;
};

enum class TransferResult {
    Completed,  // end of stream reached
    Aborted,    // sink rejected data or asked to stop
    Failed      // network or protocol error
};

struct TransferOutcome {
    TransferResult result{TransferResult::Failed};
    std::string error;
    long statusCode{0};
};

/**
 * Transport - abstract byte source
 */
class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Run one transfer to its end. Blocks the calling thread.
     */
    virtual TransferOutcome fetch(const TransferRequest& request, TransferSink& sink) = 0;
};

} // namespace surge::core::downloader
