#pragma once

/**
 * DownloadErrors.hpp
 *
 * Exception taxonomy of the download orchestrator.
 *
 * Only ValidationError ever reaches a caller (from submit). The others are
 * thrown at I/O seams, caught by the orchestrator, logged and recorded on the
 * task record.
 */

#include <stdexcept>
#include <string>

namespace surge::core::downloader {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Bad url or filename, or a request rejected by the file-type policy
 */
class ValidationError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

/**
 * Network or file I/O failure during a transfer
 */
class TransferError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

/**
 * Task store read/write failure
 */
class PersistenceError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

/**
 * Command issued against a task in an incompatible state
 */
class StateConflictError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace surge::core::downloader
