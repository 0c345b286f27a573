#ifndef TRANSFER_ERRORS_H
#define TRANSFER_ERRORS_H

#include "transfer_types.h"

#include <stdexcept>
#include <string>

// Internal to the transfer engine: stream loops catch these and turn them into
// TransferError codes. Nothing here escapes the public API.
class TransferException : public std::runtime_error {
public:
    TransferException(TransferError code, const std::string& what)
        : std::runtime_error(what), m_code(code) {}

    TransferError code() const { return m_code; }

    // Worth another attempt on a fresh connection
    bool retriable() const {
        return m_code == TransferError::CONNECT_FAILED ||
               m_code == TransferError::TIMEOUT ||
               m_code == TransferError::IO_ERROR ||
               m_code == TransferError::PROTOCOL_ERROR;
    }

private:
    TransferError m_code;
};

class TransferConnectError : public TransferException {
public:
    explicit TransferConnectError(const std::string& what)
        : TransferException(TransferError::CONNECT_FAILED, what) {}
};

class TransferTimeoutError : public TransferException {
public:
    explicit TransferTimeoutError(const std::string& what)
        : TransferException(TransferError::TIMEOUT, what) {}
};

class TransferIoError : public TransferException {
public:
    explicit TransferIoError(const std::string& what)
        : TransferException(TransferError::IO_ERROR, what) {}
};

class ChecksumMismatchError : public TransferException {
public:
    explicit ChecksumMismatchError(const std::string& what)
        : TransferException(TransferError::CHECKSUM_MISMATCH, what) {}
};

class ProtocolError : public TransferException {
public:
    explicit ProtocolError(const std::string& what)
        : TransferException(TransferError::PROTOCOL_ERROR, what) {}
};

class TransferCancelled : public TransferException {
public:
    explicit TransferCancelled(const std::string& what)
        : TransferException(TransferError::CANCELLED, what) {}
};

class RdmaUnavailable : public TransferException {
public:
    explicit RdmaUnavailable(const std::string& what)
        : TransferException(TransferError::RDMA_UNAVAILABLE, what) {}
};

#endif // TRANSFER_ERRORS_H
