#pragma once

#include <stdexcept>
#include <string>

namespace voucher::util {

/*
  Central error types.

  Verification outcomes are NOT errors; see VerificationResult.
  Everything here is recoverable: callers return to the idle/scan state.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedVoucher : public std::runtime_error {
 public:
  explicit MalformedVoucher(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedAddress : public std::runtime_error {
 public:
  explicit MalformedAddress(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientAllowance : public std::runtime_error {
 public:
  explicit InsufficientAllowance(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientBalance : public std::runtime_error {
 public:
  explicit InsufficientBalance(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Persistence failed; the enclosing ledger transaction was rolled back.
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CryptoError : public std::runtime_error {
 public:
  explicit CryptoError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace voucher::util
