#pragma once
#include <stdexcept>

namespace flowtx::core {

  struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
  };

  // Malformed hex, address or encoded input.
  struct DecodeError : Error {
    using Error::Error;
  };

  // Malformed key material or a failed signing/verification primitive.
  struct CryptoError : Error {
    using Error::Error;
  };

  struct InvalidArgument : Error {
    using Error::Error;
  };

  // A value does not fit the fixed width of its field.
  struct EncodingOverflow : Error {
    using Error::Error;
  };
}
