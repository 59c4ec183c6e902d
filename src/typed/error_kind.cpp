/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "typed/error_kind.hpp"

#include "codec/codec_error.hpp"
#include "storage/storage_error.hpp"

namespace strata {

  ErrorKind errorKind(const std::error_code &ec) {
    using codec::CodecError;
    using storage::StorageError;

    if (ec == StorageError::CONFLICT) {
      return ErrorKind::Conflict;
    }
    if (ec.category() == make_error_code(StorageError::UNKNOWN).category()) {
      return ErrorKind::Storage;
    }
    if (ec == CodecError::ENCODE_FAILED) {
      return ErrorKind::Encode;
    }
    if (ec.category() == make_error_code(CodecError::DECODE_FAILED).category()) {
      return ErrorKind::Decode;
    }
    return ErrorKind::Domain;
  }

}  // namespace strata
