/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/codec_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(strata::codec, CodecError, e) {
  using E = strata::codec::CodecError;
  switch (e) {
    case E::ENCODE_FAILED:
      return "value can not be encoded";
    case E::DECODE_FAILED:
      return "bytes can not be decoded as the requested type";
    case E::TRAILING_BYTES:
      return "unexpected bytes after the decoded value";
  }
  return "unknown codec error";
}
