/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/codec.hpp"
#include "codec/codec_error.hpp"
#include "storage/rocksdb/rocksdb.hpp"
#include "storage/storage_error.hpp"
#include "typed/batch.hpp"
#include "typed/bound.hpp"
#include "typed/collection.hpp"
#include "typed/entry.hpp"
#include "typed/error_kind.hpp"
#include "typed/iter.hpp"
#include "typed/transaction.hpp"
#include "typed/transactional_view.hpp"
#include "typed/views.hpp"
