// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "byte_cursor.hpp"
#include "parse_config.hpp"
#include "peres_def.hpp"
#include "record_header.hpp"
#include "record_types.hpp"

#include <cstdint>

namespace perfev {

using RecordDecodeFun = PERes (*)(const ParseConfig &config, uint16_t misc,
                                  ByteCursor &cursor, RecordEvent *event);

/// Decoding routine for a record type. Never null: types this library does
/// not know are decoded as UnknownRecord.
RecordDecodeFun record_decoder_for(uint32_t type);

/// True for the record types this library decodes
bool is_known_record_type(uint32_t type);

/// PERF_RECORD_* name ("UNKNOWN" if not known)
const char *record_type_str(uint32_t type);

/// False for the types whose body is not followed by a sample_id trailer
/// (samples hold the same fields in their body)
bool record_type_has_sample_id(uint32_t type);

/// Decode a record body. `body` covers the bytes following the header, up to
/// the size declared by the header.
PERes decode_record(const ParseConfig &config, const RecordHeader &header,
                    ByteCursor body, Record *out);

/// Decode only the sample_id of a record. The trailer is read directly for
/// non-sample records, samples are decoded to extract the same fields.
PERes decode_record_sample_id(const ParseConfig &config,
                              const RecordHeader &header, ByteCursor body,
                              SampleId *out);

} // namespace perfev
