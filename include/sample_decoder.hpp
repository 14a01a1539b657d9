// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "byte_cursor.hpp"
#include "parse_config.hpp"
#include "peres_def.hpp"
#include "sample.hpp"

#include <cstdint>

namespace perfev {

/// Decode a PERF_RECORD_SAMPLE body. Fields are read in kernel order, each
/// one only if its bit is part of config.sample_type. Bytes left after the
/// last known field end up in Sample::extra.
PERes decode_sample(const ParseConfig &config, uint16_t misc,
                    ByteCursor &cursor, Sample *out);

/// struct read_format, shaped by config.read_format
PERes decode_read_value(const ParseConfig &config, ByteCursor &cursor,
                        ReadValue *out);

/// abi followed by one u64 per bit of `mask` (no value when abi is NONE)
PERes decode_registers(uint64_t mask, ByteCursor &cursor, Registers *out);

/// nr, optional hw_idx, then nr perf_branch_entry
PERes decode_branch_stack(const ParseConfig &config, ByteCursor &cursor,
                          std::optional<uint64_t> *hw_index,
                          std::vector<BranchEntry> *out);

} // namespace perfev
