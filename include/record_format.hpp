// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "record_types.hpp"

#include <string>

namespace perfev {

// Human readable dumps. Only the fields present in the record are printed,
// addresses are in hex.

std::string to_string(const Record &record);
std::string to_string(const Sample &sample);
std::string to_string(const SampleId &sample_id);
std::string to_string(const ReadValue &value);

} // namespace perfev
