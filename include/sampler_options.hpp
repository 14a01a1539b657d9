// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

namespace perfev {

struct SamplerOptions {
  // A record that fails to decode stops the sampler instead of being skipped
  bool strict_decoding{false};
  // Log a warning for every record skipped because of a decode error
  bool log_skipped_records{true};
};

} // namespace perfev
