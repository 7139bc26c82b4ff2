// Copyright 2018 The Beam Team
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//    http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once
#include <string>
#include <stdint.h>
#include <stddef.h>

namespace xbridge {

// milliseconds since the Epoch
uint64_t local_timestamp_msec();

// strftime-formatted local time, with ".mmm" appended if formatMsec is set.
// Returns the number of chars written, not including the 0-term
size_t format_timestamp(char* buffer, size_t bufferCap, const char* formatStr, uint64_t timestamp, bool formatMsec = true);

std::string format_timestamp(const char* formatStr, uint64_t timestamp, bool formatMsec = true);

// Lowercase base16. The buffer must hold size*2 + 1 chars
char* to_hex(char* dst, const void* bytes, size_t size);
std::string to_hex(const void* bytes, size_t size);

} //namespace
