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

#include "helpers.h"
#include <chrono>
#include <stdio.h>
#include <time.h>

namespace xbridge {

uint64_t local_timestamp_msec() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

size_t format_timestamp(char* buffer, size_t bufferCap, const char* formatStr, uint64_t timestamp, bool formatMsec) {
    if (!bufferCap)
        return 0;

    time_t seconds = static_cast<time_t>(timestamp / 1000);
    struct tm tm;
#ifdef WIN32
    localtime_s(&tm, &seconds);
#else
    localtime_r(&seconds, &tm);
#endif

    size_t n = strftime(buffer, bufferCap, formatStr, &tm);
    if (formatMsec && (bufferCap - n > 4)) {
        snprintf(buffer + n, 5, ".%03u", static_cast<unsigned int>(timestamp % 1000));
        n += 4;
    }
    return n;
}

std::string format_timestamp(const char* formatStr, uint64_t timestamp, bool formatMsec) {
    char buf[128];
    return std::string(buf, format_timestamp(buf, sizeof(buf), formatStr, timestamp, formatMsec));
}

char* to_hex(char* dst, const void* bytes, size_t size) {
    static const char s_szDigits[] = "0123456789abcdef";

    const uint8_t* p = static_cast<const uint8_t*>(bytes);
    for (size_t i = 0; i < size; i++) {
        dst[i * 2] = s_szDigits[p[i] >> 4];
        dst[i * 2 + 1] = s_szDigits[p[i] & 0xf];
    }
    dst[size * 2] = 0;
    return dst;
}

std::string to_hex(const void* bytes, size_t size) {
    std::string res(size * 2 + 1, 0);
    to_hex(&res.front(), bytes, size);
    res.pop_back();
    return res;
}

} //namespace
