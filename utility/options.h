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

#include <boost/program_options.hpp>
#include "bridge/common.h"
#include "logger.h"

namespace xbridge
{
    namespace po = boost::program_options;
    namespace cli
    {
        extern const char* HELP;
        extern const char* HELP_FULL;
        extern const char* VERSION;
        extern const char* VERSION_FULL;
        extern const char* COMMAND;
        extern const char* LOG_LEVEL;
        extern const char* FILE_LOG_LEVEL;
        extern const char* LOG_DIR;
        extern const char* LOG_INFO;
        extern const char* LOG_DEBUG;
        extern const char* LOG_VERBOSE;
        extern const char* STORAGE;
        extern const char* PROGRAM_ID;
        // commands
        extern const char* CMD_LEAF;
        extern const char* CMD_TREE;
        extern const char* CMD_ROOT;
        extern const char* CMD_SIGN;
        extern const char* CMD_VERIFY;
        extern const char* CMD_PUBKEY;
        extern const char* CMD_ROTATE_MSG;
        extern const char* CMD_DUMP;
        // command arguments
        extern const char* ORIGIN;
        extern const char* RECEIVER;
        extern const char* PROGRAM;
        extern const char* KIND;
        extern const char* AMOUNT;
        extern const char* MINT;
        extern const char* COLLECTION;
        extern const char* NAME;
        extern const char* SYMBOL;
        extern const char* URI;
        extern const char* BATCH;
        extern const char* LEAF;
        extern const char* PATH;
        extern const char* MESSAGE;
        extern const char* SECRET;
        extern const char* SIGNATURE;
        extern const char* RECOVERY_ID;
        extern const char* PUBKEY;
        extern const char* SEEDS;
    }

    enum OptionsFlag : int
    {
        GENERAL_OPTIONS = 1 << 0,
        BRIDGE_OPTIONS  = 1 << 1,
        TOOL_OPTIONS    = 1 << 2,

        ALL_OPTIONS     = GENERAL_OPTIONS | BRIDGE_OPTIONS | TOOL_OPTIONS
    };

    // all options, and the ones shown in help
    std::pair<po::options_description, po::options_description> createOptionsDescription(int flags = ALL_OPTIONS);

    // command line first, then the config file if it exists. Values stored first are preferred
    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options);

    int getLogLevel(const std::string& dstLog, const po::variables_map& vm, int defaultValue = LOG_LEVEL_INFO);

    // throws std::runtime_error on a malformed program id
    void getBridgeConfig(bridge::Config&, const po::variables_map& vm);

    // hex value of a required option, throws std::runtime_error if it's missing or malformed
    template <uint32_t nBytes>
    void readHexOption(uintBig_t<nBytes>& val, const po::variables_map& vm, const char* szName)
    {
        if (!vm.count(szName))
            throw std::runtime_error(std::string("missing option: ") + szName);

        if (!val.Scan(vm[szName].as<std::string>().c_str()))
            throw std::runtime_error(std::string("expected ") + std::to_string(nBytes) + " hex bytes in " + szName);
    }
}
