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

#include "options.h"
#include <fstream>
#include <map>

using namespace std;

namespace xbridge
{
    namespace cli
    {
        const char* HELP = "help";
        const char* HELP_FULL = "help,h";
        const char* VERSION = "version";
        const char* VERSION_FULL = "version,v";
        const char* COMMAND = "command";
        const char* LOG_LEVEL = "log_level";
        const char* FILE_LOG_LEVEL = "file_log_level";
        const char* LOG_DIR = "log_dir";
        const char* LOG_INFO = "info";
        const char* LOG_DEBUG = "debug";
        const char* LOG_VERBOSE = "verbose";
        const char* STORAGE = "storage";
        const char* PROGRAM_ID = "program_id";
        // commands
        const char* CMD_LEAF = "leaf";
        const char* CMD_TREE = "tree";
        const char* CMD_ROOT = "root";
        const char* CMD_SIGN = "sign";
        const char* CMD_VERIFY = "verify";
        const char* CMD_PUBKEY = "pubkey";
        const char* CMD_ROTATE_MSG = "rotate_msg";
        const char* CMD_DUMP = "dump";
        // command arguments
        const char* ORIGIN = "origin";
        const char* RECEIVER = "receiver";
        const char* PROGRAM = "program";
        const char* KIND = "kind";
        const char* AMOUNT = "amount";
        const char* MINT = "mint";
        const char* COLLECTION = "collection";
        const char* NAME = "name";
        const char* SYMBOL = "symbol";
        const char* URI = "uri";
        const char* BATCH = "batch";
        const char* LEAF = "leaf";
        const char* PATH = "path";
        const char* MESSAGE = "message";
        const char* SECRET = "secret";
        const char* SIGNATURE = "signature";
        const char* RECOVERY_ID = "recovery_id";
        const char* PUBKEY = "pubkey";
        const char* SEEDS = "seeds";
    }

    pair<po::options_description, po::options_description> createOptionsDescription(int flags)
    {
        po::options_description general_options("General options");
        general_options.add_options()
            (cli::HELP_FULL, "list of all options")
            (cli::VERSION_FULL, "return project version")
            (cli::LOG_LEVEL, po::value<string>(), "log level [info|debug|verbose]")
            (cli::FILE_LOG_LEVEL, po::value<string>(), "file log level [info|debug|verbose]")
            (cli::LOG_DIR, po::value<string>()->default_value("logs"), "directory for the log files");

        const bridge::Config cfgDef;

        po::options_description bridge_options("Bridge configuration");
        bridge_options.add_options()
            (cli::PROGRAM_ID, po::value<string>()->default_value(cfgDef.ProgramID.str()), "bridge program id [hex]");

#define THE_MACRO(type, name, option, comment) (option, po::value<type>()->default_value(cfgDef.name), comment)

        bridge_options.add_options() XBRIDGE_BRIDGE_PARAMS(THE_MACRO);

#undef THE_MACRO

        po::options_description tool_options("Tool options");
        tool_options.add_options()
            (cli::COMMAND, po::value<string>(), "command to execute [leaf|tree|root|sign|verify|pubkey|rotate_msg|dump]")
            (cli::STORAGE, po::value<string>()->default_value("xbridge.db"), "bridge storage path")
            (cli::ORIGIN, po::value<string>(), "source event id [hex]")
            (cli::RECEIVER, po::value<string>(), "receiver address [hex]")
            (cli::PROGRAM, po::value<string>(), "destination program, the bridge program id if omitted [hex]")
            (cli::KIND, po::value<string>()->default_value("native"), "token kind [native|ft|nft]")
            (cli::AMOUNT, po::value<Amount>()->default_value(0), "amount in the smallest units")
            (cli::MINT, po::value<string>(), "token mint [hex]")
            (cli::COLLECTION, po::value<string>(), "NFT collection [hex]")
            (cli::NAME, po::value<string>()->default_value(""), "token name")
            (cli::SYMBOL, po::value<string>()->default_value(""), "token symbol")
            (cli::URI, po::value<string>()->default_value(""), "token uri")
            (cli::BATCH, po::value<string>(), "path to a JSON batch of transfers")
            (cli::LEAF, po::value<string>(), "leaf hash [hex]")
            (cli::PATH, po::value<string>()->default_value(""), "merkle path, comma-separated [hex]")
            (cli::MESSAGE, po::value<string>(), "32-byte message [hex]")
            (cli::SECRET, po::value<string>(), "secp256k1 secret key [hex]")
            (cli::SIGNATURE, po::value<string>(), "64-byte signature r||s [hex]")
            (cli::RECOVERY_ID, po::value<uint32_t>()->default_value(0), "signature recovery id")
            (cli::PUBKEY, po::value<string>(), "64-byte uncompressed public key [hex]")
            (cli::SEEDS, po::value<string>(), "seeds of the bridge admin account [hex]");

        po::options_description options{ "Allowed options" };
        po::options_description visible_options{ "Allowed options" };
        if (flags & GENERAL_OPTIONS)
        {
            options.add(general_options);
            visible_options.add(general_options);
        }
        if (flags & BRIDGE_OPTIONS)
        {
            options.add(bridge_options);
            visible_options.add(bridge_options);
        }
        if (flags & TOOL_OPTIONS)
        {
            options.add(tool_options);
            visible_options.add(tool_options);
        }

        return { options, visible_options };
    }

    po::variables_map getOptions(int argc, char* argv[], const char* configFile, const po::options_description& options)
    {
        po::variables_map vm;
        po::positional_options_description positional;
        positional.add(cli::COMMAND, 1);

        po::command_line_parser parser(argc, argv);
        parser.options(options);
        parser.positional(positional);
        po::store(parser.run(), vm); // value stored first is preferred

        {
            std::ifstream cfg(configFile);

            if (cfg)
            {
                po::store(po::parse_config_file(cfg, options), vm);
            }
        }

        return vm;
    }

    int getLogLevel(const std::string& dstLog, const po::variables_map& vm, int defaultValue)
    {
        const map<std::string, int> logLevels
        {
            { cli::LOG_DEBUG, LOG_LEVEL_DEBUG },
            { cli::LOG_INFO, LOG_LEVEL_INFO },
            { cli::LOG_VERBOSE, LOG_LEVEL_VERBOSE }
        };

        if (vm.count(dstLog))
        {
            auto level = vm[dstLog].as<string>();
            if (auto it = logLevels.find(level); it != logLevels.end())
            {
                return it->second;
            }
        }

        return defaultValue;
    }

    void getBridgeConfig(bridge::Config& cfg, const po::variables_map& vm)
    {
#define THE_MACRO(type, name, option, comment) \
        if (vm.count(option)) \
            cfg.name = vm[option].as<type>();

        XBRIDGE_BRIDGE_PARAMS(THE_MACRO)
#undef THE_MACRO

        if (vm.count(cli::PROGRAM_ID))
            readHexOption(cfg.ProgramID, vm, cli::PROGRAM_ID);
    }
}
