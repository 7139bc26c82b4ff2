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

#include "utility/test_helpers.h"
#include "utility/string_helpers.h"
#include "utility/options.h"
#include "utility/logger.h"
#include "utility/helpers.h"
#include <boost/filesystem.hpp>
#include <fstream>
#include <time.h>

XBRIDGE_TEST_MAIN_DEFS

using namespace xbridge;
using namespace std;

namespace
{
    // parses a fake command line the way main() does
    po::variables_map ParseArgs(std::vector<std::string> args, const char* configFile, const po::options_description& options)
    {
        args.insert(args.begin(), "xbridge-cli");

        std::vector<char*> argv;
        for (auto& s : args)
            argv.push_back(&s.front());

        return getOptions(static_cast<int>(argv.size()), argv.data(), configFile, options);
    }

    void TestSplit()
    {
        auto v = string_helpers::split("a, b ,c", ',');
        verify_test(v.size() == 3);
        verify_test(v[0] == "a" && v[1] == "b" && v[2] == "c");

        v = string_helpers::split("a, b", ',', false);
        verify_test(v.size() == 2);
        verify_test(v[1] == " b");

        v = string_helpers::split("a,,b", ',');
        verify_test(v.size() == 3);
        verify_test(v[1].empty());

        verify_test(string_helpers::split("", ',').empty());
        verify_test(string_helpers::split("abc", ',').size() == 1);
    }

    void TestOptions()
    {
        auto [options, visibleOptions] = createOptionsDescription();

        const bridge::Config cfgDef;

        {
            auto vm = ParseArgs({ "leaf", "--amount=150", "--kind", "ft" }, "", options);
            po::notify(vm);

            verify_test(vm[cli::COMMAND].as<std::string>() == cli::CMD_LEAF);
            verify_test(vm[cli::AMOUNT].as<Amount>() == 150);
            verify_test(vm[cli::KIND].as<std::string>() == "ft");
            verify_test(vm[cli::STORAGE].as<std::string>() == "xbridge.db");

            bridge::Config cfg;
            getBridgeConfig(cfg, vm);
            verify_test(cfg.NetworkTag == cfgDef.NetworkTag);
            verify_test(cfg.MaxPathLength == cfgDef.MaxPathLength);
            verify_test(cfg.ProgramID == cfgDef.ProgramID);
        }

        helpers::TempFile cfgFile("xbridge_options_test.cfg");
        {
            std::ofstream fs(cfgFile.c_str());
            fs << "network_tag=Ethereum" << std::endl;
            fs << "max_path_length=32" << std::endl;
            fs << "program_id=0x" << std::string(62, '0') << "2a" << std::endl;
        }

        {
            // the command line takes precedence over the config file
            auto vm = ParseArgs({ "dump", "--max_path_length=16" }, cfgFile.c_str(), options);
            po::notify(vm);

            bridge::Config cfg;
            getBridgeConfig(cfg, vm);
            verify_test(cfg.NetworkTag == "Ethereum");
            verify_test(cfg.MaxPathLength == 16);
            verify_test(cfg.MaxAddressSize == cfgDef.MaxAddressSize);

            bridge::Address expected = Zero;
            expected.m_pData[bridge::Address::nBytes - 1] = 0x2a;
            verify_test(cfg.ProgramID == expected);
        }

        {
            auto vm = ParseArgs({ "dump", "--program_id=123" }, "", options);
            po::notify(vm);

            bridge::Config cfg;
            bool bThrown = false;
            try
            {
                getBridgeConfig(cfg, vm);
            }
            catch (const std::runtime_error&)
            {
                bThrown = true;
            }
            verify_test(bThrown);
        }

        {
            auto vm = ParseArgs({ "sign", "--message", std::string(64, 'f') }, "", options);

            bridge::Hash msg = Zero;
            readHexOption(msg, vm, cli::MESSAGE);
            bridge::Hash expected;
            memset(expected.m_pData, 0xff, sizeof(expected.m_pData));
            verify_test(msg == expected);

            bool bThrown = false;
            try
            {
                Ecdsa::Secret sk;
                readHexOption(sk, vm, cli::SECRET); // absent
            }
            catch (const std::runtime_error&)
            {
                bThrown = true;
            }
            verify_test(bThrown);
        }

        {
            bool bThrown = false;
            try
            {
                ParseArgs({ "leaf", "--amount=lots" }, "", options);
            }
            catch (const po::error&)
            {
                bThrown = true;
            }
            verify_test(bThrown);
        }

        {
            auto vm = ParseArgs({ "--log_level=debug", "--file_log_level=bogus" }, "", options);
            verify_test(getLogLevel(cli::LOG_LEVEL, vm) == LOG_LEVEL_DEBUG);
            verify_test(getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED) == LOG_SINK_DISABLED);
            verify_test(getLogLevel("no_such_option", vm) == LOG_LEVEL_INFO);
        }

        auto [generalOnly, visibleGeneral] = createOptionsDescription(GENERAL_OPTIONS);
        verify_test(generalOnly.find_nothrow(cli::LOG_DIR, false));
        verify_test(!generalOnly.find_nothrow(cli::AMOUNT, false));
        verify_test(!visibleGeneral.find_nothrow(cli::PROGRAM_ID, false));
    }

    void TestHelpers()
    {
        const uint8_t pBytes[] = { 0x00, 0x1f, 0xa0, 0xff };
        verify_test(to_hex(pBytes, sizeof(pBytes)) == "001fa0ff");
        verify_test(to_hex(pBytes, 0).empty());

        // 2020-01-02 03:04:05.678 in the local zone
        struct tm tm = {};
        tm.tm_year = 120;
        tm.tm_mon = 0;
        tm.tm_mday = 2;
        tm.tm_hour = 3;
        tm.tm_min = 4;
        tm.tm_sec = 5;
        tm.tm_isdst = -1;
        uint64_t ts = static_cast<uint64_t>(mktime(&tm)) * 1000 + 678;

        verify_test(format_timestamp("%Y-%m-%d.%T", ts) == "2020-01-02.03:04:05.678");
        verify_test(format_timestamp("%H:%M", ts, false) == "03:04");

        uint64_t t0 = local_timestamp_msec();
        verify_test(t0 > ts);
    }

    void TestLogger()
    {
        {
            auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_LEVEL_INFO, LOG_SINK_DISABLED);
            verify_test(Logger::will_log(LOG_LEVEL_INFO));
            verify_test(Logger::will_log(LOG_LEVEL_ERROR));
            verify_test(!Logger::will_log(LOG_LEVEL_VERBOSE));
        }
        verify_test(!Logger::will_log(LOG_LEVEL_CRITICAL));

        boost::filesystem::path dir = boost::filesystem::temp_directory_path() / boost::filesystem::unique_path("xbridge_logs_%%%%%%");

        std::string sFile;
        {
            auto logger = Logger::create(LOG_LEVEL_WARNING, LOG_SINK_DISABLED, LOG_LEVEL_DEBUG, "xbridge_test_", dir.string());
            sFile = logger->get_current_file_name();

            LOG_INFO() << "withdraw " << bridge::Address(7u);
            LOG_VERBOSE() << "not written";
        }

        verify_test(!sFile.empty());
        verify_test(boost::filesystem::exists(sFile));

        std::ifstream fs(sFile);
        std::string sLine;
        verify_test(static_cast<bool>(std::getline(fs, sLine)));
        verify_test(sLine.find(bridge::Address(7u).str()) != std::string::npos);
        fs.close();

        boost::filesystem::remove_all(dir);
    }
}

int main()
{
    TestSplit();
    TestOptions();
    TestHelpers();
    TestLogger();

    return g_TestsFailed ? -1 : 0;
}
