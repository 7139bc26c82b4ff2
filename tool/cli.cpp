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

#include "utility/options.h"
#include "utility/string_helpers.h"
#include "bridge/payload.h"
#include "bridge/admin_store.h"
#include "bridge/processor.h"
#include "bridge/db.h"
#include "bridge/verifier.h"
#include "utility/helpers.h"
#include <boost/filesystem.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>

using namespace std;
using namespace xbridge;
using namespace xbridge::bridge;
using json = nlohmann::json;

namespace
{
	void printHelp(const po::options_description& options)
	{
		cout << options << std::endl;
	}

	template <uint32_t nBytes>
	void ParseHex(uintBig_t<nBytes>& val, const std::string& s, const char* szWhat)
	{
		if (!val.Scan(s.c_str()))
			throw std::runtime_error(std::string("malformed ") + szWhat + ": " + s);
	}

	TokenKind ParseKind(const std::string& s)
	{
		TokenKind kind;
		if (!TokenKindFromString(kind, s))
			throw std::runtime_error("unknown token kind: " + s);
		return kind;
	}

	// The transfer description shared by the command line and the batch file
	struct TransferArgs
	{
		std::string m_Origin;
		std::string m_Receiver;
		std::string m_Program;
		std::string m_Kind = "native";
		Amount m_Amount = 0;
		std::string m_Mint;
		std::string m_Collection;
		std::string m_Name;
		std::string m_Symbol;
		std::string m_Uri;

		void FromOptions(const po::variables_map& vm)
		{
			auto get = [&vm](std::string& s, const char* szName)
			{
				if (vm.count(szName))
					s = vm[szName].as<std::string>();
			};

			get(m_Origin, cli::ORIGIN);
			get(m_Receiver, cli::RECEIVER);
			get(m_Program, cli::PROGRAM);
			get(m_Kind, cli::KIND);
			get(m_Mint, cli::MINT);
			get(m_Collection, cli::COLLECTION);
			get(m_Name, cli::NAME);
			get(m_Symbol, cli::SYMBOL);
			get(m_Uri, cli::URI);
			m_Amount = vm[cli::AMOUNT].as<Amount>();
		}

		void FromJson(const json& j)
		{
			m_Origin = j.at(cli::ORIGIN).get<std::string>();
			m_Receiver = j.at(cli::RECEIVER).get<std::string>();
			m_Program = j.value(cli::PROGRAM, std::string());
			m_Kind = j.value(cli::KIND, m_Kind);
			m_Amount = j.value(cli::AMOUNT, Amount(0));
			m_Mint = j.value(cli::MINT, std::string());
			m_Collection = j.value(cli::COLLECTION, std::string());
			m_Name = j.value(cli::NAME, std::string());
			m_Symbol = j.value(cli::SYMBOL, std::string());
			m_Uri = j.value(cli::URI, std::string());
		}

		void Export(ContentLeaf& leaf, const Config& cfg) const
		{
			if (m_Origin.empty())
				throw std::runtime_error("origin is missing");
			if (m_Receiver.empty())
				throw std::runtime_error("receiver is missing");

			ParseHex(leaf.m_Origin, m_Origin, cli::ORIGIN);
			ParseHex(leaf.m_Receiver, m_Receiver, cli::RECEIVER);

			if (m_Program.empty())
				leaf.m_Program = cfg.ProgramID;
			else
				ParseHex(leaf.m_Program, m_Program, cli::PROGRAM);

			switch (ParseKind(m_Kind))
			{
			case TokenKind::Native:
				{
					Payload::Native p;
					p.m_Amount = m_Amount;
					leaf.m_Payload = p;
				}
				break;

			case TokenKind::FT:
				{
					Payload::FungibleTransfer p;
					ParseMint(p.m_Mint);
					p.m_Amount = m_Amount;
					p.m_Name = m_Name;
					p.m_Symbol = m_Symbol;
					p.m_Uri = m_Uri;
					leaf.m_Payload = p;
				}
				break;

			default:
				{
					Payload::NonFungibleTransfer p;
					ParseMint(p.m_Mint);
					if (!m_Collection.empty())
					{
						p.m_Collection.emplace();
						ParseHex(*p.m_Collection, m_Collection, cli::COLLECTION);
					}
					p.m_Name = m_Name;
					p.m_Symbol = m_Symbol;
					p.m_Uri = m_Uri;
					leaf.m_Payload = p;
				}
			}
		}

	private:
		void ParseMint(Address& mint) const
		{
			if (m_Mint.empty())
				throw std::runtime_error("mint is missing");
			ParseHex(mint, m_Mint, cli::MINT);
		}
	};

	int CmdLeaf(const po::variables_map& vm, const Config& cfg)
	{
		TransferArgs args;
		args.FromOptions(vm);

		ContentLeaf leaf;
		args.Export(leaf, cfg);

		ByteBuffer buf;
		leaf.Encode(buf, cfg.NetworkTag);
		LOG_VERBOSE() << "Encoded leaf: " << to_hex(buf.data(), buf.size());

		Hash hv;
		leaf.get_Hash(hv, cfg.NetworkTag);

		LOG_DEBUG() << "Leaf kind=" << get_TokenKindName(get_Kind(leaf.m_Payload)) << ", amount=" << get_Amount(leaf.m_Payload);
		cout << hv << endl;
		return 0;
	}

	int CmdTree(const po::variables_map& vm, const Config& cfg)
	{
		if (!vm.count(cli::BATCH))
			throw std::runtime_error("batch file is missing");

		std::string sPath = vm[cli::BATCH].as<std::string>();
		std::ifstream fs(sPath);
		if (!fs)
			throw std::runtime_error("can't open " + sPath);

		json jBatch = json::parse(fs);
		if (!jBatch.is_array() || jBatch.empty())
			throw std::runtime_error("batch must be a non-empty array of transfers");

		Merkle::Builder bld;
		for (const auto& jItem : jBatch)
		{
			TransferArgs args;
			args.FromJson(jItem);

			ContentLeaf leaf;
			args.Export(leaf, cfg);

			leaf.get_Hash(bld.m_vLeafs.emplace_back(), cfg.NetworkTag);
		}

		if (bld.m_vLeafs.size() < 2)
			throw std::runtime_error("batch must contain at least 2 transfers, a lone leaf has no proof path");

		Hash hvRoot;
		std::vector<Merkle::Path> vPaths;
		bridge::BuildBatch(hvRoot, vPaths, bld, cfg.MaxPathLength);

		json jLeafs = json::array();
		for (size_t i = 0; i < bld.m_vLeafs.size(); i++)
		{
			json jPath = json::array();
			for (const auto& hv : vPaths[i])
				jPath.push_back(hv.str());

			jLeafs.push_back(
				{
					{ "leaf", bld.m_vLeafs[i].str() },
					{ "path", jPath }
				});
		}

		json jOut =
		{
			{ "root", hvRoot.str() },
			{ "leafs", jLeafs }
		};

		LOG_INFO() << "Batch of " << bld.m_vLeafs.size() << " transfers, root " << hvRoot;
		cout << jOut.dump(4) << endl;
		return 0;
	}

	int CmdRoot(const po::variables_map& vm, const Config& cfg)
	{
		Hash hvLeaf;
		readHexOption(hvLeaf, vm, cli::LEAF);

		Merkle::Path path;
		for (const auto& s : string_helpers::split(vm[cli::PATH].as<std::string>(), ','))
			ParseHex(path.emplace_back(), s, cli::PATH);

		// same rules as a withdraw: a non-empty path within the configured length
		Hash hv;
		bridge::ComputeRoot(hv, hvLeaf, path, cfg.MaxPathLength);
		cout << hv << endl;
		return 0;
	}

	int CmdSign(const po::variables_map& vm)
	{
		Ecdsa::Secret sk;
		readHexOption(sk, vm, cli::SECRET);

		Hash msg;
		readHexOption(msg, vm, cli::MESSAGE);

		Signature sig;
		uint8_t nRecoveryId = 0;
		if (!Ecdsa::Sign(sig, nRecoveryId, sk, msg))
			throw std::runtime_error("signing failed");

		cout << "signature: " << sig << endl;
		cout << "recovery_id: " << static_cast<uint32_t>(nRecoveryId) << endl;
		return 0;
	}

	int CmdVerify(const po::variables_map& vm)
	{
		Hash msg;
		readHexOption(msg, vm, cli::MESSAGE);

		Signature sig;
		readHexOption(sig, vm, cli::SIGNATURE);

		PubKey pkExpected;
		readHexOption(pkExpected, vm, cli::PUBKEY);

		uint32_t nRecoveryId = vm[cli::RECOVERY_ID].as<uint32_t>();

		PubKey pk;
		bool bValid =
			(nRecoveryId <= Ecdsa::s_RecoveryIdMax) &&
			Ecdsa::RecoverPublicKey(pk, msg, sig, static_cast<uint8_t>(nRecoveryId)) &&
			(pk == pkExpected);

		cout << (bValid ? "valid" : "invalid") << endl;
		return bValid ? 0 : -1;
	}

	int CmdPubKey(const po::variables_map& vm)
	{
		Ecdsa::Secret sk;
		readHexOption(sk, vm, cli::SECRET);

		PubKey pk;
		if (!Ecdsa::get_PublicKey(pk, sk))
			throw std::runtime_error("invalid secret key");

		cout << pk << endl;
		return 0;
	}

	int CmdRotateMsg(const po::variables_map& vm)
	{
		PubKey pk;
		readHexOption(pk, vm, cli::PUBKEY);

		Hash msg;
		AdminKeyStore::get_RotationMessage(msg, pk);

		cout << msg << endl;
		return 0;
	}

	struct WithdrawPrinter
		:public IAccountWalker
	{
		uint32_t m_Count = 0;

		bool OnAccount(const Address& addr, const Address& owner, const ByteBuffer& data) override
		{
			LOG_DEBUG() << "Account " << addr << ", owner " << owner << ", data " << to_hex(data.data(), data.size());

			if (WithdrawRecord::s_Size != data.size())
				return true;

			WithdrawRecord rec;
			if (!rec.Import(data) || !rec.m_Initialized)
				return true;

			m_Count++;
			cout << "withdraw " << addr << endl;
			cout << "\torigin: " << rec.m_Origin << endl;
			cout << "\tkind: " << get_TokenKindName(rec.m_Kind) << endl;
			if (rec.m_Mint)
				cout << "\tmint: " << *rec.m_Mint << endl;
			cout << "\tamount: " << rec.m_Amount << endl;
			cout << "\treceiver: " << rec.m_Receiver << endl;
			return true;
		}
	};

	int CmdDump(const po::variables_map& vm, const Config& cfg)
	{
		std::string sPath = vm[cli::STORAGE].as<std::string>();
		if (!boost::filesystem::exists(sPath))
			throw std::runtime_error("storage not found: " + sPath);

		BridgeDB db;
		db.Open(sPath.c_str());

		LOG_INFO() << "Accounts in storage: " << db.get_AccountsCount();

		if (vm.count(cli::SEEDS))
		{
			Seed seeds;
			readHexOption(seeds, vm, cli::SEEDS);

			KeccakAddressDeriver deriver;
			Address adminAddr = get_BridgeAdminAddress(deriver, cfg, seeds);

			AdminKeyStore store(db, adminAddr);
			const AdminRecord& rec = store.get_Record();

			cout << "admin " << adminAddr << endl;
			cout << "\tkey: " << rec.m_Key << endl;
			cout << "\tcommission program: " << rec.m_CommissionProgram << endl;
		}

		WithdrawPrinter wp;
		db.EnumAccounts(wp);

		LOG_INFO() << "Withdraw records: " << wp.m_Count;
		return 0;
	}

	int RunCommand(const std::string& sCmd, const po::variables_map& vm, const Config& cfg)
	{
		if (cli::CMD_LEAF == sCmd)
			return CmdLeaf(vm, cfg);
		if (cli::CMD_TREE == sCmd)
			return CmdTree(vm, cfg);
		if (cli::CMD_ROOT == sCmd)
			return CmdRoot(vm, cfg);
		if (cli::CMD_SIGN == sCmd)
			return CmdSign(vm);
		if (cli::CMD_VERIFY == sCmd)
			return CmdVerify(vm);
		if (cli::CMD_PUBKEY == sCmd)
			return CmdPubKey(vm);
		if (cli::CMD_ROTATE_MSG == sCmd)
			return CmdRotateMsg(vm);
		if (cli::CMD_DUMP == sCmd)
			return CmdDump(vm, cfg);

		LOG_ERROR() << "unknown command: '" << sCmd << "'";
		return -1;
	}
}

int main(int argc, char* argv[])
{
	try
	{
		auto [options, visibleOptions] = createOptionsDescription();

		po::variables_map vm;
		try
		{
			vm = getOptions(argc, argv, "xbridge.cfg", options);
		}
		catch (const po::error& e)
		{
			cout << e.what() << std::endl;
			printHelp(visibleOptions);

			return -1;
		}

		if (vm.count(cli::HELP))
		{
			printHelp(visibleOptions);

			return 0;
		}

		if (vm.count(cli::VERSION))
		{
			cout << PROJECT_VERSION << endl;
			return 0;
		}

		int logLevel = getLogLevel(cli::LOG_LEVEL, vm, LOG_LEVEL_WARNING);
		int fileLogLevel = getLogLevel(cli::FILE_LOG_LEVEL, vm, LOG_SINK_DISABLED);

#define LOG_FILES_PREFIX "xbridge_"

		const auto path = boost::filesystem::system_complete(vm[cli::LOG_DIR].as<std::string>());
		auto logger = xbridge::Logger::create(logLevel, logLevel, fileLogLevel, LOG_FILES_PREFIX, path.string());

		try
		{
			po::notify(vm);

			if (!vm.count(cli::COMMAND))
			{
				printHelp(visibleOptions);
				return -1;
			}

			Config cfg;
			getBridgeConfig(cfg, vm);

			return RunCommand(vm[cli::COMMAND].as<std::string>(), vm, cfg);
		}
		catch (const po::error& e)
		{
			LOG_ERROR() << e.what();
			printHelp(visibleOptions);
		}
		catch (const Exc& e)
		{
			LOG_ERROR() << get_CategoryName(e.get_Category()) << " " << get_ErrorName(e.get_Code()) << ": " << e.what();
		}
		catch (const std::runtime_error& e)
		{
			LOG_ERROR() << e.what();
		}
	}
	catch (const std::exception& e)
	{
		std::cout << e.what() << std::endl;
	}
	catch (const CorruptionException& e)
	{
		std::cout << "Corruption: " << e.m_sErr << std::endl;
	}

	return -1;
}
