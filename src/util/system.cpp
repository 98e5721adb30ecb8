// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "utilstrencodings.h"

#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <typeinfo>

ArgsManager gArgs;

const std::string CBaseChainParams::MAIN = "main";
const std::string CBaseChainParams::TESTNET = "test";
const std::string CBaseChainParams::REGTEST = "regtest";

std::string CBaseChainParams::DataDir(const std::string& chain)
{
    if (chain == CBaseChainParams::TESTNET) return "testnet";
    if (chain == CBaseChainParams::REGTEST) return "regtest";
    return "";
}

static int64_t atoi64(const std::string& str)
{
    try {
        return std::stoll(str);
    } catch (const std::exception&) {
        return 0;
    }
}

/** Interpret a string argument as a boolean. */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi64(strValue) != 0);
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_command_line_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-') {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Interpret --foo as -foo.
        if (key.length() > 1 && key[1] == '-')
            key = key.substr(1);

        // Interpret -nofoo as -foo=0 (and -nofoo=0 as -foo=1)
        if (key.length() > 3 && key.compare(1, 2, "no") == 0) {
            key = "-" + key.substr(3);
            val = InterpretBool(val) ? "0" : "1";
        }

        m_command_line_args[key].push_back(TrimString(val));
    }
    return true;
}

bool ArgsManager::GetArgInternal(const std::string& strArg, std::string& strValue) const
{
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    it = m_command_line_args.find(strArg);
    if (it != m_command_line_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) return it->second;
    it = m_command_line_args.find(strArg);
    if (it != m_command_line_args.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    return GetArgInternal(strArg, value);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    if (GetArgInternal(strArg, value)) return value;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    if (GetArgInternal(strArg, value)) return atoi64(value);
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string value;
    if (GetArgInternal(strArg, value)) return InterpretBool(value);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

bool ArgsManager::SoftSetBoolArg(const std::string& strArg, bool fValue)
{
    if (fValue)
        return SoftSetArg(strArg, std::string("1"));
    else
        return SoftSetArg(strArg, std::string("0"));
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args[strArg] = {strValue};
}

std::string ArgsManager::GetChainName() const
{
    const bool fRegTest = GetBoolArg("-regtest", false);
    const bool fTestNet = GetBoolArg("-testnet", false);

    if (fTestNet && fRegTest)
        throw std::runtime_error("Invalid combination of -regtest and -testnet.");
    if (fRegTest)
        return CBaseChainParams::REGTEST;
    if (fTestNet)
        return CBaseChainParams::TESTNET;
    return GetArg("-chain", CBaseChainParams::MAIN);
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();
    m_command_line_args.clear();
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread)
{
    std::string message;
    if (pex)
        message = strprintf("EXCEPTION: %s       \n%s       \n%s in %s       \n", typeid(*pex).name(), pex->what(), "chainbills", pszThread);
    else
        message = strprintf("UNKNOWN EXCEPTION       \n%s in %s       \n", "chainbills", pszThread);
    LogPrintf("\n\n************************\n%s\n", message);
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.chainbills
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".chainbills";
}

static fs::path pathCached;
static fs::path pathCachedNetSpecific;
static std::mutex csPathCached;

const fs::path& GetDataDir(bool fNetSpecific)
{
    std::lock_guard<std::mutex> lock(csPathCached);

    fs::path& path = fNetSpecific ? pathCachedNetSpecific : pathCached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    if (gArgs.IsArgSet("-datadir")) {
        path = fs::absolute(gArgs.GetArg("-datadir", ""));
        if (!fs::is_directory(path)) {
            path = "";
            return path;
        }
    } else {
        path = GetDefaultDataDir();
    }
    if (fNetSpecific)
        path /= CBaseChainParams::DataDir(gArgs.GetChainName());

    if (fs::create_directories(path)) {
        LogPrintf("Created data directory %s\n", path.string());
    }

    return path;
}

void ClearDatadirCache()
{
    std::lock_guard<std::mutex> lock(csPathCached);

    pathCached = fs::path();
    pathCachedNetSpecific = fs::path();
}

bool TryCreateDirectories(const fs::path& p)
{
    try {
        return fs::create_directories(p);
    } catch (const fs::filesystem_error&) {
        if (!fs::exists(p) || !fs::is_directory(p))
            throw;
    }

    // create_directories didn't create the directory, it had to have existed already
    return false;
}
