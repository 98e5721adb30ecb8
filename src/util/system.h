// Copyright (c) 2026 The Chainbills developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, data directory
 * resolution and error helpers.
 */
#ifndef CHAINBILLS_SYSTEM_H
#define CHAINBILLS_SYSTEM_H

#include "fs.h"
#include "logging.h"
#include "util/format.h"

#include <map>
#include <mutex>
#include <stdint.h>
#include <string>
#include <vector>

template <typename... Args>
bool error(const char* fmt, const Args&... args)
{
    LogPrintf("ERROR: %s\n", tfm::format(fmt, args...));
    return false;
}

void PrintExceptionContinue(const std::exception* pex, const char* pszThread);

fs::path GetDefaultDataDir();
const fs::path& GetDataDir(bool fNetSpecific = true);
void ClearDatadirCache();
bool TryCreateDirectories(const fs::path& p);

class ArgsManager
{
protected:
    mutable std::mutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_command_line_args;

    bool GetArgInternal(const std::string& strArg, std::string& strValue) const;

public:
    /**
     * Parse "-name[=value]" and "--name[=value]" arguments. A "-noname"
     * argument sets "-name" to "0".
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Return a vector of strings of the given argument
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return command-line arguments
     */
    std::vector<std::string> GetArgs(const std::string& strArg) const;

    /**
     * Return true if the given argument has been manually set
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @return true if the argument has been set
     */
    bool IsArgSet(const std::string& strArg) const;

    /**
     * Return string argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param strDefault (e.g. "1")
     * @return command-line argument or default value
     */
    std::string GetArg(const std::string& strArg, const std::string& strDefault) const;

    /**
     * Return integer argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param nDefault (e.g. 1)
     * @return command-line argument (0 if invalid number) or default value
     */
    int64_t GetArg(const std::string& strArg, int64_t nDefault) const;

    /**
     * Return boolean argument or default value
     *
     * @param strArg Argument to get (e.g. "-foo")
     * @param fDefault (true or false)
     * @return command-line argument or default value
     */
    bool GetBoolArg(const std::string& strArg, bool fDefault) const;

    /**
     * Set an argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param strValue Value (e.g. "1")
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetArg(const std::string& strArg, const std::string& strValue);

    /**
     * Set a boolean argument if it doesn't already have a value
     *
     * @param strArg Argument to set (e.g. "-foo")
     * @param fValue Value (e.g. false)
     * @return true if argument gets set, false if it already had a value
     */
    bool SoftSetBoolArg(const std::string& strArg, bool fValue);

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    /**
     * Looks for -regtest, -testnet and returns the appropriate chain name,
     * or the value of -chain when given.
     * @return CBaseChainParams::MAIN by default; raises runtime error if an invalid combination is given.
     */
    std::string GetChainName() const;

    /** Clear all arguments. Tests only. */
    void ClearArgs();
};

extern ArgsManager gArgs;

namespace CBaseChainParams {
    extern const std::string MAIN;
    extern const std::string TESTNET;
    extern const std::string REGTEST;

    /** Data directory subfolder of a network, empty for main. */
    std::string DataDir(const std::string& chain);
} // namespace CBaseChainParams

#endif // CHAINBILLS_SYSTEM_H
