// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Server/client environment: argument handling, config file parsing,
 * data directory.
 */
#ifndef CIPHERBATCH_UTIL_SYSTEM_H
#define CIPHERBATCH_UTIL_SYSTEM_H

#include "fs.h"
#include "sync.h"

#include <map>
#include <stdint.h>
#include <string>
#include <vector>

extern const char * const CIPHERBATCH_CONF_FILENAME;

class ArgsManager
{
protected:
    mutable RecursiveMutex cs_args;
    std::map<std::string, std::vector<std::string>> m_override_args;
    std::map<std::string, std::vector<std::string>> m_config_args;

    bool ReadConfigStream(std::istream& stream, std::string& error);

public:
    ArgsManager();

    /**
     * Parse command line arguments of the form -name[=value]. A leading
     * double dash is accepted as well. Non-option arguments end parsing.
     */
    bool ParseParameters(int argc, const char* const argv[], std::string& error);

    /**
     * Read key=value lines from a config file. Lines starting with '#' are
     * comments. Values from the command line take precedence.
     */
    bool ReadConfigFiles(std::string& error);
    bool ReadConfigFile(const fs::path& path, std::string& error);

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
     * Return true if the argument was originally passed as a negated option,
     * i.e. -nofoo.
     */
    bool IsArgNegated(const std::string& strArg) const;

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

    // Forces an arg setting. Called by SoftSetArg() if the arg hasn't already
    // been set. Also called directly in testing.
    void ForceSetArg(const std::string& strArg, const std::string& strValue);

    void ClearArgs();
};

extern ArgsManager gArgs;

const fs::path& GetDataDir();
fs::path GetDefaultDataDir();
void ClearDatadirCache();
fs::path GetConfigFile(const std::string& confPath);

/** Interpret a string argument as a boolean, -nofoo style negation aside */
bool InterpretBool(const std::string& strValue);

/**
 * Format a string to be used as group of options in help messages
 *
 * @param message Group name (e.g. "Settlement options:")
 * @return the formatted string
 */
std::string HelpMessageGroup(const std::string& message);

/**
 * Format a string to be used as option description in help messages
 *
 * @param option Option message (e.g. "-cooldown=<n>")
 * @param message Option description (e.g. "Cooldown in seconds")
 * @return the formatted string
 */
std::string HelpMessageOpt(const std::string& option, const std::string& message);

#endif // CIPHERBATCH_UTIL_SYSTEM_H
