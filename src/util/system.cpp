// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2018 The Bitcoin Core developers
// Copyright (c) 2025 The CipherBatch developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "logging.h"
#include "utilstrencodings.h"

#include <fstream>
#include <stdlib.h>
#include <string.h>

const char * const CIPHERBATCH_CONF_FILENAME = "cipherbatch.conf";

ArgsManager gArgs;

static RecursiveMutex csPathCached;
static fs::path pathCached;

bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    int64_t n = 0;
    if (ParseInt64(strValue, &n))
        return n != 0;
    const std::string lower = ToLower(strValue);
    return lower == "true" || lower == "yes" || lower == "on";
}

/**
 * Interpret -nofoo as if the user supplied -foo=0.
 *
 * This method also tracks when the -no form was supplied, and treats "-foo" as
 * a negated option when this happens.
 */
static void InterpretNegatedOption(std::string& key, std::string& val)
{
    if (key.substr(0, 3) == "-no") {
        bool bool_val = InterpretBool(val);
        key.erase(1, 2);
        if (!bool_val) {
            // Double negatives like -nofoo=0 are supported (but discouraged)
            LogPrintf("Warning: parsed potentially confusing double-negative %s=%s\n", key, val);
            val = "1";
        } else {
            val = "0";
        }
    }
}

ArgsManager::ArgsManager() = default;

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    LOCK(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key[0] != '-')
            break;

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        InterpretNegatedOption(key, val);
        m_override_args[key].push_back(val);
    }

    return true;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    LOCK(cs_args);
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) return it->second;
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    LOCK(cs_args);
    return m_override_args.count(strArg) || m_config_args.count(strArg);
}

bool ArgsManager::IsArgNegated(const std::string& strArg) const
{
    std::vector<std::string> values = GetArgs(strArg);
    return !values.empty() && values.back() == "0";
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return strDefault;
    return values.back();
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return nDefault;
    return atoi64(values.back());
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::vector<std::string> values = GetArgs(strArg);
    if (values.empty()) return fDefault;
    return InterpretBool(values.back());
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    if (IsArgSet(strArg)) return false;
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    LOCK(cs_args);
    m_override_args[strArg] = {strValue};
}

void ArgsManager::ClearArgs()
{
    LOCK(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}

static std::string TrimString(const std::string& str, const std::string& pattern = " \f\n\r\t\v")
{
    std::string::size_type front = str.find_first_not_of(pattern);
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type end = str.find_last_not_of(pattern);
    return str.substr(front, end - front + 1);
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    LOCK(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        const std::string pattern = " \t\r\n";
        str = TrimString(str, pattern);
        if (!str.empty()) {
            if ((pos = str.find('=')) != std::string::npos) {
                std::string name = "-" + TrimString(str.substr(0, pos), pattern);
                std::string value = TrimString(str.substr(pos + 1), pattern);
                InterpretNegatedOption(name, value);
                m_config_args[name].push_back(value);
            } else {
                error = strprintf("parse error on line %i: %s", linenr, str);
                return false;
            }
        }
        ++linenr;
    }
    return true;
}

bool ArgsManager::ReadConfigFile(const fs::path& path, std::string& error)
{
    {
        LOCK(cs_args);
        m_config_args.clear();
    }

    std::ifstream stream(path.string());
    if (!stream.good()) {
        // A missing config file is not an error
        return true;
    }
    if (!ReadConfigStream(stream, error)) {
        error = strprintf("%s: %s", path.string(), error);
        return false;
    }
    return true;
}

bool ArgsManager::ReadConfigFiles(std::string& error)
{
    const std::string confPath = GetArg("-conf", CIPHERBATCH_CONF_FILENAME);
    return ReadConfigFile(GetConfigFile(confPath), error);
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.cipherbatch
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".cipherbatch";
}

const fs::path& GetDataDir()
{
    LOCK(csPathCached);

    fs::path& path = pathCached;

    // This can be called during exceptions by LogPrintf(), so we cache the
    // value so we don't have to do memory allocations after that.
    if (!path.empty())
        return path;

    if (gArgs.IsArgSet("-datadir")) {
        path = fs::system_complete(gArgs.GetArg("-datadir", ""));
        if (!fs::is_directory(path)) {
            path = "";
            return path;
        }
    } else {
        path = GetDefaultDataDir();
    }

    fs::create_directories(path);

    return path;
}

void ClearDatadirCache()
{
    LOCK(csPathCached);
    pathCached = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_complete())
        pathConfigFile = GetDataDir() / pathConfigFile;

    return pathConfigFile;
}

static const int screenWidth = 79;
static const int optIndent = 2;
static const int msgIndent = 7;

std::string HelpMessageGroup(const std::string& message)
{
    return std::string(message) + std::string("\n\n");
}

std::string HelpMessageOpt(const std::string& option, const std::string& message)
{
    std::string strOut = std::string(optIndent, ' ') + option + std::string("\n");

    // Greedy word wrap of the description
    std::string strLine = std::string(msgIndent, ' ');
    size_t nLineStart = strLine.size();
    size_t nPos = 0;
    while (nPos < message.size()) {
        size_t nEnd = message.find(' ', nPos);
        if (nEnd == std::string::npos) nEnd = message.size();
        const std::string strWord = message.substr(nPos, nEnd - nPos);
        if (strLine.size() > nLineStart && strLine.size() + 1 + strWord.size() > (size_t)screenWidth) {
            strOut += strLine + "\n";
            strLine = std::string(msgIndent, ' ');
        }
        if (strLine.size() > nLineStart) strLine += ' ';
        strLine += strWord;
        nPos = nEnd + 1;
    }
    return strOut + strLine + "\n\n";
}
