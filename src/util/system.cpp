// Copyright (c) 2025 The DUTCHX developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util/system.h"

#include "chainparamsbase.h"
#include "utilstrencodings.h"

#include <stdexcept>
#include <stdlib.h>
#include <string.h>

const char * const DUTCHX_CONF_FILENAME = "dutchx.conf";

ArgsManager gArgs;

/** Interpret string as boolean, for argument parsing */
static bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return (atoi(strValue.c_str()) != 0);
}

static std::string TrimString(const std::string& str)
{
    std::string::size_type front = str.find_first_not_of(" \f\n\r\t\v");
    if (front == std::string::npos) {
        return std::string();
    }
    std::string::size_type back = str.find_last_not_of(" \f\n\r\t\v");
    return str.substr(front, back - front + 1);
}

bool ArgsManager::ParseParameters(int argc, const char* const argv[], std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();

    for (int i = 1; i < argc; i++) {
        std::string key(argv[i]);
        std::string val;
        size_t is_index = key.find('=');
        if (is_index != std::string::npos) {
            val = key.substr(is_index + 1);
            key.erase(is_index);
        }

        if (key.empty() || key[0] != '-')
            break;

        // Transform --foo to -foo
        if (key.length() > 1 && key[1] == '-')
            key.erase(0, 1);

        if (key.length() < 2) {
            error = strprintf("Invalid parameter %s", argv[i]);
            return false;
        }

        // Transform -nofoo to -foo=0
        if (key.compare(0, 3, "-no") == 0 && key.length() > 3) {
            key = "-" + key.substr(3);
            val = InterpretBool(val) ? "0" : "1";
        }

        m_override_args[key].push_back(val);
    }

    return true;
}

bool ArgsManager::ReadConfigStream(std::istream& stream, std::string& error)
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::string str;
    int linenr = 1;
    while (std::getline(stream, str)) {
        size_t pos;
        if ((pos = str.find('#')) != std::string::npos) {
            str = str.substr(0, pos);
        }
        str = TrimString(str);
        if (!str.empty()) {
            if (str[0] == '[') {
                error = strprintf("parse error on line %i: %s, sections are not supported", linenr, str);
                return false;
            } else if ((pos = str.find('=')) != std::string::npos) {
                std::string name = "-" + TrimString(str.substr(0, pos));
                std::string value = TrimString(str.substr(pos + 1));
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

bool ArgsManager::ReadConfigFile(const std::string& conf_path, std::string& error)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        m_config_args.clear();
    }

    fs::ifstream stream(GetConfigFile(conf_path));

    // No config file is ok
    if (!stream.good()) {
        return true;
    }
    return ReadConfigStream(stream, error);
}

bool ArgsManager::GetArgValue(const std::string& strArg, std::string& strValue) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    // Command line: last value wins
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end() && !it->second.empty()) {
        strValue = it->second.back();
        return true;
    }
    // Config file: first value wins
    it = m_config_args.find(strArg);
    if (it != m_config_args.end() && !it->second.empty()) {
        strValue = it->second.front();
        return true;
    }
    return false;
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::vector<std::string> result;
    auto it = m_override_args.find(strArg);
    if (it != m_override_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    it = m_config_args.find(strArg);
    if (it != m_config_args.end()) {
        result.insert(result.end(), it->second.begin(), it->second.end());
    }
    return result;
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::string strValue;
    return GetArgValue(strArg, strValue);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return strValue;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::string strValue;
    if (!GetArgValue(strArg, strValue)) return nDefault;
    int64_t n = 0;
    if (!ParseInt64(strValue, &n)) return 0;
    return n;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::string strValue;
    if (GetArgValue(strArg, strValue)) return InterpretBool(strValue);
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
    bool fRegTest = GetBoolArg("-regtest", false);
    bool fTestNet = GetBoolArg("-testnet", false);

    if (fTestNet && fRegTest)
        throw std::runtime_error("Invalid combination of -regtest and -testnet.");
    if (fRegTest)
        return CBaseChainParams::REGTEST;
    if (fTestNet)
        return CBaseChainParams::TESTNET;
    return CBaseChainParams::MAIN;
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    m_override_args.clear();
    m_config_args.clear();
}

fs::path GetDefaultDataDir()
{
    // Unix: ~/.dutchx
    fs::path pathRet;
    char* pszHome = getenv("HOME");
    if (pszHome == nullptr || strlen(pszHome) == 0)
        pathRet = fs::path("/");
    else
        pathRet = fs::path(pszHome);
    return pathRet / ".dutchx";
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

    fs::create_directories(path);

    return path;
}

void ClearDatadirCache()
{
    std::lock_guard<std::mutex> lock(csPathCached);

    pathCached = fs::path();
    pathCachedNetSpecific = fs::path();
}

fs::path GetConfigFile(const std::string& confPath)
{
    fs::path pathConfigFile(confPath);
    if (!pathConfigFile.is_absolute())
        pathConfigFile = GetDataDir(false) / pathConfigFile;

    return pathConfigFile;
}
