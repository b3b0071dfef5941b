// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "args.h"

#include <cstdlib>
#include <set>

#include <boost/filesystem/fstream.hpp>
#include <boost/filesystem/operations.hpp>
#include <boost/program_options/detail/config_file.hpp>

ArgsManager gArgs;

namespace {

/** Interpret string as boolean, for argument parsing */
bool InterpretBool(const std::string& strValue)
{
    if (strValue.empty())
        return true;
    return std::atoi(strValue.c_str()) != 0;
}

/** Turn -noX into -X=0 */
void InterpretNegativeSetting(std::string& strKey, std::string& strValue)
{
    if (strKey.length() > 3 && strKey[0] == '-' && strKey[1] == 'n' && strKey[2] == 'o') {
        strKey = "-" + strKey.substr(3);
        strValue = InterpretBool(strValue) ? "0" : "1";
    }
}

} // namespace

int ArgsManager::ParseParameters(int argc, const char* const argv[])
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();

    int i = 1;
    for (; i < argc; i++) {
        std::string str(argv[i]);
        std::string strValue;
        const size_t is_index = str.find('=');
        if (is_index != std::string::npos) {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }

        if (str.empty() || str[0] != '-')
            break;

        // Interpret --foo as -foo.
        // If both --foo and -foo are set, the last takes effect.
        if (str.length() > 1 && str[1] == '-')
            str = str.substr(1);
        InterpretNegativeSetting(str, strValue);

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }
    return i;
}

void ArgsManager::ReadConfigFile(const boost::filesystem::path& path)
{
    boost::filesystem::ifstream streamConfig(path);
    if (!streamConfig.good())
        return; // No config file is OK

    ReadConfigStream(streamConfig);
}

void ArgsManager::ReadConfigStream(std::istream& stream)
{
    std::lock_guard<std::mutex> lock(cs_args);
    std::set<std::string> setOptions;
    setOptions.insert("*");

    for (boost::program_options::detail::config_file_iterator it(stream, setOptions), end; it != end; ++it) {
        // Don't overwrite existing settings so command line settings override the config file
        std::string strKey = std::string("-") + it->string_key;
        std::string strValue = it->value[0];
        InterpretNegativeSetting(strKey, strValue);
        if (mapArgs.count(strKey) == 0)
            mapArgs[strKey] = strValue;
        mapMultiArgs[strKey].push_back(strValue);
    }
}

std::vector<std::string> ArgsManager::GetArgs(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    const auto it = mapMultiArgs.find(strArg);
    if (it != mapMultiArgs.end())
        return it->second;
    return {};
}

bool ArgsManager::IsArgSet(const std::string& strArg) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    return mapArgs.count(strArg);
}

std::string ArgsManager::GetArg(const std::string& strArg, const std::string& strDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    const auto it = mapArgs.find(strArg);
    if (it != mapArgs.end())
        return it->second;
    return strDefault;
}

int64_t ArgsManager::GetArg(const std::string& strArg, int64_t nDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    const auto it = mapArgs.find(strArg);
    if (it != mapArgs.end())
        return std::atoll(it->second.c_str());
    return nDefault;
}

bool ArgsManager::GetBoolArg(const std::string& strArg, bool fDefault) const
{
    std::lock_guard<std::mutex> lock(cs_args);
    const auto it = mapArgs.find(strArg);
    if (it != mapArgs.end())
        return InterpretBool(it->second);
    return fDefault;
}

bool ArgsManager::SoftSetArg(const std::string& strArg, const std::string& strValue)
{
    {
        std::lock_guard<std::mutex> lock(cs_args);
        if (mapArgs.count(strArg))
            return false;
    }
    ForceSetArg(strArg, strValue);
    return true;
}

void ArgsManager::ForceSetArg(const std::string& strArg, const std::string& strValue)
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs[strArg] = strValue;
    mapMultiArgs[strArg].clear();
    mapMultiArgs[strArg].push_back(strValue);
}

void ArgsManager::ClearArgs()
{
    std::lock_guard<std::mutex> lock(cs_args);
    mapArgs.clear();
    mapMultiArgs.clear();
}
