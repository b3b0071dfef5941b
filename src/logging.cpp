// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "logging.h"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <list>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>

#include <boost/filesystem/operations.hpp>

bool fPrintToConsole = false;
bool fPrintToDebugLog = true;
bool fLogTimestamps = true;

namespace {

/**
 * Log output is kept in memory until the debug log file is opened, then
 * flushed into it. All state below is protected by mutexDebugLog.
 */
std::mutex mutexDebugLog;
FILE* fileout = nullptr;
std::list<std::string> vMsgsBeforeOpenLog;
bool fStartedNewLine = true;

std::mutex mutexCategories;
std::set<std::string> setCategories; // protected by mutexCategories

std::string LogTimestampStr(const std::string& str)
{
    if (!fLogTimestamps || !fStartedNewLine)
        return str;

    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf) + ' ' + str;
}

} // namespace

void SetLogCategories(const std::vector<std::string>& categories)
{
    std::lock_guard<std::mutex> lock(mutexCategories);
    setCategories.clear();
    setCategories.insert(categories.begin(), categories.end());
}

bool LogAcceptCategory(const char* category)
{
    if (category == nullptr)
        return true;

    std::lock_guard<std::mutex> lock(mutexCategories);
    // "-debug" alone (an empty value) and "-debug=1" both mean every category
    if (setCategories.count("") || setCategories.count("1") || setCategories.count("all"))
        return true;
    return setCategories.count(category) != 0;
}

void OpenDebugLog(const boost::filesystem::path& path)
{
    std::lock_guard<std::mutex> lock(mutexDebugLog);
    if (fileout)
        return;

    if (path.has_parent_path())
        boost::filesystem::create_directories(path.parent_path());
    fileout = std::fopen(path.string().c_str(), "a");
    if (!fileout)
        throw std::runtime_error("Cannot open debug log file " + path.string());
    setbuf(fileout, nullptr); // unbuffered

    // dump buffered messages from before we opened the log
    while (!vMsgsBeforeOpenLog.empty()) {
        std::fwrite(vMsgsBeforeOpenLog.front().data(), 1, vMsgsBeforeOpenLog.front().size(), fileout);
        vMsgsBeforeOpenLog.pop_front();
    }
}

void CloseDebugLog()
{
    std::lock_guard<std::mutex> lock(mutexDebugLog);
    if (fileout) {
        std::fclose(fileout);
        fileout = nullptr;
    }
    vMsgsBeforeOpenLog.clear();
}

int LogPrintStr(const std::string& str)
{
    int ret = 0; // Returns total number of characters written

    std::lock_guard<std::mutex> lock(mutexDebugLog);
    const std::string strTimestamped = LogTimestampStr(str);
    fStartedNewLine = !str.empty() && str.back() == '\n';

    if (fPrintToConsole) {
        ret = std::fwrite(strTimestamped.data(), 1, strTimestamped.size(), stdout);
        std::fflush(stdout);
    }
    if (fPrintToDebugLog) {
        if (fileout == nullptr) {
            vMsgsBeforeOpenLog.push_back(strTimestamped);
            ret = strTimestamped.length();
        } else {
            ret = std::fwrite(strTimestamped.data(), 1, strTimestamped.size(), fileout);
        }
    }
    return ret;
}
