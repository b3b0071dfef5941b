// Copyright (c) 2009-2010 Satoshi Nakamoto
// Copyright (c) 2009-2016 The Bitcoin Core developers
// Copyright (c) 2026 The Kitties Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

/**
 * Debug log: timestamped lines written to the console and/or a debug log file.
 */
#ifndef KITTIES_LOGGING_H
#define KITTIES_LOGGING_H

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include <boost/format.hpp>

extern bool fPrintToConsole;
extern bool fPrintToDebugLog;
extern bool fLogTimestamps;

/** Enable the given debug categories ("1" or "all" enables every category). */
void SetLogCategories(const std::vector<std::string>& categories);

/** Return true if log accepts specified category */
bool LogAcceptCategory(const char* category);

/** Open (append) the debug log file; lines printed earlier are kept in memory and flushed into it */
void OpenDebugLog(const boost::filesystem::path& path);

/** Close the debug log file, if open */
void CloseDebugLog();

/** Send a string to the log output */
int LogPrintStr(const std::string& str);

namespace logging {

template <typename... Args>
std::string FormatLogMessage(const char* fmt, const Args&... args)
{
    try {
        boost::format formatter(fmt);
        return (formatter % ... % args).str();
    } catch (const boost::io::format_error& e) {
        return std::string("Error \"") + e.what() + "\" while formatting log message: " + fmt;
    }
}

} // namespace logging

template <typename... Args>
int LogPrintf(const char* fmt, const Args&... args)
{
    return LogPrintStr(logging::FormatLogMessage(fmt, args...));
}

template <typename... Args>
int LogPrint(const char* category, const char* fmt, const Args&... args)
{
    if (!LogAcceptCategory(category))
        return 0;
    return LogPrintStr(logging::FormatLogMessage(fmt, args...));
}

#endif // KITTIES_LOGGING_H
