/*
 * Copyright (c) 2021, University of Washington
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * 1. Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 * 2. Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * 3. Neither the name of the University of Washington nor the names of its
 *    contributors may be used to endorse or promote products derived from this
 *    software without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE UNIVERSITY OF WASHINGTON AND CONTRIBUTORS
 * “AS IS” AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED
 * TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR
 * PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL THE UNIVERSITY OF WASHINGTON OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS;
 * OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY,
 * WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR
 * OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF
 * ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

/******************************************************************************
 * INCLUDES
 ******************************************************************************/

#include "LogLib.h"

#include <cstdarg>
#include <cstring>
#include <ctime>
#include <strings.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

okey_t LogLib::logIdPool = 0;
std::vector<LogLib::log_t> LogLib::logList;
std::mutex LogLib::logMut;
int LogLib::logLvlCnts[RAW + 1];

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void LogLib::init(void)
{
    const std::lock_guard<std::mutex> lock(logMut);
    logIdPool = 0;
    logList.clear();
    memset(logLvlCnts, 0, sizeof(logLvlCnts));
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void LogLib::deinit(void)
{
    const std::lock_guard<std::mutex> lock(logMut);
    logList.clear();
}

/*----------------------------------------------------------------------------
 * createLog
 *----------------------------------------------------------------------------*/
okey_t LogLib::createLog(log_lvl_t lvl, logFunc_t handler, void* parm)
{
    /* Create New Log Structure */
    log_t new_log;
    new_log.level = lvl;
    new_log.handler = handler;
    new_log.parm = parm;

    /* Add to Log List */
    const std::lock_guard<std::mutex> lock(logMut);
    new_log.id = logIdPool++;
    logList.push_back(new_log);

    /* Return Log Id */
    return new_log.id;
}

/*----------------------------------------------------------------------------
 * deleteLog
 *----------------------------------------------------------------------------*/
bool LogLib::deleteLog(okey_t id)
{
    const std::lock_guard<std::mutex> lock(logMut);
    for(auto iter = logList.begin(); iter != logList.end(); ++iter)
    {
        if(iter->id == id)
        {
            logList.erase(iter);
            return true;
        }
    }
    return false;
}

/*----------------------------------------------------------------------------
 * setLevel
 *----------------------------------------------------------------------------*/
bool LogLib::setLevel(okey_t id, log_lvl_t lvl)
{
    const std::lock_guard<std::mutex> lock(logMut);
    for(log_t& existing_log: logList)
    {
        if(existing_log.id == id)
        {
            existing_log.level = lvl;
            return true;
        }
    }
    return false;
}

/*----------------------------------------------------------------------------
 * getLevel
 *----------------------------------------------------------------------------*/
log_lvl_t LogLib::getLevel(okey_t id)
{
    const std::lock_guard<std::mutex> lock(logMut);
    for(const log_t& existing_log: logList)
    {
        if(existing_log.id == id)
        {
            return existing_log.level;
        }
    }
    return INVALID_LOG_LEVEL;
}

/*----------------------------------------------------------------------------
 * getLvlCnts
 *----------------------------------------------------------------------------*/
int LogLib::getLvlCnts(log_lvl_t lvl)
{
    if((int)lvl >= 0 && (int)lvl <= (int)RAW)
    {
        const std::lock_guard<std::mutex> lock(logMut);
        return logLvlCnts[lvl];
    }

    return -1;
}

/*----------------------------------------------------------------------------
 * str2lvl
 *----------------------------------------------------------------------------*/
bool LogLib::str2lvl(const char* str, log_lvl_t* lvl)
{
    log_lvl_t clvl;
    if(str == NULL)                         return false;
    else if(strcasecmp(str, "RAW") == 0)    clvl = RAW;
    else if(strcasecmp(str, "DEBUG") == 0)  clvl = DEBUG;
    else if(strcasecmp(str, "INFO") == 0)   clvl = INFO;
    else if(strcasecmp(str, "WARNING") == 0) clvl = WARNING;
    else if(strcasecmp(str, "ERROR") == 0)  clvl = ERROR;
    else if(strcasecmp(str, "CRITICAL") == 0) clvl = CRITICAL;
    else                                    return false;

    *lvl = clvl;
    return true;
}

/*----------------------------------------------------------------------------
 * lvl2str
 *----------------------------------------------------------------------------*/
const char* LogLib::lvl2str(log_lvl_t lvl)
{
    switch(lvl)
    {
        case DEBUG:     return "DEBUG";
        case INFO:      return "INFO";
        case WARNING:   return "WARNING";
        case ERROR:     return "ERROR";
        case CRITICAL:  return "CRITICAL";
        case RAW:       return "RAW";
        default:        return "INVALID";
    }
}

/*----------------------------------------------------------------------------
 * logMsg
 *----------------------------------------------------------------------------*/
void LogLib::logMsg(const char* file_name, unsigned int line_number, log_lvl_t lvl, const char* format_string, ...)
{
    bool work_needed = false;

    {
        const std::lock_guard<std::mutex> lock(logMut);

        /* Count Message */
        if((int)lvl >= 0 && (int)lvl <= (int)RAW)
        {
            logLvlCnts[lvl]++;
        }

        /* Check if any work needs to be done */
        for(const log_t& check_log: logList)
        {
            if(check_log.level <= lvl)
            {
                work_needed = true;
                break;
            }
        }
    }

    /* Return Here If Nothing to Do */
    if (!work_needed) return;

    /* Build Formatted Log Entry String */
    char formatted_string[MAX_LOG_ENTRY_SIZE];
    va_list args;
    va_start(args, format_string);
    const int vlen = vsnprintf(formatted_string, MAX_LOG_ENTRY_SIZE - 1, format_string, args);
    const int msglen = MIN(vlen, MAX_LOG_ENTRY_SIZE - 1);
    va_end(args);
    if (msglen < 0) return; // nothing to do
    formatted_string[msglen] = '\0';

    /* Build Time Stamp String */
    char timestr[32];
    const time_t now = time(NULL);
    struct tm timeinfo;
    if(gmtime_r(&now, &timeinfo) == NULL)
    {
        memset(&timeinfo, 0, sizeof(timeinfo));
    }
    snprintf(timestr, sizeof(timestr), "%d:%d:%d:%d:%d", timeinfo.tm_year + 1900, timeinfo.tm_yday + 1, timeinfo.tm_hour, timeinfo.tm_min, timeinfo.tm_sec);

    /* Adjust Filename to Exclude Path */
    const char* last_path_delimeter = strrchr(file_name, PATH_DELIMETER);
    const char* file_name_only = last_path_delimeter ? last_path_delimeter + 1 : file_name;

    /* Build Log Entry Message */
    char entry_log_msg[MAX_LOG_ENTRY_SIZE];
    if(lvl != RAW)
    {
        snprintf(entry_log_msg, MAX_LOG_ENTRY_SIZE, "%s:%s:%u:%s: %s\n", timestr, file_name_only, line_number, lvl2str(lvl), formatted_string);
    }
    else
    {
        snprintf(entry_log_msg, MAX_LOG_ENTRY_SIZE, "%s", formatted_string);
    }

    /* Call All Log Handlers */
    const std::lock_guard<std::mutex> lock(logMut);
    const int size = (int)strnlen(entry_log_msg, MAX_LOG_ENTRY_SIZE - 1) + 1;
    for(const log_t& cur_log: logList)
    {
        if(cur_log.level <= lvl)
        {
            cur_log.handler(entry_log_msg, size, cur_log.parm);
        }
    }
}

/*----------------------------------------------------------------------------
 * termHandler
 *----------------------------------------------------------------------------*/
int LogLib::termHandler(const char* str, int size, void* parm)
{
    (void)parm;
    return (int)fwrite(str, 1, size - 1, stderr);
}
