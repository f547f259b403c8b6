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

#include "EventLib.h"
#include "OsApi.h"

#include <stdarg.h>
#include <strings.h>

/******************************************************************************
 * STATIC DATA
 ******************************************************************************/

std::atomic<event_level_t> EventLib::log_level {INFO};
std::atomic<event_level_t> EventLib::metric_level {DEBUG};

/******************************************************************************
 * PUBLIC METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * init
 *----------------------------------------------------------------------------*/
void EventLib::init (void)
{
    log_level = INFO;
    metric_level = DEBUG;
}

/*----------------------------------------------------------------------------
 * deinit
 *----------------------------------------------------------------------------*/
void EventLib::deinit (void)
{
}

/*----------------------------------------------------------------------------
 * setLvl
 *----------------------------------------------------------------------------*/
bool EventLib::setLvl (type_t type, event_level_t lvl)
{
    if(lvl < DEBUG || lvl >= INVALID_EVENT_LEVEL)
    {
        return false;
    }

    switch(type)
    {
        case LOG:       log_level = lvl;    return true;
        case METRIC:    metric_level = lvl; return true;
        default:                            return false;
    }
}

/*----------------------------------------------------------------------------
 * lvl2str
 *----------------------------------------------------------------------------*/
const char* EventLib::lvl2str (event_level_t lvl)
{
    switch(lvl)
    {
        case DEBUG:     return "DEBUG";
        case INFO:      return "INFO";
        case WARNING:   return "WARNING";
        case ERROR:     return "ERROR";
        case CRITICAL:  return "CRITICAL";
        default:        return NULL;
    }
}

/*----------------------------------------------------------------------------
 * str2lvl
 *----------------------------------------------------------------------------*/
bool EventLib::str2lvl (const char* str, event_level_t* lvl)
{
    if(!str || !lvl) return false;

    for(int l = DEBUG; l < INVALID_EVENT_LEVEL; l++)
    {
        if(strcasecmp(str, lvl2str(static_cast<event_level_t>(l))) == 0)
        {
            *lvl = static_cast<event_level_t>(l);
            return true;
        }
    }

    return false;
}

/*----------------------------------------------------------------------------
 * type2str
 *----------------------------------------------------------------------------*/
const char* EventLib::type2str (type_t type)
{
    switch(type)
    {
        case LOG:       return "LOG";
        case METRIC:    return "METRIC";
        default:        return NULL;
    }
}

/*----------------------------------------------------------------------------
 * subtype2str
 *----------------------------------------------------------------------------*/
const char* EventLib::subtype2str (metric_subtype_t subtype)
{
    switch(subtype)
    {
        case COUNTER:   return "COUNTER";
        case GAUGE:     return "GAUGE";
        default:        return NULL;
    }
}

/*----------------------------------------------------------------------------
 * logMsg
 *----------------------------------------------------------------------------*/
void EventLib::logMsg(const char* file_name, unsigned int line_number, event_level_t lvl, const char* msg_fmt, ...)
{
    event_t event;

    /* Return Here If Nothing to Do */
    if(lvl < log_level) return;

    /* Initialize Log Message */
    event.systime   = OsApi::time(OsApi::SYS_CLK);
    event.tid       = Thread::getId();
    event.type      = LOG;
    event.level     = lvl;

    /* Build Name - <Filename> */
    const char* last_path_delimeter = strrchr(file_name, PATH_DELIMETER);
    const char* file_name_only = last_path_delimeter ? last_path_delimeter + 1 : file_name;
    snprintf(event.name, MAX_NAME_SIZE, "%s", file_name_only);
    event.line      = line_number;

    /* Build Attribute - <log message> */
    va_list args;
    va_start(args, msg_fmt);
    const int vlen = vsnprintf(event.attr, MAX_ATTR_SIZE - 1, msg_fmt, args);
    const int attr_size = MAX(MIN(vlen + 1, MAX_ATTR_SIZE), 1);
    event.attr[attr_size - 1] = '\0';
    va_end(args);

    /* Post Log Message */
    sendEvent(&event);
}

/*----------------------------------------------------------------------------
 * generateMetric
 *----------------------------------------------------------------------------*/
void EventLib::generateMetric (event_level_t lvl, const char* name, metric_subtype_t subtype, double value)
{
    event_t event;

    /* Return Here If Nothing to Do */
    if(lvl < metric_level || lvl < log_level) return;

    /* Initialize Metric */
    event.systime   = OsApi::time(OsApi::SYS_CLK);
    event.tid       = Thread::getId();
    event.type      = METRIC;
    event.level     = lvl;
    event.line      = 0;

    /* Build Name and Attribute */
    snprintf(event.name, MAX_NAME_SIZE, "%s", name);
    snprintf(event.attr, MAX_ATTR_SIZE, "%s=%lf", subtype2str(subtype), value);

    /* Post Metric */
    sendEvent(&event);
}

/******************************************************************************
 * PRIVATE METHODS
 ******************************************************************************/

/*----------------------------------------------------------------------------
 * sendEvent
 *----------------------------------------------------------------------------*/
void EventLib::sendEvent (const event_t* event)
{
    const char* lvl_str = lvl2str(static_cast<event_level_t>(event->level));
    OsApi::print(event->name, event->line, "%s %s", lvl_str ? lvl_str : "?", event->attr);
}
