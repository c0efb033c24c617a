// SPDX-FileCopyrightText:  2022-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_LOGGING_H
#define FATIMG_LOGGING_H

#include <cstdio>
#include <memory>
#include <string>

#include "misc/compiler.h"

#include <loguru.hpp>

enum LOG_TYPES {
	LOG_ALL,
	LOG_HOSTFS,
	LOG_FAT,
	LOG_IMAGE,
	LOG_MAX
};

enum LOG_SEVERITIES {
	LOG_NORMAL,
	LOG_WARN,
	LOG_ERROR
};

// A class that implements a logger that can handle log messages generated
// while building images. Uses the loguru library to do the actual logging.
class Logger {
public:
	// Adds logger to the list of loggers that will be used to log messages.
	// The id can be used to remove the logger.
	static void AddLogger(const char* id, std::unique_ptr<Logger> logger,
	                      LOG_SEVERITIES severity = LOG_NORMAL);

	// Removes the logger that was added with the given ID.
	static void RemoveLogger(const char* id);

	virtual ~Logger() = default;

	virtual void Log(const char* log_group_name,
	                 const loguru::Message& message) = 0;
	virtual void Flush() {}
};

// A class used to help with the LOG() macro. Use that macro instead of using
// this class directly.
class LogHelper {
	LOG_TYPES d_type;
	LOG_SEVERITIES d_severity;
	const char* file;
	int line;

public:
	LogHelper(LOG_TYPES type, LOG_SEVERITIES severity, const char* file, int line)
	        : d_type(type),
	          d_severity(severity),
	          file(file),
	          line(line)
	{}

	void operator()(const char* buf, ...) GCC_ATTRIBUTE(__format__(__printf__, 2, 3));
};

// Registers the log group names. If 'logfile' is not empty, all messages of
// warning severity and above are also written to that file.
void LOG_StartUp(const std::string& logfile = {});

// Removes the file logger (if any) installed by LOG_StartUp.
void LOG_ShutDown();

#define LOG(type, severity) LogHelper(type, severity, __FILE__, __LINE__)

// Keep for compatibility
#define LOG_MSG(...) LOG_F(INFO, __VA_ARGS__)

#define LOG_INFO(...)    LOG_F(INFO, __VA_ARGS__)
#define LOG_WARNING(...) LOG_F(WARNING, __VA_ARGS__)
#define LOG_ERR(...)     LOG_F(ERROR, __VA_ARGS__)

#ifdef NDEBUG
// LOG_DEBUG exists only for messages useful during development.
#define LOG_DEBUG(...)
#define LOG_TRACE(...)
#else

template <typename... Args>
void LOG_DEBUG(const std::string& format, const Args&... args) noexcept
{
	const auto format_green = std::string(loguru::terminal_green()) +
	                          loguru::terminal_bold() + format +
	                          loguru::terminal_reset();

	DLOG_F(INFO, format_green.c_str(), args...);
}

template <typename... Args>
void LOG_TRACE(const std::string& format, const Args&... args) noexcept
{
	const auto format_purple = std::string(loguru::terminal_purple()) +
	                           loguru::terminal_bold() + format +
	                           loguru::terminal_reset();

	DLOG_F(INFO, format_purple.c_str(), args...);
}

#endif // NDEBUG

#endif
