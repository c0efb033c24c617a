// SPDX-FileCopyrightText:  2022-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "misc/logging.h"

#include <cstdarg>
#include <memory>

static loguru::Verbosity ConvertSeverityToVerbosity(LOG_SEVERITIES severity)
{
	switch (severity) {
	case LOG_NORMAL: return loguru::Verbosity_INFO;
	case LOG_WARN: return loguru::Verbosity_WARNING;
	case LOG_ERROR: return loguru::Verbosity_ERROR;
	// This should never happen, but if it does, we'll set the verbosity to
	// be as low as possible.
	default: return loguru::Verbosity_9;
	}
}

struct _LogGroup {
	const char* front = nullptr;
	bool enabled      = false;
};

static _LogGroup loggrp[LOG_MAX] = {{"", true}, {nullptr, false}};

// A thread_local value that is used to pass along the message type (if any) to
// the logger.
//
// This makes the assumption that the log callback will be called in the dynamic
// scope of the log call itself. If this does not happen, then the value will be
// lost.
thread_local LOG_TYPES curr_msg_log_type = LOG_ALL;

static void OnLogCallback(void* logger, const loguru::Message& message)
{
	const char* front = loggrp[curr_msg_log_type].front;
	static_cast<Logger*>(logger)->Log(front ? front : "", message);
}

static void OnFlushCallback(void* logger)
{
	static_cast<Logger*>(logger)->Flush();
}

static void OnCloseCallback(void* logger)
{
	delete static_cast<Logger*>(logger);
}

void Logger::AddLogger(const char* id, std::unique_ptr<Logger> logger,
                       LOG_SEVERITIES severity)
{
	loguru::Verbosity verbosity = ConvertSeverityToVerbosity(severity);
	loguru::add_callback(id,
	                     OnLogCallback,
	                     logger.release(),
	                     verbosity,
	                     OnCloseCallback,
	                     OnFlushCallback);
}

void Logger::RemoveLogger(const char* id)
{
	loguru::remove_callback(id);
}

static const char* const LOGURU_FILE_CALLBACK_ID = "fatimg_file_logger";

static bool file_logger_installed = false;

class FileLogger : public Logger {
public:
	explicit FileLogger(FILE* file_ptr) : file_ptr_(file_ptr) {}
	~FileLogger() override
	{
		fclose(file_ptr_);
	}

	FileLogger(const FileLogger&)            = delete;
	FileLogger& operator=(const FileLogger&) = delete;

	void Log(const char* log_group_name, const loguru::Message& message) override
	{
		fprintf(file_ptr_,
		        "%s%s:%s\n",
		        message.preamble,
		        log_group_name,
		        message.message);
	}

	void Flush() override
	{
		fflush(file_ptr_);
	}

private:
	FILE* file_ptr_;
};

void LOG_StartUp(const std::string& logfile)
{
	/* Setup logging groups */
	loggrp[LOG_ALL].front    = "ALL";
	loggrp[LOG_HOSTFS].front = "HOSTFS";
	loggrp[LOG_FAT].front    = "FAT";
	loggrp[LOG_IMAGE].front  = "IMAGE";

	for (int i = LOG_ALL + 1; i < LOG_MAX; i++) {
		loggrp[i].enabled = true;
	}

	if (logfile.empty()) {
		return;
	}

	LOG_ShutDown();

	FILE* debuglog = fopen(logfile.c_str(), "wt+");
	if (!debuglog) {
		LOG_WARNING("LOG: Can't open log file '%s'", logfile.c_str());
		return;
	}
	Logger::AddLogger(LOGURU_FILE_CALLBACK_ID,
	                  std::make_unique<FileLogger>(debuglog),
	                  LOG_WARN);
	file_logger_installed = true;
}

void LOG_ShutDown()
{
	if (file_logger_installed) {
		Logger::RemoveLogger(LOGURU_FILE_CALLBACK_ID);
		file_logger_installed = false;
	}
}

void LogHelper::operator()(const char* format, ...)
{
	if (d_type >= LOG_MAX) {
		return;
	}
	if ((d_severity != LOG_ERROR) && (!loggrp[d_type].enabled)) {
		return;
	}

	loguru::Verbosity verbosity = ConvertSeverityToVerbosity(d_severity);

	// On the current thread, update the log type so that Logger classes
	// will get the correct value when they are called.
	auto old_msg_log_type = curr_msg_log_type;
	curr_msg_log_type     = d_type;

	va_list msg;
	va_start(msg, format);
	loguru::vlog(verbosity, file, static_cast<unsigned>(line), format, msg);
	va_end(msg);

	curr_msg_log_type = old_msg_log_type;
}
