// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include <cinttypes>
#include <cstdio>
#include <optional>
#include <stdexcept>
#include <string>

#include "dos/disk_geometry.h"
#include "dos/fat_image_builder.h"
#include "misc/logging.h"
#include "shell/command_line.h"
#include "utils/string_utils.h"

#ifndef FATIMG_VERSION
#define FATIMG_VERSION "0.1.0"
#endif

namespace {

constexpr auto DefaultImageName = "FATIMG.IMG";

struct CommandLineArguments {
	bool help    = false;
	bool version = false;
	bool list    = false;

	std::string output  = {};
	std::string logfile = {};
	std::string source  = {};

	BuildSettings settings = {};
};

void print_usage(const char* program_name)
{
	printf("Usage: %s [OPTIONS] DIRECTORY\n"
	       "\n"
	       "Builds a FAT12/16 disk image holding the contents of DIRECTORY,\n"
	       "keeping the host file names as VFAT long file names.\n"
	       "\n"
	       "Options:\n"
	       "  -t TYPE        disk geometry, smallest fitting one if not set\n"
	       "  -label NAME    volume label\n"
	       "  -hidden        include hidden (dot) files\n"
	       "  -fats N        number of FAT copies, 1 or 2 (default 2)\n"
	       "  -serial HEX    volume serial number\n"
	       "  -o FILE        output image (default %s)\n"
	       "  -log FILE      also write warnings and errors to FILE\n"
	       "  -list          print the stored files\n"
	       "  -h, -help      show this help\n"
	       "  -V, -version   show the version\n"
	       "\n"
	       "Disk types:\n",
	       program_name,
	       DefaultImageName);

	for (const auto& geometry : get_geometry_presets()) {
		printf("  %-10s C:%-5u H:%-3u S:%-3u %s\n",
		       geometry.name.c_str(),
		       geometry.cylinders,
		       geometry.heads,
		       geometry.sectors,
		       geometry.is_floppy ? "floppy" : "hard disk");
	}
}

std::optional<uint32_t> parse_serial(const std::string& value)
{
	try {
		size_t num_chars_processed = 0;
		const auto number = std::stoul(value, &num_chars_processed, 16);
		if (value.size() == num_chars_processed && number <= UINT32_MAX) {
			return static_cast<uint32_t>(number);
		}
		// Note: stoul can throw invalid_argument and out_of_range
	} catch (const std::invalid_argument&) {
		// do nothing, we expect these
	} catch (const std::out_of_range&) {
		// do nothing, we expect these
	}
	return {};
}

bool parse_arguments(CommandLine& cmdline, CommandLineArguments& arguments)
{
	arguments.version = cmdline.FindRemoveBoolArgument("version", 'V');
	arguments.help    = (cmdline.FindRemoveBoolArgument("help", 'h') ||
                          cmdline.FindRemoveBoolArgument("help", '?'));
	arguments.list    = cmdline.FindRemoveBoolArgument("list");

	arguments.settings.include_hidden = cmdline.FindRemoveBoolArgument("hidden");
	arguments.settings.disk_type      = cmdline.FindRemoveStringArgument("t");
	arguments.settings.label          = cmdline.FindRemoveStringArgument("label");

	arguments.output  = cmdline.FindRemoveStringArgument("o");
	arguments.logfile = cmdline.FindRemoveStringArgument("log");

	const auto fats = cmdline.FindRemoveStringArgument("fats");
	if (!fats.empty()) {
		const auto fat_copies = parse_int(fats);
		if (!fat_copies || *fat_copies < 1 || *fat_copies > 2) {
			fprintf(stderr, "Invalid number of FAT copies, use 1 or 2\n");
			return false;
		}
		arguments.settings.fat_copies = static_cast<uint8_t>(*fat_copies);
	}

	const auto serial = cmdline.FindRemoveStringArgument("serial");
	if (!serial.empty()) {
		arguments.settings.volume_serial = parse_serial(serial);
		if (!arguments.settings.volume_serial) {
			fprintf(stderr, "Invalid volume serial number '%s'\n", serial.c_str());
			return false;
		}
	}

	if (arguments.output.empty()) {
		arguments.output = DefaultImageName;
	}

	if (arguments.help || arguments.version) {
		return true;
	}

	for (const auto& argument : cmdline.GetArguments()) {
		if (argument.starts_with('-')) {
			fprintf(stderr, "Unknown or incomplete option '%s'\n", argument.c_str());
			return false;
		}
	}

	if (cmdline.GetCount() != 1 || !cmdline.FindCommand(1, arguments.source)) {
		fprintf(stderr, "Exactly one source directory is required\n");
		return false;
	}
	return true;
}

void print_file_table(const FatImageBuilder& builder)
{
	for (const auto& record : builder.GetFileTable()) {
		if (record.IsDirectory()) {
			printf("%-40s %10s  %s\n",
			       record.dos_path.c_str(),
			       "<DIR>",
			       record.long_name.c_str());
		} else {
			printf("%-40s %10" PRIu64 "  %s\n",
			       record.dos_path.c_str(),
			       static_cast<uint64_t>(record.content.size()),
			       record.long_name.c_str());
		}
	}
}

} // namespace

int main(int argc, char* argv[])
{
	CommandLine cmdline(argc, argv);

	CommandLineArguments arguments = {};
	if (!parse_arguments(cmdline, arguments)) {
		print_usage(cmdline.GetFileName());
		return 1;
	}

	if (arguments.help) {
		print_usage(cmdline.GetFileName());
		return 0;
	}
	if (arguments.version) {
		printf("fatimg %s\n", FATIMG_VERSION);
		return 0;
	}

	loguru::g_preamble_date    = false;
	loguru::g_preamble_time    = true;
	loguru::g_preamble_uptime  = false;
	loguru::g_preamble_thread  = false;
	loguru::g_preamble_file    = false;
	loguru::g_preamble_verbose = false;
	loguru::g_preamble_pipe    = true;
	loguru::g_stderr_verbosity = loguru::Verbosity_INFO;

	loguru::init(argc, argv);
	LOG_StartUp(arguments.logfile);

	FatImageBuilder builder;

	const auto image = builder.BuildDiskFromFiles(arguments.source, arguments.settings);
	if (!image) {
		fprintf(stderr,
		        "Could not build the image from '%s': %s\n",
		        arguments.source.c_str(),
		        to_string(builder.GetLastError()).c_str());
		LOG_ShutDown();
		return 1;
	}

	if (arguments.list) {
		print_file_table(builder);
	}

	const auto written = image->WriteToFile(arguments.output);
	LOG_ShutDown();

	return written ? 0 : 1;
}
