// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#include "shell/command_line.h"

#include <algorithm>
#include <iterator>

#include "utils/string_utils.h"

CommandLine::CommandLine(int argc, const char* const argv[])
{
	if (argc < 1) {
		return;
	}
	file_name = argv[0];
	args.assign(argv + 1, argv + argc);
}

CommandLine::CommandLine(const std::string_view name, const std::string_view cmdline)
        : file_name(name)
{
	// Split on spaces; double quotes group words and are dropped
	std::string current = {};
	bool in_quotes      = false;
	bool has_quotes     = false;

	for (const auto c : cmdline) {
		if (c == '"') {
			in_quotes  = !in_quotes;
			has_quotes = true;
		} else if (c == ' ' && !in_quotes) {
			if (!current.empty() || has_quotes) {
				args.push_back(std::move(current));
				current.clear();
			}
			has_quotes = false;
		} else {
			current += c;
		}
	}
	if (!current.empty() || has_quotes) {
		args.push_back(std::move(current));
	}
}

CommandLine::arg_iterator CommandLine::FindOption(std::initializer_list<std::string_view> names)
{
	return std::find_if(args.begin(), args.end(), [&](const std::string& arg) {
		return std::any_of(names.begin(), names.end(), [&](const std::string_view name) {
			return iequals(arg, name);
		});
	});
}

bool CommandLine::FindExist(const std::string& name)
{
	return FindOption({name}) != args.end();
}

bool CommandLine::FindRemoveExist(const std::string& name)
{
	const auto old_size = args.size();
	args.erase(std::remove_if(args.begin(),
	                          args.end(),
	                          [&](const std::string& arg) { return iequals(arg, name); }),
	           args.end());
	return args.size() != old_size;
}

bool CommandLine::FindCommand(const size_t which, std::string& value) const
{
	if (which < 1 || which > args.size()) {
		return false;
	}
	value = args[which - 1];
	return true;
}

size_t CommandLine::GetCount() const
{
	return args.size();
}

std::vector<std::string> CommandLine::GetArguments() const
{
	return args;
}

void CommandLine::Shift(const size_t amount)
{
	for (size_t i = 0; i < amount; ++i) {
		if (args.empty()) {
			file_name.clear();
			continue;
		}
		file_name = args.front();
		args.erase(args.begin());
	}
}

bool CommandLine::FindRemoveBoolArgument(const std::string& name, char short_letter)
{
	const auto found = FindRemoveExist('-' + name, "--" + name);
	if (short_letter == 0) {
		return found;
	}
	return FindRemoveExist(std::string{'-', short_letter}) || found;
}

std::optional<std::string> CommandLine::TakeOptionValue(const std::string& option)
{
	const auto prefix = option + '=';
	for (auto it = args.begin(); it != args.end(); ++it) {
		if (it->size() > prefix.size() &&
		    iequals(std::string_view(*it).substr(0, prefix.size()), prefix)) {
			auto value = it->substr(prefix.size());
			args.erase(it);
			return value;
		}
	}

	auto it = FindOption({option});
	while (it != args.end()) {
		const auto next = std::next(it);

		// The option is the last argument; leave it for the caller to
		// report
		if (next == args.end()) {
			return {};
		}
		if (!next->empty() && next->front() != '-') {
			auto value = *next;
			args.erase(it, std::next(next));
			return value;
		}

		it = args.erase(it);
		it = std::find_if(it, args.end(), [&](const std::string& arg) {
			return iequals(arg, option);
		});
	}
	return {};
}

std::string CommandLine::FindRemoveStringArgument(const std::string& name)
{
	if (auto value = TakeOptionValue("--" + name)) {
		return *value;
	}
	return TakeOptionValue('-' + name).value_or("");
}

std::optional<int> CommandLine::FindRemoveIntArgument(const std::string& name,
                                                      const int base)
{
	return parse_int(FindRemoveStringArgument(name), base);
}
