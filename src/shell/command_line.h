// SPDX-FileCopyrightText:  2020-2026 The DOSBox Staging Team
// SPDX-FileCopyrightText:  2002-2021 The DOSBox Team
// SPDX-License-Identifier: GPL-2.0-or-later

#ifndef FATIMG_COMMAND_LINE_H
#define FATIMG_COMMAND_LINE_H

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class CommandLine {
public:
	CommandLine(int argc, const char* const argv[]);
	CommandLine(std::string_view name, std::string_view cmdline);

	const char* GetFileName() const
	{
		return file_name.c_str();
	}

	bool FindExist(const std::string& name);

	// Removes every occurrence of the argument, returns 'true' if at least
	// one was found.
	bool FindRemoveExist(const std::string& name);

	// Same as above, for an argument with aliases, for example if '-l' and
	// '-list' request the same action.
	template <typename... Names>
	bool FindRemoveExist(const std::string& name, Names... names)
	{
		const auto found_1 = FindRemoveExist(name);
		const auto found_2 = FindRemoveExist(names...);
		return found_1 || found_2;
	}

	bool FindCommand(size_t which, std::string& value) const;

	std::vector<std::string> GetArguments() const;

	size_t GetCount() const;

	void Shift(size_t amount = 1);

	// Finds and removes '-name' or '--name' (or '-<short_letter>')
	bool FindRemoveBoolArgument(const std::string& name, char short_letter = 0);

	// Finds and removes '-name value', '--name value' or '--name=value';
	// returns an empty string if the argument is missing or has no value.
	// A value starting with '-' is taken to be the next option.
	std::string FindRemoveStringArgument(const std::string& name);

	// Returns an empty optional if the argument is missing or its value is
	// not an integer
	std::optional<int> FindRemoveIntArgument(const std::string& name,
	                                         const int base = 10);

private:
	using arg_iterator = std::vector<std::string>::iterator;

	// Iterator to the first argument equal to one of the names, ignoring
	// case, or end()
	arg_iterator FindOption(std::initializer_list<std::string_view> names);

	// Handles both '--name value' and '--name=value' forms
	std::optional<std::string> TakeOptionValue(const std::string& option);

	std::vector<std::string> args = {};
	std::string file_name         = {};
};

#endif
