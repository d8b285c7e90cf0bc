// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "Block.hxx"
#include "Templates.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Tokenizer.hxx"
#include "util/StringStrip.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <cassert>
#include <cerrno>
#include <fstream>
#include <string>
#include <system_error>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_domain("config");

/**
 * Reads lines from a std::istream and counts them.
 */
class LineReader {
	std::istream &is;
	std::string buffer;
	unsigned line_number = 0;

public:
	explicit LineReader(std::istream &_is) noexcept:is(_is) {}

	/**
	 * @return nullptr on end-of-file
	 */
	char *ReadLine() {
		if (!std::getline(is, buffer))
			return nullptr;

		++line_number;

		if (!buffer.empty() && buffer.back() == '\r')
			buffer.pop_back();

		return buffer.data();
	}

	unsigned GetLineNumber() const noexcept {
		return line_number;
	}
};

static auto
ExpectValueAndEnd(Tokenizer &tokenizer)
{
	auto value = tokenizer.NextString();
	if (!value)
		throw std::runtime_error("Value missing");

	if (!tokenizer.IsEnd() && tokenizer.CurrentChar() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	return value;
}

static void
config_read_name_value(ConfigBlock &block, char *input, unsigned line)
{
	Tokenizer tokenizer(input);

	const char *name = tokenizer.NextWord();
	assert(name != nullptr);

	auto value = ExpectValueAndEnd(tokenizer);

	const BlockParam *bp = block.GetBlockParam(name);
	if (bp != nullptr)
		throw FmtRuntimeError("\"{}\" is duplicate, first defined on line {}",
				      name, bp->line);

	block.AddBlockParam(name, value, line);
}

static ConfigBlock
config_read_block(LineReader &reader)
{
	ConfigBlock block(reader.GetLineNumber());

	while (true) {
		char *line = reader.ReadLine();
		if (line == nullptr)
			throw std::runtime_error("Expected '}' before end-of-file");

		line = StripLeft(line);
		if (*line == 0 || *line == CONF_COMMENT)
			continue;

		if (*line == '}') {
			/* end of this block; return from the function
			   (and from this "while" loop) */

			line = StripLeft(line + 1);
			if (*line != 0 && *line != CONF_COMMENT)
				throw std::runtime_error("Unknown tokens after '}'");

			return block;
		}

		/* parse name and value */

		config_read_name_value(block, line,
				       reader.GetLineNumber());
	}
}

static void
ReadConfigBlock(ConfigData &config_data, LineReader &reader,
		const char *name, ConfigBlockOption o,
		Tokenizer &tokenizer)
{
	const auto i = unsigned(o);
	const ConfigTemplate &option = config_block_templates[i];

	if (!option.repeatable)
		if (const auto *block = config_data.GetBlock(o))
			throw FmtRuntimeError("config parameter \"{}\" is first defined "
					      "on line {} and redefined on line {}",
					      name, block->line,
					      reader.GetLineNumber());

	/* now parse the block or the value */

	if (tokenizer.CurrentChar() != '{')
		throw std::runtime_error("'{' expected");

	char *line = StripLeft(tokenizer.Rest() + 1);
	if (*line != 0 && *line != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after '{'");

	config_data.AddBlock(o, config_read_block(reader));
}

static void
ReadConfigParam(ConfigData &config_data, LineReader &reader,
		ConfigOption o, Tokenizer &tokenizer)
{
	const auto i = unsigned(o);
	const ConfigTemplate &option = config_param_templates[i];

	if (!option.repeatable)
		/* if the option is not repeatable, override the old
		   value by removing it first */
		config_data.GetParamList(o).clear();

	config_data.AddParam(o, ConfigParam(ExpectValueAndEnd(tokenizer),
					    reader.GetLineNumber()));
}

static void
ReadConfig(ConfigData &config_data, LineReader &reader)
{
	while (true) {
		char *line = reader.ReadLine();
		if (line == nullptr)
			return;

		line = StripLeft(line);
		if (*line == 0 || *line == CONF_COMMENT)
			continue;

		/* the first token in each line is the name, followed
		   by either the value or '{' */

		Tokenizer tokenizer(line);
		const char *name = tokenizer.NextWord();
		assert(name != nullptr);

		const ConfigOption o = ParseConfigOptionName(name);
		ConfigBlockOption bo;
		if (o != ConfigOption::MAX) {
			ReadConfigParam(config_data, reader, o, tokenizer);
		} else if ((bo = ParseConfigBlockOptionName(name)) != ConfigBlockOption::MAX) {
			ReadConfigBlock(config_data, reader, name, bo,
					tokenizer);
		} else {
			throw FmtRuntimeError("unrecognized parameter: {}",
					      name);
		}
	}
}

void
ReadConfigStream(ConfigData &config_data, std::istream &is, const char *name)
{
	LineReader reader(is);

	try {
		ReadConfig(config_data, reader);
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {} line {}",
						       name,
						       reader.GetLineNumber()));
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	assert(path != nullptr);

	FmtDebug(config_domain, "loading file {}", path);

	std::ifstream file(path);
	if (!file)
		throw std::system_error(errno, std::generic_category(),
					fmt::format("Failed to open {}", path));

	ReadConfigStream(config_data, file, path);
}
