// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#pragma once

/**
 * Splits one line of a configuration file into words and quoted
 * strings.  The input buffer is modified in place.
 */
class Tokenizer {
	char *input;

public:
	constexpr explicit Tokenizer(char *_input) noexcept
		:input(_input) {}

	Tokenizer(const Tokenizer &) = delete;
	Tokenizer &operator=(const Tokenizer &) = delete;

	char *Rest() noexcept {
		return input;
	}

	char CurrentChar() const noexcept {
		return *input;
	}

	bool IsEnd() const noexcept {
		return CurrentChar() == 0;
	}

	/**
	 * Reads the next word (letters, digits and underscores,
	 * starting with a letter).  Throws std::runtime_error on
	 * error.
	 *
	 * @return a pointer to the null-terminated word, or nullptr
	 * on end of line
	 */
	char *NextWord();

	/**
	 * Reads the next unquoted word.  Throws std::runtime_error on
	 * error.
	 */
	char *NextUnquoted();

	/**
	 * Reads the next quoted string.  A backslash escapes the
	 * following character.  Throws std::runtime_error on error.
	 */
	char *NextString();

	/**
	 * NextString() if the next token is quoted, NextUnquoted()
	 * otherwise.
	 */
	char *NextParam();
};
