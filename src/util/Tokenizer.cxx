// SPDX-License-Identifier: BSD-2-Clause
// author: Max Kellermann <max.kellermann@gmail.com>

#include "Tokenizer.hxx"
#include "ASCII.hxx"
#include "StringStrip.hxx"

#include <stdexcept>

static constexpr bool
IsWordChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) || ch == '_';
}

static constexpr bool
IsUnquotedChar(char ch) noexcept
{
	return (unsigned char)ch > 0x20 && ch != '"' && ch != '\'';
}

/**
 * Terminate the token at the current position and skip the
 * whitespace following it.
 */
static char *
EndToken(char *p) noexcept
{
	*p = 0;
	return StripLeft(p + 1);
}

char *
Tokenizer::NextWord()
{
	char *const word = input;

	if (*input == 0)
		return nullptr;

	if (!IsAlphaASCII(*input))
		throw std::runtime_error("Letter expected");

	while (*++input != 0) {
		if (IsWhitespaceNotNull(*input)) {
			input = EndToken(input);
			break;
		}

		if (!IsWordChar(*input))
			throw std::runtime_error("Invalid word character");
	}

	return word;
}

char *
Tokenizer::NextUnquoted()
{
	char *const word = input;

	if (*input == 0)
		return nullptr;

	if (!IsUnquotedChar(*input))
		throw std::runtime_error("Invalid unquoted character");

	while (*++input != 0) {
		if (IsWhitespaceNotNull(*input)) {
			input = EndToken(input);
			break;
		}

		if (!IsUnquotedChar(*input))
			throw std::runtime_error("Invalid unquoted character");
	}

	return word;
}

char *
Tokenizer::NextString()
{
	char *const word = input, *dest = input;

	if (*input == 0)
		return nullptr;

	if (*input != '"')
		throw std::runtime_error("'\"' expected");

	++input;

	while (*input != '"') {
		if (*input == '\\')
			++input;

		if (*input == 0)
			throw std::runtime_error("Missing closing '\"'");

		*dest++ = *input++;
	}

	++input;
	if (*input != 0 && !IsWhitespaceNotNull(*input))
		throw std::runtime_error("Space expected after closing '\"'");

	*dest = 0;
	input = StripLeft(input);
	return word;
}

char *
Tokenizer::NextParam()
{
	if (*input == '"')
		return NextString();
	else
		return NextUnquoted();
}
